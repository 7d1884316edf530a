// gir_model/sema/conflict_detector.hpp - Member override conflict classification
//
// Two phases:
//   analyze() - read-only over the whole model, produces ConflictRecords
//   apply()   - rewrites the namespace the records belong to
// Analysis of every namespace must finish before any namespace is applied.
//
#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

#include "gir_model/basic/diagnostic.hpp"
#include "gir_model/model/model.hpp"
#include "gir_model/sema/class_hierarchy.hpp"
#include "gir_model/sema/subtype_checker.hpp"

namespace gir_model
{

enum class MemberKind : uint8_t {
  Function,
  Constructor,
  Property,
  Field,
};

[[nodiscard]] std::string_view member_kind_name(MemberKind kind) noexcept;

struct ConflictRecord
{
  std::string ns;          ///< namespace name
  std::string class_name;  ///< unqualified class name
  std::string member;
  MemberKind member_kind = MemberKind::Function;
  ConflictKind kind = ConflictKind::None;
  ConflictResolution resolution = ConflictResolution::None;
  std::string ancestor;  ///< qualified ancestor name, empty for forced (known) conflicts

  /// Position of the member inside its container; not part of equality
  size_t member_index = 0;

  bool operator==(const ConflictRecord & other) const
  {
    return ns == other.ns && class_name == other.class_name && member == other.member &&
           member_kind == other.member_kind && kind == other.kind &&
           resolution == other.resolution && ancestor == other.ancestor;
  }
  bool operator!=(const ConflictRecord & other) const { return !(*this == other); }
};

struct ConflictOptions
{
  /// Classes rooted here get the reserved member names forced into conflicts
  std::string universal_base = "GObject.Object";
  std::set<std::string> reserved_members = {"connect", "connect_after", "emit"};
  /// namespace name -> member names known to be problematic
  std::map<std::string, std::set<std::string>> known_conflicts;
};

class ConflictDetector
{
public:
  explicit ConflictDetector(const ClassHierarchy & hierarchy, ConflictOptions options = {});

  /**
   * Classify every member of every class/interface/record of `ns`.
   *
   * Read-only; safe to run concurrently for different namespaces. Running it
   * again over an applied model yields the same records.
   */
  [[nodiscard]] std::vector<ConflictRecord> analyze(const Namespace & ns) const;

  /// Records for a single class (in member order)
  [[nodiscard]] std::vector<ConflictRecord> analyze_class(const BaseClass & cls) const;

  /**
   * Apply records produced by analyze() for the same namespace. Idempotent:
   * markers never nest and synthesized overloads are never duplicated.
   */
  static void apply(Namespace & ns, const std::vector<ConflictRecord> & records);

  /// One diagnostic per record (C001..C007)
  static void report(
    const Namespace & ns, const std::vector<ConflictRecord> & records, DiagnosticBag & diags);

private:
  struct Finding
  {
    ConflictKind kind = ConflictKind::None;
    const BaseClass * ancestor = nullptr;
    bool against_data_member = false;  ///< function colliding with a field/property
  };

  void analyze_function(
    const BaseClass & cls, const Function & fn, MemberKind member_kind, size_t index,
    std::vector<ConflictRecord> & out) const;
  void analyze_property(
    const BaseClass & cls, const Property & prop, size_t index,
    std::vector<ConflictRecord> & out) const;
  void analyze_field(
    const BaseClass & cls, const Field & field, size_t index,
    std::vector<ConflictRecord> & out) const;

  /// Function-vs-function classification against one ancestor
  [[nodiscard]] ConflictKind classify_functions(
    const BaseClass & cls, const Function & child, const BaseClass & ancestor,
    const Function & parent) const;
  [[nodiscard]] bool signature_incompatible(
    const BaseClass & cls, const Function & child, const BaseClass & ancestor,
    const Function & parent) const;
  [[nodiscard]] static bool signature_differs(const Function & a, const Function & b);

  /// True when an intermediate ancestor redeclares `fn` and already conflicts with `root`
  [[nodiscard]] bool inherited_further_up(
    const BaseClass & cls, const Function & fn, const BaseClass & root) const;

  [[nodiscard]] bool is_known_conflict(const BaseClass & cls, const std::string & name) const;
  [[nodiscard]] bool is_reserved(const BaseClass & cls, const std::string & name) const;

  [[nodiscard]] static ConflictRecord make_record(
    const BaseClass & cls, const std::string & member, MemberKind member_kind, size_t index,
    ConflictKind kind, ConflictResolution resolution, const std::string & ancestor);

  const ClassHierarchy & hierarchy_;
  SubtypeChecker checker_;
  ConflictOptions options_;
};

}  // namespace gir_model
