// gir_model/io/raw_tree_reader.hpp - Reading raw element trees
//
// The upstream parser hands over one JSON document per namespace. The
// RawTreeReader interface is the seam the registry and pipeline depend on.
//
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

#include "gir_model/model/raw_tree.hpp"

namespace gir_model
{

struct RawTreeLoadResult
{
  RawNamespace tree;
  bool success = false;
  std::string error;

  static RawTreeLoadResult ok(RawNamespace ns)
  {
    RawTreeLoadResult r;
    r.tree = std::move(ns);
    r.success = true;
    return r;
  }

  static RawTreeLoadResult fail(std::string msg)
  {
    RawTreeLoadResult r;
    r.error = std::move(msg);
    return r;
  }
};

class RawTreeReader
{
public:
  virtual ~RawTreeReader() = default;

  /**
   * Read the raw tree stored at `path`.
   *
   * Never throws; failures are returned as RawTreeLoadResult::fail.
   */
  [[nodiscard]] virtual RawTreeLoadResult read(const std::filesystem::path & path) const = 0;
};

/**
 * Reads `<Ns>-<Version>.gir.json` documents with nlohmann/json.
 */
class JsonRawTreeReader : public RawTreeReader
{
public:
  [[nodiscard]] RawTreeLoadResult read(const std::filesystem::path & path) const override;

  /// Parse document text
  [[nodiscard]] static RawTreeLoadResult parse(const std::string & text);

  /// Convert an already-parsed document
  [[nodiscard]] static RawTreeLoadResult from_json(const nlohmann::json & doc);
};

}  // namespace gir_model
