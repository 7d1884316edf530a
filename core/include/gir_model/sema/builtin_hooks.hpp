// gir_model/sema/builtin_hooks.hpp - Hooks shipped with the library
#pragma once

#include "gir_model/sema/patch_hooks.hpp"

namespace gir_model
{

/// First and last Clutter/Meta major versions the generic hooks are registered for
constexpr int k_builtin_generics_first_version = 10;
constexpr int k_builtin_generics_last_version = 20;

/**
 * Register the built-in hooks:
 * - Clutter 10..20: Actor<A, B> over LayoutManager/Content, Clone<A> over Actor
 * - Meta 10..20: BackgroundActor super type generified over
 *   Clutter.LayoutManager and Meta.BackgroundContent
 * - Gpseq 1.0: Result virtual function callbacks point at Result's nested types
 *
 * Generic injection only does anything when HookContext::infer_generics is set.
 */
void register_builtin_hooks(PatchHookRegistry & registry);

}  // namespace gir_model
