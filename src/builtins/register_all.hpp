#pragma once

// =============================================================================
// register_all.hpp: the standard package every Engine loads
// =============================================================================
//
// Usage (from the Engine constructor):
//     loadPackage(corePackage());
//
// To add a new category:
//   1. #include "builtins_<category>.hpp"
//   2. Call register<Category>Builtins(m) below.
//
// =============================================================================

#include "builtins_arithmetic.hpp"
#include "builtins_array.hpp"
#include "builtins_logic.hpp"
#include "builtins_string.hpp"
#include "fn_register.hpp"
#include <memory>

namespace rill
{

    /// Registers every standard builtin into the given module.
    inline void registerCoreBuiltins(Module &m)
    {
        registerArithmeticBuiltins(m);
        registerLogicBuiltins(m);
        registerStringBuiltins(m);
        registerArrayBuiltins(m);
    }

    /// The standard package, built once and shared (read-only) by every engine.
    inline std::shared_ptr<const Module> corePackage()
    {
        static const std::shared_ptr<const Module> package = []
        {
            auto m = std::make_shared<Module>();
            registerCoreBuiltins(*m);
            return m;
        }();
        return package;
    }

} // namespace rill
