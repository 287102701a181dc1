#pragma once

// =============================================================================
// Logic builtins: == != < <= > >= for numbers, chars and strings;
//                 == != for bool and (); ! & | ^ for bool
// =============================================================================

#include "fn_register.hpp"
#include <cstdint>

namespace rill
{

    template <typename T>
    void registerComparisonOps(Module &m)
    {
        registerFn(m, "==", [](T x, T y)
                   { return x == y; });
        registerFn(m, "!=", [](T x, T y)
                   { return x != y; });
        registerFn(m, "<", [](T x, T y)
                   { return x < y; });
        registerFn(m, "<=", [](T x, T y)
                   { return !(y < x); });
        registerFn(m, ">", [](T x, T y)
                   { return y < x; });
        registerFn(m, ">=", [](T x, T y)
                   { return !(x < y); });
    }

    inline void registerLogicBuiltins(Module &m)
    {
        registerComparisonOps<int8_t>(m);
        registerComparisonOps<int16_t>(m);
        registerComparisonOps<int32_t>(m);
        registerComparisonOps<int64_t>(m);
        registerComparisonOps<uint8_t>(m);
        registerComparisonOps<uint16_t>(m);
        registerComparisonOps<uint32_t>(m);
        registerComparisonOps<uint64_t>(m);
        registerComparisonOps<float>(m);
        registerComparisonOps<double>(m);
        registerComparisonOps<char32_t>(m);

        // Strings compare by content, not by identity
        registerFn(m, "==", [](const ImmutableString &x, const ImmutableString &y)
                   { return x.str() == y.str(); });
        registerFn(m, "!=", [](const ImmutableString &x, const ImmutableString &y)
                   { return x.str() != y.str(); });
        registerFn(m, "<", [](const ImmutableString &x, const ImmutableString &y)
                   { return x.str() < y.str(); });
        registerFn(m, "<=", [](const ImmutableString &x, const ImmutableString &y)
                   { return x.str() <= y.str(); });
        registerFn(m, ">", [](const ImmutableString &x, const ImmutableString &y)
                   { return x.str() > y.str(); });
        registerFn(m, ">=", [](const ImmutableString &x, const ImmutableString &y)
                   { return x.str() >= y.str(); });

        registerFn(m, "==", [](bool x, bool y)
                   { return x == y; });
        registerFn(m, "!=", [](bool x, bool y)
                   { return x != y; });
        registerFn(m, "==", [](Unit, Unit)
                   { return true; });
        registerFn(m, "!=", [](Unit, Unit)
                   { return false; });

        registerFn(m, "!", [](bool x)
                   { return !x; });
        registerFn(m, "&", [](bool x, bool y)
                   { return x && y; });
        registerFn(m, "|", [](bool x, bool y)
                   { return x || y; });
        registerFn(m, "^", [](bool x, bool y)
                   { return x != y; });
    }

} // namespace rill
