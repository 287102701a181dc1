#pragma once

// =============================================================================
// Arithmetic builtins: + - * / % ~ << >> & | ^, unary - and +, abs, sign
// =============================================================================
//
// One template per number family, instantiated for every integer width and
// both float types. Integer operations are checked: overflow, division by
// zero and bad shift amounts raise ArithmeticError. Building with
// RILL_UNCHECKED switches to two's-complement wraparound instead; division by
// zero is still reported.
//
// =============================================================================

#include "fn_register.hpp"
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>

namespace rill
{

    namespace detail
    {
        template <typename T>
        std::string numText(T x)
        {
            if constexpr (std::is_floating_point_v<T>)
                return formatFloat(x);
            else
                return std::to_string(x);
        }

        template <typename T, typename U>
        [[noreturn]] void arithmeticError(const std::string &what, T x, const char *op, U y)
        {
            throw ArithmeticError(what + ": " + numText(x) + " " + op + " " + numText(y), Position::none());
        }

#ifdef RILL_UNCHECKED
        // Signed overflow is undefined; wrap through the unsigned type
        template <typename T>
        T wrapAdd(T x, T y)
        {
            using U = std::make_unsigned_t<T>;
            return static_cast<T>(static_cast<U>(x) + static_cast<U>(y));
        }

        template <typename T>
        T wrapSub(T x, T y)
        {
            using U = std::make_unsigned_t<T>;
            return static_cast<T>(static_cast<U>(x) - static_cast<U>(y));
        }

        template <typename T>
        T wrapMul(T x, T y)
        {
            using U = std::make_unsigned_t<T>;
            return static_cast<T>(static_cast<U>(x) * static_cast<U>(y));
        }
#endif

        template <typename T>
        T integerPower(T x, INT y)
        {
#ifndef RILL_UNCHECKED
            if (y > static_cast<INT>(std::numeric_limits<uint32_t>::max()))
                arithmeticError("Integer raised to too large an index", x, "~", y);
            if (y < 0)
                arithmeticError("Integer raised to a negative index", x, "~", y);
#else
            if (y < 0)
                return 0;
#endif
            // Square and multiply
            T result = 1;
            T base = x;
            uint64_t e = static_cast<uint64_t>(y);
            while (e > 0)
            {
#ifndef RILL_UNCHECKED
                if ((e & 1) && __builtin_mul_overflow(result, base, &result))
                    arithmeticError("Power overflow", x, "~", y);
                e >>= 1;
                if (e > 0 && __builtin_mul_overflow(base, base, &base))
                    arithmeticError("Power overflow", x, "~", y);
#else
                if (e & 1)
                    result = wrapMul(result, base);
                e >>= 1;
                if (e > 0)
                    base = wrapMul(base, base);
#endif
            }
            return result;
        }
    } // namespace detail

    /// + - * / % ~ << >> & | ^ for one integer type (plus -, abs and sign
    /// when signed)
    template <typename T>
    void registerIntegerOps(Module &m)
    {
        using detail::arithmeticError;

        registerFn(m, "+", [](T x, T y) -> T
                   {
#ifndef RILL_UNCHECKED
                       T r;
                       if (__builtin_add_overflow(x, y, &r))
                           arithmeticError("Addition overflow", x, "+", y);
                       return r;
#else
                       return detail::wrapAdd(x, y);
#endif
                   });

        registerFn(m, "-", [](T x, T y) -> T
                   {
#ifndef RILL_UNCHECKED
                       T r;
                       if (__builtin_sub_overflow(x, y, &r))
                           arithmeticError("Subtraction overflow", x, "-", y);
                       return r;
#else
                       return detail::wrapSub(x, y);
#endif
                   });

        registerFn(m, "*", [](T x, T y) -> T
                   {
#ifndef RILL_UNCHECKED
                       T r;
                       if (__builtin_mul_overflow(x, y, &r))
                           arithmeticError("Multiplication overflow", x, "*", y);
                       return r;
#else
                       return detail::wrapMul(x, y);
#endif
                   });

        registerFn(m, "/", [](T x, T y) -> T
                   {
                       if (y == 0)
                           arithmeticError("Division by zero", x, "/", y);
                       if constexpr (std::is_signed_v<T>)
                       {
                           if (x == std::numeric_limits<T>::min() && y == T(-1))
                           {
#ifndef RILL_UNCHECKED
                               arithmeticError("Division overflow", x, "/", y);
#else
                               return x;
#endif
                           }
                       }
                       return static_cast<T>(x / y);
                   });

        registerFn(m, "%", [](T x, T y) -> T
                   {
                       if (y == 0)
                           arithmeticError("Modulo division by zero or overflow", x, "%", y);
                       if constexpr (std::is_signed_v<T>)
                       {
                           if (x == std::numeric_limits<T>::min() && y == T(-1))
                           {
#ifndef RILL_UNCHECKED
                               arithmeticError("Modulo division by zero or overflow", x, "%", y);
#else
                               return 0;
#endif
                           }
                       }
                       return static_cast<T>(x % y);
                   });

        registerFn(m, "~", [](T x, INT y) -> T
                   { return detail::integerPower(x, y); });

        registerFn(m, "<<", [](T x, INT y) -> T
                   {
                       constexpr INT bits = std::numeric_limits<std::make_unsigned_t<T>>::digits;
#ifndef RILL_UNCHECKED
                       if (y < 0)
                           arithmeticError("Left-shift by a negative number", x, "<<", y);
                       if (y >= bits)
                           arithmeticError("Left-shift by too many bits", x, "<<", y);
#endif
                       using U = std::make_unsigned_t<T>;
                       return static_cast<T>(static_cast<U>(x) << (static_cast<uint64_t>(y) % bits));
                   });

        registerFn(m, ">>", [](T x, INT y) -> T
                   {
                       constexpr INT bits = std::numeric_limits<std::make_unsigned_t<T>>::digits;
#ifndef RILL_UNCHECKED
                       if (y < 0)
                           arithmeticError("Right-shift by a negative number", x, ">>", y);
                       if (y >= bits)
                           arithmeticError("Right-shift by too many bits", x, ">>", y);
#endif
                       return static_cast<T>(x >> (static_cast<uint64_t>(y) % bits));
                   });

        registerFn(m, "&", [](T x, T y) -> T
                   { return static_cast<T>(x & y); });
        registerFn(m, "|", [](T x, T y) -> T
                   { return static_cast<T>(x | y); });
        registerFn(m, "^", [](T x, T y) -> T
                   { return static_cast<T>(x ^ y); });

        registerFn(m, "+", [](T x) -> T
                   { return x; });

        if constexpr (std::is_signed_v<T>)
        {
            registerFn(m, "-", [](T x) -> T
                       {
                           if (x == std::numeric_limits<T>::min())
                           {
#ifndef RILL_UNCHECKED
                               throw ArithmeticError("Negation overflow: -" + std::to_string(x), Position::none());
#else
                               return x;
#endif
                           }
                           return static_cast<T>(-x);
                       });

            registerFn(m, "abs", [](T x) -> T
                       {
                           if (x == std::numeric_limits<T>::min())
                           {
#ifndef RILL_UNCHECKED
                               throw ArithmeticError("Negation overflow: -" + std::to_string(x), Position::none());
#else
                               return x;
#endif
                           }
                           return static_cast<T>(x < 0 ? -x : x);
                       });

            registerFn(m, "sign", [](T x) -> INT
                       { return x < 0 ? -1 : (x > 0 ? 1 : 0); });
        }
    }

    /// + - * / % ~ and unary -, +, abs, sign for one float type
    template <typename T>
    void registerFloatOps(Module &m)
    {
        registerFn(m, "+", [](T x, T y) -> T
                   { return x + y; });
        registerFn(m, "-", [](T x, T y) -> T
                   { return x - y; });
        registerFn(m, "*", [](T x, T y) -> T
                   { return x * y; });
        registerFn(m, "/", [](T x, T y) -> T
                   { return x / y; });
        registerFn(m, "%", [](T x, T y) -> T
                   { return std::fmod(x, y); });

        registerFn(m, "~", [](T x, T y) -> T
                   { return std::pow(x, y); });

        registerFn(m, "~", [](T x, INT y) -> T
                   {
#ifndef RILL_UNCHECKED
                       if (y > static_cast<INT>(std::numeric_limits<int32_t>::max()) ||
                           y < static_cast<INT>(std::numeric_limits<int32_t>::min()))
                           detail::arithmeticError("Number raised to too large an index", x, "~", y);
#endif
                       return std::pow(x, static_cast<T>(y));
                   });

        registerFn(m, "+", [](T x) -> T
                   { return x; });
        registerFn(m, "-", [](T x) -> T
                   { return -x; });
        registerFn(m, "abs", [](T x) -> T
                   { return std::fabs(x); });
        registerFn(m, "sign", [](T x) -> INT
                   { return x < 0 ? -1 : (x > 0 ? 1 : 0); });
    }

    inline void registerArithmeticBuiltins(Module &m)
    {
        registerIntegerOps<int8_t>(m);
        registerIntegerOps<int16_t>(m);
        registerIntegerOps<int32_t>(m);
        registerIntegerOps<int64_t>(m);
        registerIntegerOps<uint8_t>(m);
        registerIntegerOps<uint16_t>(m);
        registerIntegerOps<uint32_t>(m);
        registerIntegerOps<uint64_t>(m);

        registerFloatOps<float>(m);
        registerFloatOps<double>(m);
    }

} // namespace rill
