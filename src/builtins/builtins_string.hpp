#pragma once

// =============================================================================
// String builtins: print, debug, to_string for every printable type;
//                  string +, +=, len, contains, to_upper, to_lower
// =============================================================================
//
// `print(x)` and `debug(x)` in a script first call the "print" / "debug"
// function registered for x's type to get the text, then hand that text to
// the engine's output callback.
//
// =============================================================================

#include "fn_register.hpp"
#include <cctype>
#include <cstdint>

namespace rill
{

    /// print / debug / to_string for one type
    template <typename T>
    void registerPrintable(Module &m)
    {
        std::vector<std::type_index> sig{typeid(T)};

        auto display = [](NativeCallContext &, FnArgs &args)
        {
            return Dynamic::makeString(args[0]->toString());
        };
        registerRawFn(m, "print", sig, display);
        registerRawFn(m, "to_string", sig, display);

        registerRawFn(m, "debug", sig, [](NativeCallContext &, FnArgs &args)
                      { return Dynamic::makeString(args[0]->toDebugString()); });
    }

    /// string + T and T + string
    template <typename T>
    void registerStringAppend(Module &m)
    {
        registerRawFn(m, "+", {typeid(ImmutableString), typeid(T)}, [](NativeCallContext &, FnArgs &args)
                      { return Dynamic::makeString(args[0]->asString().str() + args[1]->toString()); });
        registerRawFn(m, "+", {typeid(T), typeid(ImmutableString)}, [](NativeCallContext &, FnArgs &args)
                      { return Dynamic::makeString(args[0]->toString() + args[1]->asString().str()); });
    }

    inline void registerStringBuiltins(Module &m)
    {
        // ---- print / debug / to_string ----
        registerPrintable<INT>(m);
        registerPrintable<FLOAT>(m);
        registerPrintable<bool>(m);
        registerPrintable<char32_t>(m);
        registerPrintable<ImmutableString>(m);
        registerPrintable<Unit>(m);
        registerPrintable<Array>(m);
        registerPrintable<Map>(m);
        registerPrintable<FnPtr>(m);
        registerPrintable<int8_t>(m);
        registerPrintable<int16_t>(m);
        registerPrintable<int32_t>(m);
        registerPrintable<uint8_t>(m);
        registerPrintable<uint16_t>(m);
        registerPrintable<uint32_t>(m);
        registerPrintable<uint64_t>(m);
        registerPrintable<float>(m);

        // ---- Concatenation ----
        registerFn(m, "+", [](const ImmutableString &x, const ImmutableString &y)
                   { return ImmutableString(x.str() + y.str()); });
        registerFn(m, "+", [](const ImmutableString &x, char32_t c)
                   { return ImmutableString(x.str() + toUtf8(c)); });
        registerFn(m, "+", [](char32_t c, const ImmutableString &y)
                   { return ImmutableString(toUtf8(c) + y.str()); });

        registerStringAppend<INT>(m);
        registerStringAppend<FLOAT>(m);
        registerStringAppend<bool>(m);
        registerStringAppend<Unit>(m);

        registerFn(m, "+=", [](ImmutableString &s, const ImmutableString &y)
                   { s = ImmutableString(s.str() + y.str()); });
        registerFn(m, "+=", [](ImmutableString &s, char32_t c)
                   { s = ImmutableString(s.str() + toUtf8(c)); });

        // ---- Queries ----
        registerFn(m, "len", [](const ImmutableString &s)
                   { return static_cast<INT>(utf8Length(s.str())); });

        registerFn(m, "contains", [](const ImmutableString &s, const ImmutableString &sub)
                   { return s.str().find(sub.str()) != std::string::npos; });
        registerFn(m, "contains", [](const ImmutableString &s, char32_t c)
                   { return s.str().find(toUtf8(c)) != std::string::npos; });

        // ASCII case mapping
        registerFn(m, "to_upper", [](const ImmutableString &s)
                   {
                       std::string out = s.str();
                       for (auto &c : out)
                           c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
                       return out;
                   });
        registerFn(m, "to_lower", [](const ImmutableString &s)
                   {
                       std::string out = s.str();
                       for (auto &c : out)
                           c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                       return out;
                   });
    }

} // namespace rill
