#pragma once

// =============================================================================
// Array and map builtins:
//   arrays: push, pop, len, clear, contains, +, +=, range
//   maps:   len, keys, values, remove, contains
// =============================================================================

#include "fn_register.hpp"

namespace rill
{

    inline void registerArrayBuiltins(Module &m)
    {
        // ---- Arrays ----
        registerFn(m, "push", [](Array &a, Dynamic item)
                   { a.push_back(std::move(item)); });

        // pop of an empty array gives ()
        registerFn(m, "pop", [](Array &a)
                   {
                       if (a.empty())
                           return Dynamic();
                       Dynamic last = std::move(a.back());
                       a.pop_back();
                       return last;
                   });

        registerFn(m, "len", [](Array &a)
                   { return static_cast<INT>(a.size()); });
        registerFn(m, "clear", [](Array &a)
                   { a.clear(); });

        registerFn(m, "contains", [](Array &a, Dynamic item)
                   {
                       for (const auto &elem : a)
                           if (elem.equals(item))
                               return true;
                       return false;
                   });

        registerFn(m, "+", [](Array x, const Array &y)
                   {
                       x.insert(x.end(), y.begin(), y.end());
                       return x;
                   });
        registerFn(m, "+=", [](Array &x, const Array &y)
                   { x.insert(x.end(), y.begin(), y.end()); });

        // [from, to)
        registerFn(m, "range", [](INT from, INT to)
                   {
                       Array out;
                       for (INT i = from; i < to; i++)
                           out.push_back(Dynamic::makeInt(i));
                       return out;
                   });

        // ---- Object maps ----
        registerFn(m, "len", [](Map &map)
                   { return static_cast<INT>(map.size()); });

        registerFn(m, "keys", [](Map &map)
                   {
                       Array out;
                       for (const auto &entry : map)
                           out.push_back(Dynamic::makeString(entry.first));
                       return out;
                   });

        registerFn(m, "values", [](Map &map)
                   {
                       Array out;
                       for (const auto &entry : map)
                           out.push_back(entry.second);
                       return out;
                   });

        // remove of a missing key gives ()
        registerFn(m, "remove", [](Map &map, const std::string &key)
                   {
                       auto it = map.find(key);
                       if (it == map.end())
                           return Dynamic();
                       Dynamic value = std::move(it->second);
                       map.erase(it);
                       return value;
                   });

        registerFn(m, "contains", [](Map &map, const std::string &key)
                   { return map.count(key) > 0; });
    }

} // namespace rill
