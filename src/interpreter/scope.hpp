#pragma once

// =============================================================================
// Scope: Rill's variable stack
// =============================================================================
//
// A Scope is an ordered stack of (name, value) entries. A new `let` pushes an
// entry; leaving a block rewinds the stack to the size it had on entry. Lookup
// searches from the top, so later entries shadow earlier ones.
//
// Hosts create a Scope, seed it with variables, and pass it to
// Engine::evalWithScope / Engine::callFn. Whatever the script leaves on top
// of it stays there.
//
//   Scope scope;
//   scope.push("x", INT(40));
//   engine.evalWithScope<INT>(scope, "x + 2");   // 42
//
// =============================================================================

#include "dynamic.hpp"
#include "../lib/errors/error.hpp"
#include <optional>
#include <string>
#include <vector>

namespace rill
{

    enum class AccessMode
    {
        VARIABLE,
        CONSTANT,
    };

    class Scope
    {
    public:
        struct Entry
        {
            std::string name;
            Dynamic value;
            AccessMode access = AccessMode::VARIABLE;
            std::optional<std::string> exportAlias; // set by `export name [as alias]`
        };

        /// Push a new variable (shadowing any existing one of the same name)
        template <typename T>
        Scope &push(const std::string &name, T value)
        {
            return pushDynamic(name, Dynamic::from(std::move(value)), AccessMode::VARIABLE);
        }

        /// Push a new constant
        template <typename T>
        Scope &pushConstant(const std::string &name, T value)
        {
            return pushDynamic(name, Dynamic::from(std::move(value)), AccessMode::CONSTANT);
        }

        Scope &pushDynamic(const std::string &name, Dynamic value,
                           AccessMode access = AccessMode::VARIABLE)
        {
            entries_.push_back(Entry{name, std::move(value), access, std::nullopt});
            return *this;
        }

        /// Value of the topmost variable `name`, if it exists and holds a T.
        template <typename T>
        std::optional<T> getValue(const std::string &name) const
        {
            auto index = indexOf(name);
            if (!index)
                return std::nullopt;

            Dynamic value = entries_[*index].value.flatten();
            if (!value.is<T>() && !std::is_same_v<T, Dynamic>)
                return std::nullopt;
            return value.cast<T>();
        }

        /// Update the topmost variable `name`, or push it if it does not exist.
        /// Writes through shared (captured) values.
        template <typename T>
        void set(const std::string &name, T value)
        {
            auto index = indexOf(name);
            if (!index)
            {
                push(name, std::move(value));
                return;
            }

            Entry &entry = entries_[*index];
            if (entry.access == AccessMode::CONSTANT)
                throw AssignmentToConstantError(name, Position::none());
            *entry.value.write(name) = Dynamic::from(std::move(value));
        }

        bool contains(const std::string &name) const { return indexOf(name).has_value(); }

        /// Index of the topmost entry named `name`
        std::optional<size_t> indexOf(const std::string &name) const
        {
            for (size_t i = entries_.size(); i > 0; i--)
                if (entries_[i - 1].name == name)
                    return i - 1;
            return std::nullopt;
        }

        Entry &at(size_t index) { return entries_.at(index); }
        const Entry &at(size_t index) const { return entries_.at(index); }

        size_t size() const { return entries_.size(); }
        bool empty() const { return entries_.empty(); }

        /// Drop every entry above `size`
        void rewind(size_t size)
        {
            if (size < entries_.size())
                entries_.resize(size);
        }

        void clear() { entries_.clear(); }

        std::vector<Entry>::const_iterator begin() const { return entries_.begin(); }
        std::vector<Entry>::const_iterator end() const { return entries_.end(); }

    private:
        std::vector<Entry> entries_;
    };

} // namespace rill
