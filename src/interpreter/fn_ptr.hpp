#pragma once

// =============================================================================
// FnPtr: a function name plus curried arguments
// =============================================================================
//
// Created by `Fn("name")`, by a closure literal (name "anon$<id>", captured
// variables as the leading curried arguments) or by `curry`. Calling an FnPtr
// passes the curried values first, then the call-site arguments.
//
// =============================================================================

#include "dynamic.hpp"
#include <string>
#include <vector>

namespace rill
{

    /// Prefix of the functions generated for closure literals
    inline constexpr const char *ANONYMOUS_FN_PREFIX = "anon$";

    class FnPtr
    {
    public:
        explicit FnPtr(std::string name, std::vector<Dynamic> curry = {})
            : name_(std::move(name)), curry_(std::move(curry)) {}

        /// Checked construction for `Fn("name")`: the name must be a valid
        /// identifier and not a keyword. Throws FunctionNotFoundError.
        static FnPtr create(const std::string &name, Position pos);

        const std::string &fnName() const { return name_; }
        const std::vector<Dynamic> &curry() const { return curry_; }

        bool isAnonymous() const;

        /// Appends to the existing curried arguments; never replaces them.
        void addCurry(std::vector<Dynamic> values);

        /// A copy of this pointer with more curried arguments.
        FnPtr curried(std::vector<Dynamic> values) const;

        std::string toString() const { return "Fn(" + name_ + ")"; }

        bool operator==(const FnPtr &o) const;
        bool operator!=(const FnPtr &o) const { return !(*this == o); }

    private:
        std::string name_;
        std::vector<Dynamic> curry_;
    };

} // namespace rill
