#pragma once

// =============================================================================
// EvalResult<T>: a value or a RillError, handed across the host boundary
// =============================================================================
//
// Inside the engine errors travel as exceptions. Every Engine entry point
// catches them and returns an EvalResult instead, so hosts inspect failures
// as data:
//
//     auto r = engine.eval<INT>("40 + 2");
//     if (!r) std::cerr << r.error().what();
//
// Native functions registered through registerResultFn return EvalResult as
// well; an error result is raised again on the script side.
//
// =============================================================================

#include "error.hpp"
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

namespace rill
{

    /// Copy an in-flight error, keeping its ParseError-ness.
    inline std::shared_ptr<const RillError> captureError(const RillError &e)
    {
        if (auto *pe = dynamic_cast<const ParseError *>(&e))
            return std::make_shared<ParseError>(*pe);
        return std::make_shared<RillError>(e);
    }

    template <typename T>
    class EvalResult
    {
    public:
        EvalResult(T value) : value_(std::move(value)) {}
        EvalResult(std::shared_ptr<const RillError> error) : error_(std::move(error)) {}
        EvalResult(const RillError &error) : error_(captureError(error)) {}

        bool ok() const noexcept { return error_ == nullptr; }
        explicit operator bool() const noexcept { return ok(); }

        const T &value() const &
        {
            check();
            return *value_;
        }

        T &value() &
        {
            check();
            return *value_;
        }

        T &&value() &&
        {
            check();
            return std::move(*value_);
        }

        T valueOr(T fallback) const
        {
            return ok() ? *value_ : std::move(fallback);
        }

        const RillError &error() const
        {
            if (!error_)
                throw std::logic_error("EvalResult holds a value, not an error");
            return *error_;
        }

        const std::shared_ptr<const RillError> &errorPtr() const noexcept { return error_; }

        ErrorKind kind() const { return error().kind(); }

        /// Re-raise the held error inside the engine.
        [[noreturn]] void raise() const
        {
            if (auto *pe = dynamic_cast<const ParseError *>(error_.get()))
                throw *pe;
            throw error();
        }

    private:
        std::optional<T> value_;
        std::shared_ptr<const RillError> error_;

        void check() const
        {
            if (error_)
                throw std::logic_error(std::string("EvalResult holds an error: ") + error_->what());
        }
    };

} // namespace rill
