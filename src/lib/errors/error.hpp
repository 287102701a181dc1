#pragma once

// =============================================================================
// Rill Error Hierarchy
// =============================================================================
// Lexical errors are plain data (LexError) carried inside LEX_ERROR tokens, so
// the lexer never throws. Everything past the lexer inherits from RillError,
// which inherits from std::runtime_error, so a single `catch (RillError&)`
// catches any Rill-specific error. Each subclass carries an ErrorKind and the
// source Position where the error occurred (Position::none() for errors that
// originate in native code).
//
// Exceptions stay inside the engine: Engine entry points convert them into
// EvalResult values (see result.hpp).
// =============================================================================

#include "../../lexer/position.hpp"
#include <cstddef>
#include <stdexcept>
#include <string>

namespace rill
{

    // ========================================================================
    // Lexical errors (data, not exceptions)
    // ========================================================================

    enum class LexErrorType
    {
        UNEXPECTED_INPUT,
        UNTERMINATED_STRING,
        STRING_TOO_LONG,
        MALFORMED_ESCAPE_SEQUENCE,
        MALFORMED_NUMBER,
        MALFORMED_CHAR,
        MALFORMED_IDENTIFIER,
        IMPROPER_SYMBOL,
    };

    struct LexError
    {
        LexErrorType type;
        std::string text; // offending input, or the full message for IMPROPER_SYMBOL
        size_t limit = 0; // STRING_TOO_LONG only

        LexError(LexErrorType t, std::string s = "", size_t lim = 0)
            : type(t), text(std::move(s)), limit(lim) {}

        std::string message() const
        {
            switch (type)
            {
            case LexErrorType::UNEXPECTED_INPUT:
                return "Unexpected '" + text + "'";
            case LexErrorType::UNTERMINATED_STRING:
                return "Open string is not terminated";
            case LexErrorType::STRING_TOO_LONG:
                return "Length of string literal exceeds the maximum limit (" +
                       std::to_string(limit) + ")";
            case LexErrorType::MALFORMED_ESCAPE_SEQUENCE:
                return "Invalid escape sequence: '" + text + "'";
            case LexErrorType::MALFORMED_NUMBER:
                return "Invalid number: '" + text + "'";
            case LexErrorType::MALFORMED_CHAR:
                return "Invalid character: '" + text + "'";
            case LexErrorType::MALFORMED_IDENTIFIER:
                return "Variable name is not proper: '" + text + "'";
            case LexErrorType::IMPROPER_SYMBOL:
                return text;
            }
            return text;
        }

        bool operator==(const LexError &o) const
        {
            return type == o.type && text == o.text && limit == o.limit;
        }
        bool operator!=(const LexError &o) const { return !(*this == o); }
    };

    // ========================================================================
    // ErrorKind: the tag every RillError carries
    // ========================================================================

    enum class ErrorKind
    {
        PARSING,
        FUNCTION_NOT_FOUND,
        MODULE_NOT_FOUND,
        VARIABLE_NOT_FOUND,
        MISMATCHED_TYPE,
        DATA_RACE,
        ARITHMETIC,
        INDEXING,
        ASSIGNMENT_TO_CONSTANT,
        TOO_MANY_OPERATIONS,
        STACK_OVERFLOW,
        DATA_TOO_LARGE,
        TERMINATED,
        RUNTIME,
    };

    // ========================================================================
    // Base: RillError
    // ========================================================================
    // Standardised "Category: message (line L, position P)" format.
    // ========================================================================

    class RillError : public std::runtime_error
    {
    public:
        RillError(ErrorKind kind, const std::string &category, const std::string &message,
                  Position pos)
            : std::runtime_error(formatMessage(category, message, pos)),
              kind_(kind), category_(category), detail_(message), pos_(pos) {}

        ErrorKind kind() const noexcept { return kind_; }
        const std::string &category() const noexcept { return category_; }
        const std::string &detail() const noexcept { return detail_; }
        Position position() const noexcept { return pos_; }

        /// Same error, reported at `pos` (used for errors raised by native
        /// code, which has no source position of its own).
        RillError withPosition(Position pos) const
        {
            return RillError(kind_, category_, detail_, pos);
        }

    private:
        ErrorKind kind_;
        std::string category_;
        std::string detail_;
        Position pos_;

        static std::string formatMessage(const std::string &category,
                                         const std::string &message, Position pos)
        {
            std::string out = category + ": " + message;
            if (!pos.isNone())
                out += " (" + pos.toString() + ")";
            return out;
        }
    };

    // ========================================================================
    // 1. Parse errors
    // ========================================================================

    enum class ParseErrorType
    {
        BAD_INPUT,
        UNEXPECTED_EOF,
        UNKNOWN_OPERATOR,
        MISSING_TOKEN,
        MALFORMED_CALL_EXPR,
        MALFORMED_INDEX_EXPR,
        DUPLICATED_PROPERTY,
        PROPERTY_EXPECTED,
        VARIABLE_EXPECTED,
        EXPR_EXPECTED,
        WRONG_FN_DEFINITION,
        FN_MISSING_NAME,
        FN_MISSING_PARAMS,
        FN_DUPLICATED_PARAM,
        FN_MISSING_BODY,
        FN_DUPLICATED_DEFINITION,
        WRONG_EXPORT,
        DUPLICATED_EXPORT,
        ASSIGNMENT_TO_INVALID_LHS,
        LOOP_BREAK,
        EXPR_TOO_DEEP,
    };

    /// Unexpected token, missing delimiter, malformed definition. A lex error
    /// reaching the parser becomes a BAD_INPUT ParseError.
    class ParseError : public RillError
    {
    public:
        ParseError(ParseErrorType type, const std::string &message, Position pos)
            : RillError(ErrorKind::PARSING, "ParseError", message, pos), type_(type) {}

        ParseErrorType type() const noexcept { return type_; }

    private:
        ParseErrorType type_;
    };

    // ========================================================================
    // 2. Evaluation errors
    // ========================================================================

    // ---- 2a. Name resolution ------------------------------------------------

    /// No function matches the name and argument signature. The detail is the
    /// attempted signature, e.g. "add (i64, string)".
    class FunctionNotFoundError : public RillError
    {
    public:
        FunctionNotFoundError(const std::string &signature, Position pos)
            : RillError(ErrorKind::FUNCTION_NOT_FOUND, "FunctionNotFound", signature, pos) {}
    };

    class VariableNotFoundError : public RillError
    {
    public:
        VariableNotFoundError(const std::string &name, Position pos)
            : RillError(ErrorKind::VARIABLE_NOT_FOUND, "VariableNotFound", name, pos) {}
    };

    /// Import path or namespace alias not found.
    class ModuleNotFoundError : public RillError
    {
    public:
        ModuleNotFoundError(const std::string &path, Position pos)
            : RillError(ErrorKind::MODULE_NOT_FOUND, "ModuleNotFound", path, pos) {}
    };

    // ---- 2b. Types ----------------------------------------------------------

    class MismatchedTypeError : public RillError
    {
    public:
        MismatchedTypeError(const std::string &expected, const std::string &actual, Position pos)
            : RillError(ErrorKind::MISMATCHED_TYPE, "MismatchedType",
                        "expected " + expected + ", got " + actual, pos) {}
    };

    // ---- 2c. Shared values --------------------------------------------------

    /// A shared value was accessed while another access still holds its lock.
    class DataRaceError : public RillError
    {
    public:
        DataRaceError(const std::string &name, Position pos)
            : RillError(ErrorKind::DATA_RACE, "DataRace",
                        name.empty() ? "shared value is already locked"
                                     : "'" + name + "' is already locked",
                        pos) {}
    };

    // ---- 2d. Arithmetic -----------------------------------------------------

    /// Overflow, division by zero or negative shift under checked arithmetic.
    class ArithmeticError : public RillError
    {
    public:
        ArithmeticError(const std::string &message, Position pos)
            : RillError(ErrorKind::ARITHMETIC, "ArithmeticError", message, pos) {}
    };

    // ---- 2e. Collection access ----------------------------------------------

    class IndexError : public RillError
    {
    public:
        IndexError(const std::string &message, Position pos)
            : RillError(ErrorKind::INDEXING, "IndexError", message, pos) {}
    };

    // ---- 2f. Assignment -----------------------------------------------------

    class AssignmentToConstantError : public RillError
    {
    public:
        AssignmentToConstantError(const std::string &name, Position pos)
            : RillError(ErrorKind::ASSIGNMENT_TO_CONSTANT, "AssignmentToConstant",
                        "cannot modify constant '" + name + "'", pos) {}
    };

    // ---- 2g. Limits ---------------------------------------------------------

    class TooManyOperationsError : public RillError
    {
    public:
        explicit TooManyOperationsError(Position pos)
            : RillError(ErrorKind::TOO_MANY_OPERATIONS, "TooManyOperations",
                        "too many operations", pos) {}
    };

    /// Maximum call depth exceeded.
    class StackOverflowError : public RillError
    {
    public:
        StackOverflowError(size_t depth, Position pos)
            : RillError(ErrorKind::STACK_OVERFLOW, "StackOverflow",
                        "maximum call depth (" + std::to_string(depth) + ") exceeded", pos) {}
    };

    class DataTooLargeError : public RillError
    {
    public:
        DataTooLargeError(const std::string &what, size_t limit, Position pos)
            : RillError(ErrorKind::DATA_TOO_LARGE, "DataTooLarge",
                        what + " exceeds the maximum limit (" + std::to_string(limit) + ")", pos) {}
    };

    /// The progress callback asked for the run to stop.
    class TerminatedError : public RillError
    {
    public:
        explicit TerminatedError(Position pos)
            : RillError(ErrorKind::TERMINATED, "Terminated", "script terminated", pos) {}
    };

    // ---- 2h. Everything else ------------------------------------------------

    /// Script `throw`, native failures, and situations that don't fit other
    /// categories.
    class RuntimeError : public RillError
    {
    public:
        RuntimeError(const std::string &message, Position pos)
            : RillError(ErrorKind::RUNTIME, "RuntimeError", message, pos) {}
    };

} // namespace rill
