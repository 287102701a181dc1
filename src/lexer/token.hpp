#pragma once

#include "../lib/errors/error.hpp"
#include "../lib/types.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace rill
{

    enum class TokenType
    {
        // Literals
        INTEGER_CONSTANT,
        FLOAT_CONSTANT,
        CHAR_CONSTANT,
        STRING_CONSTANT,
        IDENTIFIER,

        // Delimiters
        LEFT_BRACE,    // {
        RIGHT_BRACE,   // }
        LEFT_PAREN,    // (
        RIGHT_PAREN,   // )
        LEFT_BRACKET,  // [
        RIGHT_BRACKET, // ]
        SEMICOLON,     // ;
        COLON,         // :
        DOUBLE_COLON,  // ::
        COMMA,         // ,
        PERIOD,        // .
        MAP_START,     // #{

        // Arithmetic operators
        PLUS,
        UNARY_PLUS,
        MINUS,
        UNARY_MINUS,
        MULTIPLY,
        DIVIDE,
        MODULO,
        POWER_OF, // ~
        LEFT_SHIFT,
        RIGHT_SHIFT,

        // Comparison & logic
        EQUALS, // =
        LESS_THAN,
        GREATER_THAN,
        LESS_THAN_EQUALS_TO,
        GREATER_THAN_EQUALS_TO,
        EQUALS_TO,     // ==
        NOT_EQUALS_TO, // !=
        BANG,
        PIPE,      // |
        OR,        // ||
        XOR,       // ^
        AMPERSAND, // &
        AND,       // &&

        // Compound assignment
        PLUS_ASSIGN,
        MINUS_ASSIGN,
        MULTIPLY_ASSIGN,
        DIVIDE_ASSIGN,
        LEFT_SHIFT_ASSIGN,
        RIGHT_SHIFT_ASSIGN,
        AND_ASSIGN,
        OR_ASSIGN,
        XOR_ASSIGN,
        MODULO_ASSIGN,
        POWER_OF_ASSIGN,

        // Keywords
        TRUE_KW,
        FALSE_KW,
        LET,
        CONST,
        IF,
        ELSE,
        WHILE,
        LOOP,
        FOR,
        IN,
        CONTINUE,
        BREAK,
        RETURN,
        THROW,
        FN,
        PRIVATE,
        IMPORT,
        EXPORT,
        AS,

        // Special
        LEX_ERROR,
        COMMENT,
        RESERVED,
        CUSTOM,
        EOF_TOKEN
    };

    // ---- Keyword functions (reserved names handled by the interpreter) ------

    inline constexpr const char *KEYWORD_PRINT = "print";
    inline constexpr const char *KEYWORD_DEBUG = "debug";
    inline constexpr const char *KEYWORD_TYPE_OF = "type_of";
    inline constexpr const char *KEYWORD_EVAL = "eval";
    inline constexpr const char *KEYWORD_FN_PTR = "Fn";
    inline constexpr const char *KEYWORD_FN_PTR_CALL = "call";
    inline constexpr const char *KEYWORD_FN_PTR_CURRY = "curry";
    inline constexpr const char *KEYWORD_IS_SHARED = "is_shared";
    inline constexpr const char *KEYWORD_THIS = "this";

    /// Fixed syntax of a token kind ("<<=", "while", ...). Empty for kinds whose
    /// syntax comes from their payload.
    std::string syntax(TokenType type);

    struct Token
    {
        TokenType type;
        std::string text; // identifier / string / comment / reserved / custom
        INT intValue = 0;
        FLOAT floatValue = 0.0;
        char32_t charValue = 0;
        std::optional<LexError> error;

        Token(TokenType t = TokenType::EOF_TOKEN) : type(t) {}

        static Token integer(INT v);
        static Token floating(FLOAT v);
        static Token character(char32_t c);
        static Token string(std::string s);
        static Token identifier(std::string s);
        static Token reserved(std::string s);
        static Token custom(std::string s);
        static Token comment(std::string s);
        static Token lexError(LexError e);

        /// Source text of this token; literals render their value.
        std::string syntax() const;

        bool isEof() const { return type == TokenType::EOF_TOKEN; }
        bool isReserved() const { return type == TokenType::RESERVED; }
        bool isCustom() const { return type == TokenType::CUSTOM; }

        /// An active standard keyword.
        bool isKeyword() const;

        bool isOperator() const;

        /// If another operator follows this token, is it unary?
        bool isNextUnary() const;

        /// Binary-operator precedence; 0 means "not a binary operator".
        /// Custom operators take theirs from `custom`.
        uint8_t precedence(const std::map<std::string, uint8_t> *custom = nullptr) const;

        bool isBindRight() const;

        bool operator==(const Token &o) const;
        bool operator!=(const Token &o) const { return !(*this == o); }
    };

    /// Reverse lookup a token from a piece of syntax. Reserved words and the
    /// keyword functions come back as RESERVED tokens.
    std::optional<Token> lookupFromSyntax(const std::string &syntax);

    /// Leading underscores are allowed but an alphabetic character must come
    /// before any digit.
    bool isValidIdentifier(const std::string &name);

    bool isKeywordFunction(const std::string &name);

    /// Keyword functions a script may define a function for.
    bool canOverrideKeyword(const std::string &name);

} // namespace rill
