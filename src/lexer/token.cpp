#include "token.hpp"
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace rill
{

    // ---- Syntax table (add new fixed tokens here) -------------------------------

    namespace
    {
        struct SyntaxEntry
        {
            TokenType type;
            const char *text;
        };

        const std::vector<SyntaxEntry> &syntaxEntries()
        {
            static const std::vector<SyntaxEntry> entries = {
                // Delimiters
                {TokenType::LEFT_BRACE, "{"},
                {TokenType::RIGHT_BRACE, "}"},
                {TokenType::LEFT_PAREN, "("},
                {TokenType::RIGHT_PAREN, ")"},
                {TokenType::LEFT_BRACKET, "["},
                {TokenType::RIGHT_BRACKET, "]"},
                {TokenType::SEMICOLON, ";"},
                {TokenType::COLON, ":"},
                {TokenType::DOUBLE_COLON, "::"},
                {TokenType::COMMA, ","},
                {TokenType::PERIOD, "."},
                {TokenType::MAP_START, "#{"},

                // Operators
                {TokenType::PLUS, "+"},
                {TokenType::MINUS, "-"},
                {TokenType::MULTIPLY, "*"},
                {TokenType::DIVIDE, "/"},
                {TokenType::MODULO, "%"},
                {TokenType::POWER_OF, "~"},
                {TokenType::LEFT_SHIFT, "<<"},
                {TokenType::RIGHT_SHIFT, ">>"},
                {TokenType::EQUALS, "="},
                {TokenType::LESS_THAN, "<"},
                {TokenType::GREATER_THAN, ">"},
                {TokenType::LESS_THAN_EQUALS_TO, "<="},
                {TokenType::GREATER_THAN_EQUALS_TO, ">="},
                {TokenType::EQUALS_TO, "=="},
                {TokenType::NOT_EQUALS_TO, "!="},
                {TokenType::BANG, "!"},
                {TokenType::PIPE, "|"},
                {TokenType::OR, "||"},
                {TokenType::XOR, "^"},
                {TokenType::AMPERSAND, "&"},
                {TokenType::AND, "&&"},

                // Compound assignment
                {TokenType::PLUS_ASSIGN, "+="},
                {TokenType::MINUS_ASSIGN, "-="},
                {TokenType::MULTIPLY_ASSIGN, "*="},
                {TokenType::DIVIDE_ASSIGN, "/="},
                {TokenType::LEFT_SHIFT_ASSIGN, "<<="},
                {TokenType::RIGHT_SHIFT_ASSIGN, ">>="},
                {TokenType::AND_ASSIGN, "&="},
                {TokenType::OR_ASSIGN, "|="},
                {TokenType::XOR_ASSIGN, "^="},
                {TokenType::MODULO_ASSIGN, "%="},
                {TokenType::POWER_OF_ASSIGN, "~="},

                // Keywords
                {TokenType::TRUE_KW, "true"},
                {TokenType::FALSE_KW, "false"},
                {TokenType::LET, "let"},
                {TokenType::CONST, "const"},
                {TokenType::IF, "if"},
                {TokenType::ELSE, "else"},
                {TokenType::WHILE, "while"},
                {TokenType::LOOP, "loop"},
                {TokenType::FOR, "for"},
                {TokenType::IN, "in"},
                {TokenType::CONTINUE, "continue"},
                {TokenType::BREAK, "break"},
                {TokenType::RETURN, "return"},
                {TokenType::THROW, "throw"},
                {TokenType::FN, "fn"},
                {TokenType::PRIVATE, "private"},
                {TokenType::IMPORT, "import"},
                {TokenType::EXPORT, "export"},
                {TokenType::AS, "as"},
            };
            return entries;
        }

        const std::unordered_map<int, std::string> &syntaxByType()
        {
            static const std::unordered_map<int, std::string> map = []()
            {
                std::unordered_map<int, std::string> m;
                for (const auto &e : syntaxEntries())
                    m[(int)e.type] = e.text;
                m[(int)TokenType::UNARY_PLUS] = "+";
                m[(int)TokenType::UNARY_MINUS] = "-";
                m[(int)TokenType::EOF_TOKEN] = "{EOF}";
                return m;
            }();
            return map;
        }

        const std::unordered_map<std::string, TokenType> &typeBySyntax()
        {
            static const std::unordered_map<std::string, TokenType> map = []()
            {
                std::unordered_map<std::string, TokenType> m;
                for (const auto &e : syntaxEntries())
                    m[e.text] = e.type;
                return m;
            }();
            return map;
        }

        /// Symbols and words borrowed from other languages, kept back so they
        /// can produce helpful errors or become custom syntax later.
        const std::unordered_set<std::string> &reservedSymbols()
        {
            static const std::unordered_set<std::string> set = {
                "===", "!==", "->", "<-", "=>", ":=", "::<", "(*", "*)", "#",
                "public", "new", "use", "module", "package", "var", "static",
                "shared", "with", "do", "each", "then", "goto", "exit", "switch",
                "match", "case", "try", "catch", "default", "void", "null", "nil",
                "spawn", "go", "sync", "async", "await", "yield",
                KEYWORD_PRINT, KEYWORD_DEBUG, KEYWORD_TYPE_OF, KEYWORD_EVAL,
                KEYWORD_FN_PTR, KEYWORD_FN_PTR_CALL, KEYWORD_FN_PTR_CURRY,
                KEYWORD_IS_SHARED, KEYWORD_THIS,
            };
            return set;
        }
    } // namespace

    std::string syntax(TokenType type)
    {
        auto it = syntaxByType().find((int)type);
        if (it == syntaxByType().end())
            return "";
        return it->second;
    }

    // ---- Token factories --------------------------------------------------------

    Token Token::integer(INT v)
    {
        Token t(TokenType::INTEGER_CONSTANT);
        t.intValue = v;
        return t;
    }

    Token Token::floating(FLOAT v)
    {
        Token t(TokenType::FLOAT_CONSTANT);
        t.floatValue = v;
        return t;
    }

    Token Token::character(char32_t c)
    {
        Token t(TokenType::CHAR_CONSTANT);
        t.charValue = c;
        return t;
    }

    Token Token::string(std::string s)
    {
        Token t(TokenType::STRING_CONSTANT);
        t.text = std::move(s);
        return t;
    }

    Token Token::identifier(std::string s)
    {
        Token t(TokenType::IDENTIFIER);
        t.text = std::move(s);
        return t;
    }

    Token Token::reserved(std::string s)
    {
        Token t(TokenType::RESERVED);
        t.text = std::move(s);
        return t;
    }

    Token Token::custom(std::string s)
    {
        Token t(TokenType::CUSTOM);
        t.text = std::move(s);
        return t;
    }

    Token Token::comment(std::string s)
    {
        Token t(TokenType::COMMENT);
        t.text = std::move(s);
        return t;
    }

    Token Token::lexError(LexError e)
    {
        Token t(TokenType::LEX_ERROR);
        t.error = std::move(e);
        return t;
    }

    // ---- Queries ----------------------------------------------------------------

    std::string Token::syntax() const
    {
        switch (type)
        {
        case TokenType::INTEGER_CONSTANT:
            return std::to_string(intValue);
        case TokenType::FLOAT_CONSTANT:
            return formatFloat(floatValue);
        case TokenType::CHAR_CONSTANT:
            return toUtf8(charValue);
        case TokenType::STRING_CONSTANT:
            return "string";
        case TokenType::IDENTIFIER:
        case TokenType::RESERVED:
        case TokenType::CUSTOM:
        case TokenType::COMMENT:
            return text;
        case TokenType::LEX_ERROR:
            return error ? error->message() : "";
        default:
            return rill::syntax(type);
        }
    }

    bool Token::isKeyword() const
    {
        switch (type)
        {
        case TokenType::TRUE_KW:
        case TokenType::FALSE_KW:
        case TokenType::LET:
        case TokenType::CONST:
        case TokenType::IF:
        case TokenType::ELSE:
        case TokenType::WHILE:
        case TokenType::LOOP:
        case TokenType::FOR:
        case TokenType::IN:
        case TokenType::CONTINUE:
        case TokenType::BREAK:
        case TokenType::RETURN:
        case TokenType::THROW:
        case TokenType::FN:
        case TokenType::PRIVATE:
        case TokenType::IMPORT:
        case TokenType::EXPORT:
        case TokenType::AS:
            return true;
        default:
            return false;
        }
    }

    bool Token::isOperator() const
    {
        switch (type)
        {
        case TokenType::LEFT_BRACE:
        case TokenType::RIGHT_BRACE:
        case TokenType::LEFT_PAREN:
        case TokenType::RIGHT_PAREN:
        case TokenType::LEFT_BRACKET:
        case TokenType::RIGHT_BRACKET:
        case TokenType::PLUS:
        case TokenType::UNARY_PLUS:
        case TokenType::MINUS:
        case TokenType::UNARY_MINUS:
        case TokenType::MULTIPLY:
        case TokenType::DIVIDE:
        case TokenType::MODULO:
        case TokenType::POWER_OF:
        case TokenType::LEFT_SHIFT:
        case TokenType::RIGHT_SHIFT:
        case TokenType::SEMICOLON:
        case TokenType::COLON:
        case TokenType::DOUBLE_COLON:
        case TokenType::COMMA:
        case TokenType::PERIOD:
        case TokenType::MAP_START:
        case TokenType::EQUALS:
        case TokenType::LESS_THAN:
        case TokenType::GREATER_THAN:
        case TokenType::LESS_THAN_EQUALS_TO:
        case TokenType::GREATER_THAN_EQUALS_TO:
        case TokenType::EQUALS_TO:
        case TokenType::NOT_EQUALS_TO:
        case TokenType::BANG:
        case TokenType::PIPE:
        case TokenType::OR:
        case TokenType::XOR:
        case TokenType::AMPERSAND:
        case TokenType::AND:
        case TokenType::PLUS_ASSIGN:
        case TokenType::MINUS_ASSIGN:
        case TokenType::MULTIPLY_ASSIGN:
        case TokenType::DIVIDE_ASSIGN:
        case TokenType::LEFT_SHIFT_ASSIGN:
        case TokenType::RIGHT_SHIFT_ASSIGN:
        case TokenType::AND_ASSIGN:
        case TokenType::OR_ASSIGN:
        case TokenType::XOR_ASSIGN:
        case TokenType::MODULO_ASSIGN:
        case TokenType::POWER_OF_ASSIGN:
            return true;
        default:
            return false;
        }
    }

    bool Token::isNextUnary() const
    {
        switch (type)
        {
        case TokenType::LEX_ERROR:
        case TokenType::LEFT_BRACE:   // {-expr}
        case TokenType::LEFT_PAREN:   // (-expr)
        case TokenType::LEFT_BRACKET: // [-expr]
        case TokenType::PLUS:
        case TokenType::UNARY_PLUS:
        case TokenType::MINUS:
        case TokenType::UNARY_MINUS:
        case TokenType::MULTIPLY:
        case TokenType::DIVIDE:
        case TokenType::COMMA:
        case TokenType::PERIOD:
        case TokenType::EQUALS:
        case TokenType::LESS_THAN:
        case TokenType::GREATER_THAN:
        case TokenType::BANG:
        case TokenType::LESS_THAN_EQUALS_TO:
        case TokenType::GREATER_THAN_EQUALS_TO:
        case TokenType::EQUALS_TO:
        case TokenType::NOT_EQUALS_TO:
        case TokenType::PIPE:
        case TokenType::OR:
        case TokenType::AMPERSAND:
        case TokenType::AND:
        case TokenType::IF:
        case TokenType::WHILE:
        case TokenType::PLUS_ASSIGN:
        case TokenType::MINUS_ASSIGN:
        case TokenType::MULTIPLY_ASSIGN:
        case TokenType::DIVIDE_ASSIGN:
        case TokenType::LEFT_SHIFT_ASSIGN:
        case TokenType::RIGHT_SHIFT_ASSIGN:
        case TokenType::AND_ASSIGN:
        case TokenType::OR_ASSIGN:
        case TokenType::XOR_ASSIGN:
        case TokenType::LEFT_SHIFT:
        case TokenType::RIGHT_SHIFT:
        case TokenType::XOR:
        case TokenType::MODULO:
        case TokenType::MODULO_ASSIGN:
        case TokenType::RETURN:
        case TokenType::THROW:
        case TokenType::POWER_OF:
        case TokenType::IN:
        case TokenType::POWER_OF_ASSIGN:
            return true;
        default:
            return false;
        }
    }

    uint8_t Token::precedence(const std::map<std::string, uint8_t> *custom) const
    {
        switch (type)
        {
        case TokenType::OR:
        case TokenType::XOR:
        case TokenType::PIPE:
            return 30;
        case TokenType::AND:
        case TokenType::AMPERSAND:
            return 60;
        case TokenType::EQUALS_TO:
        case TokenType::NOT_EQUALS_TO:
            return 90;
        case TokenType::LESS_THAN:
        case TokenType::LESS_THAN_EQUALS_TO:
        case TokenType::GREATER_THAN:
        case TokenType::GREATER_THAN_EQUALS_TO:
            return 110;
        case TokenType::IN:
            return 130;
        case TokenType::PLUS:
        case TokenType::MINUS:
            return 150;
        case TokenType::DIVIDE:
        case TokenType::MULTIPLY:
        case TokenType::POWER_OF:
        case TokenType::MODULO:
            return 180;
        case TokenType::LEFT_SHIFT:
        case TokenType::RIGHT_SHIFT:
            return 210;
        case TokenType::PERIOD:
            return 240;
        case TokenType::CUSTOM:
        {
            if (!custom)
                return 0;
            auto it = custom->find(text);
            return it == custom->end() ? 0 : it->second;
        }
        default:
            // Assignments are not expressions
            return 0;
        }
    }

    bool Token::isBindRight() const
    {
        switch (type)
        {
        case TokenType::EQUALS:
        case TokenType::PLUS_ASSIGN:
        case TokenType::MINUS_ASSIGN:
        case TokenType::MULTIPLY_ASSIGN:
        case TokenType::DIVIDE_ASSIGN:
        case TokenType::LEFT_SHIFT_ASSIGN:
        case TokenType::RIGHT_SHIFT_ASSIGN:
        case TokenType::AND_ASSIGN:
        case TokenType::OR_ASSIGN:
        case TokenType::XOR_ASSIGN:
        case TokenType::MODULO_ASSIGN:
        case TokenType::POWER_OF_ASSIGN:
        case TokenType::PERIOD:
            return true;
        default:
            return false;
        }
    }

    bool Token::operator==(const Token &o) const
    {
        if (type != o.type)
            return false;
        switch (type)
        {
        case TokenType::INTEGER_CONSTANT:
            return intValue == o.intValue;
        case TokenType::FLOAT_CONSTANT:
            return floatValue == o.floatValue;
        case TokenType::CHAR_CONSTANT:
            return charValue == o.charValue;
        case TokenType::LEX_ERROR:
            return error == o.error;
        default:
            return text == o.text;
        }
    }

    // ---- Free functions ---------------------------------------------------------

    std::optional<Token> lookupFromSyntax(const std::string &text)
    {
        auto it = typeBySyntax().find(text);
        if (it != typeBySyntax().end())
            return Token(it->second);
        if (reservedSymbols().count(text))
            return Token::reserved(text);
        return std::nullopt;
    }

    bool isValidIdentifier(const std::string &name)
    {
        bool firstAlphabetic = false;
        for (char c : name)
        {
            if (c == '_')
                continue;
            if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'))
                firstAlphabetic = true;
            else if (!firstAlphabetic)
                return false;
            else if (!(c >= '0' && c <= '9'))
                return false;
        }
        return firstAlphabetic;
    }

    bool isKeywordFunction(const std::string &name)
    {
        return name == KEYWORD_PRINT || name == KEYWORD_DEBUG || name == KEYWORD_TYPE_OF ||
               name == KEYWORD_EVAL || name == KEYWORD_FN_PTR || name == KEYWORD_FN_PTR_CALL ||
               name == KEYWORD_FN_PTR_CURRY || name == KEYWORD_IS_SHARED;
    }

    bool canOverrideKeyword(const std::string &name)
    {
        return name == KEYWORD_PRINT || name == KEYWORD_DEBUG || name == KEYWORD_TYPE_OF ||
               name == KEYWORD_EVAL || name == KEYWORD_FN_PTR;
    }

} // namespace rill
