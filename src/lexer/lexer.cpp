#include "lexer.hpp"
#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <limits>

namespace rill
{

    // ---- MultiInputStream -------------------------------------------------------

    MultiInputStream::MultiInputStream(std::vector<std::string> inputs)
        : inputs_(std::move(inputs)) {}

    bool MultiInputStream::skipExhausted()
    {
        while (index_ < inputs_.size() && offset_ >= inputs_[index_].size())
        {
            index_++;
            offset_ = 0;
        }
        return index_ < inputs_.size();
    }

    std::optional<char32_t> MultiInputStream::getNext()
    {
        if (!skipExhausted())
            return std::nullopt;
        return decodeUtf8(inputs_[index_], offset_);
    }

    std::optional<char32_t> MultiInputStream::peekNext()
    {
        if (!skipExhausted())
            return std::nullopt;
        size_t probe = offset_;
        return decodeUtf8(inputs_[index_], probe);
    }

    // ---- Character helpers ------------------------------------------------------

    namespace
    {
        bool isDigit(char32_t c) { return c >= '0' && c <= '9'; }

        bool isAlpha(char32_t c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }

        bool isIdContinue(char32_t c) { return isAlpha(c) || isDigit(c) || c == '_'; }

        bool isHexChar(char32_t c)
        {
            return isDigit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        }

        bool isOctalChar(char32_t c) { return c >= '0' && c <= '7'; }

        bool isBinaryChar(char32_t c) { return c == '0' || c == '1'; }

        int hexValue(char32_t c)
        {
            if (isDigit(c))
                return static_cast<int>(c - '0');
            if (c >= 'a' && c <= 'f')
                return static_cast<int>(c - 'a' + 10);
            if (c >= 'A' && c <= 'F')
                return static_cast<int>(c - 'A' + 10);
            return -1;
        }

        bool isWhitespace(char32_t c)
        {
            switch (c)
            {
            case ' ':
            case '\t':
            case '\r':
            case '\v':
            case '\f':
            case 0x85:
            case 0xA0:
            case 0x1680:
            case 0x2028:
            case 0x2029:
            case 0x202F:
            case 0x205F:
            case 0x3000:
                return true;
            default:
                return c >= 0x2000 && c <= 0x200A;
            }
        }

        std::optional<char32_t> eatNext(InputStream &stream, Position &pos)
        {
            pos.advance();
            return stream.getNext();
        }

        // ---- Comments ---------------------------------------------------------

        void scanComment(InputStream &stream, TokenizeState &state, Position &pos,
                         std::string &comment)
        {
            while (auto next = stream.getNext())
            {
                char32_t c = *next;
                pos.advance();

                if (state.includeComments)
                    appendUtf8(comment, c);

                if (c == '/' || c == '*')
                {
                    if (auto c2 = stream.getNext())
                    {
                        if (state.includeComments)
                            appendUtf8(comment, *c2);
                        if (c == '/' && *c2 == '*')
                            state.commentLevel++;
                        else if (c == '*' && *c2 == '/')
                            state.commentLevel--;
                    }
                    pos.advance();
                }
                else if (c == '\n')
                {
                    pos.newLine();
                }

                if (state.commentLevel == 0)
                    break;
            }
        }

        // ---- Numbers ----------------------------------------------------------

        /// Magnitude of a radix literal; nullopt on an empty digit run, a
        /// stray character, or a value that does not fit INT.
        std::optional<INT> parseRadix(const std::string &digits, int radix, bool negated)
        {
            if (digits.empty())
                return std::nullopt;

            const uint64_t limit = negated
                                       ? static_cast<uint64_t>(std::numeric_limits<INT>::max()) + 1
                                       : static_cast<uint64_t>(std::numeric_limits<INT>::max());
            uint64_t value = 0;
            for (char ch : digits)
            {
                int d = hexValue(static_cast<char32_t>(ch));
                if (d < 0 || d >= radix)
                    return std::nullopt;
                if (value > (limit - d) / radix)
                    return std::nullopt;
                value = value * radix + d;
            }

            if (negated)
                return value == limit ? std::numeric_limits<INT>::min() : -static_cast<INT>(value);
            return static_cast<INT>(value);
        }

        TokenWithPos readNumber(InputStream &stream, Position &pos, Position startPos,
                                char32_t first, bool negated)
        {
            std::string result(1, static_cast<char>(first));
            int radix = 0;

            while (auto peeked = stream.peekNext())
            {
                char32_t next = *peeked;
                if (isDigit(next) || next == '_')
                {
                    result += static_cast<char>(next);
                    eatNext(stream, pos);
                }
                else if (next == '.')
                {
                    result += '.';
                    eatNext(stream, pos);
                    while (auto inFloat = stream.peekNext())
                    {
                        if (!isDigit(*inFloat) && *inFloat != '_')
                            break;
                        result += static_cast<char>(*inFloat);
                        eatNext(stream, pos);
                    }
                }
                else if (first == '0' && (next == 'x' || next == 'X' || next == 'o' ||
                                          next == 'O' || next == 'b' || next == 'B'))
                {
                    // 0x????, 0o????, 0b????
                    result += static_cast<char>(next);
                    eatNext(stream, pos);

                    bool (*valid)(char32_t) = nullptr;
                    switch (next)
                    {
                    case 'x':
                    case 'X':
                        valid = isHexChar;
                        radix = 16;
                        break;
                    case 'o':
                    case 'O':
                        valid = isOctalChar;
                        radix = 8;
                        break;
                    default:
                        valid = isBinaryChar;
                        radix = 2;
                        break;
                    }

                    while (auto inRadix = stream.peekNext())
                    {
                        if (!valid(*inRadix) && *inRadix != '_')
                            break;
                        result += static_cast<char>(*inRadix);
                        eatNext(stream, pos);
                    }

                    // The literal ends at the first digit outside the radix
                    break;
                }
                else
                {
                    break;
                }
            }

            std::string raw = negated ? "-" + result : result;
            auto malformed = [&]()
            {
                return TokenWithPos{Token::lexError(LexError(LexErrorType::MALFORMED_NUMBER, raw)),
                                    startPos};
            };

            if (radix != 0)
            {
                std::string digits;
                for (size_t i = 2; i < result.size(); i++)
                    if (result[i] != '_')
                        digits += result[i];

                auto value = parseRadix(digits, radix, negated);
                if (!value)
                    return malformed();
                return {Token::integer(*value), startPos};
            }

            std::string out = negated ? "-" : "";
            for (char ch : result)
                if (ch != '_')
                    out += ch;

            INT intValue = 0;
            auto [end, ec] = std::from_chars(out.data(), out.data() + out.size(), intValue);
            if (ec == std::errc() && end == out.data() + out.size())
                return {Token::integer(intValue), startPos};

            // Not an integer; try a float instead
            errno = 0;
            char *floatEnd = nullptr;
            double floatValue = std::strtod(out.c_str(), &floatEnd);
            if (!out.empty() && floatEnd == out.c_str() + out.size() && errno != ERANGE)
                return {Token::floating(floatValue), startPos};

            return malformed();
        }

        // ---- Identifiers ------------------------------------------------------

        TokenWithPos readIdentifier(InputStream &stream, Position &pos, Position startPos,
                                    char32_t first)
        {
            std::string result(1, static_cast<char>(first));

            while (auto peeked = stream.peekNext())
            {
                if (!isIdContinue(*peeked))
                    break;
                result += static_cast<char>(*peeked);
                eatNext(stream, pos);
            }

            if (!isValidIdentifier(result))
                return {Token::lexError(LexError(LexErrorType::MALFORMED_IDENTIFIER, result)), startPos};

            if (auto token = lookupFromSyntax(result))
                return {*token, startPos};
            return {Token::identifier(result), startPos};
        }

        // ---- The state machine ------------------------------------------------

        std::optional<TokenWithPos> getNextTokenInner(InputStream &stream, TokenizeState &state,
                                                      Position &pos)
        {
            // Still inside a block comment from the previous call?
            if (state.commentLevel > 0)
            {
                Position startPos = pos;
                std::string comment;
                scanComment(stream, state, pos, comment);

                if (state.includeComments)
                    return TokenWithPos{Token::comment(comment), startPos};
            }

            bool negated = false;

            while (auto got = stream.getNext())
            {
                char32_t c = *got;
                pos.advance();

                Position startPos = pos;
                char32_t peek = stream.peekNext().value_or(0);

                auto single = [&](TokenType t) -> std::optional<TokenWithPos>
                { return TokenWithPos{Token(t), startPos}; };

                // Two-character token: consumes the peeked character.
                auto pair = [&](TokenType t) -> std::optional<TokenWithPos>
                {
                    eatNext(stream, pos);
                    return TokenWithPos{Token(t), startPos};
                };

                auto reserved = [&](const char *s) -> std::optional<TokenWithPos>
                { return TokenWithPos{Token::reserved(s), startPos}; };

                if (c == '\n')
                {
                    pos.newLine();
                    continue;
                }

                if (isDigit(c))
                    return readNumber(stream, pos, startPos, c, negated);

                if (isAlpha(c) || c == '_')
                    return readIdentifier(stream, pos, startPos, c);

                switch (c)
                {
                // " - string literal
                case '"':
                {
                    std::string out;
                    if (auto err = parseStringLiteral(stream, state, pos, '"', out))
                        return TokenWithPos{Token::lexError(*err), pos};
                    return TokenWithPos{Token::string(out), startPos};
                }

                // ' - character literal
                case '\'':
                {
                    if (peek == '\'')
                        return TokenWithPos{Token::lexError(LexError(LexErrorType::MALFORMED_CHAR, "")),
                                            startPos};

                    std::string out;
                    if (auto err = parseStringLiteral(stream, state, pos, '\'', out))
                        return TokenWithPos{Token::lexError(*err), pos};

                    size_t i = 0;
                    char32_t ch = decodeUtf8(out, i);
                    if (i < out.size())
                        return TokenWithPos{Token::lexError(LexError(LexErrorType::MALFORMED_CHAR, out)),
                                            startPos};
                    return TokenWithPos{Token::character(ch), startPos};
                }

                // Braces, parentheses, brackets
                case '{':
                    return single(TokenType::LEFT_BRACE);
                case '}':
                    return single(TokenType::RIGHT_BRACE);
                case '(':
                    if (peek == '*')
                    {
                        eatNext(stream, pos);
                        return reserved("(*");
                    }
                    return single(TokenType::LEFT_PAREN);
                case ')':
                    return single(TokenType::RIGHT_PAREN);
                case '[':
                    return single(TokenType::LEFT_BRACKET);
                case ']':
                    return single(TokenType::RIGHT_BRACKET);

                // Map literal
                case '#':
                    if (peek == '{')
                        return pair(TokenType::MAP_START);
                    return reserved("#");

                // Operators
                case '+':
                    if (peek == '=')
                        return pair(TokenType::PLUS_ASSIGN);
                    return single(state.nonUnary ? TokenType::PLUS : TokenType::UNARY_PLUS);

                case '-':
                    if (isDigit(peek))
                    {
                        if (!state.nonUnary)
                        {
                            // Fold the sign into the number literal that follows
                            negated = true;
                            continue;
                        }
                        return single(TokenType::MINUS);
                    }
                    if (peek == '=')
                        return pair(TokenType::MINUS_ASSIGN);
                    if (peek == '>')
                    {
                        eatNext(stream, pos);
                        return reserved("->");
                    }
                    return single(state.nonUnary ? TokenType::MINUS : TokenType::UNARY_MINUS);

                case '*':
                    if (peek == ')')
                    {
                        eatNext(stream, pos);
                        return reserved("*)");
                    }
                    if (peek == '=')
                        return pair(TokenType::MULTIPLY_ASSIGN);
                    return single(TokenType::MULTIPLY);

                // Comments
                case '/':
                    if (peek == '/')
                    {
                        eatNext(stream, pos);
                        std::string comment = state.includeComments ? "//" : "";

                        while (auto ch = stream.getNext())
                        {
                            if (*ch == '\n')
                            {
                                pos.newLine();
                                break;
                            }
                            if (state.includeComments)
                                appendUtf8(comment, *ch);
                            pos.advance();
                        }

                        if (state.includeComments)
                            return TokenWithPos{Token::comment(comment), startPos};
                        continue;
                    }
                    if (peek == '*')
                    {
                        state.commentLevel = 1;
                        eatNext(stream, pos);

                        std::string comment = state.includeComments ? "/*" : "";
                        scanComment(stream, state, pos, comment);

                        if (state.includeComments)
                            return TokenWithPos{Token::comment(comment), startPos};
                        continue;
                    }
                    if (peek == '=')
                        return pair(TokenType::DIVIDE_ASSIGN);
                    return single(TokenType::DIVIDE);

                case ';':
                    return single(TokenType::SEMICOLON);
                case ',':
                    return single(TokenType::COMMA);
                case '.':
                    return single(TokenType::PERIOD);

                case '=':
                    if (peek == '=')
                    {
                        eatNext(stream, pos);
                        // Warn against `===`
                        if (stream.peekNext() == U'=')
                        {
                            eatNext(stream, pos);
                            return reserved("===");
                        }
                        return single(TokenType::EQUALS_TO);
                    }
                    if (peek == '>')
                    {
                        eatNext(stream, pos);
                        return reserved("=>");
                    }
                    return single(TokenType::EQUALS);

                case ':':
                    if (peek == ':')
                    {
                        eatNext(stream, pos);
                        if (stream.peekNext() == U'<')
                        {
                            eatNext(stream, pos);
                            return reserved("::<");
                        }
                        return single(TokenType::DOUBLE_COLON);
                    }
                    if (peek == '=')
                    {
                        eatNext(stream, pos);
                        return reserved(":=");
                    }
                    return single(TokenType::COLON);

                case '<':
                    if (peek == '=')
                        return pair(TokenType::LESS_THAN_EQUALS_TO);
                    if (peek == '-')
                    {
                        eatNext(stream, pos);
                        return reserved("<-");
                    }
                    if (peek == '<')
                    {
                        eatNext(stream, pos);
                        if (stream.peekNext() == U'=')
                            return pair(TokenType::LEFT_SHIFT_ASSIGN);
                        return single(TokenType::LEFT_SHIFT);
                    }
                    return single(TokenType::LESS_THAN);

                case '>':
                    if (peek == '=')
                        return pair(TokenType::GREATER_THAN_EQUALS_TO);
                    if (peek == '>')
                    {
                        eatNext(stream, pos);
                        if (stream.peekNext() == U'=')
                            return pair(TokenType::RIGHT_SHIFT_ASSIGN);
                        return single(TokenType::RIGHT_SHIFT);
                    }
                    return single(TokenType::GREATER_THAN);

                case '!':
                    if (peek == '=')
                    {
                        eatNext(stream, pos);
                        if (stream.peekNext() == U'=')
                        {
                            eatNext(stream, pos);
                            return reserved("!==");
                        }
                        return single(TokenType::NOT_EQUALS_TO);
                    }
                    return single(TokenType::BANG);

                case '|':
                    if (peek == '|')
                        return pair(TokenType::OR);
                    if (peek == '=')
                        return pair(TokenType::OR_ASSIGN);
                    return single(TokenType::PIPE);

                case '&':
                    if (peek == '&')
                        return pair(TokenType::AND);
                    if (peek == '=')
                        return pair(TokenType::AND_ASSIGN);
                    return single(TokenType::AMPERSAND);

                case '^':
                    if (peek == '=')
                        return pair(TokenType::XOR_ASSIGN);
                    return single(TokenType::XOR);

                case '%':
                    if (peek == '=')
                        return pair(TokenType::MODULO_ASSIGN);
                    return single(TokenType::MODULO);

                case '~':
                    if (peek == '=')
                        return pair(TokenType::POWER_OF_ASSIGN);
                    return single(TokenType::POWER_OF);

                case '@':
                    return reserved("@");

                default:
                    break;
                }

                if (isWhitespace(c))
                    continue;

                return TokenWithPos{Token::lexError(LexError(LexErrorType::UNEXPECTED_INPUT, toUtf8(c))),
                                    startPos};
            }

            pos.advance();

            if (state.endWithNone)
                return std::nullopt;
            return TokenWithPos{Token(TokenType::EOF_TOKEN), pos};
        }
    } // namespace

    // ---- String literals --------------------------------------------------------

    std::optional<LexError> parseStringLiteral(InputStream &stream, TokenizeState &state,
                                               Position &pos, char32_t quote, std::string &out)
    {
        std::string result;
        size_t resultChars = 0;
        std::string escape;

        auto push = [&](char32_t ch)
        {
            appendUtf8(result, ch);
            resultChars++;
        };

        while (true)
        {
            auto got = stream.getNext();
            if (!got)
                return LexError(LexErrorType::UNTERMINATED_STRING);
            char32_t next = *got;

            pos.advance();

            if (state.maxStringSize > 0 && resultChars > state.maxStringSize)
                return LexError(LexErrorType::STRING_TOO_LONG, "", state.maxStringSize);

            if (!escape.empty())
            {
                switch (next)
                {
                case '\\':
                    escape.clear();
                    push('\\');
                    continue;
                case 't':
                    escape.clear();
                    push('\t');
                    continue;
                case 'n':
                    escape.clear();
                    push('\n');
                    continue;
                case 'r':
                    escape.clear();
                    push('\r');
                    continue;
                case 'x':
                case 'u':
                case 'U':
                {
                    // \x??, \u????, \U????????
                    std::string seq = escape;
                    escape.clear();
                    appendUtf8(seq, next);

                    int len = next == 'x' ? 2 : (next == 'u' ? 4 : 8);
                    uint32_t value = 0;

                    for (int i = 0; i < len; i++)
                    {
                        auto digit = stream.getNext();
                        if (!digit)
                            return LexError(LexErrorType::MALFORMED_ESCAPE_SEQUENCE, seq);

                        appendUtf8(seq, *digit);
                        pos.advance();

                        int d = hexValue(*digit);
                        if (d < 0)
                            return LexError(LexErrorType::MALFORMED_ESCAPE_SEQUENCE, seq);
                        value = value * 16 + static_cast<uint32_t>(d);
                    }

                    if (value > 0x10FFFF || (value >= 0xD800 && value <= 0xDFFF))
                        return LexError(LexErrorType::MALFORMED_ESCAPE_SEQUENCE, seq);
                    push(static_cast<char32_t>(value));
                    continue;
                }
                default:
                    if (next == quote)
                    {
                        escape.clear();
                        push(next);
                        continue;
                    }
                    return LexError(LexErrorType::MALFORMED_ESCAPE_SEQUENCE, escape);
                }
            }

            if (next == '\\')
            {
                escape = "\\";
                continue;
            }

            if (next == quote)
                break;

            // Cannot have new-lines inside string literals
            if (next == '\n')
            {
                pos.rewind();
                return LexError(LexErrorType::UNTERMINATED_STRING);
            }

            push(next);
        }

        if (state.maxStringSize > 0 && result.size() > state.maxStringSize)
            return LexError(LexErrorType::STRING_TOO_LONG, "", state.maxStringSize);

        out = std::move(result);
        return std::nullopt;
    }

    std::optional<TokenWithPos> getNextToken(InputStream &stream, TokenizeState &state,
                                             Position &pos)
    {
        auto result = getNextTokenInner(stream, state, pos);

        // Remember whether an operator after this token would be unary
        if (result)
            state.nonUnary = !result->first.isNextUnary();

        return result;
    }

    // ---- Lexer ------------------------------------------------------------------

    Lexer::Lexer(const std::string &source, LexerConfig config)
        : Lexer(std::vector<std::string>{source}, std::move(config)) {}

    Lexer::Lexer(std::vector<std::string> sources, LexerConfig config)
        : stream_(std::move(sources)), pos_(1, 0), config_(std::move(config))
    {
        state_.maxStringSize = config_.maxStringSize;
    }

    bool Lexer::isDisabled(const std::string &s) const
    {
        return config_.disabledSymbols && config_.disabledSymbols->count(s) > 0;
    }

    bool Lexer::isCustom(const std::string &s) const
    {
        return config_.customKeywords && config_.customKeywords->count(s) > 0;
    }

    Token Lexer::filter(Token token) const
    {
        auto improper = [](const std::string &msg)
        { return Token::lexError(LexError(LexErrorType::IMPROPER_SYMBOL, msg)); };

        if (token.type == TokenType::RESERVED)
        {
            const std::string &s = token.text;

            // Reserved keyword/operator that is custom
            if (isCustom(s))
                return Token::custom(s);

            if (s == "===")
                return improper("'===' is not a valid operator. This is not JavaScript! Should it be '=='?");
            if (s == "!==")
                return improper("'!==' is not a valid operator. This is not JavaScript! Should it be '!='?");
            if (s == "->")
                return improper("'->' is not a valid symbol. This is not C or C++!");
            if (s == "<-")
                return improper("'<-' is not a valid symbol. This is not Go! Should it be '<='?");
            if (s == "=>")
                return improper("'=>' is not a valid symbol. This is not Rust! Should it be '>='?");
            if (s == ":=")
                return improper("':=' is not a valid assignment operator. This is not Go! Should it be simply '='?");
            if (s == "::<")
                return improper("'::<>' is not a valid symbol. This is not Rust! Should it be '::'?");
            if (s == "(*" || s == "*)")
                return improper("'(* .. *)' is not a valid comment format. This is not Pascal! Should it be '/* .. */'?");
            if (s == "#")
                return improper("'#' is not a valid symbol. Should it be '#{'?");

            if (!isValidIdentifier(s))
                return improper("'" + s + "' is a reserved symbol");
            if (isDisabled(s))
                return improper("reserved symbol '" + s + "' is disabled");
            return token;
        }

        // Custom keyword
        if (token.type == TokenType::IDENTIFIER && isCustom(token.text))
            return Token::custom(token.text);

        // Custom standard keyword; only possible once it has been disabled
        if (token.isKeyword() && isCustom(token.syntax()) && isDisabled(token.syntax()))
            return Token::custom(token.syntax());

        // Disabled operator
        if (token.isOperator() && isDisabled(token.syntax()))
            return Token::lexError(LexError(LexErrorType::UNEXPECTED_INPUT, token.syntax()));

        // Disabled standard keyword
        if (token.isKeyword() && isDisabled(token.syntax()))
            return Token::reserved(token.syntax());

        return token;
    }

    std::optional<TokenWithPos> Lexer::next()
    {
        auto result = getNextToken(stream_, state_, pos_);
        if (!result)
            return std::nullopt;

        Token token = filter(std::move(result->first));
        if (config_.mapper)
            token = config_.mapper(std::move(token));
        return TokenWithPos{std::move(token), result->second};
    }

    std::vector<TokenWithPos> Lexer::tokenize()
    {
        std::vector<TokenWithPos> tokens;
        while (auto t = next())
        {
            bool eof = t->first.isEof();
            tokens.push_back(std::move(*t));
            if (eof)
                break;
        }
        return tokens;
    }

} // namespace rill
