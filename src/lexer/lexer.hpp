#pragma once

// =============================================================================
// Lexer: restartable tokenizer
// =============================================================================
//
// getNextToken() yields one (Token, Position) pair per call and keeps exactly
// enough state (TokenizeState, Position, stream cursor) to resume, including
// in the middle of a nested block comment. Lexical errors come back as
// LEX_ERROR tokens; the lexer itself never throws.
//
// The Lexer class wraps getNextToken() with the engine's per-instance
// configuration: disabled symbols, custom keywords/operators and an optional
// token mapper.
//
// =============================================================================

#include "position.hpp"
#include "token.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace rill
{

    using TokenWithPos = std::pair<Token, Position>;

    // ---- Input -----------------------------------------------------------------

    class InputStream
    {
    public:
        virtual ~InputStream() = default;
        virtual std::optional<char32_t> getNext() = 0;
        virtual std::optional<char32_t> peekNext() = 0;
    };

    /// Several UTF-8 source pieces read back to back as one character stream.
    class MultiInputStream : public InputStream
    {
    public:
        explicit MultiInputStream(std::vector<std::string> inputs);

        std::optional<char32_t> getNext() override;
        std::optional<char32_t> peekNext() override;

    private:
        std::vector<std::string> inputs_;
        size_t index_ = 0;  // current piece
        size_t offset_ = 0; // byte offset within the current piece

        bool skipExhausted();
    };

    // ---- Tokenizer state -------------------------------------------------------

    struct TokenizeState
    {
        size_t maxStringSize = 0;    // 0 = unlimited
        bool nonUnary = false;       // last token can end an expression
        size_t commentLevel = 0;     // open /* */ nesting depth
        bool endWithNone = false;    // nullopt instead of EOF at the end
        bool includeComments = false;
    };

    /// Parse a string literal after its opening `quote`. Returns the error, if
    /// any; `pos` then points at the offending character.
    std::optional<LexError> parseStringLiteral(InputStream &stream, TokenizeState &state,
                                               Position &pos, char32_t quote, std::string &out);

    /// The next token from the stream, or nullopt at the end when
    /// `state.endWithNone` is set.
    std::optional<TokenWithPos> getNextToken(InputStream &stream, TokenizeState &state,
                                             Position &pos);

    // ---- Lexer (token iterator) --------------------------------------------------

    struct LexerConfig
    {
        const std::unordered_set<std::string> *disabledSymbols = nullptr;
        const std::map<std::string, uint8_t> *customKeywords = nullptr;
        size_t maxStringSize = 0;
        std::function<Token(Token)> mapper;
    };

    class Lexer
    {
    public:
        explicit Lexer(const std::string &source, LexerConfig config = {});
        Lexer(std::vector<std::string> sources, LexerConfig config);

        /// Next filtered token. Ends with EOF_TOKEN (or nullopt when the state
        /// says so).
        std::optional<TokenWithPos> next();

        /// All tokens up to and including EOF.
        std::vector<TokenWithPos> tokenize();

        TokenizeState &state() { return state_; }

    private:
        MultiInputStream stream_;
        TokenizeState state_;
        Position pos_;
        LexerConfig config_;

        Token filter(Token token) const;
        bool isDisabled(const std::string &s) const;
        bool isCustom(const std::string &s) const;
    };

} // namespace rill
