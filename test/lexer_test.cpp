// =============================================================================
// Rill Lexer Tests
// =============================================================================
// Token stream, number and string literals, positions, reserved and disabled
// symbols, custom operators and restartable block comments.
// =============================================================================

#include "../src/lexer/lexer.hpp"
#include "test_harness.hpp"

using namespace rill;

// ---- Helpers ----------------------------------------------------------------

static std::vector<Token> lex(const std::string &src, LexerConfig config = {})
{
    Lexer lexer(src, std::move(config));
    std::vector<Token> tokens;
    for (auto &t : lexer.tokenize())
        tokens.push_back(t.first);
    return tokens;
}

// First token of `src`
static Token first(const std::string &src, LexerConfig config = {})
{
    return lex(src, std::move(config)).at(0);
}

static bool isLexError(const Token &t, LexErrorType type)
{
    return t.type == TokenType::LEX_ERROR && t.error && t.error->type == type;
}

// ============================================================================
// Token stream
// ============================================================================

static void test_basic_statement()
{
    auto tokens = lex("let x = 42;");
    RASSERT_EQ(tokens.size(), 6u);
    RASSERT(tokens[0].type == TokenType::LET);
    RASSERT(tokens[1].type == TokenType::IDENTIFIER);
    RASSERT_EQ(tokens[1].text, "x");
    RASSERT(tokens[2].type == TokenType::EQUALS);
    RASSERT(tokens[3].type == TokenType::INTEGER_CONSTANT);
    RASSERT_EQ(tokens[3].intValue, 42);
    RASSERT(tokens[4].type == TokenType::SEMICOLON);
    RASSERT(tokens[5].isEof());
}

static void test_operators()
{
    auto tokens = lex("a <<= b >> c ~ d != e && f :: g #{");
    std::vector<TokenType> expected = {
        TokenType::IDENTIFIER, TokenType::LEFT_SHIFT_ASSIGN, TokenType::IDENTIFIER,
        TokenType::RIGHT_SHIFT, TokenType::IDENTIFIER, TokenType::POWER_OF,
        TokenType::IDENTIFIER, TokenType::NOT_EQUALS_TO, TokenType::IDENTIFIER,
        TokenType::AND, TokenType::IDENTIFIER, TokenType::DOUBLE_COLON,
        TokenType::IDENTIFIER, TokenType::MAP_START, TokenType::EOF_TOKEN};

    RASSERT_EQ(tokens.size(), expected.size());
    for (size_t i = 0; i < expected.size(); i++)
        RASSERT(tokens[i].type == expected[i]);
}

static void test_unary_and_binary_minus()
{
    auto tokens = lex("-x");
    RASSERT(tokens[0].type == TokenType::UNARY_MINUS);

    tokens = lex("a-1");
    RASSERT(tokens[1].type == TokenType::MINUS);
    RASSERT_EQ(tokens[2].intValue, 1);

    // A sign in unary position folds into the literal
    tokens = lex("(-1)");
    RASSERT(tokens[1].type == TokenType::INTEGER_CONSTANT);
    RASSERT_EQ(tokens[1].intValue, -1);
}

static void test_positions()
{
    Lexer lexer("let x\n  = 1");
    auto tokens = lexer.tokenize();

    RASSERT_EQ(*tokens[0].second.line(), 1);
    RASSERT_EQ(*tokens[0].second.column(), 1);
    RASSERT_EQ(*tokens[1].second.column(), 5);
    RASSERT_EQ(*tokens[2].second.line(), 2);
    RASSERT_EQ(*tokens[2].second.column(), 3);
}

static void test_multiple_sources()
{
    Lexer lexer(std::vector<std::string>{"let x", " = 1;"}, LexerConfig{});
    auto tokens = lexer.tokenize();
    RASSERT_EQ(tokens.size(), 6u);
    RASSERT_EQ(tokens[1].first.text, "x");
    RASSERT_EQ(tokens[3].first.intValue, 1);
}

// ============================================================================
// Literals
// ============================================================================

static void test_numbers()
{
    RASSERT_EQ(first("1_000").intValue, 1000);
    RASSERT_EQ(first("0xFF").intValue, 255);
    RASSERT_EQ(first("0o17").intValue, 15);
    RASSERT_EQ(first("0b1010").intValue, 10);
    RASSERT_EQ(first("-0xFF").intValue, -255);
    RASSERT_EQ(first("-9223372036854775808").intValue, std::numeric_limits<INT>::min());
    RASSERT_EQ(first("0x7FFFFFFFFFFFFFFF").intValue, std::numeric_limits<INT>::max());

    Token f = first("3.25");
    RASSERT(f.type == TokenType::FLOAT_CONSTANT);
    RASSERT_NEAR(f.floatValue, 3.25, 1e-12);

    RASSERT(isLexError(first("0x"), LexErrorType::MALFORMED_NUMBER));
    RASSERT(isLexError(first("0x8000000000000000"), LexErrorType::MALFORMED_NUMBER));
    RASSERT_EQ(first("0x").error->text, "0x");
}

static void test_radix_literal_ends_at_foreign_digit()
{
    auto tokens = lex("0b12");
    RASSERT(tokens[0].type == TokenType::INTEGER_CONSTANT);
    RASSERT_EQ(tokens[0].intValue, 1);
    RASSERT(tokens[1].type == TokenType::INTEGER_CONSTANT);
    RASSERT_EQ(tokens[1].intValue, 2);

    tokens = lex("0o78");
    RASSERT_EQ(tokens[0].intValue, 7);
    RASSERT_EQ(tokens[1].intValue, 8);

    RASSERT_EQ(first("0xFF_FF").intValue, 65535);
    RASSERT_EQ(first("0b_1_0").intValue, 2);
}

static void test_strings_and_escapes()
{
    RASSERT_EQ(first("\"a\\tb\"").text, "a\tb");
    RASSERT_EQ(first("\"\\x41\\u00e9\"").text, "A\xC3\xA9");
    RASSERT_EQ(first("\"say \\\"hi\\\"\"").text, "say \"hi\"");
    RASSERT_EQ(first("\"h\xC3\xA9llo\"").text, "h\xC3\xA9llo");

    RASSERT(isLexError(first("\"\\q\""), LexErrorType::MALFORMED_ESCAPE_SEQUENCE));
    RASSERT(isLexError(first("\"\\x4\""), LexErrorType::MALFORMED_ESCAPE_SEQUENCE));
    RASSERT(isLexError(first("\"\\uD800\""), LexErrorType::MALFORMED_ESCAPE_SEQUENCE));
    RASSERT(isLexError(first("\"abc"), LexErrorType::UNTERMINATED_STRING));
    RASSERT(isLexError(first("\"ab\ncd\""), LexErrorType::UNTERMINATED_STRING));
}

static void test_string_size_limit()
{
    LexerConfig config;
    config.maxStringSize = 3;

    RASSERT_EQ(first("\"abc\"", config).text, "abc");

    Token t = first("\"abcd\"", config);
    RASSERT(isLexError(t, LexErrorType::STRING_TOO_LONG));
    RASSERT_EQ(t.error->limit, 3u);
}

static void test_char_literals()
{
    Token c = first("'x'");
    RASSERT(c.type == TokenType::CHAR_CONSTANT);
    RASSERT(c.charValue == U'x');
    RASSERT(first("'\xC3\xA9'").charValue == U'\u00e9');
    RASSERT(first("'\\n'").charValue == U'\n');

    RASSERT(isLexError(first("''"), LexErrorType::MALFORMED_CHAR));
    Token bad = first("'ab'");
    RASSERT(isLexError(bad, LexErrorType::MALFORMED_CHAR));
    RASSERT_EQ(bad.error->text, "ab");
}

// ============================================================================
// Reserved, disabled and custom symbols
// ============================================================================

static void test_improper_symbols()
{
    Token t = lex("a === b").at(1);
    RASSERT(isLexError(t, LexErrorType::IMPROPER_SYMBOL));
    RASSERT(t.error->message().find("Should it be '=='?") != std::string::npos);

    RASSERT(isLexError(lex("a -> b").at(1), LexErrorType::IMPROPER_SYMBOL));
    RASSERT(isLexError(lex("x := 1").at(1), LexErrorType::IMPROPER_SYMBOL));
    RASSERT(isLexError(first("(* c *)"), LexErrorType::IMPROPER_SYMBOL));
    RASSERT(isLexError(first("#"), LexErrorType::IMPROPER_SYMBOL));

    Token at = first("@");
    RASSERT(isLexError(at, LexErrorType::IMPROPER_SYMBOL));
    RASSERT_EQ(at.error->message(), "'@' is a reserved symbol");

    Token dollar = first("$");
    RASSERT(isLexError(dollar, LexErrorType::UNEXPECTED_INPUT));
    RASSERT_EQ(dollar.error->text, "$");
}

static void test_reserved_words()
{
    Token var = first("var");
    RASSERT(var.isReserved());
    RASSERT_EQ(var.text, "var");

    // Keyword functions lex as reserved names
    RASSERT(first("print").isReserved());
    RASSERT(first("this").isReserved());
    RASSERT(canOverrideKeyword("print"));
    RASSERT(!canOverrideKeyword("call"));
    RASSERT(isKeywordFunction("is_shared"));
    RASSERT(!isKeywordFunction("while"));
}

static void test_disabled_symbols()
{
    std::unordered_set<std::string> disabled = {"while", "+=", "var"};
    LexerConfig config;
    config.disabledSymbols = &disabled;

    Token w = first("while", config);
    RASSERT(w.isReserved());
    RASSERT_EQ(w.text, "while");

    Token op = lex("x += 1", config).at(1);
    RASSERT(isLexError(op, LexErrorType::UNEXPECTED_INPUT));
    RASSERT_EQ(op.error->text, "+=");

    Token var = first("var", config);
    RASSERT(isLexError(var, LexErrorType::IMPROPER_SYMBOL));
    RASSERT_EQ(var.error->message(), "reserved symbol 'var' is disabled");

    // Untouched symbols lex normally
    RASSERT(first("loop", config).type == TokenType::LOOP);
}

static void test_custom_symbols()
{
    std::map<std::string, uint8_t> custom = {{"foo", 140}, {"=>", 160}};
    LexerConfig config;
    config.customKeywords = &custom;

    auto tokens = lex("a foo b", config);
    RASSERT(tokens[1].isCustom());
    RASSERT_EQ(tokens[1].text, "foo");
    RASSERT_EQ(tokens[1].precedence(&custom), 140);
    RASSERT_EQ(tokens[1].precedence(), 0);

    Token arrow = lex("a => b", config).at(1);
    RASSERT(arrow.isCustom());
    RASSERT_EQ(arrow.text, "=>");

    // A standard keyword becomes custom only after it is disabled
    std::map<std::string, uint8_t> customWhile = {{"while", 140}};
    std::unordered_set<std::string> disabled = {"while"};
    config.customKeywords = &customWhile;
    RASSERT(first("while", config).type == TokenType::WHILE);
    config.disabledSymbols = &disabled;
    RASSERT(first("while", config).isCustom());
}

static void test_token_mapper()
{
    LexerConfig config;
    config.mapper = [](Token t)
    {
        if (t.type == TokenType::IDENTIFIER && t.text == "x")
            t.text = "y";
        return t;
    };
    RASSERT_EQ(first("x", config).text, "y");
}

static void test_syntax_table()
{
    std::vector<TokenType> types = {
        TokenType::LEFT_BRACE, TokenType::DOUBLE_COLON, TokenType::MAP_START, TokenType::PLUS,
        TokenType::POWER_OF, TokenType::LEFT_SHIFT_ASSIGN, TokenType::POWER_OF_ASSIGN,
        TokenType::NOT_EQUALS_TO, TokenType::AND, TokenType::TRUE_KW, TokenType::WHILE,
        TokenType::PRIVATE, TokenType::EXPORT, TokenType::AS};

    for (TokenType type : types)
    {
        auto token = lookupFromSyntax(syntax(type));
        RASSERT(token.has_value());
        RASSERT(token->type == type);
    }

    RASSERT_EQ(syntax(TokenType::UNARY_MINUS), "-");
    RASSERT(!lookupFromSyntax("banana").has_value());
    RASSERT(lookupFromSyntax("switch")->isReserved());

    RASSERT(isValidIdentifier("_a1"));
    RASSERT(isValidIdentifier("a_b"));
    RASSERT(!isValidIdentifier("_1a"));
    RASSERT(!isValidIdentifier("_"));
    RASSERT(!isValidIdentifier("1a"));
}

static void test_precedence()
{
    RASSERT(Token(TokenType::MULTIPLY).precedence() > Token(TokenType::PLUS).precedence());
    RASSERT(Token(TokenType::PLUS).precedence() > Token(TokenType::LESS_THAN).precedence());
    RASSERT(Token(TokenType::AND).precedence() > Token(TokenType::OR).precedence());
    RASSERT_EQ(Token(TokenType::EQUALS).precedence(), 0);
    RASSERT(Token(TokenType::EQUALS).isBindRight());
    RASSERT(!Token(TokenType::PLUS).isBindRight());
}

// ============================================================================
// Comments and restarting
// ============================================================================

static void test_comments_skipped()
{
    auto tokens = lex("1 // line comment\n2 /* a /* nested */ block */ 3");
    RASSERT_EQ(tokens.size(), 4u);
    RASSERT_EQ(tokens[0].intValue, 1);
    RASSERT_EQ(tokens[1].intValue, 2);
    RASSERT_EQ(tokens[2].intValue, 3);
}

static void test_comments_included()
{
    MultiInputStream stream({"// hi\n1"});
    TokenizeState state;
    state.includeComments = true;
    Position pos;

    auto comment = getNextToken(stream, state, pos);
    RASSERT(comment->first.type == TokenType::COMMENT);
    RASSERT_EQ(comment->first.text, "// hi");

    auto one = getNextToken(stream, state, pos);
    RASSERT_EQ(one->first.intValue, 1);
    RASSERT_EQ(*one->second.line(), 2);
}

static void test_restart_inside_block_comment()
{
    TokenizeState state;
    state.endWithNone = true;
    Position pos;

    MultiInputStream part1({"1 /* open /* nested */"});
    auto one = getNextToken(part1, state, pos);
    RASSERT_EQ(one->first.intValue, 1);
    RASSERT(!getNextToken(part1, state, pos).has_value());
    RASSERT_EQ(state.commentLevel, 1u);

    MultiInputStream part2({"still */ 2"});
    auto two = getNextToken(part2, state, pos);
    RASSERT(two.has_value());
    RASSERT_EQ(two->first.intValue, 2);
    RASSERT_EQ(state.commentLevel, 0u);
}

// ============================================================================
// Position
// ============================================================================

static void test_position()
{
    Position start;
    RASSERT_EQ(*start.line(), 1);
    RASSERT(!start.column().has_value());

    Position p(3, 7);
    RASSERT_EQ(p.toString(), "line 3, position 7");
    p.newLine();
    RASSERT_EQ(*p.line(), 4);
    RASSERT(!p.column().has_value());

    Position none = Position::none();
    none.advance();
    none.newLine();
    RASSERT(none.isNone());
    RASSERT(!none.line().has_value());
    RASSERT_EQ(none.toString(), "none");

    // Saturates instead of wrapping
    Position edge(65535, 65535);
    edge.advance();
    RASSERT_EQ(*edge.column(), 65535);
    edge.newLine();
    RASSERT_EQ(*edge.line(), 65535);
}

int main()
{
    std::cout << "\n===== Rill Lexer: Tokens =====\n";
    runTest("basic statement", test_basic_statement);
    runTest("operators", test_operators);
    runTest("unary and binary minus", test_unary_and_binary_minus);
    runTest("positions", test_positions);
    runTest("multiple sources", test_multiple_sources);

    std::cout << "\n===== Rill Lexer: Literals =====\n";
    runTest("numbers", test_numbers);
    runTest("radix literal ends at a foreign digit", test_radix_literal_ends_at_foreign_digit);
    runTest("strings and escapes", test_strings_and_escapes);
    runTest("string size limit", test_string_size_limit);
    runTest("char literals", test_char_literals);

    std::cout << "\n===== Rill Lexer: Symbols =====\n";
    runTest("improper symbols", test_improper_symbols);
    runTest("reserved words", test_reserved_words);
    runTest("disabled symbols", test_disabled_symbols);
    runTest("custom symbols", test_custom_symbols);
    runTest("token mapper", test_token_mapper);
    runTest("syntax table", test_syntax_table);
    runTest("precedence", test_precedence);

    std::cout << "\n===== Rill Lexer: Comments =====\n";
    runTest("comments skipped", test_comments_skipped);
    runTest("comments included", test_comments_included);
    runTest("restart inside a block comment", test_restart_inside_block_comment);

    std::cout << "\n===== Rill Lexer: Position =====\n";
    runTest("position", test_position);

    return testExitCode();
}
