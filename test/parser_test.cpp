// =============================================================================
// Rill Parser Tests
// =============================================================================
// Tests for the lexer + parser pipeline: statement and expression shapes,
// operator precedence, script functions, closures and parse errors.
// =============================================================================

#include "../src/lexer/lexer.hpp"
#include "../src/module/module.hpp"
#include "../src/parser/parser.hpp"
#include "../src/lib/errors/error.hpp"
#include "test_harness.hpp"

using namespace rill;

// ---- Helpers ----------------------------------------------------------------

static AST parseSource(const std::string &source, ParserSettings settings = {},
                       const std::map<std::string, uint8_t> *custom = nullptr)
{
    LexerConfig config;
    config.customKeywords = custom;
    Lexer lexer(source, config);
    Parser parser(lexer.tokenize(), custom, settings);
    return parser.parse();
}

static AST parseExpr(const std::string &source, ParserSettings settings = {})
{
    Lexer lexer(source);
    Parser parser(lexer.tokenize(), nullptr, settings);
    return parser.parseSingleExpression();
}

// Expect parsing to fail with the given error type; returns the error
static ParseError expectParseError(const std::string &source, ParseErrorType type,
                                   ParserSettings settings = {})
{
    try
    {
        parseSource(source, settings);
    }
    catch (const ParseError &e)
    {
        if (e.type() != type)
            throw std::runtime_error("Wrong parse error for '" + source + "': " + e.what());
        return e;
    }
    throw std::runtime_error("Expected a parse error for '" + source + "'");
}

template <typename T, typename N>
static const T *as(const N *node)
{
    auto *p = dynamic_cast<const T *>(node);
    if (!p)
        throw std::runtime_error("Unexpected node type");
    return p;
}

// Expression of the n-th top-level statement
static const Expr *exprAt(const AST &ast, size_t n)
{
    return as<ExprStmt>(ast.statements().at(n).get())->expr.get();
}

// ============================================================================
// Statements
// ============================================================================

static void test_let_and_const()
{
    AST ast = parseSource("let x = 42; const Y = 1; let z;");
    RASSERT_EQ(ast.statements().size(), 3u);

    auto *let = as<LetStmt>(ast.statements()[0].get());
    RASSERT_EQ(let->name, "x");
    RASSERT(!let->isConst);
    RASSERT_EQ(as<IntLiteral>(let->init.get())->value, 42);

    RASSERT(as<LetStmt>(ast.statements()[1].get())->isConst);
    RASSERT(as<LetStmt>(ast.statements()[2].get())->init == nullptr);
}

static void test_assignments()
{
    AST ast = parseSource("x = 1; x += 2; a[0] = 3; p.q -= 4;");
    RASSERT_EQ(ast.statements().size(), 4u);

    auto *plain = as<AssignStmt>(ast.statements()[0].get());
    RASSERT(plain->op.empty());
    RASSERT_EQ(as<Variable>(plain->target.get())->name, "x");

    RASSERT_EQ(as<AssignStmt>(ast.statements()[1].get())->op, "+=");
    as<IndexExpr>(as<AssignStmt>(ast.statements()[2].get())->target.get());
    as<PropertyExpr>(as<AssignStmt>(ast.statements()[3].get())->target.get());
}

static void test_loops()
{
    AST ast = parseSource("while x < 10 { x += 1; } loop { break; } for i in range(0, 3) { continue; }");
    RASSERT_EQ(ast.statements().size(), 3u);

    RASSERT(as<WhileStmt>(ast.statements()[0].get())->condition != nullptr);
    RASSERT(as<WhileStmt>(ast.statements()[1].get())->condition == nullptr);

    auto *f = as<ForStmt>(ast.statements()[2].get());
    RASSERT_EQ(f->varName, "i");
    RASSERT_EQ(as<FnCallExpr>(f->iterable.get())->name, "range");
}

static void test_if_else_chain()
{
    AST ast = parseSource("if x { 1 } else if y { 2 } else { 3 }");
    auto *top = as<IfExpr>(exprAt(ast, 0));
    auto *second = as<IfExpr>(top->elseBranch.get());
    as<BlockExpr>(second->elseBranch.get());

    // An if expression as a value
    AST valued = parseSource("let v = if x { 1 } else { 2 };");
    as<IfExpr>(as<LetStmt>(valued.statements()[0].get())->init.get());
}

static void test_return_throw()
{
    AST ast = parseSource("fn f() { return; } fn g() { throw \"bad\"; }");
    RASSERT(ast.statements().empty());

    auto *f = ast.lib().getScriptFn("f", 0, false)->script.get();
    RASSERT(as<ReturnStmt>(f->body->statements[0].get())->value == nullptr);

    auto *g = ast.lib().getScriptFn("g", 0, false)->script.get();
    RASSERT_EQ(as<StringLiteral>(as<ThrowStmt>(g->body->statements[0].get())->value.get())->value, "bad");
}

static void test_import_export()
{
    AST ast = parseSource("import \"m\" as m; import \"side\"; let a = 1; export a, a as b;");
    RASSERT_EQ(*as<ImportStmt>(ast.statements()[0].get())->alias, "m");
    RASSERT(!as<ImportStmt>(ast.statements()[1].get())->alias.has_value());

    auto *ex = as<ExportStmt>(ast.statements()[3].get());
    RASSERT_EQ(ex->names.size(), 2u);
    RASSERT(!ex->names[0].second.has_value());
    RASSERT_EQ(*ex->names[1].second, "b");
}

static void test_statement_positions()
{
    AST ast = parseSource("let x = 1;\n  let y = 2;");
    Position second = ast.statements()[1]->pos;
    RASSERT_EQ(*second.line(), 2);
    RASSERT_EQ(*second.column(), 3);
}

// ============================================================================
// Expressions
// ============================================================================

static void test_precedence()
{
    AST ast = parseSource("1 + 2 * 3");
    auto *plus = as<FnCallExpr>(exprAt(ast, 0));
    RASSERT_EQ(plus->name, "+");
    RASSERT(plus->isOperator);
    RASSERT_EQ(as<IntLiteral>(plus->args[0].get())->value, 1);
    RASSERT_EQ(as<FnCallExpr>(plus->args[1].get())->name, "*");

    ast = parseSource("(1 + 2) * 3");
    auto *times = as<FnCallExpr>(exprAt(ast, 0));
    RASSERT_EQ(times->name, "*");
    RASSERT_EQ(as<FnCallExpr>(times->args[0].get())->name, "+");

    ast = parseSource("1 < 2 == true");
    RASSERT_EQ(as<FnCallExpr>(exprAt(ast, 0))->name, "==");

    ast = parseSource("1 << 2 * 3");
    RASSERT_EQ(as<FnCallExpr>(exprAt(ast, 0))->name, "*");
}

static void test_left_associativity()
{
    AST ast = parseSource("10 - 2 - 3");
    auto *outer = as<FnCallExpr>(exprAt(ast, 0));
    RASSERT_EQ(outer->name, "-");
    RASSERT_EQ(as<IntLiteral>(outer->args[1].get())->value, 3);
    RASSERT_EQ(as<FnCallExpr>(outer->args[0].get())->name, "-");
}

static void test_logic_and_in()
{
    AST ast = parseSource("a || b && c");
    auto *orExpr = as<LogicalExpr>(exprAt(ast, 0));
    RASSERT(!orExpr->isAnd);
    RASSERT(as<LogicalExpr>(orExpr->right.get())->isAnd);

    ast = parseSource("x in [1, 2]");
    auto *in = as<InExpr>(exprAt(ast, 0));
    RASSERT_EQ(as<ArrayLiteral>(in->right.get())->elements.size(), 2u);
}

static void test_unary()
{
    RASSERT_EQ(as<IntLiteral>(exprAt(parseSource("-5"), 0))->value, -5);
    RASSERT_NEAR(as<FloatLiteral>(exprAt(parseSource("- 2.5"), 0))->value, -2.5, 1e-12);
    RASSERT_EQ(as<IntLiteral>(exprAt(parseSource("+7"), 0))->value, 7);

    auto *neg = as<FnCallExpr>(exprAt(parseSource("-x"), 0));
    RASSERT_EQ(neg->name, "-");
    RASSERT_EQ(neg->args.size(), 1u);

    auto *bang = as<FnCallExpr>(exprAt(parseSource("!flag"), 0));
    RASSERT_EQ(bang->name, "!");
}

static void test_literals()
{
    AST ast = parseSource("(); true; 'c'; \"s\"; 1.5; [1, [2]]; #{a: 1, \"b c\": 2}");
    RASSERT_EQ(ast.statements().size(), 7u);
    as<UnitLiteral>(exprAt(ast, 0));
    RASSERT(as<BoolLiteral>(exprAt(ast, 1))->value);
    RASSERT(as<CharLiteral>(exprAt(ast, 2))->value == U'c');
    RASSERT_EQ(as<StringLiteral>(exprAt(ast, 3))->value, "s");
    as<FloatLiteral>(exprAt(ast, 4));
    as<ArrayLiteral>(as<ArrayLiteral>(exprAt(ast, 5))->elements[1].get());

    auto *map = as<MapLiteral>(exprAt(ast, 6));
    RASSERT_EQ(map->entries.size(), 2u);
    RASSERT_EQ(map->entries[1].first, "b c");
}

static void test_postfix_chain()
{
    AST ast = parseSource("a.b.c(1)[0]");
    auto *index = as<IndexExpr>(exprAt(ast, 0));
    auto *method = as<MethodCallExpr>(index->object.get());
    RASSERT_EQ(method->name, "c");
    RASSERT_EQ(method->args.size(), 1u);
    auto *prop = as<PropertyExpr>(method->object.get());
    RASSERT_EQ(prop->name, "b");
    RASSERT_EQ(as<Variable>(prop->object.get())->name, "a");
}

static void test_qualified_names()
{
    AST ast = parseSource("m::sub::f(1); m::X");
    auto *call = as<FnCallExpr>(exprAt(ast, 0));
    RASSERT_EQ(call->name, "f");
    RASSERT_EQ(call->namespaces.size(), 2u);
    RASSERT_EQ(call->namespaces[1], "sub");

    auto *var = as<Variable>(exprAt(ast, 1));
    RASSERT_EQ(var->name, "X");
    RASSERT_EQ(var->namespaces[0], "m");
}

static void test_keyword_function_calls()
{
    AST ast = parseSource("print(1); x.type_of(); Fn(\"f\")");
    RASSERT_EQ(as<FnCallExpr>(exprAt(ast, 0))->name, "print");
    RASSERT_EQ(as<MethodCallExpr>(exprAt(ast, 1))->name, "type_of");
    RASSERT_EQ(as<FnCallExpr>(exprAt(ast, 2))->name, "Fn");
}

static void test_custom_operator()
{
    std::map<std::string, uint8_t> custom = {{"foo", 140}};

    AST ast = parseSource("1 foo 2 + 3", {}, &custom);
    auto *foo = as<FnCallExpr>(exprAt(ast, 0));
    RASSERT_EQ(foo->name, "foo");
    RASSERT_EQ(as<FnCallExpr>(foo->args[1].get())->name, "+");

    ast = parseSource("1 * 2 foo 3", {}, &custom);
    foo = as<FnCallExpr>(exprAt(ast, 0));
    RASSERT_EQ(foo->name, "foo");
    RASSERT_EQ(as<FnCallExpr>(foo->args[0].get())->name, "*");
}

// ============================================================================
// Functions and closures
// ============================================================================

static void test_function_definitions()
{
    AST ast = parseSource("fn add(a, b) { a + b } private fn hidden() { 1 } add(1, 2)");
    RASSERT_EQ(ast.statements().size(), 1u);

    const FuncInfo *add = ast.lib().getScriptFn("add", 2, true);
    RASSERT(add != nullptr);
    RASSERT_EQ(add->script->params.size(), 2u);
    RASSERT_EQ(add->script->params[1], "b");

    RASSERT(ast.lib().getScriptFn("hidden", 0, true) == nullptr);
    RASSERT(ast.lib().getScriptFn("hidden", 0, false) != nullptr);
    RASSERT(ast.lib().getScriptFn("add", 1, false) == nullptr);
}

static void test_keyword_override()
{
    AST ast = parseSource("fn print(x) { x }");
    RASSERT(ast.lib().getScriptFn("print", 1, false) != nullptr);

    expectParseError("fn call(x) { x }", ParseErrorType::FN_MISSING_NAME);
    expectParseError("fn while(x) { x }", ParseErrorType::FN_MISSING_NAME);
}

static void test_closure_captures()
{
    AST ast = parseSource("let y = 1; let f = |x| x + y;");
    auto *closure = as<ClosureExpr>(as<LetStmt>(ast.statements()[1].get())->init.get());

    RASSERT_EQ(closure->externals.size(), 1u);
    RASSERT_EQ(closure->externals[0], "y");
    RASSERT(closure->fnName.rfind("anon$", 0) == 0);

    const FuncInfo *fn = ast.lib().getScriptFn(closure->fnName, 2, true);
    RASSERT(fn != nullptr);
    RASSERT_EQ(fn->script->params[0], "y");
    RASSERT_EQ(fn->script->params[1], "x");
}

static void test_closure_nested_captures()
{
    AST ast = parseSource("let a = 1; let f = || { let g = || a; g };");
    auto *outer = as<ClosureExpr>(as<LetStmt>(ast.statements()[1].get())->init.get());
    RASSERT_EQ(outer->externals.size(), 1u);
    RASSERT_EQ(outer->externals[0], "a");

    // Closure ids never repeat
    AST other = parseSource("|| 1");
    RASSERT(as<ClosureExpr>(exprAt(other, 0))->fnName != outer->fnName);
    RASSERT(as<ClosureExpr>(exprAt(other, 0))->externals.empty());
}

static void test_ast_merge()
{
    AST first = parseSource("fn f() { 1 } let a = 1;");
    AST second = parseSource("fn f() { 2 } fn g() { 3 } let b = 2;");
    AST merged = first.merge(second);

    RASSERT_EQ(merged.statements().size(), 2u);
    RASSERT_EQ(merged.lib().numFunctions(), 2u);

    const ScriptFnDef *f = merged.lib().getScriptFn("f", 0, false)->script.get();
    auto *body = as<ExprStmt>(f->body->statements[0].get());
    RASSERT_EQ(as<IntLiteral>(body->expr.get())->value, 2);
}

// ============================================================================
// Errors
// ============================================================================

static void test_loop_control_outside_loop()
{
    expectParseError("break;", ParseErrorType::LOOP_BREAK);
    expectParseError("fn f() { continue; }", ParseErrorType::LOOP_BREAK);
    expectParseError("loop { let f = || { break; }; break; }", ParseErrorType::LOOP_BREAK);

    parseSource("loop { if x { break } }");
}

static void test_export_placement()
{
    expectParseError("{ export x; }", ParseErrorType::WRONG_EXPORT);
    expectParseError("let x = 1; export x as y, x as y;", ParseErrorType::DUPLICATED_EXPORT);
    expectParseError("export 1;", ParseErrorType::VARIABLE_EXPECTED);
}

static void test_invalid_assignment_targets()
{
    expectParseError("1 = 2;", ParseErrorType::ASSIGNMENT_TO_INVALID_LHS);
    expectParseError("m::x = 1;", ParseErrorType::ASSIGNMENT_TO_INVALID_LHS);
    expectParseError("f() = 1;", ParseErrorType::ASSIGNMENT_TO_INVALID_LHS);
}

static void test_expression_depth()
{
    ParserSettings settings;
    settings.maxExprDepth = 5;
    expectParseError("((((((((1))))))))", ParseErrorType::EXPR_TOO_DEEP, settings);

    settings.maxExprDepth = 0;
    parseSource("((((((((1))))))))", settings);
}

static void test_function_definition_errors()
{
    expectParseError("fn f(x, x) { x }", ParseErrorType::FN_DUPLICATED_PARAM);
    expectParseError("|x, x| x", ParseErrorType::FN_DUPLICATED_PARAM);
    expectParseError("fn f() { 1 } fn f() { 2 }", ParseErrorType::FN_DUPLICATED_DEFINITION);
    expectParseError("fn f { 1 }", ParseErrorType::FN_MISSING_PARAMS);
    expectParseError("fn f()", ParseErrorType::FN_MISSING_BODY);
    expectParseError("fn f() { fn g() { 1 } }", ParseErrorType::WRONG_FN_DEFINITION);
    expectParseError("if x { fn g() { 1 } }", ParseErrorType::WRONG_FN_DEFINITION);
}

static void test_this_placement()
{
    ParseError e = expectParseError("this + 1", ParseErrorType::BAD_INPUT);
    RASSERT_EQ(e.detail(), "'this' can only be used in functions");

    parseSource("fn f() { this }");
    parseSource("let f = || this;");
}

static void test_syntax_errors()
{
    expectParseError("let = 1;", ParseErrorType::VARIABLE_EXPECTED);
    expectParseError("foo(1, 2", ParseErrorType::MISSING_TOKEN);
    expectParseError("x y", ParseErrorType::MISSING_TOKEN);
    expectParseError("1 +", ParseErrorType::UNEXPECTED_EOF);
    expectParseError("#{a: 1, a: 2}", ParseErrorType::DUPLICATED_PROPERTY);
    expectParseError("a.1", ParseErrorType::PROPERTY_EXPECTED);
    expectParseError("a[-1]", ParseErrorType::MALFORMED_INDEX_EXPR);
    expectParseError("a[1.5]", ParseErrorType::MALFORMED_INDEX_EXPR);

    ParseError reserved = expectParseError("var x = 1;", ParseErrorType::BAD_INPUT);
    RASSERT_EQ(reserved.detail(), "'var' is a reserved keyword");

    ParseError lexical = expectParseError("a === b", ParseErrorType::BAD_INPUT);
    RASSERT(lexical.detail().find("Should it be '=='?") != std::string::npos);
}

// ============================================================================
// Single expressions
// ============================================================================

static void test_single_expression()
{
    AST ast = parseExpr("1 + 2");
    RASSERT_EQ(ast.statements().size(), 1u);
    RASSERT_EQ(as<FnCallExpr>(exprAt(ast, 0))->name, "+");

    bool failed = false;
    try
    {
        parseExpr("1; 2");
    }
    catch (const ParseError &e)
    {
        failed = e.type() == ParseErrorType::BAD_INPUT;
    }
    RASSERT(failed);

    ParserSettings strict;
    strict.allowIfExpression = false;
    strict.allowStatementBlock = false;
    strict.allowClosures = false;

    for (const char *src : {"if x { 1 } else { 2 }", "{ 1 }", "|x| x"})
    {
        failed = false;
        try
        {
            parseExpr(src, strict);
        }
        catch (const ParseError &e)
        {
            failed = e.type() == ParseErrorType::BAD_INPUT;
        }
        RASSERT(failed);
    }
}

int main()
{
    std::cout << "\n===== Rill Parser: Statements =====\n";
    runTest("let and const", test_let_and_const);
    runTest("assignments", test_assignments);
    runTest("loops", test_loops);
    runTest("if / else chain", test_if_else_chain);
    runTest("return and throw", test_return_throw);
    runTest("import and export", test_import_export);
    runTest("statement positions", test_statement_positions);

    std::cout << "\n===== Rill Parser: Expressions =====\n";
    runTest("precedence", test_precedence);
    runTest("left associativity", test_left_associativity);
    runTest("logic and in", test_logic_and_in);
    runTest("unary operators", test_unary);
    runTest("literals", test_literals);
    runTest("postfix chain", test_postfix_chain);
    runTest("qualified names", test_qualified_names);
    runTest("keyword function calls", test_keyword_function_calls);
    runTest("custom operator", test_custom_operator);

    std::cout << "\n===== Rill Parser: Functions and Closures =====\n";
    runTest("function definitions", test_function_definitions);
    runTest("keyword override", test_keyword_override);
    runTest("closure captures", test_closure_captures);
    runTest("nested closure captures", test_closure_nested_captures);
    runTest("AST merge", test_ast_merge);

    std::cout << "\n===== Rill Parser: Errors =====\n";
    runTest("loop control outside a loop", test_loop_control_outside_loop);
    runTest("export placement", test_export_placement);
    runTest("invalid assignment targets", test_invalid_assignment_targets);
    runTest("expression depth", test_expression_depth);
    runTest("function definition errors", test_function_definition_errors);
    runTest("this placement", test_this_placement);
    runTest("syntax errors", test_syntax_errors);

    std::cout << "\n===== Rill Parser: Single Expressions =====\n";
    runTest("single expression", test_single_expression);

    return testExitCode();
}
