// =============================================================================
// Rill Closure Tests
// =============================================================================
// Function pointers, currying, closures capturing shared variables, `this`
// binding through `call`, and data-race detection on shared values.
// =============================================================================

#include "../src/engine/engine.hpp"
#include "test_harness.hpp"
#include <memory>

using namespace rill;

// ---- Helpers ----------------------------------------------------------------

// call_with_arg(fp, x): calls fp with a single argument
static void registerCallWithArg(Engine &engine)
{
    engine.registerRawFn("call_with_arg", {typeid(FnPtr), typeid(INT)},
                         [](NativeCallContext &ctx, FnArgs &args)
                         {
                             FnPtr fp = args[0]->asFnPtr();
                             return ctx.callFnPtr(fp, {*args[1]});
                         });
}

// ============================================================================
// Function pointers
// ============================================================================

static void test_fn_ptr_curry_call()
{
    Engine engine;
    registerCallWithArg(engine);

    RASSERT_EQ(RUNWRAP(engine.eval<INT>(R"(
        let addition = |x, y| { x + y };
        let curried = addition.curry(2);

        call_with_arg(curried, 40)
    )")),
               42);
}

static void test_fn_ptr_keyword_forms()
{
    Engine engine;
    RASSERT_EQ(RUNWRAP(engine.eval<INT>(R"(
        fn add(a, b) { a + b }
        let f = Fn("add");
        call(f, 40, 2)
    )")),
               42);

    RASSERT_EQ(RUNWRAP(engine.eval<INT>(R"(
        fn add(a, b) { a + b }
        let f = curry(Fn("add"), 40);
        f.call(2)
    )")),
               42);

    RASSERT_EQ(RUNWRAP(engine.eval<std::string>("Fn(\"foo\").to_string()")), "Fn(foo)");
    RASSERT_ERR(engine.eval<INT>("Fn(\"not a name\")"), ErrorKind::FUNCTION_NOT_FOUND);
}

static void test_fn_ptr_to_native()
{
    Engine engine;
    RASSERT_EQ(RUNWRAP(engine.eval<INT>("let f = Fn(\"len\"); f.call([1, 2, 3]) + 39")), 42);
    RASSERT_ERR(engine.eval<INT>("Fn(\"+\")"), ErrorKind::FUNCTION_NOT_FOUND);
}

// ============================================================================
// Closures
// ============================================================================

static void test_closure_compile_expression_rejected()
{
    Engine engine;
    auto r = engine.compileExpression("let f = |x| {};");
    RASSERT_ERR(r, ErrorKind::PARSING);

    auto *pe = dynamic_cast<const ParseError *>(&r.error());
    RASSERT(pe != nullptr);
    RASSERT(pe->type() == ParseErrorType::BAD_INPUT);
}

static void test_nested_closures_and_curry()
{
    Engine engine;
    RASSERT_EQ(RUNWRAP(engine.eval<INT>(R"(
        let x = 8;

        let res = |y, z| {
            let w = 12;

            return (|| x + y + z + w).call();
        }.curry(15).call(2);

        res + (|| x - 3).call()
    )")),
               42);
}

static void test_closure_mutates_captured()
{
    Engine engine;
    RASSERT_EQ(RUNWRAP(engine.eval<INT>(R"(
        let a = 41;
        let foo = |x| { a += x };
        foo.call(1);
        a
    )")),
               42);

    RASSERT_EQ(RUNWRAP(engine.eval<INT>(R"(
        let a = 21;
        let f = |x| a += x;
        f.call(a);
        a
    )")),
               42);
}

static void test_captured_variable_is_shared()
{
    Engine engine;
    RASSERT(RUNWRAP(engine.eval<bool>(R"(
        let a = 41;
        let foo = |x| { a += x };
        a.is_shared()
    )")));

    RASSERT(RUNWRAP(engine.eval<bool>(R"(
        let a = 41;
        let foo = |x| { a += x };
        is_shared(a)
    )")));

    RASSERT(!RUNWRAP(engine.eval<bool>("let a = 41; is_shared(a)")));

    // Reading a shared variable gives a plain copy
    RASSERT(!RUNWRAP(engine.eval<bool>(R"(
        let a = 41;
        let foo = || a;
        let b = a;
        b.is_shared()
    )")));
}

static void test_closure_calls_native()
{
    Engine engine;
    engine.registerFn("plus_one", [](INT x)
                      { return x + 1; });

    RASSERT_EQ(RUNWRAP(engine.eval<INT>(R"(
        let a = 41;
        let f = || plus_one(a);
        f.call()
    )")),
               42);

    RASSERT_EQ(RUNWRAP(engine.eval<INT>(R"(
        let a = 40;
        let f = |x| {
            let f = |x| {
                let f = |x| plus_one(a) + x;
                f.call(x)
            };
            f.call(x)
        };
        f.call(1)
    )")),
               42);
}

static void test_native_calls_closure()
{
    Engine engine;
    engine.registerRawFn("custom_call", {typeid(INT), typeid(FnPtr)},
                         [](NativeCallContext &ctx, FnArgs &args)
                         {
                             FnPtr fp = args[1]->asFnPtr();
                             return ctx.callFnPtr(fp, {});
                         });

    RASSERT_EQ(RUNWRAP(engine.eval<INT>(R"(
        let a = 41;
        let b = 0;
        let f = || b.custom_call(|| a + 1);

        f.call()
    )")),
               42);
}

// ============================================================================
// `this` binding and data races
// ============================================================================

static void test_call_binds_this()
{
    Engine engine;
    RASSERT_EQ(RUNWRAP(engine.eval<INT>(R"(
        let a = 1;
        let b = 40;
        let foo = |x| { this += a + x };
        b.call(foo, 1);
        b
    )")),
               42);
}

static void test_data_race_detected()
{
    Engine engine;
    auto r = engine.eval<INT>(R"(
        let a = 20;
        let foo = |x| { this += a + x };
        a.call(foo, 1);
        a
    )");
    RASSERT_ERR(r, ErrorKind::DATA_RACE);
}

static void test_this_outside_function_rejected()
{
    Engine engine;
    RASSERT_ERR(engine.compile("this + 1"), ErrorKind::PARSING);
}

// ============================================================================
// Closures used from the host
// ============================================================================

using MyType = std::shared_ptr<INT>;

static void test_closure_on_shared_host_objects()
{
    Engine engine;
    engine.registerTypeWithName<MyType>("MyType")
        .registerGetSet("data", [](MyType &p)
                        { return *p; }, [](MyType &p, INT value)
                        { *p = value; })
        .registerFn("+=", [](MyType &p1, MyType p2)
                    { *p1 += *p2; })
        .registerFn("-=", [](MyType &p1, MyType p2)
                    { *p1 -= *p2; });

    AST ast = RUNWRAP(engine.compile(R"(
        #{
            name: "A",
            description: "B",
            cost: 1,
            health_added: 0,
            action: |p1, p2| { p1 += p2 }
        }
    )"));

    Map res = RUNWRAP(engine.evalAst<Map>(ast));
    std::string name = res.at("action").cast<FnPtr>().fnName();

    auto p1 = std::make_shared<INT>(41);
    auto p2 = std::make_shared<INT>(1);

    Scope scope;
    RUNWRAP(engine.callFn<Unit>(scope, ast, name, p1, p2));
    RASSERT_EQ(*p1, 42);

    // Properties on the host object from a script
    scope.push("obj", p1);
    RASSERT_EQ(RUNWRAP(engine.evalWithScope<INT>(scope, "obj.data = obj.data - 2; obj.data")), 40);
    RASSERT_EQ(*p1, 40);
}

static void test_closure_outlives_its_script()
{
    Engine engine;
    AST ast = RUNWRAP(engine.compile(R"(
        let test = "hello";

        |x| test + x
    )"));

    FnPtr fp = RUNWRAP(engine.evalAst<FnPtr>(ast));

    // Keep only the functions; the captured value travels with the pointer
    ast.clearStatements();

    Dynamic result = RUNWRAP(engine.callFnPtr(ast, fp, {Dynamic::makeInt(42)}));
    RASSERT_EQ(result.cast<std::string>(), "hello42");
}

int main()
{
    std::cout << "\n===== Rill Closures: Function Pointers =====\n";
    runTest("fn ptr: curry then call from native", test_fn_ptr_curry_call);
    runTest("fn ptr: Fn, call and curry keywords", test_fn_ptr_keyword_forms);
    runTest("fn ptr: pointer to a native function", test_fn_ptr_to_native);

    std::cout << "\n===== Rill Closures: Capture =====\n";
    runTest("closure: rejected in a single expression", test_closure_compile_expression_rejected);
    runTest("closure: nested closures and curry", test_nested_closures_and_curry);
    runTest("closure: mutates a captured variable", test_closure_mutates_captured);
    runTest("closure: captured variable is shared", test_captured_variable_is_shared);
    runTest("closure: calls a native function", test_closure_calls_native);
    runTest("closure: called from a native function", test_native_calls_closure);

    std::cout << "\n===== Rill Closures: this and Data Races =====\n";
    runTest("call binds this", test_call_binds_this);
    runTest("data race detected", test_data_race_detected);
    runTest("this outside a function", test_this_outside_function_rejected);

    std::cout << "\n===== Rill Closures: Host Side =====\n";
    runTest("closure on shared host objects", test_closure_on_shared_host_objects);
    runTest("closure outlives its script", test_closure_outlives_its_script);

    return testExitCode();
}
