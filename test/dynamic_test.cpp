// =============================================================================
// Rill Dynamic Tests
// =============================================================================
// The dynamic value container, shared cells and their locks, function pointer
// values, and the host-side Scope.
// =============================================================================

#include "../src/engine/engine.hpp"
#include "test_harness.hpp"

using namespace rill;

// ============================================================================
// Values
// ============================================================================

static void test_type_names()
{
    RASSERT_EQ(Dynamic::makeUnit().typeName(), "()");
    RASSERT_EQ(Dynamic::makeBool(true).typeName(), "bool");
    RASSERT_EQ(Dynamic::makeInt(1).typeName(), "i64");
    RASSERT_EQ(Dynamic::makeFloat(1.5).typeName(), "f64");
    RASSERT_EQ(Dynamic::makeChar(U'x').typeName(), "char");
    RASSERT_EQ(Dynamic::from(std::string("hi")).typeName(), "string");
    RASSERT_EQ(Dynamic::makeArray().typeName(), "array");
    RASSERT_EQ(Dynamic::makeMap().typeName(), "map");
    RASSERT_EQ(Dynamic::makeFnPtr(FnPtr("foo")).typeName(), "Fn");

    // Host integers other than i64 are boxed
    Dynamic small = Dynamic::from(int32_t(7));
    RASSERT(small.type() == DynType::VARIANT);
    RASSERT_EQ(small.typeName(), "i32");
    RASSERT_EQ(small.toString(), "7");
}

static void test_from_and_is()
{
    RASSERT(Dynamic::from(INT(42)).is<INT>());
    RASSERT(Dynamic::from(42.0).is<FLOAT>());
    RASSERT(Dynamic::from("text").is<ImmutableString>());
    RASSERT(Dynamic::from(std::string("text")).is<std::string>());
    RASSERT(!Dynamic::from(INT(42)).is<FLOAT>());
    RASSERT(Dynamic::from(Unit{}).isUnit());
}

static void test_cast()
{
    RASSERT_EQ(Dynamic::makeInt(42).cast<INT>(), 42);
    RASSERT_EQ(Dynamic::from("hello").cast<std::string>(), "hello");
    RASSERT_EQ(Dynamic::makeArray({Dynamic::makeInt(1)}).cast<Array>().size(), 1u);

    try
    {
        Dynamic::makeInt(42).cast<std::string>();
        RASSERT(false);
    }
    catch (const MismatchedTypeError &e)
    {
        RASSERT(e.kind() == ErrorKind::MISMATCHED_TYPE);
        RASSERT_EQ(e.detail(), "expected string, got i64");
    }
}

static void test_to_string()
{
    RASSERT_EQ(Dynamic::makeUnit().toString(), "");
    RASSERT_EQ(Dynamic::makeBool(false).toString(), "false");
    RASSERT_EQ(Dynamic::makeInt(-5).toString(), "-5");
    RASSERT_EQ(Dynamic::makeFloat(42.0).toString(), "42.0");
    RASSERT_EQ(Dynamic::makeFloat(0.5).toString(), "0.5");
    RASSERT_EQ(Dynamic::makeChar(U'x').toString(), "x");
    RASSERT_EQ(Dynamic::from("a\"b").toString(), "a\"b");
    RASSERT_EQ(Dynamic::makeFnPtr(FnPtr("foo")).toString(), "Fn(foo)");

    Array arr = {Dynamic::makeInt(1), Dynamic::from("two"), Dynamic::makeChar(U'3')};
    RASSERT_EQ(Dynamic::makeArray(arr).toString(), "[1, \"two\", '3']");
}

static void test_to_debug_string()
{
    RASSERT_EQ(Dynamic::makeUnit().toDebugString(), "()");
    RASSERT_EQ(Dynamic::from("a\"b\n").toDebugString(), "\"a\\\"b\\n\"");
    RASSERT_EQ(Dynamic::makeChar(U'\'').toDebugString(), "'\\''");
    RASSERT_EQ(Dynamic::makeInt(42).toDebugString(), "42");

    Map map;
    map["b"] = Dynamic::from("x");
    map["a"] = Dynamic::makeArray({Dynamic::makeInt(1), Dynamic::makeFloat(2.0)});
    RASSERT_EQ(Dynamic::makeMap(map).toDebugString(), "#{\"a\": [1, 2.0], \"b\": \"x\"}");
}

static void test_equals()
{
    RASSERT(Dynamic::makeInt(1).equals(Dynamic::makeInt(1)));
    RASSERT(!Dynamic::makeInt(1).equals(Dynamic::makeFloat(1.0)));
    RASSERT(Dynamic::makeUnit().equals(Dynamic::makeUnit()));

    Array a = {Dynamic::makeInt(1), Dynamic::from("x")};
    Array b = {Dynamic::makeInt(1), Dynamic::from("x")};
    RASSERT(Dynamic::makeArray(a).equals(Dynamic::makeArray(b)));
    b.push_back(Dynamic::makeUnit());
    RASSERT(!Dynamic::makeArray(a).equals(Dynamic::makeArray(b)));

    // Shared values compare by content
    Dynamic shared = Dynamic::makeInt(7).intoShared();
    RASSERT(shared.equals(Dynamic::makeInt(7)));
    RASSERT(Dynamic::makeInt(7).equals(shared));
}

static void test_take_leaves_unit()
{
    Dynamic value = Dynamic::from("moved");
    Dynamic out = value.take();
    RASSERT(value.isUnit());
    RASSERT_EQ(out.cast<std::string>(), "moved");
}

// ============================================================================
// Sharing and locks
// ============================================================================

static void test_shared_aliases()
{
    Dynamic shared = Dynamic::makeInt(1).intoShared();
    Dynamic alias = shared;
    RASSERT(shared.isShared() && alias.isShared());

    *alias.write() = Dynamic::makeInt(42);
    RASSERT_EQ(shared.cast<INT>(), 42);

    // intoShared on a shared value is another alias, not a new cell
    Dynamic again = shared.intoShared();
    *again.write() = Dynamic::makeInt(7);
    RASSERT_EQ(shared.cast<INT>(), 7);

    // Type queries look through the cell
    RASSERT(shared.is<INT>());
    RASSERT_EQ(shared.typeName(), "i64");
    RASSERT_EQ(shared.toString(), "7");
}

static void test_flatten_detaches()
{
    Dynamic shared = Dynamic::makeInt(1).intoShared();
    Dynamic plain = shared.flatten();
    RASSERT(!plain.isShared());

    *shared.write() = Dynamic::makeInt(2);
    RASSERT_EQ(plain.cast<INT>(), 1);
    RASSERT_EQ(shared.cast<INT>(), 2);
}

static void test_locks_detect_races()
{
    Dynamic shared = Dynamic::makeInt(1).intoShared();

    {
        auto w = shared.write("x");
        try
        {
            Dynamic alias = shared;
            auto second = alias.write("x");
            RASSERT(false);
        }
        catch (const DataRaceError &e)
        {
            RASSERT(e.kind() == ErrorKind::DATA_RACE);
            RASSERT_EQ(e.detail(), "'x' is already locked");
        }

        bool raced = false;
        try
        {
            auto r = shared.read();
        }
        catch (const DataRaceError &)
        {
            raced = true;
        }
        RASSERT(raced);
    }

    // Released: multiple readers are fine, a writer is not
    {
        auto r1 = shared.read();
        auto r2 = shared.read();
        RASSERT_EQ(r1->asInt(), 1);

        bool raced = false;
        try
        {
            auto w = shared.write();
        }
        catch (const DataRaceError &)
        {
            raced = true;
        }
        RASSERT(raced);
    }

    auto w = shared.write();
    *w = Dynamic::makeInt(2);
}

static void test_plain_values_lock_trivially()
{
    Dynamic plain = Dynamic::makeInt(1);
    auto w1 = plain.write();
    auto w2 = plain.write();
    *w2 = Dynamic::makeInt(5);
    RASSERT_EQ(w1->asInt(), 5);
}

// ============================================================================
// Function pointers
// ============================================================================

static void test_fn_ptr_create()
{
    FnPtr fp = FnPtr::create("foo", Position::none());
    RASSERT_EQ(fp.fnName(), "foo");
    RASSERT(fp.curry().empty());
    RASSERT(!fp.isAnonymous());
    RASSERT(FnPtr(std::string(ANONYMOUS_FN_PREFIX) + "3").isAnonymous());

    // Keyword functions may be pointed at
    RASSERT_EQ(FnPtr::create("print", Position::none()).fnName(), "print");

    for (const char *bad : {"", "1abc", "a b", "+", "while", "let", "var"})
    {
        bool thrown = false;
        try
        {
            FnPtr::create(bad, Position(1, 1));
        }
        catch (const FunctionNotFoundError &e)
        {
            thrown = true;
            RASSERT_EQ(e.detail(), bad);
        }
        RASSERT(thrown);
    }
}

static void test_fn_ptr_curry()
{
    FnPtr fp("add");
    FnPtr one = fp.curried({Dynamic::makeInt(1)});
    RASSERT(fp.curry().empty());
    RASSERT_EQ(one.curry().size(), 1u);

    one.addCurry({Dynamic::makeInt(2), Dynamic::makeInt(3)});
    RASSERT_EQ(one.curry().size(), 3u);
    RASSERT_EQ(one.curry()[0].asInt(), 1);
    RASSERT_EQ(one.curry()[2].asInt(), 3);

    RASSERT(fp != one);
    RASSERT(one == FnPtr("add", {Dynamic::makeInt(1), Dynamic::makeInt(2), Dynamic::makeInt(3)}));
}

// ============================================================================
// Scope
// ============================================================================

static void test_scope_values()
{
    Scope scope;
    scope.push("x", INT(1)).push("name", std::string("rill")).pushConstant("LIMIT", INT(10));

    RASSERT_EQ(scope.size(), 3u);
    RASSERT_EQ(*scope.getValue<INT>("x"), 1);
    RASSERT_EQ(*scope.getValue<std::string>("name"), "rill");
    RASSERT(!scope.getValue<INT>("name").has_value());
    RASSERT(!scope.getValue<INT>("missing").has_value());

    // Shadowing: the latest entry wins
    scope.push("x", INT(2));
    RASSERT_EQ(*scope.getValue<INT>("x"), 2);
    RASSERT_EQ(*scope.indexOf("x"), 3u);

    scope.set("x", INT(3));
    RASSERT_EQ(*scope.getValue<INT>("x"), 3);

    // set on an unknown name pushes it
    scope.set("fresh", true);
    RASSERT(scope.contains("fresh"));

    scope.rewind(3);
    RASSERT_EQ(*scope.getValue<INT>("x"), 1);
    RASSERT(!scope.contains("fresh"));
}

static void test_scope_constant_rejects_set()
{
    Scope scope;
    scope.pushConstant("LIMIT", INT(10));

    bool thrown = false;
    try
    {
        scope.set("LIMIT", INT(11));
    }
    catch (const AssignmentToConstantError &e)
    {
        thrown = true;
        RASSERT(e.kind() == ErrorKind::ASSIGNMENT_TO_CONSTANT);
    }
    RASSERT(thrown);
    RASSERT_EQ(*scope.getValue<INT>("LIMIT"), 10);

    Engine engine;
    RASSERT_ERR(engine.evalWithScope<INT>(scope, "LIMIT = 1; LIMIT"), ErrorKind::ASSIGNMENT_TO_CONSTANT);
}

static void test_scope_writes_through_shared()
{
    Scope scope;
    scope.pushDynamic("s", Dynamic::makeInt(1).intoShared());
    Dynamic alias = scope.at(0).value;

    scope.set("s", INT(42));
    RASSERT_EQ(alias.cast<INT>(), 42);
    RASSERT_EQ(*scope.getValue<INT>("s"), 42);
}

int main()
{
    std::cout << "\n===== Rill Dynamic: Values =====\n";
    runTest("type names", test_type_names);
    runTest("from and is", test_from_and_is);
    runTest("cast", test_cast);
    runTest("toString", test_to_string);
    runTest("toDebugString", test_to_debug_string);
    runTest("equals", test_equals);
    runTest("take leaves unit", test_take_leaves_unit);

    std::cout << "\n===== Rill Dynamic: Sharing and Locks =====\n";
    runTest("shared values alias one cell", test_shared_aliases);
    runTest("flatten detaches", test_flatten_detaches);
    runTest("locks detect races", test_locks_detect_races);
    runTest("plain values lock trivially", test_plain_values_lock_trivially);

    std::cout << "\n===== Rill Dynamic: Function Pointers =====\n";
    runTest("Fn creation", test_fn_ptr_create);
    runTest("curry", test_fn_ptr_curry);

    std::cout << "\n===== Rill Dynamic: Scope =====\n";
    runTest("scope values", test_scope_values);
    runTest("constant rejects set", test_scope_constant_rejects_set);
    runTest("set writes through shared", test_scope_writes_through_shared);

    return testExitCode();
}
