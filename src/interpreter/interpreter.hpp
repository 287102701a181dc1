#pragma once

// =============================================================================
// Interpreter: Rill's tree-walking evaluator
// =============================================================================
//
// Walks the AST produced by the Parser and executes it against a Scope.
//
// Design choices:
//   - Block scoping: a block rewinds the Scope (and its imports) on exit.
//   - Script function calls run in a fresh Scope; the callee never sees the
//     caller's variables. Closures reach outside only through the shared
//     values curried into them.
//   - Method receivers and assignment targets are accessed in place under a
//     write lock; every other read yields a flattened copy.
//   - `return`, `break` and `continue` unwind with signal structs, not
//     errors.
//   - Native functions are looked up in the engine's global module, then in
//     its packages. Script functions take priority over natives.
//
// An Interpreter lives for one evaluation. It reads the Engine but never
// changes it.
//
// =============================================================================

#include "dynamic.hpp"
#include "fn_ptr.hpp"
#include "scope.hpp"
#include "../module/module.hpp"
#include "../parser/ast.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace rill
{

    class Engine;

    // ---- Control-flow signal for return -------------------------------------

    struct ReturnSignal
    {
        Dynamic value;
    };

    // ---- Control-flow signals for break/continue ---------------------------

    struct BreakSignal
    {
    };
    struct ContinueSignal
    {
    };

    // ========================================================================
    // Interpreter
    // ========================================================================

    class Interpreter
    {
    public:
        using ImportList = std::vector<std::pair<std::string, std::shared_ptr<const Module>>>;

        /// `lib` holds the script functions of the AST being run (may be null)
        Interpreter(const Engine &engine, Scope &scope, const Module *lib);

        /// Execute top-level statements; the value of the last one is returned
        Dynamic run(const std::vector<std::shared_ptr<const Stmt>> &statements);

        /// Call a public script function of the library directly on the
        /// current scope. Parameters are pushed on top and removed afterwards.
        Dynamic callFnOnScope(const std::string &name, std::vector<Dynamic> args, Dynamic *thisPtr);

        /// Call a function pointer: curried values first, then `args`
        Dynamic callFnPtr(const FnPtr &fnPtr, std::vector<Dynamic> args, Dynamic *thisPtr, bool publicOnly,
                          Position pos);

        const Engine &engine() const { return engine_; }

        /// Modules imported at the current level, oldest first
        const ImportList &imports() const { return imports_; }

    private:
        const Engine &engine_;
        Scope *scope_;
        const Module *lib_;
        const Module *rootLib_;
        Dynamic *this_ = nullptr;
        ImportList imports_;
        size_t callDepth_ = 0;
        uint64_t operations_ = 0;

        class BlockGuard;
        class FrameGuard;

        using TargetFn = std::function<void(Dynamic &)>;

        void tick(Position pos);

        // ---- Statement execution -------------------------------------------

        Dynamic exec(const Stmt *stmt);
        void execLet(const LetStmt *node);
        void execAssign(const AssignStmt *node);
        void execWhile(const WhileStmt *node);
        void execFor(const ForStmt *node);
        void execImport(const ImportStmt *node);
        void execExport(const ExportStmt *node);

        // ---- Expression evaluation -----------------------------------------

        Dynamic eval(const Expr *expr);
        Dynamic evalVariable(const Variable *node);
        Dynamic evalBlock(const BlockExpr *node);
        Dynamic evalIf(const IfExpr *node);
        Dynamic evalLogical(const LogicalExpr *node);
        Dynamic evalIn(const InExpr *node);
        Dynamic evalArray(const ArrayLiteral *node);
        Dynamic evalMap(const MapLiteral *node);
        Dynamic evalClosure(const ClosureExpr *node);
        Dynamic evalIndex(const IndexExpr *node);
        Dynamic evalProperty(const PropertyExpr *node);
        Dynamic evalFnCall(const FnCallExpr *node);
        Dynamic evalKeywordCall(const FnCallExpr *node);
        Dynamic evalQualifiedCall(const FnCallExpr *node);
        Dynamic evalMethodCall(const MethodCallExpr *node);

        std::vector<Dynamic> evalArgs(const std::vector<ExprPtr> &args, size_t from = 0);

        // ---- Places (assignment targets and method receivers) -------------

        void accessTarget(const Expr *expr, bool forWrite, const TargetFn &fn);
        void accessIndex(Dynamic &container, const Dynamic &index, bool forWrite, Position pos,
                         const TargetFn &fn);
        void accessProperty(Dynamic &container, const std::string &prop, bool forWrite, Position pos,
                            const TargetFn &fn);

        Dynamic readIndex(Dynamic &container, const Dynamic &index, Position pos);

        // ---- Function calls ------------------------------------------------

        struct ScriptFnRef
        {
            const FuncInfo *fn = nullptr;
            const Module *lib = nullptr;
        };

        ScriptFnRef findScriptFn(const std::string &name, size_t arity, bool publicOnly) const;
        const FuncInfo *findNative(const std::string &name, const std::vector<std::type_index> &types,
                                   bool method) const;
        std::shared_ptr<const Module> findModule(const std::vector<std::string> &path, Position pos) const;

        Dynamic callScriptFn(const ScriptFnRef &ref, std::vector<Dynamic> args, Dynamic *thisPtr, Position pos);
        Dynamic callNative(const FuncInfo &fn, const std::string &name, FnArgs &args, bool method, Position pos);
        Dynamic callMethod(const std::string &name, Dynamic &target, std::vector<Dynamic> &args, Position pos);

        /// Call a native by value; `==` and `!=` fall back to "unequal".
        Dynamic callByValue(const std::string &name, std::vector<Dynamic> &args, Position pos);

        /// Call a native only if one exists; returns false otherwise.
        bool tryCallNative(const std::string &name, FnArgs &args, bool method, Position pos, Dynamic &result);

        Dynamic runBody(const ScriptFnDef &def);

        void checkDataSize(const Dynamic &value, Position pos) const;
        std::string signatureOf(const std::string &name, const FnArgs &args) const;

        friend class NativeCallContext;
    };

} // namespace rill
