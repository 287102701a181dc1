#pragma once

#include "../lexer/position.hpp"
#include "../lib/types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rill
{

    class Module;

    // ============================================================
    // Forward declarations & smart-pointer aliases
    // ============================================================

    struct Expr;
    struct Stmt;

    using ExprPtr = std::unique_ptr<Expr>;
    using StmtPtr = std::unique_ptr<Stmt>;

    // ============================================================
    // Base classes
    // ============================================================

    struct Expr
    {
        Position pos;
        virtual ~Expr() = default;
    };

    struct Stmt
    {
        Position pos;
        virtual ~Stmt() = default;
    };

    // ============================================================
    // Expression nodes
    // ============================================================

    struct IntLiteral : Expr
    {
        INT value;
        IntLiteral(INT v, Position p) : value(v) { pos = p; }
    };

    struct FloatLiteral : Expr
    {
        FLOAT value;
        FloatLiteral(FLOAT v, Position p) : value(v) { pos = p; }
    };

    struct CharLiteral : Expr
    {
        char32_t value;
        CharLiteral(char32_t v, Position p) : value(v) { pos = p; }
    };

    struct StringLiteral : Expr
    {
        std::string value;
        StringLiteral(std::string v, Position p) : value(std::move(v)) { pos = p; }
    };

    struct BoolLiteral : Expr
    {
        bool value;
        BoolLiteral(bool v, Position p) : value(v) { pos = p; }
    };

    // `()`
    struct UnitLiteral : Expr
    {
        explicit UnitLiteral(Position p) { pos = p; }
    };

    // A variable, optionally qualified: x, m::X, a::b::X
    struct Variable : Expr
    {
        std::string name;
        std::vector<std::string> namespaces;
        Variable(std::string n, std::vector<std::string> ns, Position p)
            : name(std::move(n)), namespaces(std::move(ns)) { pos = p; }
    };

    struct ThisExpr : Expr
    {
        explicit ThisExpr(Position p) { pos = p; }
    };

    struct ArrayLiteral : Expr
    {
        std::vector<ExprPtr> elements;
        ArrayLiteral(std::vector<ExprPtr> elems, Position p) : elements(std::move(elems)) { pos = p; }
    };

    // #{ key: value, ... }
    struct MapLiteral : Expr
    {
        std::vector<std::pair<std::string, ExprPtr>> entries;
        MapLiteral(std::vector<std::pair<std::string, ExprPtr>> e, Position p)
            : entries(std::move(e)) { pos = p; }
    };

    // f(args), m::f(args), and every operator except the short-circuit ones
    struct FnCallExpr : Expr
    {
        std::string name;
        std::vector<std::string> namespaces;
        std::vector<ExprPtr> args;
        bool isOperator = false; // never passes its first argument by reference
        FnCallExpr(std::string n, std::vector<std::string> ns, std::vector<ExprPtr> a, Position p)
            : name(std::move(n)), namespaces(std::move(ns)), args(std::move(a)) { pos = p; }
    };

    // object.name(args)
    struct MethodCallExpr : Expr
    {
        ExprPtr object;
        std::string name;
        std::vector<ExprPtr> args;
        MethodCallExpr(ExprPtr obj, std::string n, std::vector<ExprPtr> a, Position p)
            : object(std::move(obj)), name(std::move(n)), args(std::move(a)) { pos = p; }
    };

    // object.name
    struct PropertyExpr : Expr
    {
        ExprPtr object;
        std::string name;
        PropertyExpr(ExprPtr obj, std::string n, Position p)
            : object(std::move(obj)), name(std::move(n)) { pos = p; }
    };

    // object[index]
    struct IndexExpr : Expr
    {
        ExprPtr object;
        ExprPtr index;
        IndexExpr(ExprPtr obj, ExprPtr idx, Position p)
            : object(std::move(obj)), index(std::move(idx)) { pos = p; }
    };

    // && and || (short-circuit)
    struct LogicalExpr : Expr
    {
        bool isAnd;
        ExprPtr left;
        ExprPtr right;
        LogicalExpr(bool andOp, ExprPtr l, ExprPtr r, Position p)
            : isAnd(andOp), left(std::move(l)), right(std::move(r)) { pos = p; }
    };

    // lhs in rhs
    struct InExpr : Expr
    {
        ExprPtr left;
        ExprPtr right;
        InExpr(ExprPtr l, ExprPtr r, Position p) : left(std::move(l)), right(std::move(r)) { pos = p; }
    };

    // { stmt; stmt; expr }
    struct BlockExpr : Expr
    {
        std::vector<StmtPtr> statements;
        BlockExpr(std::vector<StmtPtr> stmts, Position p) : statements(std::move(stmts)) { pos = p; }
    };

    // if cond { ... } else if ... else { ... }
    struct IfExpr : Expr
    {
        ExprPtr condition;
        ExprPtr thenBlock;
        ExprPtr elseBranch; // BlockExpr, IfExpr or nullptr
        IfExpr(ExprPtr cond, ExprPtr thenB, ExprPtr elseB, Position p)
            : condition(std::move(cond)), thenBlock(std::move(thenB)), elseBranch(std::move(elseB)) { pos = p; }
    };

    // |params| body: the body lives in the AST's module under `fnName`, taking
    // the captured variables as its leading parameters.
    struct ClosureExpr : Expr
    {
        std::string fnName;
        std::vector<std::string> externals;
        ClosureExpr(std::string name, std::vector<std::string> ext, Position p)
            : fnName(std::move(name)), externals(std::move(ext)) { pos = p; }
    };

    // ============================================================
    // Statement nodes
    // ============================================================

    struct ExprStmt : Stmt
    {
        ExprPtr expr;
        ExprStmt(ExprPtr e, Position p) : expr(std::move(e)) { pos = p; }
    };

    // let x = ...; const X = ...;
    struct LetStmt : Stmt
    {
        std::string name;
        ExprPtr init; // nullptr → unit
        bool isConst;
        LetStmt(std::string n, ExprPtr i, bool c, Position p)
            : name(std::move(n)), init(std::move(i)), isConst(c) { pos = p; }
    };

    // target = value, target op= value
    struct AssignStmt : Stmt
    {
        std::string op; // "" for plain '=', otherwise "+=", "-=", ...
        ExprPtr target;
        ExprPtr value;
        AssignStmt(std::string o, ExprPtr t, ExprPtr v, Position p)
            : op(std::move(o)), target(std::move(t)), value(std::move(v)) { pos = p; }
    };

    // while cond { ... }, loop { ... }
    struct WhileStmt : Stmt
    {
        ExprPtr condition; // nullptr → loop
        ExprPtr body;
        WhileStmt(ExprPtr cond, ExprPtr b, Position p) : condition(std::move(cond)), body(std::move(b)) { pos = p; }
    };

    struct ForStmt : Stmt
    {
        std::string varName;
        ExprPtr iterable;
        ExprPtr body;
        ForStmt(std::string var, ExprPtr iter, ExprPtr b, Position p)
            : varName(std::move(var)), iterable(std::move(iter)), body(std::move(b)) { pos = p; }
    };

    struct BreakStmt : Stmt
    {
        explicit BreakStmt(Position p) { pos = p; }
    };

    struct ContinueStmt : Stmt
    {
        explicit ContinueStmt(Position p) { pos = p; }
    };

    struct ReturnStmt : Stmt
    {
        ExprPtr value; // nullptr → unit
        ReturnStmt(ExprPtr v, Position p) : value(std::move(v)) { pos = p; }
    };

    struct ThrowStmt : Stmt
    {
        ExprPtr value; // nullptr → unit
        ThrowStmt(ExprPtr v, Position p) : value(std::move(v)) { pos = p; }
    };

    // import "path" as alias;
    struct ImportStmt : Stmt
    {
        ExprPtr path;
        std::optional<std::string> alias;
        ImportStmt(ExprPtr pathExpr, std::optional<std::string> a, Position p)
            : path(std::move(pathExpr)), alias(std::move(a)) { pos = p; }
    };

    // export x, y as z;
    struct ExportStmt : Stmt
    {
        std::vector<std::pair<std::string, std::optional<std::string>>> names;
        ExportStmt(std::vector<std::pair<std::string, std::optional<std::string>>> n, Position p)
            : names(std::move(n)) { pos = p; }
    };

    // ============================================================
    // Script functions
    // ============================================================

    enum class FnAccess
    {
        PUBLIC,
        PRIVATE,
    };

    struct ScriptFnDef
    {
        std::string name;
        FnAccess access = FnAccess::PUBLIC;
        std::vector<std::string> params;
        std::unique_ptr<BlockExpr> body;
        Position pos;
    };

    // ============================================================
    // AST: top-level statements plus the script functions
    // ============================================================

    class AST
    {
    public:
        AST();
        AST(std::vector<std::shared_ptr<const Stmt>> statements, std::shared_ptr<Module> lib);

        const std::vector<std::shared_ptr<const Stmt>> &statements() const { return statements_; }

        const Module &lib() const { return *lib_; }
        const std::shared_ptr<Module> &sharedLib() const { return lib_; }

        /// Statements of `other` run after ours. Functions of `other` replace
        /// ours on an identical name and arity.
        AST merge(const AST &other) const;

        /// Keep only the functions
        void clearStatements() { statements_.clear(); }

    private:
        std::vector<std::shared_ptr<const Stmt>> statements_;
        std::shared_ptr<Module> lib_;
    };

} // namespace rill
