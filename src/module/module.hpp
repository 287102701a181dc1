#pragma once

// =============================================================================
// Module: Rill's function dispatch table
// =============================================================================
//
// A Module maps a function signature (name + ordered argument type ids) to a
// callable, plus a table of named values (constants) and nested sub-modules.
// Same name with different signatures coexist; setting an identical signature
// again overwrites the old entry.
//
// Native functions all share one shape:
//
//     Dynamic fn(NativeCallContext &ctx, FnArgs &args)
//
// where args[i] points at the i-th argument. In a method-style call args[0]
// points at the receiver's own storage, so writes through it are visible to
// the caller. See builtins/fn_register.hpp for the templates that build these
// wrappers from ordinary C++ callables.
//
// Script functions live in the same table keyed by (name, arity): every
// parameter is the wildcard type id typeid(Dynamic).
//
// =============================================================================

#include "../interpreter/dynamic.hpp"
#include "../parser/ast.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <typeindex>
#include <vector>

namespace rill
{

    class Engine;
    class Interpreter;
    class NativeCallContext;

    /// Argument list of a native function call
    using FnArgs = std::vector<Dynamic *>;

    /// Every native function, whatever its C++ signature, is wrapped into this
    using NativeFn = std::function<Dynamic(NativeCallContext &, FnArgs &)>;

    // ========================================================================
    // FnSignature: the dispatch key
    // ========================================================================

    struct FnSignature
    {
        std::string name;
        std::vector<std::type_index> params;

        bool operator<(const FnSignature &o) const;
        bool operator==(const FnSignature &o) const { return name == o.name && params == o.params; }

        /// "name (i64, f64)"
        std::string toString() const;
    };

    /// "name (i64, f64)" for a call site
    std::string formatSignature(const std::string &name, const std::vector<std::type_index> &types);

    struct FuncInfo
    {
        std::string name;
        FnAccess access = FnAccess::PUBLIC;
        std::vector<std::type_index> params;
        NativeFn native;                           // empty for script functions
        std::shared_ptr<const ScriptFnDef> script; // null for native functions

        bool isScript() const { return script != nullptr; }
    };

    // ========================================================================
    // NativeCallContext: what a native function can see of the engine
    // ========================================================================

    class NativeCallContext
    {
    public:
        NativeCallContext(Interpreter &interp, std::string fnName, Position pos)
            : interp_(interp), fnName_(std::move(fnName)), pos_(pos) {}

        const Engine &engine() const;
        const std::string &fnName() const { return fnName_; }

        /// Position of the call site
        Position position() const { return pos_; }

        /// Call a function pointer with its curried arguments followed by
        /// `args`. `thisPtr`, when given, is bound to `this`. Private script
        /// functions are not reachable from here.
        Dynamic callFnPtr(const FnPtr &fnPtr, std::vector<Dynamic> args, Dynamic *thisPtr = nullptr) const;

    private:
        Interpreter &interp_;
        std::string fnName_;
        Position pos_;
    };

    // ========================================================================
    // Module
    // ========================================================================

    class Module
    {
    public:
        Module() = default;

        // ---- Functions ----

        /// Register (or overwrite) a native function
        void setFn(const std::string &name, FnAccess access, std::vector<std::type_index> params,
                   NativeFn fn);

        /// Register (or overwrite) a script function under (name, arity)
        void setScriptFn(std::shared_ptr<const ScriptFnDef> def);

        /// Exact signature lookup
        const FuncInfo *getFn(const std::string &name, const std::vector<std::type_index> &params) const;

        /// Script function lookup by (name, arity)
        const FuncInfo *getScriptFn(const std::string &name, size_t arity, bool publicOnly) const;

        /// Cheapest non-exact match for a call: an INT argument may fill a
        /// double parameter (cost 1) and a typeid(Dynamic) parameter takes
        /// anything (cost 2). Ties go to the first candidate in signature
        /// order. With `method` set the receiver (argument 0) must match
        /// exactly or by wildcard. Returns the candidate and its total cost.
        std::pair<const FuncInfo *, int> findPromoted(const std::string &name,
                                                      const std::vector<std::type_index> &argTypes,
                                                      bool method, bool publicOnly) const;

        /// Exact match, falling back to findPromoted()
        const FuncInfo *resolveFn(const std::string &name, const std::vector<std::type_index> &argTypes,
                                  bool method = false) const;

        bool containsFn(const std::string &name) const;

        const std::map<FnSignature, FuncInfo> &functions() const { return functions_; }
        size_t numFunctions() const { return functions_.size(); }

        // ---- Variables ----

        template <typename T>
        void setVar(const std::string &name, T value)
        {
            variables_[name] = Dynamic::from(std::move(value));
        }

        const Dynamic *getVar(const std::string &name) const;
        bool containsVar(const std::string &name) const { return variables_.count(name) > 0; }

        const std::map<std::string, Dynamic> &variables() const { return variables_; }
        size_t numVariables() const { return variables_.size(); }

        // ---- Sub-modules ----

        void setSubModule(const std::string &name, std::shared_ptr<const Module> module);
        std::shared_ptr<const Module> getSubModule(const std::string &name) const;
        bool containsSubModule(const std::string &name) const { return modules_.count(name) > 0; }

        const std::map<std::string, std::shared_ptr<const Module>> &subModules() const { return modules_; }

        // ---- Combination ----

        /// Merge another module into this one. Last write wins on an identical
        /// signature, variable name or sub-module name.
        Module &combine(const Module &other);

        /// Like combine(), but the other module's sub-modules are merged into
        /// this module's top level instead of being kept as sub-modules.
        Module &combineFlatten(const Module &other);

        // ---- Modules from scripts ----

        /// Run `ast` in a fresh scope and collect its exported variables,
        /// public functions and top-level imports into a new module.
        static std::shared_ptr<Module> evalAstAsModule(const Engine &engine, const AST &ast);

    private:
        std::map<FnSignature, FuncInfo> functions_;
        std::map<std::string, Dynamic> variables_;
        std::map<std::string, std::shared_ptr<const Module>> modules_;
    };

} // namespace rill
