#pragma once

// =============================================================================
// Engine: the host-facing facade
// =============================================================================
//
// An Engine owns the configuration shared by every script it runs: the global
// module of host-registered functions, the loaded packages, the module
// resolver, the lexer's disabled symbols and custom operators, the output
// callbacks and the execution limits.
//
//   rill::Engine engine;
//   engine.registerFn("add", [](INT a, INT b) { return a + b; });
//
//   auto r = engine.eval<INT>("add(40, 2)");
//   if (r) std::cout << r.value() << "\n";           // 42
//   else   std::cerr << r.error().what() << "\n";
//
// Every entry point returns an EvalResult; no exception reaches the host.
// Evaluation never modifies the Engine, so one Engine can run independent
// scripts on several threads when built with RILL_SYNC.
//
// =============================================================================

#include "../builtins/fn_register.hpp"
#include "../interpreter/dynamic.hpp"
#include "../interpreter/fn_ptr.hpp"
#include "../interpreter/scope.hpp"
#include "../lexer/lexer.hpp"
#include "../lib/errors/result.hpp"
#include "../module/module.hpp"
#include "../module/resolver.hpp"
#include "../parser/ast.hpp"
#include "../parser/parser.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace rill
{

    /// Execution limits. Zero means "no limit" except where noted.
    struct Limits
    {
        size_t maxCallLevels = 64;
        uint64_t maxOperations = 0;
        size_t maxExprDepth = 128;
        size_t maxStringSize = 0;
        size_t maxArraySize = 0;
        size_t maxMapSize = 0;
    };

    using PrintCallback = std::function<void(const std::string &)>;
    using DebugCallback = std::function<void(const std::string &, Position)>;
    using ProgressCallback = std::function<bool(uint64_t)>;

    class Engine
    {
    public:
        /// An engine with the standard package loaded
        Engine();

        /// An engine with no packages at all
        static Engine newRaw();

        // ---- Compilation ----

        EvalResult<AST> compile(const std::string &script) const;

        /// Several source pieces compiled as one script
        EvalResult<AST> compileScripts(const std::vector<std::string> &scripts) const;

        /// A single expression: no statements, blocks, `if` or closures
        EvalResult<AST> compileExpression(const std::string &script) const;

        // ---- Evaluation ----

        template <typename T>
        EvalResult<T> eval(const std::string &script) const
        {
            Scope scope;
            return evalWithScope<T>(scope, script);
        }

        template <typename T>
        EvalResult<T> evalWithScope(Scope &scope, const std::string &script) const
        {
            auto ast = compile(script);
            if (!ast)
                return ast.errorPtr();
            return evalAstWithScope<T>(scope, ast.value());
        }

        template <typename T>
        EvalResult<T> evalExpression(const std::string &script) const
        {
            Scope scope;
            return evalExpressionWithScope<T>(scope, script);
        }

        template <typename T>
        EvalResult<T> evalExpressionWithScope(Scope &scope, const std::string &script) const
        {
            auto ast = compileExpression(script);
            if (!ast)
                return ast.errorPtr();
            return evalAstWithScope<T>(scope, ast.value());
        }

        template <typename T>
        EvalResult<T> evalAst(const AST &ast) const
        {
            Scope scope;
            return evalAstWithScope<T>(scope, ast);
        }

        template <typename T>
        EvalResult<T> evalAstWithScope(Scope &scope, const AST &ast) const
        {
            return castResult<T>(evalAstDynamic(scope, ast));
        }

        /// Evaluate and throw the result away
        EvalResult<Unit> consume(const std::string &script) const;
        EvalResult<Unit> consumeWithScope(Scope &scope, const std::string &script) const;

        // ---- Calling into a compiled script ----

        /// Call a public script function of `ast` on top of `scope`. The
        /// top-level statements are not run. Variables the function leaves
        /// behind are dropped; changes to existing ones stay.
        template <typename T, typename... Args>
        EvalResult<T> callFn(Scope &scope, const AST &ast, const std::string &name, Args &&...args) const
        {
            std::vector<Dynamic> values{Dynamic::from(std::forward<Args>(args))...};
            return castResult<T>(callFnDynamic(scope, ast, name, nullptr, std::move(values)));
        }

        /// callFn with an optional `this` binding
        EvalResult<Dynamic> callFnDynamic(Scope &scope, const AST &ast, const std::string &name, Dynamic *thisPtr,
                                          std::vector<Dynamic> args) const;

        /// Call a function pointer, looking up script functions in `ast`
        EvalResult<Dynamic> callFnPtr(const AST &ast, const FnPtr &fnPtr, std::vector<Dynamic> args) const;

        /// Compile `script` and bind its public function `name` into a host
        /// callable. The callable owns the engine and the compiled script;
        /// each call runs on a fresh scope.
        template <typename R, typename... Args>
        static EvalResult<std::function<EvalResult<R>(Args...)>> createFromScript(Engine engine,
                                                                                 const std::string &script,
                                                                                 const std::string &name)
        {
            auto compiled = engine.compile(script);
            if (!compiled)
                return compiled.errorPtr();

            auto owner = std::make_shared<const Engine>(std::move(engine));
            auto ast = std::make_shared<const AST>(std::move(compiled).value());
            return std::function<EvalResult<R>(Args...)>(
                [owner, ast, name](Args... args)
                {
                    Scope scope;
                    return owner->template callFn<R>(scope, *ast, name, std::move(args)...);
                });
        }

        // ---- Registration ----

        template <typename F>
        Engine &registerFn(const std::string &name, F &&f)
        {
            rill::registerFn(global_, name, std::forward<F>(f));
            return *this;
        }

        template <typename F>
        Engine &registerResultFn(const std::string &name, F &&f)
        {
            rill::registerResultFn(global_, name, std::forward<F>(f));
            return *this;
        }

        Engine &registerRawFn(const std::string &name, std::vector<std::type_index> params, NativeFn fn)
        {
            rill::registerRawFn(global_, name, std::move(params), std::move(fn));
            return *this;
        }

        /// Make T known to the engine (its display name defaults to the
        /// compiler's type name)
        template <typename T>
        Engine &registerType()
        {
            typeNames_.emplace(std::type_index(typeid(T)), typeNameOf(typeid(T)));
            return *this;
        }

        template <typename T>
        Engine &registerTypeWithName(const std::string &name)
        {
            typeNames_[std::type_index(typeid(T))] = name;
            return *this;
        }

        template <typename F>
        Engine &registerGet(const std::string &prop, F &&getter)
        {
            rill::registerGet(global_, prop, std::forward<F>(getter));
            return *this;
        }

        template <typename F>
        Engine &registerSet(const std::string &prop, F &&setter)
        {
            rill::registerSet(global_, prop, std::forward<F>(setter));
            return *this;
        }

        template <typename G, typename S>
        Engine &registerGetSet(const std::string &prop, G &&getter, S &&setter)
        {
            registerGet(prop, std::forward<G>(getter));
            return registerSet(prop, std::forward<S>(setter));
        }

        template <typename F>
        Engine &registerIndexerGet(F &&getter)
        {
            rill::registerIndexerGet(global_, std::forward<F>(getter));
            return *this;
        }

        template <typename F>
        Engine &registerIndexerSet(F &&setter)
        {
            rill::registerIndexerSet(global_, std::forward<F>(setter));
            return *this;
        }

        /// Make a package's functions callable from every script. Later
        /// packages are searched after earlier ones.
        Engine &loadPackage(std::shared_ptr<const Module> package);

        // ---- Configuration ----

        Engine &setModuleResolver(std::shared_ptr<ModuleResolver> resolver);
        const ModuleResolver *moduleResolver() const { return resolver_.get(); }

        /// Turn a keyword or operator off: it lexes as a reserved symbol (or
        /// an error for operators) from now on.
        Engine &disableSymbol(const std::string &symbol);

        /// Add a binary operator that calls the function of the same name.
        /// Fails for reserved symbols and active standard keywords/operators.
        EvalResult<Unit> registerCustomOperator(const std::string &name, uint8_t precedence);

        Engine &onPrint(PrintCallback callback);
        Engine &onDebug(DebugCallback callback);
        Engine &onProgress(ProgressCallback callback);

        Limits &limits() { return limits_; }
        const Limits &limits() const { return limits_; }

        // ---- Used by the interpreter ----

        const Module &globalModule() const { return global_; }
        const std::vector<std::shared_ptr<const Module>> &packages() const { return packages_; }

        /// Display name of a type, honouring registerTypeWithName()
        std::string mapTypeName(std::type_index type) const;

        /// "name (i64, MyType)"
        std::string formatSignature(const std::string &name, const std::vector<std::type_index> &types) const;

        void print(const std::string &text) const;
        void debug(const std::string &text, Position pos) const;

        /// false when the progress callback asks to stop
        bool progress(uint64_t operations) const;
        bool hasProgressCallback() const { return static_cast<bool>(progress_); }

    private:
        Module global_;
        std::vector<std::shared_ptr<const Module>> packages_;
        std::shared_ptr<ModuleResolver> resolver_;
        std::unordered_map<std::type_index, std::string> typeNames_;
        std::unordered_set<std::string> disabledSymbols_;
        std::map<std::string, uint8_t> customOperators_;
        Limits limits_;
        PrintCallback print_;
        DebugCallback debug_;
        ProgressCallback progress_;

        struct RawTag
        {
        };
        explicit Engine(RawTag);

        LexerConfig lexerConfig() const;
        EvalResult<AST> parseTokens(std::vector<std::string> scripts, ParserSettings settings, bool expression) const;

        EvalResult<Dynamic> evalAstDynamic(Scope &scope, const AST &ast) const;

        template <typename T>
        EvalResult<T> castResult(EvalResult<Dynamic> result) const
        {
            if (!result)
                return result.errorPtr();
            if constexpr (std::is_same_v<T, Dynamic>)
            {
                return std::move(result).value();
            }
            else
            {
                const Dynamic &value = result.value();
                if (!value.is<T>())
                    return EvalResult<T>(MismatchedTypeError(mapTypeName(typeid(CanonicalType<T>)),
                                                             mapTypeName(value.typeId()), Position::none()));
                return value.template cast<T>();
            }
        }
    };

} // namespace rill
