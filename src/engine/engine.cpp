#include "engine.hpp"
#include "../builtins/register_all.hpp"
#include "../interpreter/interpreter.hpp"
#include "../lexer/token.hpp"
#include <iostream>

namespace rill
{

    // ========================================================================
    // Construction
    // ========================================================================

    Engine::Engine() : Engine(RawTag{})
    {
        loadPackage(corePackage());

        print_ = [](const std::string &text)
        { std::cout << text << std::endl; };

        debug_ = [](const std::string &text, Position pos)
        {
            if (pos.isNone())
                std::cout << text << std::endl;
            else
                std::cout << pos.toString() << " | " << text << std::endl;
        };
    }

    Engine::Engine(RawTag) {}

    Engine Engine::newRaw()
    {
        return Engine(RawTag{});
    }

    // ========================================================================
    // Compilation
    // ========================================================================

    LexerConfig Engine::lexerConfig() const
    {
        LexerConfig config;
        config.disabledSymbols = &disabledSymbols_;
        config.customKeywords = &customOperators_;
        config.maxStringSize = limits_.maxStringSize;
        return config;
    }

    EvalResult<AST> Engine::parseTokens(std::vector<std::string> scripts, ParserSettings settings,
                                        bool expression) const
    {
        try
        {
            Lexer lexer(std::move(scripts), lexerConfig());
            Parser parser(lexer.tokenize(), &customOperators_, settings);
            return expression ? parser.parseSingleExpression() : parser.parse();
        }
        catch (const RillError &e)
        {
            return EvalResult<AST>(e);
        }
    }

    EvalResult<AST> Engine::compile(const std::string &script) const
    {
        return compileScripts({script});
    }

    EvalResult<AST> Engine::compileScripts(const std::vector<std::string> &scripts) const
    {
        ParserSettings settings;
        settings.maxExprDepth = limits_.maxExprDepth;
        return parseTokens(scripts, settings, false);
    }

    EvalResult<AST> Engine::compileExpression(const std::string &script) const
    {
        ParserSettings settings;
        settings.allowIfExpression = false;
        settings.allowStatementBlock = false;
        settings.allowClosures = false;
        settings.maxExprDepth = limits_.maxExprDepth;
        return parseTokens({script}, settings, true);
    }

    // ========================================================================
    // Evaluation
    // ========================================================================

    EvalResult<Dynamic> Engine::evalAstDynamic(Scope &scope, const AST &ast) const
    {
        try
        {
            Interpreter interp(*this, scope, &ast.lib());
            return interp.run(ast.statements());
        }
        catch (const RillError &e)
        {
            return EvalResult<Dynamic>(e);
        }
    }

    EvalResult<Unit> Engine::consume(const std::string &script) const
    {
        Scope scope;
        return consumeWithScope(scope, script);
    }

    EvalResult<Unit> Engine::consumeWithScope(Scope &scope, const std::string &script) const
    {
        auto ast = compile(script);
        if (!ast)
            return ast.errorPtr();

        auto result = evalAstDynamic(scope, ast.value());
        if (!result)
            return result.errorPtr();
        return Unit{};
    }

    EvalResult<Dynamic> Engine::callFnDynamic(Scope &scope, const AST &ast, const std::string &name,
                                              Dynamic *thisPtr, std::vector<Dynamic> args) const
    {
        try
        {
            Interpreter interp(*this, scope, &ast.lib());
            return interp.callFnOnScope(name, std::move(args), thisPtr);
        }
        catch (const RillError &e)
        {
            return EvalResult<Dynamic>(e);
        }
    }

    EvalResult<Dynamic> Engine::callFnPtr(const AST &ast, const FnPtr &fnPtr, std::vector<Dynamic> args) const
    {
        try
        {
            Scope scope;
            Interpreter interp(*this, scope, &ast.lib());
            return interp.callFnPtr(fnPtr, std::move(args), nullptr, true, Position::none());
        }
        catch (const RillError &e)
        {
            return EvalResult<Dynamic>(e);
        }
    }

    // ========================================================================
    // Configuration
    // ========================================================================

    Engine &Engine::loadPackage(std::shared_ptr<const Module> package)
    {
        packages_.push_back(std::move(package));
        return *this;
    }

    Engine &Engine::setModuleResolver(std::shared_ptr<ModuleResolver> resolver)
    {
        resolver_ = std::move(resolver);
        return *this;
    }

    Engine &Engine::disableSymbol(const std::string &symbol)
    {
        disabledSymbols_.insert(symbol);
        return *this;
    }

    EvalResult<Unit> Engine::registerCustomOperator(const std::string &name, uint8_t precedence)
    {
        if (name.empty())
            return RuntimeError("custom operator name is empty", Position::none());

        if (auto token = lookupFromSyntax(name))
        {
            bool disabled = disabledSymbols_.count(name) > 0;

            if (token->isKeyword() && !disabled)
                return RuntimeError("'" + name + "' is a reserved keyword", Position::none());
            if (token->isOperator() && !disabled)
                return RuntimeError("'" + name + "' is a reserved operator", Position::none());
            if (token->isReserved() && !isValidIdentifier(name))
                return RuntimeError("'" + name + "' is a reserved symbol", Position::none());
        }

        customOperators_[name] = precedence;
        return Unit{};
    }

    Engine &Engine::onPrint(PrintCallback callback)
    {
        print_ = std::move(callback);
        return *this;
    }

    Engine &Engine::onDebug(DebugCallback callback)
    {
        debug_ = std::move(callback);
        return *this;
    }

    Engine &Engine::onProgress(ProgressCallback callback)
    {
        progress_ = std::move(callback);
        return *this;
    }

    // ========================================================================
    // Used by the interpreter
    // ========================================================================

    std::string Engine::mapTypeName(std::type_index type) const
    {
        auto it = typeNames_.find(type);
        if (it != typeNames_.end())
            return it->second;
        return typeNameOf(type);
    }

    std::string Engine::formatSignature(const std::string &name, const std::vector<std::type_index> &types) const
    {
        std::string out = name + " (";
        for (size_t i = 0; i < types.size(); i++)
        {
            if (i > 0)
                out += ", ";
            out += mapTypeName(types[i]);
        }
        return out + ")";
    }

    void Engine::print(const std::string &text) const
    {
        if (print_)
            print_(text);
    }

    void Engine::debug(const std::string &text, Position pos) const
    {
        if (debug_)
            debug_(text, pos);
    }

    bool Engine::progress(uint64_t operations) const
    {
        return !progress_ || progress_(operations);
    }

} // namespace rill
