#include "ast.hpp"
#include "../module/module.hpp"

namespace rill
{

    AST::AST() : lib_(std::make_shared<Module>()) {}

    AST::AST(std::vector<std::shared_ptr<const Stmt>> statements, std::shared_ptr<Module> lib)
        : statements_(std::move(statements)), lib_(lib ? std::move(lib) : std::make_shared<Module>()) {}

    AST AST::merge(const AST &other) const
    {
        std::vector<std::shared_ptr<const Stmt>> statements = statements_;
        statements.insert(statements.end(), other.statements_.begin(), other.statements_.end());

        auto lib = std::make_shared<Module>();
        lib->combine(*lib_);
        lib->combine(*other.lib_);
        return AST(std::move(statements), std::move(lib));
    }

} // namespace rill
