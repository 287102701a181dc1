#include "module.hpp"
#include "../engine/engine.hpp"
#include "../interpreter/interpreter.hpp"
#include "../interpreter/scope.hpp"

namespace rill
{

    // ========================================================================
    // FnSignature
    // ========================================================================

    bool FnSignature::operator<(const FnSignature &o) const
    {
        if (name != o.name)
            return name < o.name;
        if (params.size() != o.params.size())
            return params.size() < o.params.size();
        return params < o.params;
    }

    std::string FnSignature::toString() const
    {
        return formatSignature(name, params);
    }

    std::string formatSignature(const std::string &name, const std::vector<std::type_index> &types)
    {
        std::string out = name + " (";
        for (size_t i = 0; i < types.size(); i++)
        {
            if (i > 0)
                out += ", ";
            out += typeNameOf(types[i]);
        }
        out += ")";
        return out;
    }

    // ========================================================================
    // Functions
    // ========================================================================

    void Module::setFn(const std::string &name, FnAccess access, std::vector<std::type_index> params,
                       NativeFn fn)
    {
        FuncInfo info;
        info.name = name;
        info.access = access;
        info.params = params;
        info.native = std::move(fn);
        functions_[FnSignature{name, std::move(params)}] = std::move(info);
    }

    void Module::setScriptFn(std::shared_ptr<const ScriptFnDef> def)
    {
        std::vector<std::type_index> params(def->params.size(), std::type_index(typeid(Dynamic)));

        FuncInfo info;
        info.name = def->name;
        info.access = def->access;
        info.params = params;
        info.script = def;
        functions_[FnSignature{def->name, std::move(params)}] = std::move(info);
    }

    const FuncInfo *Module::getFn(const std::string &name, const std::vector<std::type_index> &params) const
    {
        auto it = functions_.find(FnSignature{name, params});
        return it == functions_.end() ? nullptr : &it->second;
    }

    const FuncInfo *Module::getScriptFn(const std::string &name, size_t arity, bool publicOnly) const
    {
        std::vector<std::type_index> params(arity, std::type_index(typeid(Dynamic)));
        auto it = functions_.find(FnSignature{name, params});
        if (it == functions_.end() || !it->second.isScript())
            return nullptr;
        if (publicOnly && it->second.access == FnAccess::PRIVATE)
            return nullptr;
        return &it->second;
    }

    std::pair<const FuncInfo *, int> Module::findPromoted(const std::string &name,
                                                          const std::vector<std::type_index> &argTypes,
                                                          bool method, bool publicOnly) const
    {
        static const std::type_index DYNAMIC_TYPE(typeid(Dynamic));
        static const std::type_index INT_TYPE(typeid(INT));
        static const std::type_index FLOAT_TYPE(typeid(FLOAT));

        const FuncInfo *best = nullptr;
        int bestCost = 0;

        // Signatures sort by name, then arity: walk just this name's group
        for (auto it = functions_.lower_bound(FnSignature{name, {}});
             it != functions_.end() && it->first.name == name; ++it)
        {
            const FuncInfo &fn = it->second;
            if (fn.params.size() != argTypes.size())
                continue;
            if (publicOnly && fn.access == FnAccess::PRIVATE)
                continue;

            int cost = 0;
            bool viable = true;
            for (size_t i = 0; i < argTypes.size() && viable; i++)
            {
                const std::type_index &param = fn.params[i];
                if (param == argTypes[i])
                    continue;
                if (param == DYNAMIC_TYPE)
                    cost += 2;
                else if (param == FLOAT_TYPE && argTypes[i] == INT_TYPE && !(method && i == 0))
                    cost += 1;
                else
                    viable = false;
            }

            if (viable && (!best || cost < bestCost))
            {
                best = &fn;
                bestCost = cost;
            }
        }
        return {best, bestCost};
    }

    const FuncInfo *Module::resolveFn(const std::string &name, const std::vector<std::type_index> &argTypes,
                                      bool method) const
    {
        if (auto *exact = getFn(name, argTypes))
            return exact;
        return findPromoted(name, argTypes, method, false).first;
    }

    bool Module::containsFn(const std::string &name) const
    {
        auto it = functions_.lower_bound(FnSignature{name, {}});
        return it != functions_.end() && it->first.name == name;
    }

    // ========================================================================
    // Variables and sub-modules
    // ========================================================================

    const Dynamic *Module::getVar(const std::string &name) const
    {
        auto it = variables_.find(name);
        return it == variables_.end() ? nullptr : &it->second;
    }

    void Module::setSubModule(const std::string &name, std::shared_ptr<const Module> module)
    {
        modules_[name] = std::move(module);
    }

    std::shared_ptr<const Module> Module::getSubModule(const std::string &name) const
    {
        auto it = modules_.find(name);
        return it == modules_.end() ? nullptr : it->second;
    }

    // ========================================================================
    // Combination
    // ========================================================================

    Module &Module::combine(const Module &other)
    {
        for (const auto &[sig, fn] : other.functions_)
            functions_[sig] = fn;
        for (const auto &[name, value] : other.variables_)
            variables_[name] = value;
        for (const auto &[name, sub] : other.modules_)
            modules_[name] = sub;
        return *this;
    }

    Module &Module::combineFlatten(const Module &other)
    {
        for (const auto &[name, sub] : other.modules_)
            combineFlatten(*sub);
        for (const auto &[sig, fn] : other.functions_)
            functions_[sig] = fn;
        for (const auto &[name, value] : other.variables_)
            variables_[name] = value;
        return *this;
    }

    // ========================================================================
    // Modules from scripts
    // ========================================================================

    std::shared_ptr<Module> Module::evalAstAsModule(const Engine &engine, const AST &ast)
    {
        Scope scope;
        Interpreter interp(engine, scope, &ast.lib());
        interp.run(ast.statements());

        auto module = std::make_shared<Module>();

        for (const auto &entry : scope)
        {
            if (entry.exportAlias)
                module->variables_[*entry.exportAlias] = entry.value.flatten();
        }

        // Private functions come along so the public ones can call them, but
        // qualified calls from outside never see them.
        for (const auto &[sig, fn] : ast.lib().functions())
        {
            if (fn.isScript())
                module->functions_[sig] = fn;
        }

        for (const auto &[alias, sub] : interp.imports())
            module->modules_[alias] = sub;

        return module;
    }

} // namespace rill
