#include "resolver.hpp"
#include "../engine/engine.hpp"

namespace rill
{

    // ========================================================================
    // StaticModuleResolver
    // ========================================================================

    void StaticModuleResolver::insert(const std::string &path, Module module)
    {
        insert(path, std::make_shared<const Module>(std::move(module)));
    }

    void StaticModuleResolver::insert(const std::string &path, std::shared_ptr<const Module> module)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        modules_[path] = std::move(module);
    }

    bool StaticModuleResolver::remove(const std::string &path)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return modules_.erase(path) > 0;
    }

    bool StaticModuleResolver::contains(const std::string &path) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return modules_.count(path) > 0;
    }

    size_t StaticModuleResolver::size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return modules_.size();
    }

    void StaticModuleResolver::clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        modules_.clear();
    }

    std::shared_ptr<const Module> StaticModuleResolver::resolve(const Engine &, const std::string &path,
                                                                Position pos) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = modules_.find(path);
        if (it == modules_.end())
            throw ModuleNotFoundError(path, pos);
        return it->second;
    }

    // ========================================================================
    // SourceModuleResolver
    // ========================================================================

    void SourceModuleResolver::addSource(const std::string &path, std::string script)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        sources_[path] = std::move(script);
        cache_.erase(path);
    }

    bool SourceModuleResolver::contains(const std::string &path) const
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return sources_.count(path) > 0;
    }

    void SourceModuleResolver::clearCache()
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        cache_.clear();
    }

    std::shared_ptr<const Module> SourceModuleResolver::resolve(const Engine &engine, const std::string &path,
                                                                Position pos) const
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);

        // 1. Already compiled
        auto cached = cache_.find(path);
        if (cached != cache_.end())
            return cached->second;

        // 2. Known at all?
        auto source = sources_.find(path);
        if (source == sources_.end())
            throw ModuleNotFoundError(path, pos);

        // 3. Circular imports
        if (loading_.count(path))
            throw ModuleNotFoundError("circular import of '" + path + "'", pos);

        loading_.insert(path);
        std::shared_ptr<const Module> module;
        try
        {
            auto ast = engine.compile(source->second);
            if (!ast)
                ast.raise();
            module = Module::evalAstAsModule(engine, ast.value());
        }
        catch (...)
        {
            loading_.erase(path);
            throw;
        }
        loading_.erase(path);

        cache_[path] = module;
        return module;
    }

    // ========================================================================
    // ModuleResolversCollection
    // ========================================================================

    std::shared_ptr<const Module> ModuleResolversCollection::resolve(const Engine &engine, const std::string &path,
                                                                     Position pos) const
    {
        for (const auto &resolver : resolvers_)
        {
            try
            {
                return resolver->resolve(engine, path, pos);
            }
            catch (const RillError &e)
            {
                // Only "this resolver doesn't know the path" moves on
                if (e.kind() != ErrorKind::MODULE_NOT_FOUND || e.detail() != path)
                    throw;
            }
        }
        throw ModuleNotFoundError(path, pos);
    }

} // namespace rill
