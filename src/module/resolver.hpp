#pragma once

// =============================================================================
// Module resolvers: turn an import path into a module
// =============================================================================
//
//   import "hello" as h;     →   engine.moduleResolver()->resolve(engine, "hello", pos)
//
// Resolvers hand out std::shared_ptr<const Module>, so importing the same path
// twice binds the same module instance twice. A resolver that does not know
// the path throws ModuleNotFoundError(path, pos).
//
// =============================================================================

#include "module.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace rill
{

    class Engine;

    class ModuleResolver
    {
    public:
        virtual ~ModuleResolver() = default;

        virtual std::shared_ptr<const Module> resolve(const Engine &engine, const std::string &path,
                                                      Position pos) const = 0;
    };

    // ========================================================================
    // StaticModuleResolver: a fixed path → module table
    // ========================================================================

    class StaticModuleResolver : public ModuleResolver
    {
    public:
        /// Seal `module` and make it importable under `path`
        void insert(const std::string &path, Module module);
        void insert(const std::string &path, std::shared_ptr<const Module> module);

        bool remove(const std::string &path);
        bool contains(const std::string &path) const;
        size_t size() const;
        bool empty() const { return size() == 0; }
        void clear();

        std::shared_ptr<const Module> resolve(const Engine &engine, const std::string &path,
                                              Position pos) const override;

    private:
        mutable std::mutex mutex_;
        std::map<std::string, std::shared_ptr<const Module>> modules_;
    };

    // ========================================================================
    // SourceModuleResolver: script sources compiled on first import
    // ========================================================================

    class SourceModuleResolver : public ModuleResolver
    {
    public:
        /// Register (or replace) the script behind `path`. Drops any module
        /// already compiled from the old source.
        void addSource(const std::string &path, std::string script);

        bool contains(const std::string &path) const;

        /// Forget every compiled module; the sources stay.
        void clearCache();

        std::shared_ptr<const Module> resolve(const Engine &engine, const std::string &path,
                                              Position pos) const override;

    private:
        // Recursive: a module's own imports come back through this resolver
        // on the same thread.
        mutable std::recursive_mutex mutex_;
        std::map<std::string, std::string> sources_;
        mutable std::map<std::string, std::shared_ptr<const Module>> cache_;
        mutable std::set<std::string> loading_; // circular-import guard
    };

    // ========================================================================
    // ModuleResolversCollection: first resolver that knows the path wins
    // ========================================================================

    class ModuleResolversCollection : public ModuleResolver
    {
    public:
        void push(std::shared_ptr<ModuleResolver> resolver) { resolvers_.push_back(std::move(resolver)); }

        size_t size() const { return resolvers_.size(); }
        void clear() { resolvers_.clear(); }

        std::shared_ptr<const Module> resolve(const Engine &engine, const std::string &path,
                                              Position pos) const override;

    private:
        std::vector<std::shared_ptr<ModuleResolver>> resolvers_;
    };

} // namespace rill
