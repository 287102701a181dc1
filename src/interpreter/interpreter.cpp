#include "interpreter.hpp"
#include "../builtins/fn_register.hpp"
#include "../engine/engine.hpp"
#include "../lexer/token.hpp"
#include "../module/resolver.hpp"
#include <iterator>
#include <optional>

namespace rill
{

    // ========================================================================
    // Helpers
    // ========================================================================

    static std::string joinPath(const std::vector<std::string> &namespaces, const std::string &name)
    {
        std::string out;
        for (const auto &ns : namespaces)
            out += ns + "::";
        return out + name;
    }

    static bool requireBool(const Dynamic &value, Position pos)
    {
        if (value.type() != DynType::BOOL)
            throw MismatchedTypeError("bool", value.typeName(), pos);
        return value.asBool();
    }

    static size_t arrayIndex(size_t size, const Dynamic &index, Position pos)
    {
        if (index.type() != DynType::INT)
            throw MismatchedTypeError("i64", index.typeName(), pos);

        INT i = index.asInt();
        if (i < 0 || static_cast<size_t>(i) >= size)
            throw IndexError("Array index " + std::to_string(i) + " out of bounds: only " +
                                 std::to_string(size) + " elements in the array",
                             pos);
        return static_cast<size_t>(i);
    }

    static std::string mapKey(const Dynamic &index, Position pos)
    {
        if (index.type() != DynType::STRING)
            throw MismatchedTypeError("string", index.typeName(), pos);
        return index.asString().str();
    }

    /// Find the index-th character; `offset` and `length` give its UTF-8 bytes
    static char32_t locateChar(const std::string &s, const Dynamic &index, Position pos, size_t &offset,
                               size_t &length)
    {
        if (index.type() != DynType::INT)
            throw MismatchedTypeError("i64", index.typeName(), pos);

        INT wanted = index.asInt();
        INT count = 0;
        size_t i = 0;
        while (i < s.size())
        {
            size_t start = i;
            char32_t c = decodeUtf8(s, i);
            if (count == wanted && wanted >= 0)
            {
                offset = start;
                length = i - start;
                return c;
            }
            count++;
        }
        throw IndexError("String index " + std::to_string(wanted) + " out of bounds: only " +
                             std::to_string(count) + " characters in the string",
                         pos);
    }

    // ========================================================================
    // Guards
    // ========================================================================

    // Rewinds the scope and the imports to where they were on entry
    class Interpreter::BlockGuard
    {
    public:
        explicit BlockGuard(Interpreter &interp)
            : interp_(interp), scope_(*interp.scope_), scopeSize_(scope_.size()),
              importCount_(interp.imports_.size()) {}

        ~BlockGuard()
        {
            scope_.rewind(scopeSize_);
            auto &imports = interp_.imports_;
            if (imports.size() > importCount_)
                imports.erase(imports.begin() + static_cast<std::ptrdiff_t>(importCount_), imports.end());
        }

        BlockGuard(const BlockGuard &) = delete;
        BlockGuard &operator=(const BlockGuard &) = delete;

    private:
        Interpreter &interp_;
        Scope &scope_;
        size_t scopeSize_;
        size_t importCount_;
    };

    // Switches to a function's scope, library and `this` for one call
    class Interpreter::FrameGuard
    {
    public:
        FrameGuard(Interpreter &interp, Scope &scope, const Module *lib, Dynamic *thisPtr)
            : interp_(interp), savedScope_(interp.scope_), savedLib_(interp.lib_), savedThis_(interp.this_),
              importCount_(interp.imports_.size())
        {
            interp.scope_ = &scope;
            interp.lib_ = lib;
            interp.this_ = thisPtr;
            interp.callDepth_++;
        }

        ~FrameGuard()
        {
            interp_.scope_ = savedScope_;
            interp_.lib_ = savedLib_;
            interp_.this_ = savedThis_;
            interp_.callDepth_--;
            auto &imports = interp_.imports_;
            if (imports.size() > importCount_)
                imports.erase(imports.begin() + static_cast<std::ptrdiff_t>(importCount_), imports.end());
        }

        FrameGuard(const FrameGuard &) = delete;
        FrameGuard &operator=(const FrameGuard &) = delete;

    private:
        Interpreter &interp_;
        Scope *savedScope_;
        const Module *savedLib_;
        Dynamic *savedThis_;
        size_t importCount_;
    };

    // ========================================================================
    // NativeCallContext
    // ========================================================================

    const Engine &NativeCallContext::engine() const
    {
        return interp_.engine();
    }

    Dynamic NativeCallContext::callFnPtr(const FnPtr &fnPtr, std::vector<Dynamic> args, Dynamic *thisPtr) const
    {
        return interp_.callFnPtr(fnPtr, std::move(args), thisPtr, true, pos_);
    }

    // ========================================================================
    // Construction / entry points
    // ========================================================================

    Interpreter::Interpreter(const Engine &engine, Scope &scope, const Module *lib)
        : engine_(engine), scope_(&scope), lib_(lib), rootLib_(lib)
    {
    }

    Dynamic Interpreter::run(const std::vector<std::shared_ptr<const Stmt>> &statements)
    {
        Dynamic result;
        try
        {
            for (const auto &stmt : statements)
                result = exec(stmt.get());
        }
        catch (ReturnSignal &signal)
        {
            return std::move(signal.value);
        }
        return result;
    }

    Dynamic Interpreter::callFnOnScope(const std::string &name, std::vector<Dynamic> args, Dynamic *thisPtr)
    {
        ScriptFnRef ref = findScriptFn(name, args.size(), true);
        if (!ref.fn)
            throw FunctionNotFoundError(name, Position::none());

        const ScriptFnDef &def = *ref.fn->script;
        BlockGuard block(*this);
        for (size_t i = 0; i < def.params.size(); i++)
            scope_->pushDynamic(def.params[i], std::move(args[i]));

        FrameGuard frame(*this, *scope_, ref.lib, thisPtr);
        return runBody(def);
    }

    Dynamic Interpreter::callFnPtr(const FnPtr &fnPtr, std::vector<Dynamic> args, Dynamic *thisPtr, bool publicOnly,
                                   Position pos)
    {
        std::string name = fnPtr.fnName();
        std::vector<Dynamic> all = fnPtr.curry();
        all.reserve(all.size() + args.size());
        for (auto &arg : args)
            all.push_back(std::move(arg));

        ScriptFnRef ref = findScriptFn(name, all.size(), publicOnly);
        if (ref.fn)
            return callScriptFn(ref, std::move(all), thisPtr, pos);

        FnArgs ptrs;
        if (thisPtr)
            ptrs.push_back(thisPtr);
        for (auto &value : all)
            ptrs.push_back(&value);

        Dynamic result;
        if (tryCallNative(name, ptrs, thisPtr != nullptr, pos, result))
            return result;
        throw FunctionNotFoundError(signatureOf(name, ptrs), pos);
    }

    void Interpreter::tick(Position pos)
    {
        operations_++;

        uint64_t max = engine_.limits().maxOperations;
        if (max > 0 && operations_ > max)
            throw TooManyOperationsError(pos);
        if (engine_.hasProgressCallback() && !engine_.progress(operations_))
            throw TerminatedError(pos);
    }

    // ========================================================================
    // Statement execution
    // ========================================================================

    Dynamic Interpreter::exec(const Stmt *stmt)
    {
        tick(stmt->pos);

        if (auto *p = dynamic_cast<const ExprStmt *>(stmt))
            return eval(p->expr.get());

        if (auto *p = dynamic_cast<const LetStmt *>(stmt))
            execLet(p);
        else if (auto *p = dynamic_cast<const AssignStmt *>(stmt))
            execAssign(p);
        else if (auto *p = dynamic_cast<const WhileStmt *>(stmt))
            execWhile(p);
        else if (auto *p = dynamic_cast<const ForStmt *>(stmt))
            execFor(p);
        else if (dynamic_cast<const BreakStmt *>(stmt))
            throw BreakSignal{};
        else if (dynamic_cast<const ContinueStmt *>(stmt))
            throw ContinueSignal{};
        else if (auto *p = dynamic_cast<const ReturnStmt *>(stmt))
            throw ReturnSignal{p->value ? eval(p->value.get()) : Dynamic()};
        else if (auto *p = dynamic_cast<const ThrowStmt *>(stmt))
        {
            Dynamic value = p->value ? eval(p->value.get()) : Dynamic();
            throw RuntimeError(value.isUnit() ? "" : value.toString(), stmt->pos);
        }
        else if (auto *p = dynamic_cast<const ImportStmt *>(stmt))
            execImport(p);
        else if (auto *p = dynamic_cast<const ExportStmt *>(stmt))
            execExport(p);
        else
            throw RuntimeError("unsupported statement", stmt->pos);

        return Dynamic();
    }

    void Interpreter::execLet(const LetStmt *node)
    {
        Dynamic value = node->init ? eval(node->init.get()) : Dynamic();
        if (value.isShared())
            value = value.flatten();
        checkDataSize(value, node->pos);

        scope_->pushDynamic(node->name, std::move(value),
                            node->isConst ? AccessMode::CONSTANT : AccessMode::VARIABLE);
    }

    void Interpreter::execAssign(const AssignStmt *node)
    {
        Position pos = node->pos;
        Dynamic rhs = eval(node->value.get());
        if (rhs.isShared())
            rhs = rhs.flatten();

        if (node->op.empty())
        {
            checkDataSize(rhs, pos);
            accessTarget(node->target.get(), true, [&](Dynamic &target)
                         { target = std::move(rhs); });
            return;
        }

        // x op= y: the op-assign function in place, else x = x op y
        std::string baseOp = node->op.substr(0, node->op.size() - 1);
        accessTarget(node->target.get(), true, [&](Dynamic &target)
                     {
                         FnArgs args{&target, &rhs};
                         Dynamic ignored;
                         if (tryCallNative(node->op, args, true, pos, ignored))
                             return;

                         std::vector<Dynamic> values{target, rhs};
                         target = callByValue(baseOp, values, pos);
                         checkDataSize(target, pos);
                     });
    }

    void Interpreter::execWhile(const WhileStmt *node)
    {
        while (true)
        {
            if (node->condition && !requireBool(eval(node->condition.get()), node->condition->pos))
                break;

            try
            {
                eval(node->body.get());
            }
            catch (const BreakSignal &)
            {
                break;
            }
            catch (const ContinueSignal &)
            {
            }
        }
    }

    void Interpreter::execFor(const ForStmt *node)
    {
        Dynamic iterable = eval(node->iterable.get());

        // false once the body breaks out
        auto iterate = [&](Dynamic item) -> bool
        {
            BlockGuard guard(*this);
            scope_->pushDynamic(node->varName, std::move(item));
            try
            {
                eval(node->body.get());
            }
            catch (const BreakSignal &)
            {
                return false;
            }
            catch (const ContinueSignal &)
            {
            }
            return true;
        };

        switch (iterable.type())
        {
        case DynType::ARRAY:
        {
            Array items = std::move(iterable.asArrayMut());
            for (auto &item : items)
                if (!iterate(std::move(item)))
                    break;
            break;
        }
        case DynType::STRING:
        {
            std::string text = iterable.asString().str();
            size_t i = 0;
            while (i < text.size())
                if (!iterate(Dynamic::makeChar(decodeUtf8(text, i))))
                    break;
            break;
        }
        default:
            throw MismatchedTypeError("array or string", engine_.mapTypeName(iterable.typeId()),
                                      node->iterable->pos);
        }
    }

    void Interpreter::execImport(const ImportStmt *node)
    {
        Position pathPos = node->path->pos;
        Dynamic path = eval(node->path.get());
        if (path.type() != DynType::STRING)
            throw MismatchedTypeError("string", engine_.mapTypeName(path.typeId()), pathPos);

        const ModuleResolver *resolver = engine_.moduleResolver();
        if (!resolver)
            throw ModuleNotFoundError(path.asString().str(), pathPos);

        auto module = resolver->resolve(engine_, path.asString().str(), pathPos);
        if (node->alias)
            imports_.emplace_back(*node->alias, std::move(module));
    }

    void Interpreter::execExport(const ExportStmt *node)
    {
        for (const auto &[name, alias] : node->names)
        {
            auto index = scope_->indexOf(name);
            if (!index)
                throw VariableNotFoundError(name, node->pos);
            scope_->at(*index).exportAlias = alias ? *alias : name;
        }
    }

    // ========================================================================
    // Expression evaluation
    // ========================================================================

    Dynamic Interpreter::eval(const Expr *expr)
    {
        tick(expr->pos);

        // ---- Literals ----
        if (auto *p = dynamic_cast<const IntLiteral *>(expr))
            return Dynamic::makeInt(p->value);
        if (auto *p = dynamic_cast<const FloatLiteral *>(expr))
            return Dynamic::makeFloat(p->value);
        if (auto *p = dynamic_cast<const StringLiteral *>(expr))
            return Dynamic::makeString(p->value);
        if (auto *p = dynamic_cast<const CharLiteral *>(expr))
            return Dynamic::makeChar(p->value);
        if (auto *p = dynamic_cast<const BoolLiteral *>(expr))
            return Dynamic::makeBool(p->value);
        if (dynamic_cast<const UnitLiteral *>(expr))
            return Dynamic();

        // ---- Names ----
        if (auto *p = dynamic_cast<const Variable *>(expr))
            return evalVariable(p);
        if (dynamic_cast<const ThisExpr *>(expr))
        {
            if (!this_)
                throw VariableNotFoundError(KEYWORD_THIS, expr->pos);
            return this_->flatten();
        }

        // ---- Calls ----
        if (auto *p = dynamic_cast<const FnCallExpr *>(expr))
            return evalFnCall(p);
        if (auto *p = dynamic_cast<const MethodCallExpr *>(expr))
            return evalMethodCall(p);

        // ---- Access ----
        if (auto *p = dynamic_cast<const PropertyExpr *>(expr))
            return evalProperty(p);
        if (auto *p = dynamic_cast<const IndexExpr *>(expr))
            return evalIndex(p);

        // ---- Compound ----
        if (auto *p = dynamic_cast<const LogicalExpr *>(expr))
            return evalLogical(p);
        if (auto *p = dynamic_cast<const InExpr *>(expr))
            return evalIn(p);
        if (auto *p = dynamic_cast<const BlockExpr *>(expr))
            return evalBlock(p);
        if (auto *p = dynamic_cast<const IfExpr *>(expr))
            return evalIf(p);
        if (auto *p = dynamic_cast<const ArrayLiteral *>(expr))
            return evalArray(p);
        if (auto *p = dynamic_cast<const MapLiteral *>(expr))
            return evalMap(p);
        if (auto *p = dynamic_cast<const ClosureExpr *>(expr))
            return evalClosure(p);

        throw RuntimeError("unsupported expression", expr->pos);
    }

    Dynamic Interpreter::evalVariable(const Variable *node)
    {
        if (!node->namespaces.empty())
        {
            auto module = findModule(node->namespaces, node->pos);
            if (const Dynamic *value = module->getVar(node->name))
                return *value;
            throw VariableNotFoundError(joinPath(node->namespaces, node->name), node->pos);
        }

        auto index = scope_->indexOf(node->name);
        if (!index)
            throw VariableNotFoundError(node->name, node->pos);
        return scope_->at(*index).value.read(node->name, node->pos)->flatten();
    }

    Dynamic Interpreter::evalBlock(const BlockExpr *node)
    {
        BlockGuard guard(*this);
        Dynamic result;
        for (const auto &stmt : node->statements)
            result = exec(stmt.get());
        return result;
    }

    Dynamic Interpreter::evalIf(const IfExpr *node)
    {
        if (requireBool(eval(node->condition.get()), node->condition->pos))
            return eval(node->thenBlock.get());
        if (node->elseBranch)
            return eval(node->elseBranch.get());
        return Dynamic();
    }

    Dynamic Interpreter::evalLogical(const LogicalExpr *node)
    {
        bool left = requireBool(eval(node->left.get()), node->left->pos);
        if (node->isAnd ? !left : left)
            return Dynamic::makeBool(left);
        return Dynamic::makeBool(requireBool(eval(node->right.get()), node->right->pos));
    }

    Dynamic Interpreter::evalIn(const InExpr *node)
    {
        Dynamic needle = eval(node->left.get());
        Dynamic haystack = eval(node->right.get());

        switch (haystack.type())
        {
        case DynType::ARRAY:
            for (const auto &item : haystack.asArray())
            {
                std::vector<Dynamic> pair{needle, item};
                Dynamic same = callByValue("==", pair, node->pos);
                if (same.type() == DynType::BOOL && same.asBool())
                    return Dynamic::makeBool(true);
            }
            return Dynamic::makeBool(false);

        case DynType::STRING:
        {
            const std::string &text = haystack.asString().str();
            if (needle.type() == DynType::STRING)
                return Dynamic::makeBool(text.find(needle.asString().str()) != std::string::npos);
            if (needle.type() == DynType::CHAR)
                return Dynamic::makeBool(text.find(toUtf8(needle.asChar())) != std::string::npos);
            throw MismatchedTypeError("string or char", engine_.mapTypeName(needle.typeId()), node->left->pos);
        }

        case DynType::MAP:
        {
            const Map &map = haystack.asMap();
            if (needle.type() == DynType::STRING)
                return Dynamic::makeBool(map.count(needle.asString().str()) > 0);
            if (needle.type() == DynType::CHAR)
                return Dynamic::makeBool(map.count(toUtf8(needle.asChar())) > 0);
            throw MismatchedTypeError("string", engine_.mapTypeName(needle.typeId()), node->left->pos);
        }

        default:
            throw MismatchedTypeError("array, string or map", engine_.mapTypeName(haystack.typeId()),
                                      node->right->pos);
        }
    }

    Dynamic Interpreter::evalArray(const ArrayLiteral *node)
    {
        Array items;
        items.reserve(node->elements.size());
        for (const auto &elem : node->elements)
        {
            Dynamic value = eval(elem.get());
            items.push_back(value.isShared() ? value.flatten() : std::move(value));
        }

        Dynamic result = Dynamic::makeArray(std::move(items));
        checkDataSize(result, node->pos);
        return result;
    }

    Dynamic Interpreter::evalMap(const MapLiteral *node)
    {
        Map map;
        for (const auto &[key, expr] : node->entries)
        {
            Dynamic value = eval(expr.get());
            map[key] = value.isShared() ? value.flatten() : std::move(value);
        }

        Dynamic result = Dynamic::makeMap(std::move(map));
        checkDataSize(result, node->pos);
        return result;
    }

    Dynamic Interpreter::evalClosure(const ClosureExpr *node)
    {
        // Every captured variable becomes shared; the closure holds aliases
        std::vector<Dynamic> captured;
        captured.reserve(node->externals.size());
        for (const auto &name : node->externals)
        {
            auto index = scope_->indexOf(name);
            if (!index)
                throw VariableNotFoundError(name, node->pos);

            Dynamic &slot = scope_->at(*index).value;
            if (!slot.isShared())
                slot = slot.intoShared();
            captured.push_back(slot.intoShared());
        }
        return Dynamic::makeFnPtr(FnPtr(node->fnName, std::move(captured)));
    }

    Dynamic Interpreter::evalIndex(const IndexExpr *node)
    {
        Dynamic container = eval(node->object.get());
        Dynamic index = eval(node->index.get());
        return readIndex(container, index, node->pos);
    }

    Dynamic Interpreter::readIndex(Dynamic &container, const Dynamic &index, Position pos)
    {
        switch (container.type())
        {
        case DynType::ARRAY:
        {
            const Array &items = container.asArray();
            return items[arrayIndex(items.size(), index, pos)].flatten();
        }

        case DynType::MAP:
        {
            const Map &map = container.asMap();
            auto it = map.find(mapKey(index, pos));
            return it == map.end() ? Dynamic() : it->second.flatten();
        }

        case DynType::STRING:
        {
            size_t offset = 0;
            size_t length = 0;
            return Dynamic::makeChar(locateChar(container.asString().str(), index, pos, offset, length));
        }

        default:
        {
            Dynamic idx = index;
            FnArgs args{&container, &idx};
            Dynamic result;
            if (tryCallNative(FN_IDX_GET, args, true, pos, result))
                return result;
            throw IndexError("Indexing is not supported for " + engine_.mapTypeName(container.typeId()), pos);
        }
        }
    }

    Dynamic Interpreter::evalProperty(const PropertyExpr *node)
    {
        Dynamic container = eval(node->object.get());

        if (container.type() == DynType::MAP)
        {
            const Map &map = container.asMap();
            auto it = map.find(node->name);
            return it == map.end() ? Dynamic() : it->second.flatten();
        }

        std::string getter = getterName(node->name);
        FnArgs args{&container};
        Dynamic result;
        if (tryCallNative(getter, args, true, node->pos, result))
            return result;
        throw FunctionNotFoundError(signatureOf(getter, args), node->pos);
    }

    std::vector<Dynamic> Interpreter::evalArgs(const std::vector<ExprPtr> &args, size_t from)
    {
        std::vector<Dynamic> values;
        if (from < args.size())
            values.reserve(args.size() - from);
        for (size_t i = from; i < args.size(); i++)
            values.push_back(eval(args[i].get()));
        return values;
    }

    // ========================================================================
    // Places
    // ========================================================================

    void Interpreter::accessTarget(const Expr *expr, bool forWrite, const TargetFn &fn)
    {
        if (auto *var = dynamic_cast<const Variable *>(expr))
        {
            if (!var->namespaces.empty())
            {
                if (forWrite)
                    throw AssignmentToConstantError(joinPath(var->namespaces, var->name), var->pos);
                Dynamic temp = evalVariable(var);
                fn(temp);
                return;
            }

            auto index = scope_->indexOf(var->name);
            if (!index)
                throw VariableNotFoundError(var->name, var->pos);

            Scope::Entry &entry = scope_->at(*index);
            if (entry.access == AccessMode::CONSTANT)
            {
                if (forWrite)
                    throw AssignmentToConstantError(var->name, var->pos);

                // Methods on a constant work on a copy
                Dynamic temp = entry.value.flatten();
                fn(temp);
                return;
            }

            auto lock = entry.value.write(var->name, var->pos);
            fn(*lock);
            return;
        }

        if (auto *p = dynamic_cast<const ThisExpr *>(expr))
        {
            if (!this_)
                throw VariableNotFoundError(KEYWORD_THIS, p->pos);
            auto lock = this_->write(KEYWORD_THIS, p->pos);
            fn(*lock);
            return;
        }

        if (auto *p = dynamic_cast<const IndexExpr *>(expr))
        {
            Dynamic index = eval(p->index.get());
            accessTarget(p->object.get(), forWrite, [&](Dynamic &container)
                         { accessIndex(container, index, forWrite, p->pos, fn); });
            return;
        }

        if (auto *p = dynamic_cast<const PropertyExpr *>(expr))
        {
            accessTarget(p->object.get(), forWrite, [&](Dynamic &container)
                         { accessProperty(container, p->name, forWrite, p->pos, fn); });
            return;
        }

        // Anything else is a temporary
        Dynamic temp = eval(expr);
        fn(temp);
    }

    void Interpreter::accessIndex(Dynamic &container, const Dynamic &index, bool forWrite, Position pos,
                                  const TargetFn &fn)
    {
        switch (container.type())
        {
        case DynType::ARRAY:
        {
            Array &items = container.asArrayMut();
            auto lock = items[arrayIndex(items.size(), index, pos)].write("", pos);
            fn(*lock);
            return;
        }

        case DynType::MAP:
        {
            Map &map = container.asMapMut();
            std::string key = mapKey(index, pos);
            auto it = map.find(key);
            if (it == map.end())
            {
                if (!forWrite)
                {
                    Dynamic temp;
                    fn(temp);
                    return;
                }
                it = map.emplace(key, Dynamic()).first;
            }
            auto lock = it->second.write(key, pos);
            fn(*lock);
            return;
        }

        case DynType::STRING:
        {
            std::string text = container.asString().str();
            size_t offset = 0;
            size_t length = 0;
            Dynamic ch = Dynamic::makeChar(locateChar(text, index, pos, offset, length));
            fn(ch);
            if (!forWrite)
                return;

            if (ch.type() != DynType::CHAR)
                throw MismatchedTypeError("char", engine_.mapTypeName(ch.typeId()), pos);
            text.replace(offset, length, toUtf8(ch.asChar()));
            container = Dynamic::makeString(std::move(text));
            return;
        }

        default:
        {
            // Custom types go through their indexer pair
            Dynamic idx = index;
            Dynamic value;
            FnArgs getArgs{&container, &idx};
            if (!tryCallNative(FN_IDX_GET, getArgs, true, pos, value) && !forWrite)
                throw IndexError("Indexing is not supported for " + engine_.mapTypeName(container.typeId()), pos);

            fn(value);

            FnArgs setArgs{&container, &idx, &value};
            Dynamic ignored;
            if (!tryCallNative(FN_IDX_SET, setArgs, true, pos, ignored) && forWrite)
                throw FunctionNotFoundError(signatureOf(FN_IDX_SET, setArgs), pos);
            return;
        }
        }
    }

    void Interpreter::accessProperty(Dynamic &container, const std::string &prop, bool forWrite, Position pos,
                                     const TargetFn &fn)
    {
        if (container.type() == DynType::MAP)
        {
            accessIndex(container, Dynamic::makeString(prop), forWrite, pos, fn);
            return;
        }

        std::string getter = getterName(prop);
        std::string setter = setterName(prop);

        Dynamic value;
        FnArgs getArgs{&container};
        if (!tryCallNative(getter, getArgs, true, pos, value) && !forWrite)
            throw FunctionNotFoundError(signatureOf(getter, getArgs), pos);

        fn(value);

        FnArgs setArgs{&container, &value};
        Dynamic ignored;
        if (!tryCallNative(setter, setArgs, true, pos, ignored) && forWrite)
            throw FunctionNotFoundError(signatureOf(setter, setArgs), pos);
    }

    // ========================================================================
    // Function calls
    // ========================================================================

    Dynamic Interpreter::evalFnCall(const FnCallExpr *node)
    {
        const std::string &name = node->name;
        Position pos = node->pos;
        size_t argc = node->args.size();

        if (!node->namespaces.empty())
            return evalQualifiedCall(node);

        if (!node->isOperator && isKeywordFunction(name))
        {
            bool overridden = canOverrideKeyword(name) && findScriptFn(name, argc, false).fn;
            if (!overridden)
                return evalKeywordCall(node);
        }

        ScriptFnRef ref = findScriptFn(name, argc, false);
        if (ref.fn)
            return callScriptFn(ref, evalArgs(node->args), nullptr, pos);

        // A plain variable as first argument is passed by reference
        if (!node->isOperator && argc > 0)
        {
            auto *var = dynamic_cast<const Variable *>(node->args[0].get());
            if (var && var->namespaces.empty())
            {
                std::vector<Dynamic> rest = evalArgs(node->args, 1);

                auto index = scope_->indexOf(var->name);
                if (!index)
                    throw VariableNotFoundError(var->name, var->pos);

                Scope::Entry &entry = scope_->at(*index);
                if (entry.access == AccessMode::VARIABLE)
                {
                    auto lock = entry.value.write(var->name, var->pos);
                    FnArgs ptrs{&*lock};
                    for (auto &value : rest)
                        ptrs.push_back(&value);

                    Dynamic result;
                    if (tryCallNative(name, ptrs, true, pos, result))
                        return result;
                }

                std::vector<Dynamic> args;
                args.reserve(argc);
                args.push_back(evalVariable(var));
                for (auto &value : rest)
                    args.push_back(std::move(value));
                return callByValue(name, args, pos);
            }
        }

        std::vector<Dynamic> args = evalArgs(node->args);
        return callByValue(name, args, pos);
    }

    Dynamic Interpreter::evalKeywordCall(const FnCallExpr *node)
    {
        const std::string &name = node->name;
        Position pos = node->pos;
        size_t argc = node->args.size();

        if (name == KEYWORD_IS_SHARED && argc == 1)
        {
            auto *var = dynamic_cast<const Variable *>(node->args[0].get());
            if (var && var->namespaces.empty())
            {
                auto index = scope_->indexOf(var->name);
                if (!index)
                    throw VariableNotFoundError(var->name, var->pos);
                return Dynamic::makeBool(scope_->at(*index).value.isShared());
            }
            eval(node->args[0].get());
            return Dynamic::makeBool(false);
        }

        std::vector<Dynamic> args = evalArgs(node->args);

        if (name == KEYWORD_FN_PTR && argc == 1)
        {
            if (args[0].type() != DynType::STRING)
                throw MismatchedTypeError("string", engine_.mapTypeName(args[0].typeId()), node->args[0]->pos);
            return Dynamic::makeFnPtr(FnPtr::create(args[0].asString().str(), pos));
        }

        if ((name == KEYWORD_PRINT || name == KEYWORD_DEBUG) && argc == 1)
        {
            bool isPrint = name == KEYWORD_PRINT;

            // The type's own print/debug function gives the text, if it has one
            FnArgs ptrs{&args[0]};
            Dynamic text;
            if (!tryCallNative(name, ptrs, false, pos, text))
                text = Dynamic::makeString(isPrint ? args[0].toString() : args[0].toDebugString());

            std::string out = text.type() == DynType::STRING ? text.asString().str() : text.toString();
            if (isPrint)
                engine_.print(out);
            else
                engine_.debug(out, pos);
            return Dynamic();
        }

        if (name == KEYWORD_TYPE_OF && argc == 1)
            return Dynamic::makeString(engine_.mapTypeName(args[0].typeId()));

        if ((name == KEYWORD_FN_PTR_CALL || name == KEYWORD_FN_PTR_CURRY) && argc >= 1 &&
            args[0].type() == DynType::FN_PTR)
        {
            FnPtr fnPtr = args[0].asFnPtr();
            std::vector<Dynamic> rest(std::make_move_iterator(args.begin() + 1),
                                      std::make_move_iterator(args.end()));
            if (name == KEYWORD_FN_PTR_CURRY)
                return Dynamic::makeFnPtr(fnPtr.curried(std::move(rest)));
            return callFnPtr(fnPtr, std::move(rest), nullptr, false, pos);
        }

        // `eval` is reserved but not available, and so is any misuse above
        FnArgs ptrs;
        for (auto &value : args)
            ptrs.push_back(&value);
        throw FunctionNotFoundError(signatureOf(name, ptrs), pos);
    }

    Dynamic Interpreter::evalQualifiedCall(const FnCallExpr *node)
    {
        const std::string &name = node->name;
        Position pos = node->pos;

        auto module = findModule(node->namespaces, pos);
        std::vector<Dynamic> args = evalArgs(node->args);

        if (const FuncInfo *fn = module->getScriptFn(name, args.size(), true))
            return callScriptFn(ScriptFnRef{fn, module.get()}, std::move(args), nullptr, pos);

        FnArgs ptrs;
        std::vector<std::type_index> types;
        for (auto &value : args)
        {
            ptrs.push_back(&value);
            types.push_back(value.typeId());
        }

        const FuncInfo *fn = module->getFn(name, types);
        if (fn && fn->access == FnAccess::PRIVATE)
            fn = nullptr;
        if (!fn)
            fn = module->findPromoted(name, types, false, true).first;
        if (!fn || fn->isScript())
            throw FunctionNotFoundError(joinPath(node->namespaces, engine_.formatSignature(name, types)), pos);

        return callNative(*fn, name, ptrs, false, pos);
    }

    Dynamic Interpreter::evalMethodCall(const MethodCallExpr *node)
    {
        const std::string &name = node->name;
        Position pos = node->pos;

        if (node->args.empty() && (name == KEYWORD_IS_SHARED || name == KEYWORD_TYPE_OF))
        {
            auto *var = dynamic_cast<const Variable *>(node->object.get());
            if (name == KEYWORD_IS_SHARED && var && var->namespaces.empty())
            {
                auto index = scope_->indexOf(var->name);
                if (!index)
                    throw VariableNotFoundError(var->name, var->pos);
                return Dynamic::makeBool(scope_->at(*index).value.isShared());
            }

            Dynamic value = eval(node->object.get());
            if (name == KEYWORD_IS_SHARED)
                return Dynamic::makeBool(false);
            return Dynamic::makeString(engine_.mapTypeName(value.typeId()));
        }

        std::vector<Dynamic> args = evalArgs(node->args);

        if (name == KEYWORD_FN_PTR_CURRY)
        {
            Dynamic object = eval(node->object.get());
            if (object.type() == DynType::FN_PTR)
                return Dynamic::makeFnPtr(object.asFnPtr().curried(std::move(args)));

            FnArgs ptrs{&object};
            for (auto &value : args)
                ptrs.push_back(&value);
            throw FunctionNotFoundError(signatureOf(name, ptrs), pos);
        }

        if (name == KEYWORD_FN_PTR_CALL)
        {
            // fp.call(args) calls the pointer; obj.call(fp, args) binds `this` to obj
            std::optional<FnPtr> direct;
            Dynamic result;
            accessTarget(node->object.get(), false, [&](Dynamic &target)
                         {
                             if (target.type() == DynType::FN_PTR)
                             {
                                 direct = target.asFnPtr();
                                 return;
                             }
                             if (args.empty() || args[0].type() != DynType::FN_PTR)
                             {
                                 FnArgs ptrs{&target};
                                 for (auto &value : args)
                                     ptrs.push_back(&value);
                                 throw FunctionNotFoundError(signatureOf(name, ptrs), pos);
                             }

                             FnPtr fnPtr = args[0].asFnPtr();
                             std::vector<Dynamic> rest(std::make_move_iterator(args.begin() + 1),
                                                       std::make_move_iterator(args.end()));
                             result = callFnPtr(fnPtr, std::move(rest), &target, false, pos);
                         });

            if (direct)
                return callFnPtr(*direct, std::move(args), nullptr, false, pos);
            return result;
        }

        Dynamic result;
        accessTarget(node->object.get(), false, [&](Dynamic &target)
                     { result = callMethod(name, target, args, pos); });
        return result;
    }

    Interpreter::ScriptFnRef Interpreter::findScriptFn(const std::string &name, size_t arity, bool publicOnly) const
    {
        if (lib_)
        {
            if (const FuncInfo *fn = lib_->getScriptFn(name, arity, publicOnly))
                return ScriptFnRef{fn, lib_};
        }
        if (rootLib_ && rootLib_ != lib_)
        {
            if (const FuncInfo *fn = rootLib_->getScriptFn(name, arity, publicOnly))
                return ScriptFnRef{fn, rootLib_};
        }
        return ScriptFnRef{};
    }

    const FuncInfo *Interpreter::findNative(const std::string &name, const std::vector<std::type_index> &types,
                                            bool method) const
    {
        // 1. Exact match: global module first, then packages in load order
        if (const FuncInfo *fn = engine_.globalModule().getFn(name, types))
            return fn;
        for (const auto &package : engine_.packages())
            if (const FuncInfo *fn = package->getFn(name, types))
                return fn;

        // 2. Cheapest promoted match across all of them
        const FuncInfo *best = nullptr;
        int bestCost = 0;
        auto consider = [&](const Module &module)
        {
            auto [fn, cost] = module.findPromoted(name, types, method, false);
            if (fn && !fn->isScript() && (!best || cost < bestCost))
            {
                best = fn;
                bestCost = cost;
            }
        };
        consider(engine_.globalModule());
        for (const auto &package : engine_.packages())
            consider(*package);
        return best;
    }

    std::shared_ptr<const Module> Interpreter::findModule(const std::vector<std::string> &path, Position pos) const
    {
        std::shared_ptr<const Module> module;
        for (auto it = imports_.rbegin(); it != imports_.rend(); ++it)
        {
            if (it->first == path[0])
            {
                module = it->second;
                break;
            }
        }

        // Inside a module's own functions its imports are sub-modules
        if (!module && lib_)
            module = lib_->getSubModule(path[0]);
        if (!module)
            throw ModuleNotFoundError(path[0], pos);

        for (size_t i = 1; i < path.size(); i++)
        {
            std::shared_ptr<const Module> sub = module->getSubModule(path[i]);
            if (!sub)
                throw ModuleNotFoundError(
                    joinPath(std::vector<std::string>(path.begin(), path.begin() + static_cast<std::ptrdiff_t>(i)),
                             path[i]),
                    pos);
            module = std::move(sub);
        }
        return module;
    }

    Dynamic Interpreter::callScriptFn(const ScriptFnRef &ref, std::vector<Dynamic> args, Dynamic *thisPtr,
                                      Position pos)
    {
        size_t maxLevels = engine_.limits().maxCallLevels;
        if (maxLevels > 0 && callDepth_ >= maxLevels)
            throw StackOverflowError(maxLevels, pos);

        const ScriptFnDef &def = *ref.fn->script;
        Scope frameScope;
        for (size_t i = 0; i < def.params.size(); i++)
            frameScope.pushDynamic(def.params[i], std::move(args[i]));

        FrameGuard frame(*this, frameScope, ref.lib, thisPtr);
        return runBody(def);
    }

    Dynamic Interpreter::runBody(const ScriptFnDef &def)
    {
        try
        {
            return evalBlock(def.body.get());
        }
        catch (ReturnSignal &signal)
        {
            return std::move(signal.value);
        }
    }

    Dynamic Interpreter::callMethod(const std::string &name, Dynamic &target, std::vector<Dynamic> &args,
                                    Position pos)
    {
        ScriptFnRef ref = findScriptFn(name, args.size(), false);
        if (ref.fn)
            return callScriptFn(ref, std::move(args), &target, pos);

        FnArgs ptrs{&target};
        for (auto &value : args)
            ptrs.push_back(&value);

        Dynamic result;
        if (tryCallNative(name, ptrs, true, pos, result))
            return result;
        throw FunctionNotFoundError(signatureOf(name, ptrs), pos);
    }

    Dynamic Interpreter::callByValue(const std::string &name, std::vector<Dynamic> &args, Position pos)
    {
        FnArgs ptrs;
        for (auto &value : args)
            ptrs.push_back(&value);

        Dynamic result;
        if (tryCallNative(name, ptrs, false, pos, result))
            return result;

        // Values nothing knows how to compare are simply unequal
        if (args.size() == 2 && (name == "==" || name == "!="))
            return Dynamic::makeBool(name == "!=");

        throw FunctionNotFoundError(signatureOf(name, ptrs), pos);
    }

    bool Interpreter::tryCallNative(const std::string &name, FnArgs &args, bool method, Position pos,
                                    Dynamic &result)
    {
        std::vector<std::type_index> types;
        types.reserve(args.size());
        for (const Dynamic *arg : args)
            types.push_back(arg->typeId());

        const FuncInfo *fn = findNative(name, types, method);
        if (!fn)
            return false;
        result = callNative(*fn, name, args, method, pos);
        return true;
    }

    Dynamic Interpreter::callNative(const FuncInfo &fn, const std::string &name, FnArgs &args, bool method,
                                    Position pos)
    {
        static const std::type_index FLOAT_TYPE(typeid(FLOAT));

        static const std::type_index INT_TYPE(typeid(INT));

        FnArgs callArgs = args;

        // A shared first argument is locked in place. Other shared arguments,
        // and INT arguments filling a FLOAT parameter, are passed as copies.
        std::vector<Dynamic> copies;
        copies.reserve(callArgs.size());
        std::optional<DynamicWriteLock> firstLock;
        for (size_t i = 0; i < callArgs.size(); i++)
        {
            Dynamic *arg = callArgs[i];
            bool promote = !(method && i == 0) && i < fn.params.size() && fn.params[i] == FLOAT_TYPE &&
                           arg->typeId() == INT_TYPE;

            if (i == 0 && arg->isShared() && !promote)
            {
                firstLock.emplace(arg->write("", pos));
                callArgs[0] = &**firstLock;
            }
            else if (promote || arg->isShared())
            {
                Dynamic value = arg->flatten();
                if (promote)
                    value = Dynamic::makeFloat(static_cast<FLOAT>(value.asInt()));
                copies.push_back(std::move(value));
                callArgs[i] = &copies.back();
            }
        }

        NativeCallContext ctx(*this, name, pos);
        Dynamic result;
        try
        {
            result = fn.native(ctx, callArgs);
        }
        catch (const RillError &e)
        {
            if (e.position().isNone())
                throw e.withPosition(pos);
            throw;
        }
        catch (const std::exception &e)
        {
            throw RuntimeError(e.what(), pos);
        }

        checkDataSize(result, pos);
        if (method && !callArgs.empty())
            checkDataSize(*callArgs[0], pos);
        return result;
    }

    // ========================================================================
    // Limits
    // ========================================================================

    void Interpreter::checkDataSize(const Dynamic &value, Position pos) const
    {
        const Limits &limits = engine_.limits();

        switch (value.type())
        {
        case DynType::STRING:
            if (limits.maxStringSize > 0 && utf8Length(value.asString().str()) > limits.maxStringSize)
                throw DataTooLargeError("Length of string", limits.maxStringSize, pos);
            break;
        case DynType::ARRAY:
            if (limits.maxArraySize > 0 && value.asArray().size() > limits.maxArraySize)
                throw DataTooLargeError("Size of array", limits.maxArraySize, pos);
            break;
        case DynType::MAP:
            if (limits.maxMapSize > 0 && value.asMap().size() > limits.maxMapSize)
                throw DataTooLargeError("Size of map", limits.maxMapSize, pos);
            break;
        default:
            break;
        }
    }

    std::string Interpreter::signatureOf(const std::string &name, const FnArgs &args) const
    {
        std::vector<std::type_index> types;
        types.reserve(args.size());
        for (const Dynamic *arg : args)
            types.push_back(arg->typeId());
        return engine_.formatSignature(name, types);
    }

} // namespace rill
