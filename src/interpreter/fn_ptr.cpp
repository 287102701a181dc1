#include "fn_ptr.hpp"
#include "../lexer/token.hpp"

namespace rill
{

    FnPtr FnPtr::create(const std::string &name, Position pos)
    {
        if (!isValidIdentifier(name))
            throw FunctionNotFoundError(name, pos);

        // Standard keywords cannot name a function
        if (auto token = lookupFromSyntax(name))
        {
            if (token->isKeyword() || (token->isReserved() && !isKeywordFunction(name)))
                throw FunctionNotFoundError(name, pos);
        }
        return FnPtr(name);
    }

    bool FnPtr::isAnonymous() const
    {
        return name_.rfind(ANONYMOUS_FN_PREFIX, 0) == 0;
    }

    void FnPtr::addCurry(std::vector<Dynamic> values)
    {
        curry_.reserve(curry_.size() + values.size());
        for (auto &v : values)
            curry_.push_back(std::move(v));
    }

    FnPtr FnPtr::curried(std::vector<Dynamic> values) const
    {
        FnPtr copy = *this;
        copy.addCurry(std::move(values));
        return copy;
    }

    bool FnPtr::operator==(const FnPtr &o) const
    {
        if (name_ != o.name_ || curry_.size() != o.curry_.size())
            return false;
        for (size_t i = 0; i < curry_.size(); i++)
            if (!curry_[i].equals(o.curry_[i]))
                return false;
        return true;
    }

} // namespace rill
