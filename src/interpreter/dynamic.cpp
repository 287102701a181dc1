#include "dynamic.hpp"
#include "fn_ptr.hpp"
#include <unordered_map>

namespace rill
{

    // ========================================================================
    // typeNameOf: display names for type ids
    // ========================================================================

    std::string typeNameOf(std::type_index type)
    {
        static const std::unordered_map<std::type_index, std::string> names = {
            {typeid(Unit), "()"},
            {typeid(bool), "bool"},
            {typeid(INT), "i64"},
            {typeid(FLOAT), "f64"},
            {typeid(char32_t), "char"},
            {typeid(ImmutableString), "string"},
            {typeid(std::string), "string"},
            {typeid(Array), "array"},
            {typeid(Map), "map"},
            {typeid(FnPtr), "Fn"},
            {typeid(Dynamic), "?"},
            {typeid(int8_t), "i8"},
            {typeid(int16_t), "i16"},
            {typeid(int32_t), "i32"},
            {typeid(uint8_t), "u8"},
            {typeid(uint16_t), "u16"},
            {typeid(uint32_t), "u32"},
            {typeid(uint64_t), "u64"},
            {typeid(float), "f32"},
        };

        auto it = names.find(type);
        if (it != names.end())
            return it->second;
        return type.name();
    }

    // ========================================================================
    // Factories
    // ========================================================================

    Dynamic::Dynamic() : type_(DynType::UNIT) { v_.p = nullptr; }

    Dynamic Dynamic::makeUnit() { return Dynamic(); }

    Dynamic Dynamic::makeBool(bool value)
    {
        Dynamic d(DynType::BOOL);
        d.v_.b = value;
        return d;
    }

    Dynamic Dynamic::makeInt(INT value)
    {
        Dynamic d(DynType::INT);
        d.v_.i = value;
        return d;
    }

    Dynamic Dynamic::makeFloat(FLOAT value)
    {
        Dynamic d(DynType::FLOAT);
        d.v_.f = value;
        return d;
    }

    Dynamic Dynamic::makeChar(char32_t value)
    {
        Dynamic d(DynType::CHAR);
        d.v_.c = value;
        return d;
    }

    Dynamic Dynamic::makeString(ImmutableString value)
    {
        Dynamic d(DynType::STRING);
        d.v_.p = new ImmutableString(std::move(value));
        return d;
    }

    Dynamic Dynamic::makeArray(Array value)
    {
        Dynamic d(DynType::ARRAY);
        d.v_.p = new Array(std::move(value));
        return d;
    }

    Dynamic Dynamic::makeMap(Map value)
    {
        Dynamic d(DynType::MAP);
        d.v_.p = new Map(std::move(value));
        return d;
    }

    Dynamic Dynamic::makeFnPtr(FnPtr value)
    {
        Dynamic d(DynType::FN_PTR);
        d.v_.p = new FnPtr(std::move(value));
        return d;
    }

    Dynamic Dynamic::makeVariant(std::unique_ptr<CustomValue> value)
    {
        Dynamic d(DynType::VARIANT);
        d.v_.p = value.release();
        return d;
    }

    // ========================================================================
    // Copy / move / destroy
    // ========================================================================

    Dynamic::~Dynamic() { release(); }

    Dynamic::Dynamic(const Dynamic &other) : type_(DynType::UNIT)
    {
        v_.p = nullptr;
        copyFrom(other);
    }

    Dynamic &Dynamic::operator=(const Dynamic &other)
    {
        if (this != &other)
        {
            // Copy first: `other` may live inside our own payload
            Dynamic copy(other);
            *this = std::move(copy);
        }
        return *this;
    }

    Dynamic::Dynamic(Dynamic &&other) noexcept : type_(other.type_), v_(other.v_)
    {
        other.type_ = DynType::UNIT;
        other.v_.p = nullptr;
    }

    Dynamic &Dynamic::operator=(Dynamic &&other) noexcept
    {
        if (this != &other)
        {
            DynType oldType = type_;
            Payload oldPayload = v_;

            type_ = other.type_;
            v_ = other.v_;
            other.type_ = DynType::UNIT;
            other.v_.p = nullptr;

            // Release the old payload last: `other` may have lived inside it
            Dynamic old(oldType);
            old.v_ = oldPayload;
        }
        return *this;
    }

    void Dynamic::copyFrom(const Dynamic &other)
    {
        type_ = other.type_;
        switch (other.type_)
        {
        case DynType::STRING:
            v_.p = new ImmutableString(other.asString());
            break;
        case DynType::ARRAY:
            v_.p = new Array(other.asArray());
            break;
        case DynType::MAP:
            v_.p = new Map(other.asMap());
            break;
        case DynType::FN_PTR:
            v_.p = new FnPtr(other.asFnPtr());
            break;
        case DynType::SHARED:
            v_.p = new std::shared_ptr<SharedCell>(other.cell());
            break;
        case DynType::VARIANT:
            v_.p = other.asVariant().clone().release();
            break;
        default:
            v_ = other.v_;
            break;
        }
    }

    void Dynamic::release()
    {
        switch (type_)
        {
        case DynType::STRING:
            delete static_cast<ImmutableString *>(v_.p);
            break;
        case DynType::ARRAY:
            delete static_cast<Array *>(v_.p);
            break;
        case DynType::MAP:
            delete static_cast<Map *>(v_.p);
            break;
        case DynType::FN_PTR:
            delete static_cast<FnPtr *>(v_.p);
            break;
        case DynType::SHARED:
            delete static_cast<std::shared_ptr<SharedCell> *>(v_.p);
            break;
        case DynType::VARIANT:
            delete static_cast<CustomValue *>(v_.p);
            break;
        default:
            break;
        }
        type_ = DynType::UNIT;
        v_.p = nullptr;
    }

    // ========================================================================
    // Payload access
    // ========================================================================

    const ImmutableString &Dynamic::asString() const { return *static_cast<const ImmutableString *>(v_.p); }
    const Array &Dynamic::asArray() const { return *static_cast<const Array *>(v_.p); }
    Array &Dynamic::asArrayMut() { return *static_cast<Array *>(v_.p); }
    const Map &Dynamic::asMap() const { return *static_cast<const Map *>(v_.p); }
    Map &Dynamic::asMapMut() { return *static_cast<Map *>(v_.p); }
    const FnPtr &Dynamic::asFnPtr() const { return *static_cast<const FnPtr *>(v_.p); }
    FnPtr &Dynamic::asFnPtrMut() { return *static_cast<FnPtr *>(v_.p); }
    const CustomValue &Dynamic::asVariant() const { return *static_cast<const CustomValue *>(v_.p); }

    const std::shared_ptr<SharedCell> &Dynamic::cell() const
    {
        return *static_cast<const std::shared_ptr<SharedCell> *>(v_.p);
    }

    std::type_index Dynamic::typeId() const
    {
        switch (type_)
        {
        case DynType::UNIT:
            return typeid(Unit);
        case DynType::BOOL:
            return typeid(bool);
        case DynType::INT:
            return typeid(INT);
        case DynType::FLOAT:
            return typeid(FLOAT);
        case DynType::CHAR:
            return typeid(char32_t);
        case DynType::STRING:
            return typeid(ImmutableString);
        case DynType::ARRAY:
            return typeid(Array);
        case DynType::MAP:
            return typeid(Map);
        case DynType::FN_PTR:
            return typeid(FnPtr);
        case DynType::SHARED:
            return read()->typeId();
        case DynType::VARIANT:
            return asVariant().typeId();
        }
        return typeid(Unit);
    }

    std::string Dynamic::typeName() const { return typeNameOf(typeId()); }

    Dynamic Dynamic::take()
    {
        Dynamic out(std::move(*this));
        return out;
    }

    // ========================================================================
    // Sharing
    // ========================================================================

    Dynamic Dynamic::flatten() const
    {
        if (!isShared())
            return *this;
        return read()->flatten();
    }

    Dynamic Dynamic::intoShared() const
    {
        if (isShared())
            return *this;

        Dynamic d(DynType::SHARED);
        d.v_.p = new std::shared_ptr<SharedCell>(std::make_shared<SharedCell>(*this));
        return d;
    }

    DynamicReadLock Dynamic::read(const std::string &name, Position pos) const
    {
        if (!isShared())
            return DynamicReadLock(this);
        return DynamicReadLock(cell(), name, pos);
    }

    DynamicWriteLock Dynamic::write(const std::string &name, Position pos)
    {
        if (!isShared())
            return DynamicWriteLock(this);
        return DynamicWriteLock(cell(), name, pos);
    }

    // ---- Locks ----
    //
    // Locks never wait. A cell already held by a conflicting lock, on this
    // thread or (with RILL_SYNC) another one, raises DataRaceError. try_lock
    // may also fail spuriously under RILL_SYNC; that is reported the same way.

    DynamicReadLock::DynamicReadLock(std::shared_ptr<SharedCell> cell, const std::string &name,
                                     Position pos)
        : target_(&cell->value), cell_(std::move(cell))
    {
#ifdef RILL_SYNC
        if (!cell_->mutex_.try_lock_shared())
            throw DataRaceError(name, pos);
#else
        if (cell_->writer_)
            throw DataRaceError(name, pos);
        cell_->readers_++;
#endif
    }

    DynamicReadLock::DynamicReadLock(DynamicReadLock &&other) noexcept
        : target_(other.target_), cell_(std::move(other.cell_))
    {
        other.cell_.reset();
    }

    DynamicReadLock::~DynamicReadLock()
    {
        if (!cell_)
            return;
#ifdef RILL_SYNC
        cell_->mutex_.unlock_shared();
#else
        cell_->readers_--;
#endif
    }

    DynamicWriteLock::DynamicWriteLock(std::shared_ptr<SharedCell> cell, const std::string &name,
                                       Position pos)
        : target_(&cell->value), cell_(std::move(cell))
    {
#ifdef RILL_SYNC
        if (!cell_->mutex_.try_lock())
            throw DataRaceError(name, pos);
#else
        if (cell_->writer_ || cell_->readers_ > 0)
            throw DataRaceError(name, pos);
        cell_->writer_ = true;
#endif
    }

    DynamicWriteLock::DynamicWriteLock(DynamicWriteLock &&other) noexcept
        : target_(other.target_), cell_(std::move(other.cell_))
    {
        other.cell_.reset();
    }

    DynamicWriteLock::~DynamicWriteLock()
    {
        if (!cell_)
            return;
#ifdef RILL_SYNC
        cell_->mutex_.unlock();
#else
        cell_->writer_ = false;
#endif
    }

    // ========================================================================
    // toString / equals
    // ========================================================================

    namespace
    {
        std::string quote(const std::string &s, char q)
        {
            std::string out(1, q);
            for (char c : s)
            {
                switch (c)
                {
                case '\\':
                    out += "\\\\";
                    break;
                case '\n':
                    out += "\\n";
                    break;
                case '\t':
                    out += "\\t";
                    break;
                case '\r':
                    out += "\\r";
                    break;
                default:
                    if (c == q)
                        out += '\\';
                    out += c;
                    break;
                }
            }
            out += q;
            return out;
        }
    } // namespace

    std::string Dynamic::toString() const
    {
        switch (type_)
        {
        case DynType::UNIT:
            return "";
        case DynType::BOOL:
            return v_.b ? "true" : "false";
        case DynType::INT:
            return std::to_string(v_.i);
        case DynType::FLOAT:
            return formatFloat(v_.f);
        case DynType::CHAR:
            return toUtf8(v_.c);
        case DynType::STRING:
            return asString().str();
        case DynType::ARRAY:
        case DynType::MAP:
            return toDebugString();
        case DynType::FN_PTR:
            return asFnPtr().toString();
        case DynType::SHARED:
            return read()->toString();
        case DynType::VARIANT:
            return asVariant().toString();
        }
        return "";
    }

    std::string Dynamic::toDebugString() const
    {
        switch (type_)
        {
        case DynType::UNIT:
            return "()";
        case DynType::CHAR:
            return quote(toUtf8(v_.c), '\'');
        case DynType::STRING:
            return quote(asString().str(), '"');
        case DynType::ARRAY:
        {
            std::string out = "[";
            const Array &arr = asArray();
            for (size_t i = 0; i < arr.size(); i++)
            {
                if (i > 0)
                    out += ", ";
                out += arr[i].toDebugString();
            }
            return out + "]";
        }
        case DynType::MAP:
        {
            std::string out = "#{";
            bool first = true;
            for (const auto &[key, value] : asMap())
            {
                if (!first)
                    out += ", ";
                first = false;
                out += quote(key, '"') + ": " + value.toDebugString();
            }
            return out + "}";
        }
        case DynType::SHARED:
            return read()->toDebugString();
        default:
            return toString();
        }
    }

    bool Dynamic::equals(const Dynamic &other) const
    {
        if (isShared())
            return read()->equals(other);
        if (other.isShared())
            return equals(*other.read());
        if (type_ != other.type_)
            return false;

        switch (type_)
        {
        case DynType::UNIT:
            return true;
        case DynType::BOOL:
            return v_.b == other.v_.b;
        case DynType::INT:
            return v_.i == other.v_.i;
        case DynType::FLOAT:
            return v_.f == other.v_.f;
        case DynType::CHAR:
            return v_.c == other.v_.c;
        case DynType::STRING:
            return asString() == other.asString();
        case DynType::ARRAY:
        {
            const Array &a = asArray();
            const Array &b = other.asArray();
            if (a.size() != b.size())
                return false;
            for (size_t i = 0; i < a.size(); i++)
                if (!a[i].equals(b[i]))
                    return false;
            return true;
        }
        case DynType::MAP:
        {
            const Map &a = asMap();
            const Map &b = other.asMap();
            if (a.size() != b.size())
                return false;
            for (auto ia = a.begin(), ib = b.begin(); ia != a.end(); ++ia, ++ib)
                if (ia->first != ib->first || !ia->second.equals(ib->second))
                    return false;
            return true;
        }
        case DynType::FN_PTR:
            return asFnPtr() == other.asFnPtr();
        case DynType::VARIANT:
            return asVariant().equals(other.asVariant());
        default:
            return false;
        }
    }

} // namespace rill
