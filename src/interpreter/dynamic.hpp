#pragma once

// =============================================================================
// Dynamic: Rill's runtime value type
// =============================================================================
//
// Design:
//   A Dynamic is a type tag plus a payload. Scalars (bool, integer, float,
//   char) live inline in a union; everything else lives on the heap behind a
//   void* that is released according to the tag. Dispatch is one enum check
//   plus a static_cast.
//
//   Copying deep-copies the payload, with one exception: SHARED. A shared
//   value points at a reference-counted SharedCell, and copying it produces
//   another alias of the same cell. Closures promote the variables they
//   capture to SHARED so every holder observes later writes.
//
//   Host types the engine does not know about are boxed in a VARIANT: a
//   CustomValueOf<T> behind the polymorphic CustomValue interface.
//
// Access to a shared cell goes through RAII locks (DynamicReadLock,
// DynamicWriteLock). Taking a conflicting lock throws DataRaceError instead
// of blocking.
//
// =============================================================================

#include "../lexer/position.hpp"
#include "../lib/errors/error.hpp"
#include "../lib/types.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <vector>

#ifdef RILL_SYNC
#include <shared_mutex>
#endif

namespace rill
{

    // Forward declarations
    class Dynamic;
    class FnPtr;
    class SharedCell;
    class DynamicReadLock;
    class DynamicWriteLock;

    // ========================================================================
    // Unit, ImmutableString, Array, Map
    // ========================================================================

    /// The `()` value.
    struct Unit
    {
        bool operator==(const Unit &) const { return true; }
        bool operator!=(const Unit &) const { return false; }
    };

    /// Shared, immutable text. Every string-like parameter of a native
    /// function (std::string, std::string_view, const char*) is presented to
    /// the dispatcher as this one type.
    class ImmutableString
    {
    public:
        ImmutableString() : str_(emptyString()) {}
        ImmutableString(const std::string &s) : str_(std::make_shared<const std::string>(s)) {}
        ImmutableString(std::string &&s) : str_(std::make_shared<const std::string>(std::move(s))) {}
        ImmutableString(const char *s) : str_(std::make_shared<const std::string>(s)) {}

        const std::string &str() const { return *str_; }
        operator const std::string &() const { return *str_; }

        size_t size() const { return str_->size(); }
        bool empty() const { return str_->empty(); }
        const char *c_str() const { return str_->c_str(); }

        bool operator==(const ImmutableString &o) const { return str_ == o.str_ || *str_ == *o.str_; }
        bool operator!=(const ImmutableString &o) const { return !(*this == o); }
        bool operator<(const ImmutableString &o) const { return *str_ < *o.str_; }

    private:
        std::shared_ptr<const std::string> str_;

        static const std::shared_ptr<const std::string> &emptyString()
        {
            static const std::shared_ptr<const std::string> empty = std::make_shared<const std::string>();
            return empty;
        }
    };

    /// A script array
    using Array = std::vector<Dynamic>;

    /// A script object map (`#{ a: 1 }`), ordered by key
    using Map = std::map<std::string, Dynamic>;

    /// Display name of a type id: "i64", "string", "array", ... Unknown host
    /// types fall back to the compiler's type name.
    std::string typeNameOf(std::type_index type);

    // ========================================================================
    // CustomValue: boxed host values
    // ========================================================================

    class CustomValue
    {
    public:
        virtual ~CustomValue() = default;

        virtual std::unique_ptr<CustomValue> clone() const = 0;
        virtual std::type_index typeId() const = 0;
        virtual std::string toString() const = 0;
        virtual bool equals(const CustomValue &other) const = 0;
    };

    template <typename T>
    class CustomValueOf final : public CustomValue
    {
    public:
        T value;

        explicit CustomValueOf(T v) : value(std::move(v)) {}

        std::unique_ptr<CustomValue> clone() const override
        {
            return std::make_unique<CustomValueOf<T>>(value);
        }

        std::type_index typeId() const override { return typeid(T); }

        std::string toString() const override
        {
            if constexpr (std::is_same_v<T, float>)
                return formatFloat(value);
            else if constexpr (std::is_arithmetic_v<T>)
                return std::to_string(value);
            else
                return typeNameOf(typeid(T));
        }

        bool equals(const CustomValue &other) const override
        {
            if constexpr (std::is_arithmetic_v<T>)
            {
                if (other.typeId() != typeId())
                    return false;
                return static_cast<const CustomValueOf<T> &>(other).value == value;
            }
            else
            {
                return this == &other;
            }
        }
    };

    // ========================================================================
    // DynType: the type tag enum
    // ========================================================================

    enum class DynType : uint8_t
    {
        UNIT = 0,
        BOOL,
        INT,   // INT (int64_t)
        FLOAT, // FLOAT (double)
        CHAR,  // char32_t
        STRING,
        ARRAY,
        MAP,
        FN_PTR,
        SHARED,  // std::shared_ptr<SharedCell>
        VARIANT, // CustomValue
    };

    // ========================================================================
    // Dynamic: the value
    // ========================================================================

    class Dynamic
    {
    public:
        // ---- Construction: named factory methods ----

        static Dynamic makeUnit();
        static Dynamic makeBool(bool value);
        static Dynamic makeInt(INT value);
        static Dynamic makeFloat(FLOAT value);
        static Dynamic makeChar(char32_t value);
        static Dynamic makeString(ImmutableString value);
        static Dynamic makeArray(Array value = {});
        static Dynamic makeMap(Map value = {});
        static Dynamic makeFnPtr(FnPtr value);
        static Dynamic makeVariant(std::unique_ptr<CustomValue> value);

        /// Wrap any host value, choosing the matching tag.
        template <typename T>
        static Dynamic from(T &&value);

        // ---- Default constructor → unit ----

        Dynamic();

        ~Dynamic();
        Dynamic(const Dynamic &other);
        Dynamic &operator=(const Dynamic &other);
        Dynamic(Dynamic &&other) noexcept;
        Dynamic &operator=(Dynamic &&other) noexcept;

        // ---- Type queries ----

        DynType type() const { return type_; }
        bool isUnit() const { return type_ == DynType::UNIT; }
        bool isShared() const { return type_ == DynType::SHARED; }

        /// Type id of the held value; a shared value reports its contents.
        std::type_index typeId() const;

        /// Display name of typeId()
        std::string typeName() const;

        template <typename T>
        bool is() const;

        // ---- Payload access (unchecked: caller must verify the tag first) ----

        bool asBool() const { return v_.b; }
        INT asInt() const { return v_.i; }
        FLOAT asFloat() const { return v_.f; }
        char32_t asChar() const { return v_.c; }
        const ImmutableString &asString() const;
        const Array &asArray() const;
        Array &asArrayMut();
        const Map &asMap() const;
        Map &asMapMut();
        const FnPtr &asFnPtr() const;
        FnPtr &asFnPtrMut();
        const CustomValue &asVariant() const;

        // ---- Typed access ----

        /// Pointer to the payload if it holds exactly a T, otherwise nullptr.
        /// Shared values must be locked first.
        template <typename T>
        T *ptr();

        template <typename T>
        const T *ptr() const;

        /// Copy out a T, reading through a shared cell. Throws
        /// MismatchedTypeError.
        template <typename T>
        T cast() const;

        /// Move the value out, leaving unit behind.
        Dynamic take();

        // ---- Sharing ----

        /// A plain (non-shared) copy of the value.
        Dynamic flatten() const;

        /// A shared alias of this value. Already-shared values return another
        /// alias of the same cell.
        Dynamic intoShared() const;

        /// Lock for reading. Non-shared values lock trivially.
        DynamicReadLock read(const std::string &name = "", Position pos = Position::none()) const;

        /// Lock for writing. Non-shared values lock trivially.
        DynamicWriteLock write(const std::string &name = "", Position pos = Position::none());

        // ---- Conversion to string ----

        /// Text for `print` and string concatenation.
        std::string toString() const;

        /// Text for `debug`: strings and chars quoted.
        std::string toDebugString() const;

        // ---- Comparison ----

        bool equals(const Dynamic &other) const;

    private:
        DynType type_;
        union Payload
        {
            bool b;
            INT i;
            FLOAT f;
            char32_t c;
            void *p;
        } v_;

        explicit Dynamic(DynType type) : type_(type) { v_.p = nullptr; }

        const std::shared_ptr<SharedCell> &cell() const;

        void copyFrom(const Dynamic &other);
        void release();
    };

    // ========================================================================
    // SharedCell and its locks
    // ========================================================================

    /// The interior-mutable cell behind a SHARED value.
    class SharedCell
    {
    public:
        explicit SharedCell(Dynamic v) : value(std::move(v)) {}

        Dynamic value;

    private:
        friend class DynamicReadLock;
        friend class DynamicWriteLock;

#ifdef RILL_SYNC
        std::shared_mutex mutex_;
#else
        size_t readers_ = 0;
        bool writer_ = false;
#endif
    };

    class DynamicReadLock
    {
    public:
        explicit DynamicReadLock(const Dynamic *direct) : target_(direct) {}
        DynamicReadLock(std::shared_ptr<SharedCell> cell, const std::string &name, Position pos);
        ~DynamicReadLock();

        DynamicReadLock(DynamicReadLock &&other) noexcept;
        DynamicReadLock(const DynamicReadLock &) = delete;
        DynamicReadLock &operator=(const DynamicReadLock &) = delete;
        DynamicReadLock &operator=(DynamicReadLock &&) = delete;

        const Dynamic &operator*() const { return *target_; }
        const Dynamic *operator->() const { return target_; }

    private:
        const Dynamic *target_;
        std::shared_ptr<SharedCell> cell_;
    };

    class DynamicWriteLock
    {
    public:
        explicit DynamicWriteLock(Dynamic *direct) : target_(direct) {}
        DynamicWriteLock(std::shared_ptr<SharedCell> cell, const std::string &name, Position pos);
        ~DynamicWriteLock();

        DynamicWriteLock(DynamicWriteLock &&other) noexcept;
        DynamicWriteLock(const DynamicWriteLock &) = delete;
        DynamicWriteLock &operator=(const DynamicWriteLock &) = delete;
        DynamicWriteLock &operator=(DynamicWriteLock &&) = delete;

        Dynamic &operator*() const { return *target_; }
        Dynamic *operator->() const { return target_; }

    private:
        Dynamic *target_;
        std::shared_ptr<SharedCell> cell_;
    };

    // ========================================================================
    // Template definitions
    // ========================================================================

    /// std::string is presented as ImmutableString everywhere in dispatch.
    template <typename T>
    using CanonicalType = std::conditional_t<
        std::is_same_v<std::decay_t<T>, std::string> || std::is_same_v<std::decay_t<T>, std::string_view> ||
            std::is_same_v<std::decay_t<T>, const char *> || std::is_same_v<std::decay_t<T>, char *>,
        ImmutableString, std::decay_t<T>>;

    template <typename T>
    Dynamic Dynamic::from(T &&value)
    {
        using U = std::decay_t<T>;

        if constexpr (std::is_same_v<U, Dynamic>)
            return Dynamic(std::forward<T>(value));
        else if constexpr (std::is_same_v<U, Unit>)
            return makeUnit();
        else if constexpr (std::is_same_v<U, bool>)
            return makeBool(value);
        else if constexpr (std::is_same_v<U, INT>)
            return makeInt(value);
        else if constexpr (std::is_same_v<U, FLOAT>)
            return makeFloat(value);
        else if constexpr (std::is_same_v<U, char32_t>)
            return makeChar(value);
        else if constexpr (std::is_same_v<U, ImmutableString>)
            return makeString(std::forward<T>(value));
        else if constexpr (std::is_same_v<CanonicalType<U>, ImmutableString>)
            return makeString(ImmutableString(std::string(value)));
        else if constexpr (std::is_same_v<U, Array>)
            return makeArray(std::forward<T>(value));
        else if constexpr (std::is_same_v<U, Map>)
            return makeMap(std::forward<T>(value));
        else if constexpr (std::is_same_v<U, FnPtr>)
            return makeFnPtr(std::forward<T>(value));
        else
            return makeVariant(std::make_unique<CustomValueOf<U>>(std::forward<T>(value)));
    }

    template <typename T>
    bool Dynamic::is() const
    {
        return typeId() == std::type_index(typeid(CanonicalType<T>));
    }

    template <typename T>
    T *Dynamic::ptr()
    {
        if constexpr (std::is_same_v<T, Dynamic>)
        {
            return this;
        }
        else if constexpr (std::is_same_v<T, Unit>)
        {
            static Unit unit;
            return type_ == DynType::UNIT ? &unit : nullptr;
        }
        else if constexpr (std::is_same_v<T, bool>)
        {
            return type_ == DynType::BOOL ? &v_.b : nullptr;
        }
        else if constexpr (std::is_same_v<T, INT>)
        {
            return type_ == DynType::INT ? &v_.i : nullptr;
        }
        else if constexpr (std::is_same_v<T, FLOAT>)
        {
            return type_ == DynType::FLOAT ? &v_.f : nullptr;
        }
        else if constexpr (std::is_same_v<T, char32_t>)
        {
            return type_ == DynType::CHAR ? &v_.c : nullptr;
        }
        else if constexpr (std::is_same_v<T, ImmutableString>)
        {
            return type_ == DynType::STRING ? static_cast<T *>(v_.p) : nullptr;
        }
        else if constexpr (std::is_same_v<T, Array>)
        {
            return type_ == DynType::ARRAY ? static_cast<T *>(v_.p) : nullptr;
        }
        else if constexpr (std::is_same_v<T, Map>)
        {
            return type_ == DynType::MAP ? static_cast<T *>(v_.p) : nullptr;
        }
        else if constexpr (std::is_same_v<T, FnPtr>)
        {
            return type_ == DynType::FN_PTR ? static_cast<T *>(v_.p) : nullptr;
        }
        else
        {
            if (type_ != DynType::VARIANT)
                return nullptr;
            auto *custom = static_cast<CustomValue *>(v_.p);
            if (custom->typeId() != std::type_index(typeid(T)))
                return nullptr;
            return &static_cast<CustomValueOf<T> *>(custom)->value;
        }
    }

    template <typename T>
    const T *Dynamic::ptr() const
    {
        return const_cast<Dynamic *>(this)->ptr<T>();
    }

    template <typename T>
    T Dynamic::cast() const
    {
        using U = std::decay_t<T>;

        if constexpr (std::is_same_v<U, Dynamic>)
        {
            return flatten();
        }
        else
        {
            if (isShared())
                return read()->template cast<U>();

            if constexpr (std::is_same_v<U, std::string>)
            {
                if (auto *s = ptr<ImmutableString>())
                    return s->str();
            }
            else
            {
                if (auto *p = ptr<U>())
                    return *p;
            }
            throw MismatchedTypeError(typeNameOf(typeid(CanonicalType<U>)), typeName(), Position::none());
        }
    }

} // namespace rill
