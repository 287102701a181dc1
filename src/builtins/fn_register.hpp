#pragma once

// =============================================================================
// fn_register.hpp: wrap ordinary C++ callables as native Rill functions
// =============================================================================
//
// Every native function in a Module has the same shape (see module.hpp):
//
//     Dynamic fn(NativeCallContext &ctx, FnArgs &args)
//
// registerFn() builds that wrapper from a function pointer, a lambda or
// functor, or a member-function pointer (whose object becomes the first
// argument). The parameter types give the dispatch signature:
//
//     registerFn(m, "add", [](INT a, INT b) { return a + b; });          // (i64, i64)
//     registerFn(m, "push", [](Array &a, Dynamic v) { a.push_back(v); }); // (array, ?)
//
// A non-const T& first parameter binds to the receiver's own storage, so the
// function writes through to the caller's variable. Every other parameter is
// extracted by value. String-like parameters (std::string, const
// std::string&, std::string_view, const char*) all dispatch as "string".
//
// To add a package:
//   1. Create  src/builtins/builtins_<category>.hpp
//   2. Write   inline void registerXxxBuiltins(Module &m);
//   3. Call it from register_all.hpp → registerCoreBuiltins().
//
// =============================================================================

#include "../interpreter/dynamic.hpp"
#include "../interpreter/fn_ptr.hpp"
#include "../lib/errors/result.hpp"
#include "../module/module.hpp"
#include <functional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <typeindex>
#include <utility>
#include <vector>

namespace rill
{

    namespace detail
    {

        // ---- Argument extraction --------------------------------------------

        template <typename P>
        using BareType = std::remove_cv_t<std::remove_reference_t<P>>;

        template <typename P>
        inline constexpr bool isMutRef = std::is_lvalue_reference_v<P> && !std::is_const_v<std::remove_reference_t<P>>;

        template <typename P>
        std::type_index paramTypeId()
        {
            using D = BareType<P>;
            if constexpr (std::is_same_v<D, Dynamic>)
                return typeid(Dynamic);
            else
                return typeid(CanonicalType<D>);
        }

        template <typename D>
        D extractValue(Dynamic &arg)
        {
            if constexpr (std::is_same_v<D, Dynamic>)
            {
                return arg;
            }
            else if constexpr (std::is_same_v<D, std::string_view> || std::is_same_v<D, const char *>)
            {
                const ImmutableString *s = arg.ptr<ImmutableString>();
                if (!s)
                    throw MismatchedTypeError("string", arg.typeName(), Position::none());
                if constexpr (std::is_same_v<D, std::string_view>)
                    return std::string_view(s->str());
                else
                    return s->c_str();
            }
            else
            {
                return arg.cast<D>();
            }
        }

        template <typename D>
        D &extractRef(Dynamic &arg)
        {
            static_assert(!std::is_same_v<D, std::string>,
                          "strings are immutable: take ImmutableString& or a value instead");
            D *p = arg.ptr<D>();
            if (!p)
                throw MismatchedTypeError(typeNameOf(typeid(D)), arg.typeName(), Position::none());
            return *p;
        }

        /// Storage for one extracted argument for the duration of a call
        template <typename P, size_t I, bool ByRef = (I == 0 && isMutRef<P>)>
        class ArgHolder;

        template <typename P, size_t I>
        class ArgHolder<P, I, true>
        {
        public:
            explicit ArgHolder(Dynamic &arg) : ptr_(&extractRef<BareType<P>>(arg)) {}
            BareType<P> &get() { return *ptr_; }

        private:
            BareType<P> *ptr_;
        };

        template <typename P, size_t I>
        class ArgHolder<P, I, false>
        {
        public:
            explicit ArgHolder(Dynamic &arg) : value_(extractValue<BareType<P>>(arg)) {}
            BareType<P> &get() { return value_; }

        private:
            BareType<P> value_;
        };

        // ---- Return conversion ----------------------------------------------

        template <typename T>
        struct IsEvalResult : std::false_type
        {
        };

        template <typename T>
        struct IsEvalResult<EvalResult<T>> : std::true_type
        {
        };

        template <typename R>
        Dynamic toDynamic(R &&result)
        {
            using U = std::decay_t<R>;
            if constexpr (IsEvalResult<U>::value)
            {
                if (!result.ok())
                    result.raise();
                return toDynamic(std::move(result).value());
            }
            else
            {
                return Dynamic::from(std::forward<R>(result));
            }
        }

        // ---- Callable traits ------------------------------------------------

        template <typename R, typename... A>
        struct Signature
        {
            using Return = R;
            static constexpr size_t arity = sizeof...(A);

            static std::vector<std::type_index> paramTypes() { return {paramTypeId<A>()...}; }

            template <typename F>
            static Dynamic call(F &fn, FnArgs &args)
            {
                return callIndexed(fn, args, std::index_sequence_for<A...>{});
            }

        private:
            template <typename F, size_t... I>
            static Dynamic callIndexed(F &fn, FnArgs &args, std::index_sequence<I...>)
            {
                (void)args;
                std::tuple<ArgHolder<A, I>...> holders{ArgHolder<A, I>(*args[I])...};
                (void)holders;

                if constexpr (std::is_void_v<R>)
                {
                    std::invoke(fn, std::forward<A>(std::get<I>(holders).get())...);
                    return Dynamic();
                }
                else
                {
                    return toDynamic(std::invoke(fn, std::forward<A>(std::get<I>(holders).get())...));
                }
            }
        };

        // operator() of a lambda or functor: the object itself is not an argument
        template <typename T>
        struct CallOperatorTraits;

        template <typename C, typename R, typename... A>
        struct CallOperatorTraits<R (C::*)(A...) const> : Signature<R, A...>
        {
        };

        template <typename C, typename R, typename... A>
        struct CallOperatorTraits<R (C::*)(A...)> : Signature<R, A...>
        {
        };

        template <typename C, typename R, typename... A>
        struct CallOperatorTraits<R (C::*)(A...) const noexcept> : Signature<R, A...>
        {
        };

        template <typename F>
        struct FnTraits : CallOperatorTraits<decltype(&F::operator())>
        {
        };

        template <typename R, typename... A>
        struct FnTraits<R (*)(A...)> : Signature<R, A...>
        {
        };

        template <typename R, typename... A>
        struct FnTraits<R (*)(A...) noexcept> : Signature<R, A...>
        {
        };

        // Member functions: the object is the first argument
        template <typename C, typename R, typename... A>
        struct FnTraits<R (C::*)(A...)> : Signature<R, C &, A...>
        {
        };

        template <typename C, typename R, typename... A>
        struct FnTraits<R (C::*)(A...) const> : Signature<R, const C &, A...>
        {
        };

        template <typename F>
        NativeFn makeNative(F &&f)
        {
            using Fn = std::decay_t<F>;
            using Traits = FnTraits<Fn>;
            return [fn = Fn(std::forward<F>(f))](NativeCallContext &, FnArgs &args) mutable -> Dynamic
            {
                return Traits::call(fn, args);
            };
        }

    } // namespace detail

    // ========================================================================
    // Registration
    // ========================================================================

    /// Register a callable under `name`, dispatched by its parameter types.
    template <typename F>
    void registerFn(Module &module, const std::string &name, F &&f, FnAccess access = FnAccess::PUBLIC)
    {
        using Traits = detail::FnTraits<std::decay_t<F>>;
        module.setFn(name, access, Traits::paramTypes(), detail::makeNative(std::forward<F>(f)));
    }

    /// Register a fallible callable returning EvalResult<R>. An error result is
    /// raised in the script like any other error.
    template <typename F>
    void registerResultFn(Module &module, const std::string &name, F &&f, FnAccess access = FnAccess::PUBLIC)
    {
        using Traits = detail::FnTraits<std::decay_t<F>>;
        static_assert(detail::IsEvalResult<std::decay_t<typename Traits::Return>>::value,
                      "registerResultFn expects a callable returning EvalResult<T>");
        module.setFn(name, access, Traits::paramTypes(), detail::makeNative(std::forward<F>(f)));
    }

    /// Register a native function with an explicit signature. Use
    /// typeid(Dynamic) for a parameter that accepts anything.
    inline void registerRawFn(Module &module, const std::string &name, std::vector<std::type_index> params,
                              NativeFn fn, FnAccess access = FnAccess::PUBLIC)
    {
        module.setFn(name, access, std::move(params), std::move(fn));
    }

    // ---- Custom-type properties and indexers ----------------------------------

    inline std::string getterName(const std::string &prop) { return "get$" + prop; }
    inline std::string setterName(const std::string &prop) { return "set$" + prop; }

    inline constexpr const char *FN_IDX_GET = "index$get";
    inline constexpr const char *FN_IDX_SET = "index$set";

    /// getter: (T&) -> V
    template <typename F>
    void registerGet(Module &module, const std::string &prop, F &&getter)
    {
        registerFn(module, getterName(prop), std::forward<F>(getter));
    }

    /// setter: (T&, V) -> void
    template <typename F>
    void registerSet(Module &module, const std::string &prop, F &&setter)
    {
        registerFn(module, setterName(prop), std::forward<F>(setter));
    }

    /// getter: (T&, I) -> V
    template <typename F>
    void registerIndexerGet(Module &module, F &&getter)
    {
        registerFn(module, FN_IDX_GET, std::forward<F>(getter));
    }

    /// setter: (T&, I, V) -> void
    template <typename F>
    void registerIndexerSet(Module &module, F &&setter)
    {
        registerFn(module, FN_IDX_SET, std::forward<F>(setter));
    }

} // namespace rill
