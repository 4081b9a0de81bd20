#pragma once

#include <celldraw/result.hpp>
#include <memory>
#include <type_traits>
#include <utility>

namespace celldraw {
namespace base {

// Marker passed to createImpl() so that a type opts into the factory
// explicitly instead of being constructed by accident.
struct ObjectFactoryContext {};

// ObjectFactory - create protocol for shared_ptr objects
//
//   1. The header declares the interface type (e.g. Config)
//   2. The cpp defines a private subclass (ConfigImpl) with init()
//   3. createImpl() builds the Impl, runs init() and returns Result<Ptr>
//
// The subclass implements one of (checked in order):
//   1. static Result<Ptr> createImpl(ContextType&, Args...)
//   2. static Result<Ptr> createImpl(Args...)
//
template<typename T, typename ContextT = ObjectFactoryContext>
class ObjectFactory {
public:
    using ContextType = ContextT;
    using Type = T;
    using Ptr = std::shared_ptr<T>;
    using FactoryType = ObjectFactory<Type, ContextType>;

private:
    template<typename FType, typename... Args>
    struct HasCreateImplWithContext {
    private:
        template<typename F>
        static auto check(F*) -> decltype(
            F::Type::createImpl(std::declval<typename F::ContextType&>(),
                                std::declval<Args>()...),
            std::true_type{});
        template<typename>
        static std::false_type check(...);
    public:
        static constexpr bool value =
            std::is_same_v<decltype(check<FType>(nullptr)), std::true_type>;
    };

    template<typename FType, typename... Args>
    struct HasCreateImpl {
    private:
        template<typename F>
        static auto check(F*) -> decltype(
            F::Type::createImpl(std::declval<Args>()...),
            std::true_type{});
        template<typename>
        static std::false_type check(...);
    public:
        static constexpr bool value =
            std::is_same_v<decltype(check<FType>(nullptr)), std::true_type>;
    };

public:
    template<typename... Args>
    static Result<Ptr> create(Args&&... args) {
        if constexpr (HasCreateImplWithContext<FactoryType, Args...>::value) {
            ContextType context;
            return Type::createImpl(context, std::forward<Args>(args)...);
        } else if constexpr (HasCreateImpl<FactoryType, Args...>::value) {
            return Type::createImpl(std::forward<Args>(args)...);
        } else {
            static_assert(sizeof(T) == 0,
                "ObjectFactory: no matching createImpl(...) in subclass");
            return Err<Ptr>("unreachable");
        }
    }
};

} // namespace base
} // namespace celldraw
