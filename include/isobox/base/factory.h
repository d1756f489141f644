#pragma once

#include <isobox/result.hpp>
#include <memory>
#include <type_traits>
#include <utility>

namespace isobox {
namespace base {

// ObjectFactory - enforces the create protocol for shared_ptr objects
//
//   1. Header declares the interface type (e.g., SvgCanvas)
//   2. Cpp defines a private subclass (e.g., SvgCanvasImpl) with init()
//   3. createImpl() builds the Impl, calls init(), returns Result<Ptr>
//
// Subclass must implement one of (checked in order):
//   1. static Result<Ptr> createImpl(Args...)
//   2. static Result<Ptr> createImpl()
//
template<typename T>
class ObjectFactory {
public:
    using Type = T;
    using Ptr = std::shared_ptr<T>;
    using FactoryType = ObjectFactory<Type>;

private:
    // SFINAE: check for static Result<Ptr> createImpl(Args...)
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

    // SFINAE: check for static Result<Ptr> createImpl()
    template<typename FType>
    struct HasCreateImplNoArgs {
    private:
        template<typename F>
        static auto check(F*) -> decltype(F::Type::createImpl(), std::true_type{});
        template<typename>
        static std::false_type check(...);
    public:
        static constexpr bool value =
            std::is_same_v<decltype(check<FType>(nullptr)), std::true_type>;
    };

public:
    template<typename... Args>
    static Result<Ptr> create(Args&&... args) {
        if constexpr (HasCreateImpl<FactoryType, Args...>::value) {
            return Type::createImpl(std::forward<Args>(args)...);

        } else if constexpr (HasCreateImplNoArgs<FactoryType>::value) {
            return Type::createImpl();

        } else {
            // clang-format off
            static_assert(sizeof(T) == 0,
                "ObjectFactory: No createImpl found.\n"
                "Subclass must implement one of (checked in order):\n"
                "  1. static Result<Ptr> createImpl(Args...)\n"
                "  2. static Result<Ptr> createImpl()\n");
            // clang-format on
            return Err<Ptr>("unreachable");
        }
    }
};

} // namespace base
} // namespace isobox
