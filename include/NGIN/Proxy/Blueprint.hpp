// Blueprint.hpp
// Proxy blueprints: the flattened interface closure, its forwarding slots and
// the concrete class composed from every interface's Forwarder.
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <NGIN/Proxy/Export.hpp>
#include <NGIN/Proxy/InterfaceBuilder.hpp>
#include <NGIN/Proxy/ProxyObject.hpp>
#include <NGIN/Proxy/Registry.hpp>
#include <NGIN/Proxy/Types.hpp>

#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace NGIN::Proxy
{
  namespace detail
  {
    // ---- Interface list algebra ----
    template <class T, class List>
    struct ListContains;
    template <class T, class... I>
    struct ListContains<T, InterfaceList<I...>> : std::bool_constant<(std::is_same_v<T, I> || ...)>
    {
    };

    template <class A, class B>
    struct ListConcat;
    template <class... A, class... B>
    struct ListConcat<InterfaceList<A...>, InterfaceList<B...>>
    {
      using type = InterfaceList<A..., B...>;
    };

    // Pre-order walk over Extends; the first occurrence of an interface wins.
    template <class Visited, class Pending>
    struct ClosureWalk;
    template <bool Seen, class Visited, class Head, class Tail>
    struct ClosureStep;

    template <class Visited>
    struct ClosureWalk<Visited, InterfaceList<>>
    {
      using type = Visited;
    };
    template <class Visited, class Head, class... Tail>
    struct ClosureWalk<Visited, InterfaceList<Head, Tail...>>
    {
      using type = typename ClosureStep<ListContains<Head, Visited>::value, Visited, Head, InterfaceList<Tail...>>::type;
    };

    template <class Visited, class Head, class Tail>
    struct ClosureStep<true, Visited, Head, Tail>
    {
      using type = typename ClosureWalk<Visited, Tail>::type;
    };
    template <class Visited, class Head, class Tail>
    struct ClosureStep<false, Visited, Head, Tail>
    {
      using WithHead = typename ListConcat<Visited, InterfaceList<Head>>::type;
      using AfterHead = typename ClosureWalk<WithHead, ExtendsOf<Head>>::type;
      using type = typename ClosureWalk<AfterHead, Tail>::type;
    };

    template <class Requested>
    using ClosureOf = typename ClosureWalk<InterfaceList<>, Requested>::type;

    // Requested interfaces that are not already a base of another requested one.
    template <class T, class List>
    struct IsBaseOfOther;
    template <class T, class... I>
    struct IsBaseOfOther<T, InterfaceList<I...>>
        : std::bool_constant<((!std::is_same_v<T, I> && std::is_base_of_v<T, I>) || ...)>
    {
    };

    template <class Requested, class Pending, class Out>
    struct DirectBasesWalk;
    template <class Requested, class Out>
    struct DirectBasesWalk<Requested, InterfaceList<>, Out>
    {
      using type = Out;
    };
    template <class Requested, class Head, class... Tail, class Out>
    struct DirectBasesWalk<Requested, InterfaceList<Head, Tail...>, Out>
    {
      static constexpr bool skip = IsBaseOfOther<Head, Requested>::value || ListContains<Head, Out>::value;
      using Next = std::conditional_t<skip, Out, typename ListConcat<Out, InterfaceList<Head>>::type>;
      using type = typename DirectBasesWalk<Requested, InterfaceList<Tail...>, Next>::type;
    };

    template <class Requested>
    using DirectBases = typename DirectBasesWalk<Requested, Requested, InterfaceList<>>::type;

    // ---- Proxy class composition ----
    template <class Bases>
    class ProxyRoot;
    template <class... I>
    class ProxyRoot<InterfaceList<I...>> : public virtual ProxyObject, public I...
    {
    };

    template <class Base, class Closure>
    struct ForwarderChain;
    template <class Base>
    struct ForwarderChain<Base, InterfaceList<>>
    {
      using type = Base;
    };
    template <class Base, class Head, class... Tail>
    struct ForwarderChain<Base, InterfaceList<Head, Tail...>>
    {
      using Next = typename NGIN::Proxy::Describe<Head>::template Forwarder<Base>;
      using type = typename ForwarderChain<Next, InterfaceList<Tail...>>::type;
    };

    template <class Requested>
    using ProxyClassBase = typename ForwarderChain<ProxyRoot<DirectBases<Requested>>, ClosureOf<Requested>>::type;

    template <class Requested>
    class ProxyClass final : public ProxyClassBase<Requested>
    {
    public:
      ProxyClass(HandlerPtr handler, const BlueprintRuntimeDesc *blueprint)
          : NGIN::Proxy::ProxyObject(std::move(handler), blueprint)
      {
      }
    };

    using ConstructFn = std::unique_ptr<ProxyObject> (*)(HandlerPtr, const BlueprintRuntimeDesc *);

    template <class Requested>
    std::unique_ptr<ProxyObject> ConstructProxy(HandlerPtr handler, const BlueprintRuntimeDesc *blueprint)
    {
      return std::make_unique<ProxyClass<Requested>>(std::move(handler), blueprint);
    }

    // ---- Runtime blueprint ----
    struct ForwardingSlot
    {
      const InterfaceRuntimeDesc *owner{nullptr};
      NGIN::UInt32 methodIndex{InvalidIndex};
    };

    struct BlueprintRuntimeDesc
    {
      std::string name;
      NGIN::UInt64 id{0};
      NGIN::Containers::Vector<const InterfaceRuntimeDesc *> interfaces;
      NGIN::Containers::Vector<ForwardingSlot> slots;
      ConstructFn Construct{nullptr};
    };

    // Walks `interfaces` and everything they extend, registering each interface
    // when its slots are generated. `closureSize` is the size of the closure the
    // proxy class was composed from.
    NGIN_PROXY_API std::expected<std::unique_ptr<BlueprintRuntimeDesc>, Error>
    BuildBlueprint(std::span<const InterfaceInfo *const> interfaces, std::string_view name, ConstructFn construct,
                   NGIN::UIntSize closureSize);

  } // namespace detail

  class NGIN_PROXY_API Blueprint
  {
  public:
    constexpr Blueprint() = default;
    explicit constexpr Blueprint(const detail::BlueprintRuntimeDesc *desc) : m_desc(desc) {}

    [[nodiscard]] bool IsValid() const noexcept { return m_desc != nullptr; }
    [[nodiscard]] std::string_view Name() const;
    [[nodiscard]] NGIN::UInt64 GetId() const;

    // Closure in traversal order
    [[nodiscard]] NGIN::UIntSize InterfaceCount() const;
    [[nodiscard]] Interface InterfaceAt(NGIN::UIntSize i) const;
    [[nodiscard]] bool Implements(const Interface &iface) const;

    template <class I>
    [[nodiscard]] bool Implements() const
    {
      auto iface = TryGetInterface<I>();
      return iface.has_value() && Implements(*iface);
    }

    // One slot per method of every interface of the closure
    [[nodiscard]] NGIN::UIntSize MethodCount() const;
    [[nodiscard]] Method MethodAt(NGIN::UIntSize i) const;

    [[nodiscard]] ExpectedProxy Instantiate(HandlerPtr handler) const;

    friend bool operator==(const Blueprint &, const Blueprint &) = default;

  private:
    const detail::BlueprintRuntimeDesc *m_desc{nullptr};
  };

} // namespace NGIN::Proxy
