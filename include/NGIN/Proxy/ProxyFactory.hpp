// ProxyFactory.hpp
// Process-wide blueprint cache and proxy factory
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <NGIN/Proxy/Blueprint.hpp>
#include <NGIN/Proxy/Export.hpp>
#include <NGIN/Proxy/InterfaceBuilder.hpp>
#include <NGIN/Proxy/NameUtils.hpp>
#include <NGIN/Proxy/Types.hpp>

#include <memory>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace NGIN::Proxy
{
  namespace detail
  {
    template <class T, class... I>
    consteval bool AllImplemented(InterfaceList<I...>)
    {
      return ((DescribedInterface<I> && std::is_base_of_v<I, T>) && ...);
    }

    // Interfaces T stands for when it is not itself treated as the interface:
    // an interface implements itself, anything else lists them in Implements<T>.
    template <class T>
    struct ImplementedInterfaces
    {
      using type = typename NGIN::Proxy::Implements<T>::type;
      static_assert(AllImplemented<T>(type{}), "Implements<T> must list described interfaces that T derives from");
    };
    template <DescribedInterface T>
    struct ImplementedInterfaces<T>
    {
      using type = InterfaceList<T>;
    };
  } // namespace detail

  class NGIN_PROXY_API ProxyFactory
  {
  public:
    ProxyFactory(const ProxyFactory &) = delete;
    ProxyFactory &operator=(const ProxyFactory &) = delete;

    static ProxyFactory &GetInstance();

    // Proxy for T: a described interface yields a proxy of that interface, any
    // other type a proxy of the interfaces listed in Implements<T>.
    template <class T>
    [[nodiscard]] ExpectedProxy Create(HandlerPtr handler)
    {
      return Create<T>(std::move(handler), detail::DescribedInterface<T>);
    }

    // `isTargetInterface` states how T is used; true requires T to be a described interface.
    template <class T>
    [[nodiscard]] ExpectedProxy Create(HandlerPtr handler, bool isTargetInterface)
    {
      if (!handler)
        return std::unexpected(Error{ErrorCode::InvalidArgument, "handler must not be null", detail::TypeNameOf<T>()});

      if (isTargetInterface)
      {
        if constexpr (detail::DescribedInterface<T>)
          return CreateFrom<InterfaceList<T>>(std::move(handler), detail::TypeNameOf<T>());
        else
          return std::unexpected(Error{ErrorCode::InvalidArgument, "target is not a described interface", detail::TypeNameOf<T>()});
      }

      using Requested = typename detail::ImplementedInterfaces<T>::type;
      if constexpr (Requested::Size == 0)
        return std::unexpected(Error{ErrorCode::InvalidArgument, "target implements no interfaces", detail::TypeNameOf<T>()});
      else
        return CreateFrom<Requested>(std::move(handler), detail::TypeNameOf<T>());
    }

    [[nodiscard]] std::optional<Blueprint> FindBlueprint(std::string_view name) const;
    [[nodiscard]] NGIN::UIntSize BlueprintCount() const;

  private:
    ProxyFactory() = default;

    template <class Requested>
    ExpectedProxy CreateFrom(HandlerPtr handler, std::string_view targetName)
    {
      static const auto infos = detail::InfosOf(Requested{});

      std::string name;
      name.reserve(targetName.size() + ProxySuffix.size());
      name.append(targetName).append(ProxySuffix);

      auto blueprint = GetOrBuildBlueprint(name, std::span<const detail::InterfaceInfo *const>(infos.data(), infos.size()),
                                           &detail::ConstructProxy<Requested>, detail::ClosureOf<Requested>::Size);
      if (!blueprint)
        return std::unexpected(blueprint.error());
      return blueprint->Instantiate(std::move(handler));
    }

    ExpectedBlueprint GetOrBuildBlueprint(std::string_view name, std::span<const detail::InterfaceInfo *const> interfaces,
                                          detail::ConstructFn construct, NGIN::UIntSize closureSize);

    mutable std::shared_mutex m_mutex;
    NGIN::Containers::Vector<std::unique_ptr<detail::BlueprintRuntimeDesc>> m_blueprints;
    NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> m_byName;
  };

  template <class T>
  [[nodiscard]] ExpectedProxy CreateProxy(HandlerPtr handler)
  {
    return ProxyFactory::GetInstance().Create<T>(std::move(handler));
  }

  template <class T>
  [[nodiscard]] ExpectedProxy CreateProxy(HandlerPtr handler, bool isTargetInterface)
  {
    return ProxyFactory::GetInstance().Create<T>(std::move(handler), isTargetInterface);
  }

} // namespace NGIN::Proxy
