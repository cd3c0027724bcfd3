// ProxyObject.hpp
// Common base of every synthesized proxy and the per-call forwarding routine
#pragma once

#include <NGIN/Primitives.hpp>

#include <NGIN/Proxy/Convert.hpp>
#include <NGIN/Proxy/Export.hpp>
#include <NGIN/Proxy/Handler.hpp>
#include <NGIN/Proxy/NameUtils.hpp>
#include <NGIN/Proxy/Registry.hpp>
#include <NGIN/Proxy/Types.hpp>

#include <span>
#include <type_traits>
#include <utility>

namespace NGIN::Proxy
{
  namespace detail
  {
    struct BlueprintRuntimeDesc;
  }

  // Synthesized proxy classes derive from ProxyObject virtually, so only the
  // most-derived class binds the handler and forwarders need no constructors.
  class NGIN_PROXY_API ProxyObject
  {
  public:
    virtual ~ProxyObject() = default;

    ProxyObject(const ProxyObject &) = delete;
    ProxyObject &operator=(const ProxyObject &) = delete;

    [[nodiscard]] const HandlerPtr &GetHandler() const noexcept { return m_handler; }
    [[nodiscard]] Blueprint GetBlueprint() const;

    // View this proxy as one of the interfaces of its closure; nullptr otherwise.
    template <class I>
    [[nodiscard]] I *As() noexcept
    {
      return dynamic_cast<I *>(this);
    }
    template <class I>
    [[nodiscard]] const I *As() const noexcept
    {
      return dynamic_cast<const I *>(this);
    }

  protected:
    ProxyObject() = default;
    ProxyObject(HandlerPtr handler, const detail::BlueprintRuntimeDesc *blueprint)
        : m_handler(std::move(handler)), m_blueprint(blueprint)
    {
    }

    // Body of every forwarding override: resolve the descriptor, box the
    // arguments, call the handler and convert its result.
    // Throws DispatchError when the method cannot be resolved or the result
    // does not convert; exceptions from the handler propagate unchanged.
    template <auto MemFn, class... A>
    typename detail::MethodTraits<decltype(MemFn)>::Ret Forward(A &&...a) const
    {
      using Traits = detail::MethodTraits<decltype(MemFn)>;
      using Declaring = typename Traits::Class;
      using R = typename Traits::Ret;
      static_assert(sizeof...(A) == Traits::Arity, "argument count does not match the forwarded method");
      static_assert(!std::is_reference_v<R>, "reference return types cannot be forwarded");

      static const NGIN::UInt32 index = detail::FindMethodIndex(detail::TypeIdOf<Declaring>(), detail::MethodKeyOf<MemFn>());
      if (index == InvalidIndex)
        throw DispatchError(Error{ErrorCode::NotFound, "method not described", detail::TypeNameOf<Declaring>()});

      auto method = ResolveMethod(detail::TypeNameOf<Declaring>(), index);
      if (!method)
        throw DispatchError(method.error());

      auto args = detail::BoxArguments<typename Traits::Params>(std::make_index_sequence<Traits::Arity>{}, std::forward<A>(a)...);
      Any result = m_handler->Invoke(const_cast<ProxyObject &>(*this), *method, std::span<const Any>(args.data(), args.size()));

      if constexpr (std::is_void_v<R>)
      {
        (void)result;
      }
      else
      {
        auto converted = detail::ConvertAny<R>(result);
        if (!converted)
          throw DispatchError(converted.error());
        return std::move(*converted);
      }
    }

  private:
    const HandlerPtr m_handler{};
    const detail::BlueprintRuntimeDesc *m_blueprint{nullptr};
  };

} // namespace NGIN::Proxy
