// Handler.hpp
// The invocation handler contract every proxy routes its calls to
#pragma once

#include <NGIN/Proxy/Registry.hpp>
#include <NGIN/Proxy/Types.hpp>

#include <memory>
#include <span>
#include <type_traits>
#include <utility>

namespace NGIN::Proxy
{
  class IInvocationHandler
  {
  public:
    virtual ~IInvocationHandler() = default;

    // `args` holds one box per declared parameter, in order. Non-const lvalue
    // reference parameters arrive as pointers. The result is converted to the
    // method's declared return type and ignored for void methods.
    virtual Any Invoke(ProxyObject &proxy, const Method &method, std::span<const Any> args) = 0;
  };

  template <class Fn>
  concept HandlerCallable = std::is_invocable_r_v<Any, Fn &, ProxyObject &, const Method &, std::span<const Any>>;

  template <class Fn>
  class FunctionHandler final : public IInvocationHandler
  {
  public:
    explicit FunctionHandler(Fn fn) : m_fn(std::move(fn)) {}

    Any Invoke(ProxyObject &proxy, const Method &method, std::span<const Any> args) override
    {
      return m_fn(proxy, method, args);
    }

  private:
    Fn m_fn;
  };

  template <class Fn>
  requires HandlerCallable<std::decay_t<Fn>>
  [[nodiscard]] HandlerPtr MakeHandler(Fn &&fn)
  {
    return std::make_shared<FunctionHandler<std::decay_t<Fn>>>(std::forward<Fn>(fn));
  }

} // namespace NGIN::Proxy
