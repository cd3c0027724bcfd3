// InterfaceBuilder.hpp
// Public InterfaceBuilder<I> handed to Describe<I>::Do to declare methods and properties
#pragma once

#include <NGIN/Proxy/Convert.hpp>
#include <NGIN/Proxy/NameUtils.hpp>
#include <NGIN/Proxy/Registry.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace NGIN::Proxy
{
  namespace detail
  {
    template <class T>
    inline ParameterRuntimeDesc ParameterDescOf()
    {
      if constexpr (std::is_void_v<T>)
        return ParameterRuntimeDesc{0, "void", ValueKind::Void};
      else
        return ParameterRuntimeDesc{TypeIdOf<T>(), TypeNameOf<T>(), ValueKindOf<std::remove_cvref_t<T>>()};
    }

    template <class Params, std::size_t... I>
    inline void AppendParameters(NGIN::Containers::Vector<ParameterRuntimeDesc> &out, std::index_sequence<I...>)
    {
      out.Reserve(sizeof...(I));
      (out.PushBack(ParameterDescOf<BoxedT<std::tuple_element_t<I, Params>>>()), ...);
    }

    template <auto MemFn, std::size_t... I>
    std::expected<Any, Error> InvokeMethodImpl(void *obj, [[maybe_unused]] const Any *args, std::index_sequence<I...>)
    {
      using Traits = MethodTraits<decltype(MemFn)>;
      using C = std::conditional_t<Traits::IsConst, const typename Traits::Class, typename Traits::Class>;
      using R = typename Traits::Ret;
      using Params = typename Traits::Params;

      std::tuple<std::expected<BoxedT<std::tuple_element_t<I, Params>>, Error>...> unboxed{
          UnboxArgument<std::tuple_element_t<I, Params>>(args[I])...};

      std::optional<Error> failure;
      (
          [&]
          {
            const auto &u = std::get<I>(unboxed);
            if (!failure && !u.has_value())
              failure = Error{ErrorCode::InvalidArgument, "argument not convertible to parameter type", u.error().subject};
          }(),
          ...);
      if (failure)
        return std::unexpected(*failure);

      auto *self = static_cast<C *>(obj);
      if constexpr (std::is_void_v<R>)
      {
        (self->*MemFn)(PassArgument<std::tuple_element_t<I, Params>>(*std::get<I>(unboxed))...);
        return Any::MakeVoid();
      }
      else
      {
        return Any{(self->*MemFn)(PassArgument<std::tuple_element_t<I, Params>>(*std::get<I>(unboxed))...)};
      }
    }

    template <auto MemFn>
    std::expected<Any, Error> InvokeMethod(void *obj, const Any *args, NGIN::UIntSize count)
    {
      using Traits = MethodTraits<decltype(MemFn)>;
      if (count != Traits::Arity)
        return std::unexpected(Error{ErrorCode::InvalidArgument, "bad arity"});
      if (!obj)
        return std::unexpected(Error{ErrorCode::InvalidArgument, "null target"});
      return InvokeMethodImpl<MemFn>(obj, args, std::make_index_sequence<Traits::Arity>{});
    }
  } // namespace detail

  template <class I>
  class InterfaceBuilder
  {
  public:
    // Constructed by the registry while it owns the descriptor under construction.
    explicit InterfaceBuilder(detail::InterfaceRuntimeDesc &desc) : m_desc(desc) {}

    // Declare the next method of I. The name defaults to the member identifier.
    template <auto MemFn>
    InterfaceBuilder &Method(std::string_view name = {})
    {
      using Traits = detail::MethodTraits<decltype(MemFn)>;
      using R = typename Traits::Ret;
      static_assert(std::is_same_v<typename Traits::Class, I>, "method must be declared by the described interface");
      static_assert(!std::is_reference_v<R>, "reference return types cannot be forwarded");

      const void *key = detail::MethodKeyOf<MemFn>();
      if (IndexOfKey(key) != InvalidIndex)
      {
        Fail("method described twice");
        return *this;
      }

      detail::MethodRuntimeDesc m{};
      m.name = std::string(name.empty() ? detail::MemberNameOf<MemFn>() : name);
      m.index = static_cast<NGIN::UInt32>(m_desc.methods.Size());
      m.declaring = &m_desc;
      m.returnType = detail::ParameterDescOf<R>();
      detail::AppendParameters<typename Traits::Params>(m.params, std::make_index_sequence<Traits::Arity>{});
      m.isConst = Traits::IsConst;
      m.key = key;
      m.Invoke = &detail::InvokeMethod<MemFn>;
      if (m.name.empty())
      {
        Fail("method has no name");
        return *this;
      }
      m_desc.methods.PushBack(std::move(m));
      return *this;
    }

    // Declare a property backed by methods already described on this builder.
    template <auto Getter, auto Setter = nullptr>
    InterfaceBuilder &Property(std::string_view name = {})
    {
      using GetTraits = detail::MethodTraits<decltype(Getter)>;
      using ValueT = typename GetTraits::Ret;
      static_assert(std::is_same_v<typename GetTraits::Class, I>, "property getter must be declared by the described interface");

      if constexpr (GetTraits::Arity != 0 || std::is_void_v<ValueT>)
      {
        Fail("property getter must take no parameters and return a value");
        return *this;
      }
      else
      {
        detail::PropertyRuntimeDesc p{};
        p.name = std::string(name.empty() ? detail::MemberNameOf<Getter>() : name);
        p.index = static_cast<NGIN::UInt32>(m_desc.properties.Size());
        p.typeId = detail::TypeIdOf<ValueT>();
        p.typeName = detail::TypeNameOf<ValueT>();
        p.declaring = &m_desc;
        p.getterIndex = IndexOfKey(detail::MethodKeyOf<Getter>());
        if (p.getterIndex == InvalidIndex)
        {
          Fail("property accessor not described as a method");
          return *this;
        }

        if constexpr (!std::is_null_pointer_v<decltype(Setter)>)
        {
          using SetTraits = detail::MethodTraits<decltype(Setter)>;
          static_assert(std::is_same_v<typename SetTraits::Class, I>, "property setter must be declared by the described interface");
          if constexpr (SetTraits::Arity != 1)
          {
            Fail("property setter must take exactly one parameter");
            return *this;
          }
          else
          {
            p.setterIndex = IndexOfKey(detail::MethodKeyOf<Setter>());
            if (p.setterIndex == InvalidIndex)
            {
              Fail("property accessor not described as a method");
              return *this;
            }
          }
        }
        m_desc.properties.PushBack(std::move(p));
        return *this;
      }
    }

  private:
    [[nodiscard]] NGIN::UInt32 IndexOfKey(const void *key) const
    {
      for (NGIN::UIntSize i = 0; i < m_desc.methods.Size(); ++i)
      {
        if (m_desc.methods[i].key == key)
          return static_cast<NGIN::UInt32>(i);
      }
      return InvalidIndex;
    }

    void Fail(std::string_view message)
    {
      if (!m_desc.describeError)
        m_desc.describeError = Error{ErrorCode::SynthesisFailure, message, m_desc.qualifiedName};
    }

    detail::InterfaceRuntimeDesc &m_desc;
  };

  namespace detail
  {
    template <class I>
    void DescribeInto(InterfaceRuntimeDesc &desc)
    {
      InterfaceBuilder<I> b{desc};
      NGIN::Proxy::Describe<I>::Do(b);
    }

    template <class I>
    const InterfaceInfo &InterfaceInfoOf();

    template <class... B>
    inline std::array<const InterfaceInfo *, sizeof...(B)> InfosOf(InterfaceList<B...>)
    {
      return {&InterfaceInfoOf<B>()...};
    }

    template <class Base, class Derived>
    struct CheckExtends
    {
      static_assert(DescribedInterface<Base>, "extended interface must be described");
      static_assert(std::is_base_of_v<Base, Derived>, "extended interface must be a base of the describing interface");
      static constexpr bool value = true;
    };

    template <class I, class... B>
    consteval bool ExtendsAreBases(InterfaceList<B...>)
    {
      return (CheckExtends<B, I>::value && ...);
    }

    template <class I>
    const InterfaceInfo &InterfaceInfoOf()
    {
      static_assert(DescribedInterface<I>, "proxy interfaces must be abstract, polymorphic and have a Describe<I> specialization");
      static_assert(ExtendsAreBases<I>(ExtendsOf<I>{}));
      static const auto bases = InfosOf(ExtendsOf<I>{});
      static const InterfaceInfo info{TypeNameOf<I>(), TypeIdOf<I>(), &DescribeInto<I>,
                                      std::span<const InterfaceInfo *const>(bases.data(), bases.size())};
      return info;
    }

    template <class I>
    std::expected<const InterfaceRuntimeDesc *, Error> EnsureRegistered()
    {
      return RegisterInterface(InterfaceInfoOf<I>());
    }
  } // namespace detail

  // Registers I and every interface it extends on first use.
  template <class I>
  ExpectedInterface GetInterface()
  {
    auto desc = detail::EnsureRegistered<I>();
    if (!desc)
      return std::unexpected(desc.error());
    return Interface{*desc};
  }

  // Lookup only; never registers.
  template <class I>
  std::optional<Interface> TryGetInterface()
  {
    if (const auto *desc = detail::FindInterfaceDesc(detail::TypeIdOf<I>()))
      return Interface{desc};
    return std::nullopt;
  }

} // namespace NGIN::Proxy
