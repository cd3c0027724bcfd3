// Registry.hpp
// Process-wide interface descriptor cache and query API
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Containers/HashMap.hpp>

#include <array>
#include <expected>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

#include <NGIN/Proxy/Convert.hpp>
#include <NGIN/Proxy/Export.hpp>
#include <NGIN/Proxy/NameUtils.hpp>
#include <NGIN/Proxy/Types.hpp>

namespace NGIN::Proxy
{
  // Ordered list of interfaces, used for `Extends` and `Implements`.
  template <class... I>
  struct InterfaceList
  {
    static constexpr NGIN::UIntSize Size = sizeof...(I);
  };

  template <class I>
  class InterfaceBuilder;

  // Customization point an interface author specializes once, next to the interface:
  //
  //   template <> struct NGIN::Proxy::Describe<Demo::ILogger>
  //   {
  //     using Extends = InterfaceList<Demo::ICalc>; // optional
  //     static void Do(InterfaceBuilder<Demo::ILogger> &b) { b.Method<&Demo::ILogger::Log>(); }
  //     template <class Base>
  //     struct Forwarder : Base
  //     {
  //       void Log(std::string msg) override { this->template Forward<&Demo::ILogger::Log>(std::move(msg)); }
  //     };
  //   };
  //
  // Methods must be described in declaration order.
  template <class T>
  struct Describe;

  // Interfaces a concrete type stands for when it is used as a proxy target.
  template <class T>
  struct Implements
  {
    using type = InterfaceList<>;
  };

  namespace detail
  {
    struct InterfaceRuntimeDesc;

    struct ParameterRuntimeDesc
    {
      NGIN::UInt64 typeId{0};
      std::string_view typeName{};
      ValueKind kind{ValueKind::Void};
    };

    struct MethodRuntimeDesc
    {
      std::string name;
      NGIN::UInt32 index{InvalidIndex};
      const InterfaceRuntimeDesc *declaring{nullptr};
      ParameterRuntimeDesc returnType{};
      NGIN::Containers::Vector<ParameterRuntimeDesc> params;
      bool isConst{false};
      const void *key{nullptr};
      std::expected<Any, Error> (*Invoke)(void *, const Any *, NGIN::UIntSize){nullptr};
    };

    struct PropertyRuntimeDesc
    {
      std::string name;
      NGIN::UInt32 index{InvalidIndex};
      NGIN::UInt64 typeId{0};
      std::string_view typeName{};
      NGIN::UInt32 getterIndex{InvalidIndex};
      NGIN::UInt32 setterIndex{InvalidIndex};
      const InterfaceRuntimeDesc *declaring{nullptr};
    };

    // Compile-time facts about an interface, one static instance per interface type.
    struct InterfaceInfo
    {
      std::string_view qualifiedName;
      NGIN::UInt64 typeId{0};
      void (*Describe)(InterfaceRuntimeDesc &){nullptr};
      std::span<const InterfaceInfo *const> bases;
    };

    struct InterfaceRuntimeDesc
    {
      std::string_view qualifiedName;
      NGIN::UInt64 typeId{0};
      const InterfaceInfo *info{nullptr};
      NGIN::Containers::Vector<MethodRuntimeDesc> methods;
      NGIN::Containers::Vector<PropertyRuntimeDesc> properties;
      NGIN::Containers::Vector<NGIN::UInt64> baseTypeIds;
      // First problem found while describing; a failed description is never published.
      std::optional<Error> describeError;
    };

    // Descriptors are heap-allocated and never move once published.
    struct Registry
    {
      mutable std::shared_mutex mutex;
      NGIN::Containers::Vector<std::unique_ptr<InterfaceRuntimeDesc>> interfaces;
      NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> byTypeId;
    };

    NGIN_PROXY_API Registry &GetRegistry() noexcept;

    // Get-or-create. Registers the extended interfaces first, so a published
    // descriptor always has its whole closure published too.
    NGIN_PROXY_API std::expected<const InterfaceRuntimeDesc *, Error> RegisterInterface(const InterfaceInfo &info);

    NGIN_PROXY_API const InterfaceRuntimeDesc *FindInterfaceDesc(NGIN::UInt64 typeId) noexcept;

    // Position of the method described with `key`, or InvalidIndex.
    NGIN_PROXY_API NGIN::UInt32 FindMethodIndex(NGIN::UInt64 typeId, const void *key) noexcept;

    // Detection for Describe<T>::Do(InterfaceBuilder<T>&)
    template <class, class = void>
    struct HasDescribeImpl : std::false_type
    {
    };
    template <class T>
    struct HasDescribeImpl<T, std::void_t<decltype(NGIN::Proxy::Describe<T>::Do(std::declval<InterfaceBuilder<T> &>()))>>
        : std::true_type
    {
    };

    template <class T>
    concept DescribedInterface = std::is_class_v<T> && std::is_polymorphic_v<T> && std::is_abstract_v<T> &&
                                 HasDescribeImpl<T>::value;

    template <class T, class = void>
    struct ExtendsOfImpl
    {
      using type = InterfaceList<>;
    };
    template <class T>
    struct ExtendsOfImpl<T, std::void_t<typename NGIN::Proxy::Describe<T>::Extends>>
    {
      using type = typename NGIN::Proxy::Describe<T>::Extends;
    };

    template <class T>
    using ExtendsOf = typename ExtendsOfImpl<T>::type;

    // Pointer-to-member-function decomposition
    template <class C, bool Const, class R, class... A>
    struct MethodTraitsBase
    {
      using Class = C;
      using Ret = R;
      using Params = std::tuple<A...>;
      static constexpr bool IsConst = Const;
      static constexpr NGIN::UIntSize Arity = sizeof...(A);
    };

    template <class M>
    struct MethodTraits;
    template <class C, class R, class... A>
    struct MethodTraits<R (C::*)(A...)> : MethodTraitsBase<C, false, R, A...>
    {
    };
    template <class C, class R, class... A>
    struct MethodTraits<R (C::*)(A...) const> : MethodTraitsBase<C, true, R, A...>
    {
    };
    template <class C, class R, class... A>
    struct MethodTraits<R (C::*)(A...) noexcept> : MethodTraitsBase<C, false, R, A...>
    {
    };
    template <class C, class R, class... A>
    struct MethodTraits<R (C::*)(A...) const noexcept> : MethodTraitsBase<C, true, R, A...>
    {
    };

    // One distinct address per member function pointer constant.
    template <auto MemFn>
    struct MethodKey
    {
      static constexpr char tag = 0;
    };

    template <auto MemFn>
    inline const void *MethodKeyOf() noexcept
    {
      return &MethodKey<MemFn>::tag;
    }

  } // namespace detail

  class Property;

  class NGIN_PROXY_API Method
  {
  public:
    constexpr Method() = default;
    explicit constexpr Method(const detail::MethodRuntimeDesc *desc) : m_desc(desc) {}

    [[nodiscard]] bool IsValid() const noexcept { return m_desc != nullptr; }
    [[nodiscard]] std::string_view GetName() const;
    [[nodiscard]] NGIN::UInt32 GetIndex() const;
    [[nodiscard]] Interface GetDeclaringInterface() const;

    [[nodiscard]] NGIN::UIntSize GetParameterCount() const;
    [[nodiscard]] NGIN::UInt64 GetParameterTypeId(NGIN::UIntSize i) const;
    [[nodiscard]] std::string_view GetParameterTypeName(NGIN::UIntSize i) const;
    [[nodiscard]] ValueKind GetParameterKind(NGIN::UIntSize i) const;

    // 0 for void
    [[nodiscard]] NGIN::UInt64 GetReturnTypeId() const;
    [[nodiscard]] std::string_view GetReturnTypeName() const;
    [[nodiscard]] ValueKind GetReturnKind() const;
    [[nodiscard]] bool IsConst() const;

    // Calls the real implementation on `target`, which must be viewed as the declaring interface.
    template <class Obj>
    requires(!std::is_pointer_v<std::remove_reference_t<Obj>>)
    [[nodiscard]] std::expected<Any, Error> Invoke(Obj &target, std::span<const Any> args) const
    {
      if (auto e = CheckTarget(detail::TypeIdOf<Obj>(), std::is_const_v<Obj>))
        return std::unexpected(*e);
      return InvokeErased(const_cast<void *>(static_cast<const void *>(std::addressof(target))), args);
    }

    template <class R, class Obj, class... A>
    requires(!std::is_pointer_v<std::remove_reference_t<Obj>>)
    [[nodiscard]] std::expected<R, Error> InvokeAs(Obj &target, A &&...a) const
    {
      std::array<Any, sizeof...(A)> tmp{Any{std::forward<A>(a)}...};
      auto r = Invoke(target, std::span<const Any>(tmp.data(), tmp.size()));
      if (!r.has_value())
        return std::unexpected(r.error());
      if constexpr (std::is_void_v<R>)
        return {};
      else
        return detail::ConvertAny<R>(*r);
    }

    friend bool operator==(const Method &, const Method &) = default;

  private:
    // `target` points at the declaring interface subobject.
    [[nodiscard]] std::expected<Any, Error> InvokeErased(void *target, std::span<const Any> args) const;
    [[nodiscard]] std::optional<Error> CheckTarget(NGIN::UInt64 targetTypeId, bool constTarget) const;

    const detail::MethodRuntimeDesc *m_desc{nullptr};
  };

  class NGIN_PROXY_API Property
  {
  public:
    constexpr Property() = default;
    explicit constexpr Property(const detail::PropertyRuntimeDesc *desc) : m_desc(desc) {}

    [[nodiscard]] bool IsValid() const noexcept { return m_desc != nullptr; }
    [[nodiscard]] std::string_view GetName() const;
    [[nodiscard]] NGIN::UInt32 GetIndex() const;
    [[nodiscard]] NGIN::UInt64 GetTypeId() const;
    [[nodiscard]] std::string_view GetTypeName() const;
    [[nodiscard]] Method GetGetter() const;
    [[nodiscard]] std::optional<Method> GetSetter() const;
    [[nodiscard]] bool IsReadOnly() const;
    [[nodiscard]] Interface GetDeclaringInterface() const;

    friend bool operator==(const Property &, const Property &) = default;

  private:
    const detail::PropertyRuntimeDesc *m_desc{nullptr};
  };

  class NGIN_PROXY_API Interface
  {
  public:
    constexpr Interface() = default;
    explicit constexpr Interface(const detail::InterfaceRuntimeDesc *desc) : m_desc(desc) {}

    [[nodiscard]] bool IsValid() const noexcept { return m_desc != nullptr; }
    [[nodiscard]] std::string_view QualifiedName() const;
    [[nodiscard]] NGIN::UInt64 GetTypeId() const;

    [[nodiscard]] NGIN::UIntSize MethodCount() const;
    [[nodiscard]] Method MethodAt(NGIN::UIntSize i) const;
    [[nodiscard]] ExpectedMethod GetMethod(std::string_view name) const;
    [[nodiscard]] std::optional<Method> FindMethod(std::string_view name) const;

    [[nodiscard]] NGIN::UIntSize PropertyCount() const;
    [[nodiscard]] Property PropertyAt(NGIN::UIntSize i) const;
    [[nodiscard]] ExpectedProperty GetProperty(std::string_view name) const;

    // Directly extended interfaces
    [[nodiscard]] NGIN::UIntSize BaseCount() const;
    [[nodiscard]] Interface BaseAt(NGIN::UIntSize i) const;
    // Transitive; an interface is not derived from itself.
    [[nodiscard]] bool IsDerivedFrom(const Interface &other) const;

    friend bool operator==(const Interface &, const Interface &) = default;

  private:
    const detail::InterfaceRuntimeDesc *m_desc{nullptr};
  };

  // Descriptor of the method at `index` of the named interface.
  NGIN_PROXY_API ExpectedMethod ResolveMethod(std::string_view qualifiedName, NGIN::UInt32 index);
  NGIN_PROXY_API ExpectedProperty ResolveProperty(std::string_view qualifiedName, NGIN::UInt32 index);

  // Queries
  NGIN_PROXY_API ExpectedInterface GetInterface(std::string_view qualifiedName);
  NGIN_PROXY_API std::optional<Interface> FindInterface(std::string_view qualifiedName);
  NGIN_PROXY_API NGIN::UIntSize InterfaceCount();

} // namespace NGIN::Proxy
