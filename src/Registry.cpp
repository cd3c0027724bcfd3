#include <NGIN/Proxy/Registry.hpp>
#include <NGIN/Proxy/NameUtils.hpp>

#include <mutex>

namespace NGIN::Proxy::detail
{

  Registry &GetRegistry() noexcept
  {
    static Registry registry{};
    return registry;
  }

  namespace
  {
    const InterfaceRuntimeDesc *FindLocked(const Registry &reg, NGIN::UInt64 typeId) noexcept
    {
      if (const auto *p = reg.byTypeId.GetPtr(typeId))
        return reg.interfaces[*p].get();
      return nullptr;
    }

    std::expected<const InterfaceRuntimeDesc *, Error> CheckIdentity(const InterfaceRuntimeDesc *existing,
                                                                      const InterfaceInfo &info)
    {
      if (existing->qualifiedName != info.qualifiedName)
        return std::unexpected(Error{ErrorCode::SynthesisFailure, "type id already taken by another interface", info.qualifiedName});
      return existing;
    }
  } // namespace

  std::expected<const InterfaceRuntimeDesc *, Error> RegisterInterface(const InterfaceInfo &info)
  {
    auto &reg = GetRegistry();
    {
      std::shared_lock lock(reg.mutex);
      if (const auto *existing = FindLocked(reg, info.typeId))
        return CheckIdentity(existing, info);
    }

    for (const auto *base : info.bases)
    {
      auto r = RegisterInterface(*base);
      if (!r)
        return std::unexpected(r.error());
    }

    std::unique_lock lock(reg.mutex);
    if (const auto *existing = FindLocked(reg, info.typeId))
      return CheckIdentity(existing, info);

    auto desc = std::make_unique<InterfaceRuntimeDesc>();
    desc->qualifiedName = info.qualifiedName;
    desc->typeId = info.typeId;
    desc->info = &info;
    desc->baseTypeIds.Reserve(info.bases.size());
    for (const auto *base : info.bases)
      desc->baseTypeIds.PushBack(base->typeId);

    if (info.Describe)
      info.Describe(*desc);
    if (desc->describeError)
      return std::unexpected(*desc->describeError);

    const auto idx = static_cast<NGIN::UInt32>(reg.interfaces.Size());
    reg.interfaces.PushBack(std::move(desc));
    reg.byTypeId.Insert(info.typeId, idx);
    return reg.interfaces[idx].get();
  }

  const InterfaceRuntimeDesc *FindInterfaceDesc(NGIN::UInt64 typeId) noexcept
  {
    const auto &reg = GetRegistry();
    std::shared_lock lock(reg.mutex);
    return FindLocked(reg, typeId);
  }

  NGIN::UInt32 FindMethodIndex(NGIN::UInt64 typeId, const void *key) noexcept
  {
    const auto *desc = FindInterfaceDesc(typeId);
    if (!desc)
      return InvalidIndex;
    for (NGIN::UIntSize i = 0; i < desc->methods.Size(); ++i)
    {
      if (desc->methods[i].key == key)
        return static_cast<NGIN::UInt32>(i);
    }
    return InvalidIndex;
  }

} // namespace NGIN::Proxy::detail

namespace NGIN::Proxy
{

  namespace
  {
    constexpr std::string_view kInvalidHandle = "invalid handle";

    const detail::InterfaceRuntimeDesc *FindByName(std::string_view qualifiedName) noexcept
    {
      const auto *desc = detail::FindInterfaceDesc(detail::TypeIdOfName(qualifiedName));
      if (desc && desc->qualifiedName == qualifiedName)
        return desc;
      return nullptr;
    }

    bool DerivesFrom(const detail::InterfaceRuntimeDesc &desc, NGIN::UInt64 target)
    {
      for (NGIN::UIntSize i = 0; i < desc.baseTypeIds.Size(); ++i)
      {
        if (desc.baseTypeIds[i] == target)
          return true;
        const auto *base = detail::FindInterfaceDesc(desc.baseTypeIds[i]);
        if (base && DerivesFrom(*base, target))
          return true;
      }
      return false;
    }
  } // namespace

  // Method
  std::string_view Method::GetName() const
  {
    return m_desc ? std::string_view{m_desc->name} : std::string_view{};
  }

  NGIN::UInt32 Method::GetIndex() const
  {
    return m_desc ? m_desc->index : InvalidIndex;
  }

  Interface Method::GetDeclaringInterface() const
  {
    return m_desc ? Interface{m_desc->declaring} : Interface{};
  }

  NGIN::UIntSize Method::GetParameterCount() const
  {
    return m_desc ? m_desc->params.Size() : 0;
  }

  NGIN::UInt64 Method::GetParameterTypeId(NGIN::UIntSize i) const
  {
    if (!m_desc || i >= m_desc->params.Size())
      return 0;
    return m_desc->params[i].typeId;
  }

  std::string_view Method::GetParameterTypeName(NGIN::UIntSize i) const
  {
    if (!m_desc || i >= m_desc->params.Size())
      return {};
    return m_desc->params[i].typeName;
  }

  ValueKind Method::GetParameterKind(NGIN::UIntSize i) const
  {
    if (!m_desc || i >= m_desc->params.Size())
      return ValueKind::Void;
    return m_desc->params[i].kind;
  }

  NGIN::UInt64 Method::GetReturnTypeId() const
  {
    return m_desc ? m_desc->returnType.typeId : 0;
  }

  std::string_view Method::GetReturnTypeName() const
  {
    return m_desc ? m_desc->returnType.typeName : std::string_view{};
  }

  ValueKind Method::GetReturnKind() const
  {
    return m_desc ? m_desc->returnType.kind : ValueKind::Void;
  }

  bool Method::IsConst() const
  {
    return m_desc && m_desc->isConst;
  }

  std::expected<Any, Error> Method::InvokeErased(void *target, std::span<const Any> args) const
  {
    if (!m_desc || !m_desc->Invoke)
      return std::unexpected(Error{ErrorCode::InvalidArgument, kInvalidHandle});
    return m_desc->Invoke(target, args.data(), static_cast<NGIN::UIntSize>(args.size()));
  }

  std::optional<Error> Method::CheckTarget(NGIN::UInt64 targetTypeId, bool constTarget) const
  {
    if (!m_desc)
      return Error{ErrorCode::InvalidArgument, kInvalidHandle};
    if (m_desc->declaring->typeId != targetTypeId)
      return Error{ErrorCode::InvalidArgument, "target is not the declaring interface", m_desc->declaring->qualifiedName};
    if (constTarget && !m_desc->isConst)
      return Error{ErrorCode::InvalidArgument, "non-const method called on a const target", m_desc->declaring->qualifiedName};
    return std::nullopt;
  }

  // Property
  std::string_view Property::GetName() const
  {
    return m_desc ? std::string_view{m_desc->name} : std::string_view{};
  }

  NGIN::UInt32 Property::GetIndex() const
  {
    return m_desc ? m_desc->index : InvalidIndex;
  }

  NGIN::UInt64 Property::GetTypeId() const
  {
    return m_desc ? m_desc->typeId : 0;
  }

  std::string_view Property::GetTypeName() const
  {
    return m_desc ? m_desc->typeName : std::string_view{};
  }

  Method Property::GetGetter() const
  {
    if (!m_desc)
      return Method{};
    return Method{&m_desc->declaring->methods[m_desc->getterIndex]};
  }

  std::optional<Method> Property::GetSetter() const
  {
    if (!m_desc || m_desc->setterIndex == InvalidIndex)
      return std::nullopt;
    return Method{&m_desc->declaring->methods[m_desc->setterIndex]};
  }

  bool Property::IsReadOnly() const
  {
    return !m_desc || m_desc->setterIndex == InvalidIndex;
  }

  Interface Property::GetDeclaringInterface() const
  {
    return m_desc ? Interface{m_desc->declaring} : Interface{};
  }

  // Interface
  std::string_view Interface::QualifiedName() const
  {
    return m_desc ? m_desc->qualifiedName : std::string_view{};
  }

  NGIN::UInt64 Interface::GetTypeId() const
  {
    return m_desc ? m_desc->typeId : 0;
  }

  NGIN::UIntSize Interface::MethodCount() const
  {
    return m_desc ? m_desc->methods.Size() : 0;
  }

  Method Interface::MethodAt(NGIN::UIntSize i) const
  {
    if (!m_desc || i >= m_desc->methods.Size())
      return Method{};
    return Method{&m_desc->methods[i]};
  }

  ExpectedMethod Interface::GetMethod(std::string_view name) const
  {
    if (auto m = FindMethod(name))
      return *m;
    return std::unexpected(Error{ErrorCode::NotFound, "method not found", QualifiedName()});
  }

  std::optional<Method> Interface::FindMethod(std::string_view name) const
  {
    if (!m_desc)
      return std::nullopt;
    for (NGIN::UIntSize i = 0; i < m_desc->methods.Size(); ++i)
    {
      if (m_desc->methods[i].name == name)
        return Method{&m_desc->methods[i]};
    }
    return std::nullopt;
  }

  NGIN::UIntSize Interface::PropertyCount() const
  {
    return m_desc ? m_desc->properties.Size() : 0;
  }

  Property Interface::PropertyAt(NGIN::UIntSize i) const
  {
    if (!m_desc || i >= m_desc->properties.Size())
      return Property{};
    return Property{&m_desc->properties[i]};
  }

  ExpectedProperty Interface::GetProperty(std::string_view name) const
  {
    if (m_desc)
    {
      for (NGIN::UIntSize i = 0; i < m_desc->properties.Size(); ++i)
      {
        if (m_desc->properties[i].name == name)
          return Property{&m_desc->properties[i]};
      }
    }
    return std::unexpected(Error{ErrorCode::NotFound, "property not found", QualifiedName()});
  }

  NGIN::UIntSize Interface::BaseCount() const
  {
    return m_desc ? m_desc->baseTypeIds.Size() : 0;
  }

  Interface Interface::BaseAt(NGIN::UIntSize i) const
  {
    if (!m_desc || i >= m_desc->baseTypeIds.Size())
      return Interface{};
    return Interface{detail::FindInterfaceDesc(m_desc->baseTypeIds[i])};
  }

  bool Interface::IsDerivedFrom(const Interface &other) const
  {
    if (!m_desc || !other.m_desc)
      return false;
    return DerivesFrom(*m_desc, other.m_desc->typeId);
  }

  // Queries
  ExpectedMethod ResolveMethod(std::string_view qualifiedName, NGIN::UInt32 index)
  {
    const auto *desc = FindByName(qualifiedName);
    if (!desc)
      return std::unexpected(Error{ErrorCode::NotFound, "interface not registered"});
    if (index >= desc->methods.Size())
      return std::unexpected(Error{ErrorCode::NotFound, "method index out of range", desc->qualifiedName});
    return Method{&desc->methods[index]};
  }

  ExpectedProperty ResolveProperty(std::string_view qualifiedName, NGIN::UInt32 index)
  {
    const auto *desc = FindByName(qualifiedName);
    if (!desc)
      return std::unexpected(Error{ErrorCode::NotFound, "interface not registered"});
    if (index >= desc->properties.Size())
      return std::unexpected(Error{ErrorCode::NotFound, "property index out of range", desc->qualifiedName});
    return Property{&desc->properties[index]};
  }

  ExpectedInterface GetInterface(std::string_view qualifiedName)
  {
    if (const auto *desc = FindByName(qualifiedName))
      return Interface{desc};
    return std::unexpected(Error{ErrorCode::NotFound, "interface not registered"});
  }

  std::optional<Interface> FindInterface(std::string_view qualifiedName)
  {
    if (const auto *desc = FindByName(qualifiedName))
      return Interface{desc};
    return std::nullopt;
  }

  NGIN::UIntSize InterfaceCount()
  {
    const auto &reg = detail::GetRegistry();
    std::shared_lock lock(reg.mutex);
    return reg.interfaces.Size();
  }

} // namespace NGIN::Proxy
