#include <NGIN/Proxy/Blueprint.hpp>
#include <NGIN/Proxy/NameUtils.hpp>

namespace NGIN::Proxy::detail
{

  namespace
  {
    bool SameSignature(const MethodRuntimeDesc &a, const MethodRuntimeDesc &b)
    {
      if (a.name != b.name || a.isConst != b.isConst || a.params.Size() != b.params.Size())
        return false;
      for (NGIN::UIntSize i = 0; i < a.params.Size(); ++i)
      {
        if (a.params[i].typeId != b.params[i].typeId)
          return false;
      }
      return true;
    }

    class BlueprintBuilder
    {
    public:
      explicit BlueprintBuilder(BlueprintRuntimeDesc &out) : m_out(out) {}

      // Registers `info`, emits one slot per method, then descends into the
      // interfaces it extends. Shared ancestors are emitted once.
      std::expected<void, Error> Visit(const InterfaceInfo &info)
      {
        if (IsVisited(info.typeId))
          return {};

        auto registered = RegisterInterface(info);
        if (!registered)
          return std::unexpected(registered.error());
        const auto *desc = *registered;

        m_out.interfaces.PushBack(desc);
        for (NGIN::UIntSize i = 0; i < desc->methods.Size(); ++i)
        {
          if (Conflicts(*desc, desc->methods[i]))
            return std::unexpected(Error{ErrorCode::SynthesisFailure, "method with the same signature declared by two interfaces",
                                         desc->qualifiedName});
          m_out.slots.PushBack(ForwardingSlot{desc, static_cast<NGIN::UInt32>(i)});
        }

        for (const auto *base : info.bases)
        {
          auto r = Visit(*base);
          if (!r)
            return r;
        }
        return {};
      }

    private:
      [[nodiscard]] bool IsVisited(NGIN::UInt64 typeId) const
      {
        for (NGIN::UIntSize i = 0; i < m_out.interfaces.Size(); ++i)
        {
          if (m_out.interfaces[i]->typeId == typeId)
            return true;
        }
        return false;
      }

      [[nodiscard]] bool Conflicts(const InterfaceRuntimeDesc &owner, const MethodRuntimeDesc &method) const
      {
        for (NGIN::UIntSize i = 0; i < m_out.slots.Size(); ++i)
        {
          const auto &slot = m_out.slots[i];
          if (slot.owner != &owner && SameSignature(slot.owner->methods[slot.methodIndex], method))
            return true;
        }
        return false;
      }

      BlueprintRuntimeDesc &m_out;
    };
  } // namespace

  std::expected<std::unique_ptr<BlueprintRuntimeDesc>, Error>
  BuildBlueprint(std::span<const InterfaceInfo *const> interfaces, std::string_view name, ConstructFn construct,
                 NGIN::UIntSize closureSize)
  {
    if (interfaces.empty())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "interface set is empty"});
    if (name.empty())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "blueprint name is empty"});
    if (!construct)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "blueprint has no constructor"});
    for (const auto *info : interfaces)
    {
      if (!info)
        return std::unexpected(Error{ErrorCode::InvalidArgument, "null interface in interface set"});
    }

    auto blueprint = std::make_unique<BlueprintRuntimeDesc>();
    blueprint->name = std::string(name);
    blueprint->id = TypeIdOfName(name);
    blueprint->Construct = construct;

    BlueprintBuilder builder{*blueprint};
    for (const auto *info : interfaces)
    {
      auto r = builder.Visit(*info);
      if (!r)
        return std::unexpected(r.error());
    }

    if (blueprint->interfaces.Size() != closureSize)
      return std::unexpected(Error{ErrorCode::SynthesisFailure, "interface closure does not match the proxy class"});
    return blueprint;
  }

} // namespace NGIN::Proxy::detail

namespace NGIN::Proxy
{

  std::string_view Blueprint::Name() const
  {
    return m_desc ? std::string_view{m_desc->name} : std::string_view{};
  }

  NGIN::UInt64 Blueprint::GetId() const
  {
    return m_desc ? m_desc->id : 0;
  }

  NGIN::UIntSize Blueprint::InterfaceCount() const
  {
    return m_desc ? m_desc->interfaces.Size() : 0;
  }

  Interface Blueprint::InterfaceAt(NGIN::UIntSize i) const
  {
    if (!m_desc || i >= m_desc->interfaces.Size())
      return Interface{};
    return Interface{m_desc->interfaces[i]};
  }

  bool Blueprint::Implements(const Interface &iface) const
  {
    if (!m_desc || !iface.IsValid())
      return false;
    for (NGIN::UIntSize i = 0; i < m_desc->interfaces.Size(); ++i)
    {
      if (m_desc->interfaces[i]->typeId == iface.GetTypeId())
        return true;
    }
    return false;
  }

  NGIN::UIntSize Blueprint::MethodCount() const
  {
    return m_desc ? m_desc->slots.Size() : 0;
  }

  Method Blueprint::MethodAt(NGIN::UIntSize i) const
  {
    if (!m_desc || i >= m_desc->slots.Size())
      return Method{};
    const auto &slot = m_desc->slots[i];
    return Method{&slot.owner->methods[slot.methodIndex]};
  }

  ExpectedProxy Blueprint::Instantiate(HandlerPtr handler) const
  {
    if (!m_desc)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "invalid handle"});
    if (!handler)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "handler must not be null"});
    return m_desc->Construct(std::move(handler), m_desc);
  }

  Blueprint ProxyObject::GetBlueprint() const
  {
    return Blueprint{m_blueprint};
  }

} // namespace NGIN::Proxy
