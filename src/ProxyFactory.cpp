#include <NGIN/Proxy/ProxyFactory.hpp>

#include <mutex>

namespace NGIN::Proxy
{

  ProxyFactory &ProxyFactory::GetInstance()
  {
    static ProxyFactory instance;
    return instance;
  }

  std::optional<Blueprint> ProxyFactory::FindBlueprint(std::string_view name) const
  {
    std::shared_lock lock(m_mutex);
    if (const auto *p = m_byName.GetPtr(detail::TypeIdOfName(name)))
    {
      const auto *desc = m_blueprints[*p].get();
      if (desc->name == name)
        return Blueprint{desc};
    }
    return std::nullopt;
  }

  NGIN::UIntSize ProxyFactory::BlueprintCount() const
  {
    std::shared_lock lock(m_mutex);
    return m_blueprints.Size();
  }

  ExpectedBlueprint ProxyFactory::GetOrBuildBlueprint(std::string_view name,
                                                      std::span<const detail::InterfaceInfo *const> interfaces,
                                                      detail::ConstructFn construct, NGIN::UIntSize closureSize)
  {
    if (auto existing = FindBlueprint(name))
      return *existing;

    // Building happens under the exclusive lock so each name is built at most once.
    std::unique_lock lock(m_mutex);
    const auto id = detail::TypeIdOfName(name);
    if (const auto *p = m_byName.GetPtr(id))
    {
      const auto *desc = m_blueprints[*p].get();
      if (desc->name != name)
        return std::unexpected(Error{ErrorCode::SynthesisFailure, "blueprint id already taken by another blueprint", desc->name});
      return Blueprint{desc};
    }

    auto built = detail::BuildBlueprint(interfaces, name, construct, closureSize);
    if (!built)
      return std::unexpected(built.error());

    const auto idx = static_cast<NGIN::UInt32>(m_blueprints.Size());
    m_blueprints.PushBack(std::move(*built));
    m_byName.Insert(id, idx);
    return Blueprint{m_blueprints[idx].get()};
  }

} // namespace NGIN::Proxy
