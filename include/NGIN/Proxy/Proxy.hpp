#pragma once

#include <string_view>

#include <NGIN/Proxy/Export.hpp>
#include <NGIN/Proxy/Types.hpp>
#include <NGIN/Proxy/Registry.hpp>
#include <NGIN/Proxy/InterfaceBuilder.hpp>
#include <NGIN/Proxy/Handler.hpp>
#include <NGIN/Proxy/ProxyObject.hpp>
#include <NGIN/Proxy/Blueprint.hpp>
#include <NGIN/Proxy/ProxyFactory.hpp>

namespace NGIN::Proxy
{

    // For quick sanity checks / examples.
    [[nodiscard]] constexpr std::string_view LibraryName() noexcept { return "NGIN.Proxy"; }

} // namespace NGIN::Proxy
