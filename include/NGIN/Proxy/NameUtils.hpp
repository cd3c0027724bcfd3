// NameUtils.hpp
// Derives method names and qualified type names at compile time.
#pragma once

#include <NGIN/Hashing/FNV.hpp>
#include <NGIN/Meta/TypeName.hpp>
#include <NGIN/Primitives.hpp>

#include <string_view>
#include <type_traits>

namespace NGIN::Proxy::detail
{

  template <class T>
  inline constexpr std::string_view TypeNameOf() noexcept
  {
    return NGIN::Meta::TypeName<std::remove_cvref_t<T>>::qualifiedName;
  }

  // Interface and value type identity: FNV-1a 64 of the qualified name.
  template <class T>
  inline NGIN::UInt64 TypeIdOf()
  {
    const auto sv = TypeNameOf<T>();
    return NGIN::Hashing::FNV1a64(sv.data(), sv.size());
  }

  inline NGIN::UInt64 TypeIdOfName(std::string_view qualifiedName)
  {
    return NGIN::Hashing::FNV1a64(qualifiedName.data(), qualifiedName.size());
  }

  // Member identifier of a pointer-to-member-function constant, e.g. "Add" for &Demo::ICalc::Add.
  template <auto Member>
  consteval std::string_view MemberNameOf() noexcept
  {
#if defined(_MSC_VER)
    constexpr std::string_view sig = __FUNCSIG__;
    constexpr std::string_view key = "<&";
    constexpr std::string_view close = ">(";
#elif defined(__clang__)
    constexpr std::string_view sig = __PRETTY_FUNCTION__;
    constexpr std::string_view key = "[Member = &";
    constexpr std::string_view close = "]";
#elif defined(__GNUC__)
    // GCC appends "; std::string_view = ..." after the template argument.
    constexpr std::string_view sig = __PRETTY_FUNCTION__;
    constexpr std::string_view key = "[with auto Member = &";
    constexpr std::string_view close = ";]";
#else
    constexpr std::string_view sig{};
    constexpr std::string_view key{};
    constexpr std::string_view close{};
    return {};
#endif
    auto kpos = sig.find(key);
    if (kpos == std::string_view::npos)
      return {};
    auto start = kpos + key.size();
    auto end = sig.find_first_of(close, start);
    if (end == std::string_view::npos || end <= start)
      return {};
    auto full = sig.substr(start, end - start);
    auto dc = full.rfind("::");
    if (dc == std::string_view::npos)
      return full;
    return full.substr(dc + 2);
  }

} // namespace NGIN::Proxy::detail
