// Convert.hpp: Argument boxing and the Any -> T conversion table used by dispatch
#pragma once

#include <NGIN/Primitives.hpp>

#include <NGIN/Proxy/NameUtils.hpp>
#include <NGIN/Proxy/Types.hpp>

#include <array>
#include <cmath>
#include <cstddef>
#include <expected>
#include <limits>
#include <memory>
#include <tuple>
#include <type_traits>
#include <utility>

namespace NGIN::Proxy::detail
{

  template <class T>
  consteval ValueKind ValueKindOf() noexcept
  {
    using U = std::remove_cv_t<T>;
    if constexpr (std::is_void_v<U>)
      return ValueKind::Void;
    else if constexpr (std::is_same_v<U, bool>)
      return ValueKind::Bool;
    else if constexpr (std::is_enum_v<U>)
      return ValueKind::Enum;
    else if constexpr (std::is_integral_v<U>)
    {
      static_assert(sizeof(U) <= 8, "integral types wider than 64 bits are not supported");
      if constexpr (sizeof(U) == 1)
        return std::is_signed_v<U> ? ValueKind::Int8 : ValueKind::UInt8;
      else if constexpr (sizeof(U) == 2)
        return std::is_signed_v<U> ? ValueKind::Int16 : ValueKind::UInt16;
      else if constexpr (sizeof(U) == 4)
        return std::is_signed_v<U> ? ValueKind::Int32 : ValueKind::UInt32;
      else
        return std::is_signed_v<U> ? ValueKind::Int64 : ValueKind::UInt64;
    }
    else if constexpr (std::is_same_v<U, float>)
      return ValueKind::Float;
    else if constexpr (std::is_same_v<U, double>)
      return ValueKind::Double;
    else if constexpr (std::is_pointer_v<U> || std::is_null_pointer_v<U>)
      return ValueKind::Reference;
    else
      return ValueKind::Value;
  }

  // How a handler result (or a boxed argument) is turned back into a declared type.
  enum class ConversionRule : NGIN::UInt8
  {
    Discard,     // void: the value is ignored
    Narrow,      // primitive: exact type, or any arithmetic value cast to the declared width
    Underlying,  // enum: the enum itself, or any integral value through the underlying type
    Exact,       // other by-value types: the boxed type must match
    PassThrough, // pointers: handed through unchanged, empty maps to nullptr
  };

  inline constexpr std::array<ConversionRule, ValueKindCount> ConversionTable{
      ConversionRule::Discard,     // Void
      ConversionRule::Narrow,      // Bool
      ConversionRule::Narrow,      // Int8
      ConversionRule::Narrow,      // UInt8
      ConversionRule::Narrow,      // Int16
      ConversionRule::Narrow,      // UInt16
      ConversionRule::Narrow,      // Int32
      ConversionRule::Narrow,      // UInt32
      ConversionRule::Narrow,      // Int64
      ConversionRule::Narrow,      // UInt64
      ConversionRule::Narrow,      // Float
      ConversionRule::Narrow,      // Double
      ConversionRule::Underlying,  // Enum
      ConversionRule::Exact,       // Value
      ConversionRule::PassThrough, // Reference
  };

  [[nodiscard]] constexpr ConversionRule RuleFor(ValueKind kind) noexcept
  {
    return ConversionTable[static_cast<NGIN::UIntSize>(kind)];
  }

  inline bool IsEmptyAny(const Any &value)
  {
    static const NGIN::UInt64 voidId = Any::MakeVoid().GetTypeId();
    return value.GetTypeId() == voidId;
  }

  template <class Dest>
  inline std::expected<Dest, Error> NotConvertible()
  {
    return std::unexpected(Error{ErrorCode::ConversionFailure, "value not convertible to the declared type", TypeNameOf<Dest>()});
  }

  // Floating sources must fit the destination; out-of-range values are not convertible.
  template <class Dest, class Src>
  inline std::expected<Dest, Error> CastFloating(Src v)
  {
    if constexpr (std::is_integral_v<Dest> && !std::is_same_v<Dest, bool>)
    {
      if (!std::isfinite(v))
        return NotConvertible<Dest>();
      const auto wide = static_cast<long double>(v);
      if (wide <= static_cast<long double>(std::numeric_limits<Dest>::lowest()) - 1.0L ||
          wide >= static_cast<long double>(std::numeric_limits<Dest>::max()) + 1.0L)
        return NotConvertible<Dest>();
    }
    else if constexpr (std::is_floating_point_v<Dest> && sizeof(Dest) < sizeof(Src))
    {
      if (std::isfinite(v) && (v > std::numeric_limits<Dest>::max() || v < std::numeric_limits<Dest>::lowest()))
        return NotConvertible<Dest>();
    }
    return static_cast<Dest>(v);
  }

  // Arithmetic source table; integral-only when converting to an enum's underlying type.
  template <class Dest, bool AllowFloating>
  inline std::expected<Dest, Error> CastArithmetic(const Any &src)
  {
    const auto tid = src.GetTypeId();
    if (tid == TypeIdOf<bool>())
      return static_cast<Dest>(src.template Cast<bool>());
    if (tid == TypeIdOf<signed char>())
      return static_cast<Dest>(src.template Cast<signed char>());
    if (tid == TypeIdOf<unsigned char>())
      return static_cast<Dest>(src.template Cast<unsigned char>());
    if (tid == TypeIdOf<char>())
      return static_cast<Dest>(src.template Cast<char>());
    if (tid == TypeIdOf<short>())
      return static_cast<Dest>(src.template Cast<short>());
    if (tid == TypeIdOf<unsigned short>())
      return static_cast<Dest>(src.template Cast<unsigned short>());
    if (tid == TypeIdOf<int>())
      return static_cast<Dest>(src.template Cast<int>());
    if (tid == TypeIdOf<unsigned int>())
      return static_cast<Dest>(src.template Cast<unsigned int>());
    if (tid == TypeIdOf<long>())
      return static_cast<Dest>(src.template Cast<long>());
    if (tid == TypeIdOf<unsigned long>())
      return static_cast<Dest>(src.template Cast<unsigned long>());
    if (tid == TypeIdOf<long long>())
      return static_cast<Dest>(src.template Cast<long long>());
    if (tid == TypeIdOf<unsigned long long>())
      return static_cast<Dest>(src.template Cast<unsigned long long>());
    if constexpr (AllowFloating)
    {
      if (tid == TypeIdOf<float>())
        return CastFloating<Dest>(src.template Cast<float>());
      if (tid == TypeIdOf<double>())
        return CastFloating<Dest>(src.template Cast<double>());
    }
    return NotConvertible<Dest>();
  }

  template <class To>
  inline std::expected<std::remove_cvref_t<To>, Error> ConvertAny(const Any &src)
  {
    using Dest = std::remove_cvref_t<To>;
    constexpr ConversionRule rule = RuleFor(ValueKindOf<Dest>());
    static_assert(rule != ConversionRule::Discard, "void has no value to convert");

    if constexpr (rule == ConversionRule::Narrow)
    {
      if (src.GetTypeId() == TypeIdOf<Dest>())
        return src.template Cast<Dest>();
      return CastArithmetic<Dest, true>(src);
    }
    else if constexpr (rule == ConversionRule::Underlying)
    {
      using U = std::underlying_type_t<Dest>;
      if (src.GetTypeId() == TypeIdOf<Dest>())
        return src.template Cast<Dest>();
      auto raw = CastArithmetic<U, false>(src);
      if (!raw)
        return NotConvertible<Dest>();
      return static_cast<Dest>(*raw);
    }
    else if constexpr (rule == ConversionRule::PassThrough)
    {
      if (src.GetTypeId() == TypeIdOf<Dest>())
        return src.template Cast<Dest>();
      if (IsEmptyAny(src) || src.GetTypeId() == TypeIdOf<std::nullptr_t>())
        return Dest{nullptr};
      if constexpr (std::is_pointer_v<Dest> && std::is_const_v<std::remove_pointer_t<Dest>>)
      {
        using Mutable = std::remove_const_t<std::remove_pointer_t<Dest>> *;
        if (src.GetTypeId() == TypeIdOf<Mutable>())
          return static_cast<Dest>(src.template Cast<Mutable>());
      }
      return NotConvertible<Dest>();
    }
    else
    {
      if (src.GetTypeId() == TypeIdOf<Dest>())
        return src.template Cast<Dest>();
      return NotConvertible<Dest>();
    }
  }

  // Non-const lvalue reference parameters travel as pointers so a handler can write through them.
  template <class P>
  inline constexpr bool IsOutParam = std::is_lvalue_reference_v<P> && !std::is_const_v<std::remove_reference_t<P>>;

  template <class P>
  using BoxedT = std::conditional_t<IsOutParam<P>, std::remove_reference_t<P> *, std::remove_cvref_t<P>>;

  template <class P, class A>
  inline Any BoxArgument(A &&a)
  {
    if constexpr (IsOutParam<P>)
      return Any{std::addressof(a)};
    else
      return Any{BoxedT<P>(std::forward<A>(a))};
  }

  template <class Params, std::size_t... I, class... A>
  inline std::array<Any, sizeof...(A)> BoxArguments(std::index_sequence<I...>, A &&...a)
  {
    return {BoxArgument<std::tuple_element_t<I, Params>>(std::forward<A>(a))...};
  }

  // Storage an unboxed argument lives in for the duration of a real call.
  template <class P>
  inline std::expected<BoxedT<P>, Error> UnboxArgument(const Any &arg)
  {
    if constexpr (IsOutParam<P>)
    {
      if (arg.GetTypeId() != TypeIdOf<BoxedT<P>>())
        return std::unexpected(Error{ErrorCode::InvalidArgument, "reference argument must be boxed as a pointer", TypeNameOf<P>()});
      auto *ptr = arg.template Cast<BoxedT<P>>();
      if (!ptr)
        return std::unexpected(Error{ErrorCode::InvalidArgument, "null reference argument", TypeNameOf<P>()});
      return ptr;
    }
    else
    {
      return ConvertAny<BoxedT<P>>(arg);
    }
  }

  template <class P>
  inline decltype(auto) PassArgument(BoxedT<P> &storage)
  {
    if constexpr (IsOutParam<P>)
      return *storage;
    else if constexpr (std::is_rvalue_reference_v<P>)
      return std::move(storage);
    else
      return static_cast<BoxedT<P> &>(storage);
  }

} // namespace NGIN::Proxy::detail
