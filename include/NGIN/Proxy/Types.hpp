// Types.hpp
// Public-facing error codes, value kinds and the dispatch exception
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Utilities/Any.hpp>

#include <NGIN/Proxy/Export.hpp>

#include <exception>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace NGIN::Proxy
{

  using Any = NGIN::Utilities::Any<>;

  // Appended to the target's qualified name to form a blueprint identity.
  inline constexpr std::string_view ProxySuffix = "Proxy";

  inline constexpr NGIN::UInt32 InvalidIndex = static_cast<NGIN::UInt32>(-1);

  enum class ErrorCode : unsigned
  {
    NotFound = 1,
    InvalidArgument = 2,
    SynthesisFailure = 3,
    ConversionFailure = 4,
  };

  // Semantic classification of a parameter or return type. Drives both argument
  // boxing and the result conversion table in Convert.hpp.
  enum class ValueKind : NGIN::UInt8
  {
    Void = 0,
    Bool,
    Int8,
    UInt8,
    Int16,
    UInt16,
    Int32,
    UInt32,
    Int64,
    UInt64,
    Float,
    Double,
    Enum,
    Value,
    Reference,
  };

  inline constexpr NGIN::UIntSize ValueKindCount = static_cast<NGIN::UIntSize>(ValueKind::Reference) + 1;

  [[nodiscard]] NGIN_PROXY_API std::string_view ToString(ErrorCode code) noexcept;
  [[nodiscard]] NGIN_PROXY_API std::string_view ToString(ValueKind kind) noexcept;

  // `message` and `subject` always view static storage (literals or qualified type names).
  struct Error
  {
    ErrorCode code{ErrorCode::InvalidArgument};
    std::string_view message{};
    std::string_view subject{};

    constexpr Error() = default;
    constexpr Error(ErrorCode c, std::string_view m) : code(c), message(m) {}
    constexpr Error(ErrorCode c, std::string_view m, std::string_view s) : code(c), message(m), subject(s) {}
  };

  /// Thrown from a forwarding routine when a call cannot be dispatched or its
  /// result cannot be converted; the proxied signature leaves no other channel.
  class NGIN_PROXY_API DispatchError : public std::exception
  {
  public:
    explicit DispatchError(Error error);

    [[nodiscard]] const Error &GetError() const noexcept { return m_error; }
    [[nodiscard]] ErrorCode Code() const noexcept { return m_error.code; }
    [[nodiscard]] const char *what() const noexcept override { return m_what.c_str(); }

  private:
    Error m_error;
    std::string m_what;
  };

  // Forward decls of high-level wrappers
  class Interface;
  class Method;
  class Property;
  class Blueprint;
  class ProxyObject;
  class IInvocationHandler;

  using HandlerPtr = std::shared_ptr<IInvocationHandler>;

  using ExpectedInterface = std::expected<Interface, Error>;
  using ExpectedMethod = std::expected<Method, Error>;
  using ExpectedProperty = std::expected<Property, Error>;
  using ExpectedBlueprint = std::expected<Blueprint, Error>;
  using ExpectedProxy = std::expected<std::unique_ptr<ProxyObject>, Error>;

} // namespace NGIN::Proxy
