#include <NGIN/Proxy/Types.hpp>

namespace NGIN::Proxy
{

  std::string_view ToString(ErrorCode code) noexcept
  {
    switch (code)
    {
    case ErrorCode::NotFound:
      return "NotFound";
    case ErrorCode::InvalidArgument:
      return "InvalidArgument";
    case ErrorCode::SynthesisFailure:
      return "SynthesisFailure";
    case ErrorCode::ConversionFailure:
      return "ConversionFailure";
    }
    return "Unknown";
  }

  std::string_view ToString(ValueKind kind) noexcept
  {
    switch (kind)
    {
    case ValueKind::Void:
      return "Void";
    case ValueKind::Bool:
      return "Bool";
    case ValueKind::Int8:
      return "Int8";
    case ValueKind::UInt8:
      return "UInt8";
    case ValueKind::Int16:
      return "Int16";
    case ValueKind::UInt16:
      return "UInt16";
    case ValueKind::Int32:
      return "Int32";
    case ValueKind::UInt32:
      return "UInt32";
    case ValueKind::Int64:
      return "Int64";
    case ValueKind::UInt64:
      return "UInt64";
    case ValueKind::Float:
      return "Float";
    case ValueKind::Double:
      return "Double";
    case ValueKind::Enum:
      return "Enum";
    case ValueKind::Value:
      return "Value";
    case ValueKind::Reference:
      return "Reference";
    }
    return "Unknown";
  }

  DispatchError::DispatchError(Error error) : m_error(error)
  {
    m_what.append(ToString(error.code)).append(": ").append(error.message);
    if (!error.subject.empty())
      m_what.append(" (").append(error.subject).append(")");
  }

} // namespace NGIN::Proxy
