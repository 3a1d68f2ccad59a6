#include "client/error.hpp"

#include <fmt/format.h>

namespace ftr
{
std::string_view to_string(ErrorKind kind)
{
  switch (kind) {
    case ErrorKind::Transport:
      return "TransportError";
    case ErrorKind::Integrity:
      return "IntegrityError";
    case ErrorKind::ProtocolMismatch:
      return "ProtocolMismatch";
    case ErrorKind::StateCorruption:
      return "StateCorruption";
    case ErrorKind::InvalidInput:
      return "InvalidInput";
  }

  return "UnknownError";
}

std::string TransferError::describe() const
{
  if (unit) {
    return fmt::format("{} (unit {}): {}", to_string(kind), *unit, message);
  }

  return fmt::format("{}: {}", to_string(kind), message);
}

TransferError make_error(ErrorKind kind,
                         std::string message,
                         std::optional<size_t> unit)
{
  return TransferError {
      .kind = kind, .message = std::move(message), .unit = unit};
}

TransferException::TransferException(TransferError error)
    : std::runtime_error {error.describe()}
    , m_error {std::move(error)}
{
}

TransferException::TransferException(ErrorKind kind, std::string message)
    : TransferException {make_error(kind, std::move(message))}
{
}
}  // namespace ftr
