#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ftr
{
enum class ErrorKind : uint8_t
{
  Transport,
  Integrity,
  ProtocolMismatch,
  StateCorruption,
  InvalidInput,
};

std::string_view to_string(ErrorKind kind);

struct TransferError
{
  ErrorKind kind;
  std::string message;
  std::optional<size_t> unit;

  std::string describe() const;
};

TransferError make_error(ErrorKind kind,
                         std::string message,
                         std::optional<size_t> unit = std::nullopt);

template<typename T>
using Result = std::expected<T, TransferError>;

// Carries a TransferError across coroutine boundaries.
class TransferException : public std::runtime_error
{
  TransferError m_error;

public:
  explicit TransferException(TransferError error);

  TransferException(ErrorKind kind, std::string message);

  const TransferError& error() const { return m_error; }
};
}  // namespace ftr
