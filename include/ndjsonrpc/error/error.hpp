#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include <nlohmann/json.hpp>

namespace ndjsonrpc::error {

enum class TransportErrorCode {
  // Implementation-defined server error range of JSON-RPC
  kConfigurationError = -32010,
  kNotSupported = -32011,
  kNotConnected = -32012,
  kReadError = -32013,
  kWriteError = -32014,
  kTransportClosed = -32015,
};

namespace detail {
inline auto DefaultMessageFor(TransportErrorCode code) -> std::string_view {
  switch (code) {
    case TransportErrorCode::kConfigurationError:
      return "Transport configuration error";
    case TransportErrorCode::kNotSupported:
      return "Operation not supported";
    case TransportErrorCode::kNotConnected:
      return "Transport not connected";
    case TransportErrorCode::kReadError:
      return "Read error";
    case TransportErrorCode::kWriteError:
      return "Write error";
    case TransportErrorCode::kTransportClosed:
      return "Transport closed";
  }
  return "Unknown error";
}
}  // namespace detail

// Error type for all transport failures. Failures caused by a system call
// carry the errno value that was observed.
class TransportError {
 public:
  TransportError(
      TransportErrorCode code, std::string message,
      std::optional<int> system_code = std::nullopt)
      : code_(code),
        message_(std::move(message)),
        system_code_(system_code) {
  }

  [[nodiscard]] auto ToJson() const -> nlohmann::json {
    nlohmann::json json;
    json["code"] = static_cast<int>(Code());
    json["message"] = Message();
    if (system_code_) {
      json["data"] = {{"errno", *system_code_}};
    }
    return json;
  }

  [[nodiscard]] auto Code() const -> TransportErrorCode {
    return code_;
  }

  [[nodiscard]] auto Message() const -> std::string_view {
    return message_;
  }

  [[nodiscard]] auto SystemCode() const -> std::optional<int> {
    return system_code_;
  }

  auto operator==(const TransportError& other) const -> bool {
    return Code() == other.Code() && Message() == other.Message() &&
           SystemCode() == other.SystemCode();
  }

  auto operator!=(const TransportError& other) const -> bool {
    return !(*this == other);
  }

  static auto FromCode(TransportErrorCode code, std::string message = "")
      -> TransportError {
    if (message.empty()) {
      message = std::string(detail::DefaultMessageFor(code));
    }
    return {code, std::move(message)};
  }

  /// Builds an error from a failed system call, appending the system
  /// description to the message.
  static auto FromSystemError(
      TransportErrorCode code, const std::error_code& ec,
      std::string message = "") -> TransportError {
    if (message.empty()) {
      message = std::string(detail::DefaultMessageFor(code));
    }
    message += ": " + ec.message();
    return {code, std::move(message), ec.value()};
  }

  static auto UnexpectedFromCode(
      TransportErrorCode code, std::string message = "")
      -> std::unexpected<TransportError> {
    return std::unexpected(FromCode(code, std::move(message)));
  }

  static auto UnexpectedFromSystemError(
      TransportErrorCode code, const std::error_code& ec,
      std::string message = "") -> std::unexpected<TransportError> {
    return std::unexpected(FromSystemError(code, ec, std::move(message)));
  }

 private:
  TransportErrorCode code_;
  std::string message_;
  std::optional<int> system_code_;
};

inline auto Ok() -> std::expected<void, TransportError> {
  return {};
}

}  // namespace ndjsonrpc::error
