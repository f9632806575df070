#pragma once

#include <expected>
#include <memory>
#include <optional>
#include <string>

#include <asio.hpp>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include "ndjsonrpc/error/error.hpp"

namespace ndjsonrpc::transport {

/// Logger that discards everything; used when no logger is supplied.
inline auto MakeNullLogger(std::string name)
    -> std::shared_ptr<spdlog::logger> {
  return std::make_shared<spdlog::logger>(
      std::move(name), std::make_shared<spdlog::sinks::null_sink_mt>());
}

/**
 * @brief Message transport consumed by the JSON-RPC layer.
 *
 * Messages are opaque strings without framing; implementations add and
 * strip their own framing.
 */
class Transport {
 public:
  /// Next message, std::nullopt once the sequence has completed.
  using ReceiveResult =
      std::expected<std::optional<std::string>, error::TransportError>;

  explicit Transport(
      asio::any_io_executor executor,
      std::shared_ptr<spdlog::logger> logger = nullptr)
      : logger_(logger ? logger : MakeNullLogger("ndjsonrpc.transport")),
        executor_(std::move(executor)),
        strand_(asio::make_strand(executor_)) {
  }

  Transport(const Transport &) = delete;
  Transport(Transport &&) = delete;

  auto operator=(const Transport &) -> Transport & = delete;
  auto operator=(Transport &&) -> Transport & = delete;

  virtual ~Transport() = default;

  virtual auto Start()
      -> asio::awaitable<std::expected<void, error::TransportError>> = 0;

  virtual auto Close()
      -> asio::awaitable<std::expected<void, error::TransportError>> = 0;

  virtual auto CloseNow() -> void = 0;

  virtual auto SendMessage(std::string message)
      -> asio::awaitable<std::expected<void, error::TransportError>> = 0;

  virtual auto ReceiveMessage() -> asio::awaitable<ReceiveResult> = 0;

  [[nodiscard]] auto GetExecutor() const -> asio::any_io_executor {
    return executor_;
  }

  [[nodiscard]] auto GetStrand() -> asio::strand<asio::any_io_executor> & {
    return strand_;
  }

 protected:
  auto Logger() -> std::shared_ptr<spdlog::logger> {
    return logger_;
  }

 private:
  std::shared_ptr<spdlog::logger> logger_;
  asio::any_io_executor executor_;
  asio::strand<asio::any_io_executor> strand_;
};

}  // namespace ndjsonrpc::transport
