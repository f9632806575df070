#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

#include <asio.hpp>

#include "ndjsonrpc/transport/file_descriptor.hpp"
#include "ndjsonrpc/transport/line_framer.hpp"
#include "ndjsonrpc/transport/message_queue.hpp"
#include "ndjsonrpc/transport/transport.hpp"

namespace ndjsonrpc::transport {

/**
 * @brief Newline-delimited transport over a pair of file descriptors.
 *
 * By default the process's standard input and output are used. Start() puts
 * both descriptors in non-blocking mode and spawns a read loop on the
 * transport strand; the loop splits the input on '\n' and queues every
 * non-empty line for ReceiveMessage(). SendMessage() appends '\n' and writes
 * the whole frame, waiting out EAGAIN.
 *
 * Close() must be awaited before the transport is destroyed while its
 * executor is still running.
 */
class StdioTransport : public Transport {
 public:
  enum class ConnectionState {
    kNotConnected,
    kConnected,
    kDisconnected,
  };

  static constexpr std::size_t kReadBufferSize = 4096;
  static constexpr std::chrono::milliseconds kRetryDelay{10};

  explicit StdioTransport(
      asio::any_io_executor executor,
      FileDescriptor input = FileDescriptor::StandardInput(),
      FileDescriptor output = FileDescriptor::StandardOutput(),
      std::shared_ptr<spdlog::logger> logger = nullptr);

  ~StdioTransport() override;

  StdioTransport(const StdioTransport&) = delete;
  auto operator=(const StdioTransport&) -> StdioTransport& = delete;

  StdioTransport(StdioTransport&&) = delete;
  auto operator=(StdioTransport&&) -> StdioTransport& = delete;

  /// Connects; a no-op when already connected.
  auto Start()
      -> asio::awaitable<std::expected<void, error::TransportError>> override;

  /// Disconnects and completes the receive sequence; a no-op when not
  /// connected. A frame still waiting on a busy output is abandoned and its
  /// sender gets kNotConnected. Returns once the read loop and all pending
  /// senders have finished.
  auto Close()
      -> asio::awaitable<std::expected<void, error::TransportError>> override;

  /// Marks the transport disconnected without waiting. Safe from any thread.
  void CloseNow() override;

  auto SendMessage(std::string message)
      -> asio::awaitable<std::expected<void, error::TransportError>> override;

  auto ReceiveMessage() -> asio::awaitable<ReceiveResult> override;

  [[nodiscard]] auto State() const -> ConnectionState {
    return state_.load();
  }

  [[nodiscard]] auto IsConnected() const -> bool {
    return State() == ConnectionState::kConnected;
  }

 private:
  auto DoStart() -> asio::awaitable<std::expected<void, error::TransportError>>;

  auto DoClose() -> asio::awaitable<std::expected<void, error::TransportError>>;

  auto DoSendMessage(std::string message)
      -> asio::awaitable<std::expected<void, error::TransportError>>;

  // Writes the whole frame, retrying on EAGAIN and partial writes
  auto WriteFrame(std::string_view frame)
      -> asio::awaitable<std::expected<void, error::TransportError>>;

  auto ReadLoop() -> asio::awaitable<void>;

  FileDescriptor input_;
  FileDescriptor output_;
  std::atomic<ConnectionState> state_{ConnectionState::kNotConnected};

  // Strand-confined state
  LineFramer framer_;
  MessageQueue queue_;
  asio::cancellation_signal cancel_signal_;
  bool read_loop_active_{false};
  bool writing_{false};
  // Senders between the connection check and their return
  std::size_t active_sends_{0};
};

}  // namespace ndjsonrpc::transport
