#pragma once

#include <deque>
#include <expected>
#include <optional>
#include <string>

#include <asio.hpp>

#include "ndjsonrpc/error/error.hpp"

namespace ndjsonrpc::transport {

/**
 * @brief Single-producer, single-consumer message queue with a terminal
 * signal.
 *
 * The queue is not thread-safe: producer and consumer must run on the same
 * strand. After Finish(), queued messages are still delivered, then the
 * terminal error (if any) exactly once, then std::nullopt forever.
 */
class MessageQueue {
 public:
  using PopResult =
      std::expected<std::optional<std::string>, error::TransportError>;

  explicit MessageQueue(asio::any_io_executor executor);

  MessageQueue(const MessageQueue&) = delete;
  auto operator=(const MessageQueue&) -> MessageQueue& = delete;
  MessageQueue(MessageQueue&&) = delete;
  auto operator=(MessageQueue&&) -> MessageQueue& = delete;

  ~MessageQueue() = default;

  /// Enqueues a message. Ignored once the queue is finished.
  void Push(std::string message);

  /**
   * @brief Marks the end of the sequence.
   * @param error Terminal error to hand to the consumer, if any.
   * @return true if this call finished the queue, false if it already was.
   */
  auto Finish(std::optional<error::TransportError> error = std::nullopt)
      -> bool;

  /// Waits for the next message or the terminal signal.
  auto Pop() -> asio::awaitable<PopResult>;

  [[nodiscard]] auto IsFinished() const -> bool {
    return finished_;
  }

  [[nodiscard]] auto Size() const -> std::size_t {
    return messages_.size();
  }

 private:
  std::deque<std::string> messages_;
  bool finished_{false};
  std::optional<error::TransportError> terminal_error_;

  // Waits forever; cancelled to wake the consumer
  asio::steady_timer signal_;
};

}  // namespace ndjsonrpc::transport
