#include "ndjsonrpc/transport/message_queue.hpp"

#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>

namespace ndjsonrpc::transport {

MessageQueue::MessageQueue(asio::any_io_executor executor)
    : signal_(std::move(executor)) {
}

void MessageQueue::Push(std::string message) {
  if (finished_) {
    return;
  }
  messages_.push_back(std::move(message));
  signal_.cancel();
}

auto MessageQueue::Finish(std::optional<error::TransportError> error) -> bool {
  if (finished_) {
    return false;
  }
  finished_ = true;
  terminal_error_ = std::move(error);
  signal_.cancel();
  return true;
}

auto MessageQueue::Pop() -> asio::awaitable<PopResult> {
  while (messages_.empty() && !finished_) {
    signal_.expires_at(asio::steady_timer::time_point::max());
    std::error_code ec;
    co_await signal_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
  }

  if (!messages_.empty()) {
    std::string message = std::move(messages_.front());
    messages_.pop_front();
    co_return message;
  }

  if (terminal_error_) {
    auto error = std::move(*terminal_error_);
    terminal_error_.reset();
    co_return std::unexpected(std::move(error));
  }

  co_return std::nullopt;
}

}  // namespace ndjsonrpc::transport
