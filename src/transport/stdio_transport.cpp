#include "ndjsonrpc/transport/stdio_transport.hpp"

#include <array>
#include <cerrno>
#include <optional>

#include <asio/bind_cancellation_slot.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>
#include <spdlog/spdlog.h>

namespace ndjsonrpc::transport {

using error::Ok;
using error::TransportError;
using error::TransportErrorCode;

namespace {
auto WithDefaultLogger(std::shared_ptr<spdlog::logger> logger)
    -> std::shared_ptr<spdlog::logger> {
  return logger ? std::move(logger)
                : MakeNullLogger("ndjsonrpc.transport.stdio");
}

// Cancellable wait; an aborted wait simply returns early
auto RetryDelay() -> asio::awaitable<void> {
  asio::steady_timer timer(
      co_await asio::this_coro::executor, StdioTransport::kRetryDelay);
  std::error_code ec;
  co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
}
}  // namespace

StdioTransport::StdioTransport(
    asio::any_io_executor executor, FileDescriptor input,
    FileDescriptor output, std::shared_ptr<spdlog::logger> logger)
    : Transport(std::move(executor), WithDefaultLogger(std::move(logger))),
      input_(std::move(input)),
      output_(std::move(output)),
      queue_(GetStrand()) {
}

StdioTransport::~StdioTransport() {
  if (IsConnected()) {
    Logger()->debug("StdioTransport destructor triggering CloseNow()");
    try {
      CloseNow();
    } catch (const std::exception &e) {
      Logger()->error("StdioTransport destructor error: {}", e.what());
    }
  }
}

auto StdioTransport::Start()
    -> asio::awaitable<std::expected<void, error::TransportError>> {
  co_return co_await asio::co_spawn(
      GetStrand(), DoStart(), asio::use_awaitable);
}

auto StdioTransport::Close()
    -> asio::awaitable<std::expected<void, error::TransportError>> {
  co_return co_await asio::co_spawn(
      GetStrand(), DoClose(), asio::use_awaitable);
}

void StdioTransport::CloseNow() {
  auto expected = ConnectionState::kConnected;
  if (state_.compare_exchange_strong(
          expected, ConnectionState::kDisconnected)) {
    Logger()->debug("StdioTransport closed synchronously");
  }
}

auto StdioTransport::SendMessage(std::string message)
    -> asio::awaitable<std::expected<void, error::TransportError>> {
  co_return co_await asio::co_spawn(
      GetStrand(), DoSendMessage(std::move(message)), asio::use_awaitable);
}

auto StdioTransport::ReceiveMessage() -> asio::awaitable<ReceiveResult> {
  co_return co_await asio::co_spawn(
      GetStrand(), queue_.Pop(), asio::use_awaitable);
}

auto StdioTransport::DoStart()
    -> asio::awaitable<std::expected<void, error::TransportError>> {
  switch (State()) {
    case ConnectionState::kConnected:
      Logger()->debug("StdioTransport already connected");
      co_return Ok();
    case ConnectionState::kDisconnected:
      Logger()->error("StdioTransport cannot start a closed transport");
      co_return TransportError::UnexpectedFromCode(
          TransportErrorCode::kTransportClosed,
          "Cannot start a closed transport");
    case ConnectionState::kNotConnected:
      break;
  }

  for (auto *descriptor : {&input_, &output_}) {
    auto result = descriptor->SetNonBlocking();
    if (!result) {
      Logger()->error(
          "StdioTransport failed to configure descriptor {}: {}",
          descriptor->NativeHandle(), result.error().Message());
      co_return std::unexpected(result.error());
    }
  }

  state_ = ConnectionState::kConnected;
  read_loop_active_ = true;
  Logger()->info("StdioTransport connected");

  asio::co_spawn(
      GetStrand(), ReadLoop(),
      asio::bind_cancellation_slot(cancel_signal_.slot(), asio::detached));

  co_return Ok();
}

auto StdioTransport::DoClose()
    -> asio::awaitable<std::expected<void, error::TransportError>> {
  // Only DoStart(), also on the strand, leaves kNotConnected
  if (State() == ConnectionState::kNotConnected) {
    Logger()->debug("StdioTransport not connected, nothing to close");
    co_return Ok();
  }

  // CloseNow() may already have flipped the state; finish the job here
  const auto previous = state_.exchange(ConnectionState::kDisconnected);
  if (read_loop_active_) {
    cancel_signal_.emit(asio::cancellation_type::terminal);
  }
  queue_.Finish();
  if (previous == ConnectionState::kConnected) {
    Logger()->info("StdioTransport disconnected");
  }

  // The loop and any pending senders see the flag at their next retry
  while (read_loop_active_ || active_sends_ > 0) {
    co_await RetryDelay();
  }

  co_return Ok();
}

auto StdioTransport::DoSendMessage(std::string message)
    -> asio::awaitable<std::expected<void, error::TransportError>> {
  if (!IsConnected()) {
    co_return TransportError::UnexpectedFromCode(
        TransportErrorCode::kNotConnected,
        "SendMessage() called on a transport that is not connected");
  }

  ++active_sends_;

  // One frame at a time, so frames from concurrent callers never interleave
  while (writing_) {
    co_await RetryDelay();
  }

  if (!IsConnected()) {
    --active_sends_;
    co_return TransportError::UnexpectedFromCode(
        TransportErrorCode::kNotConnected,
        "Transport disconnected before the message was written");
  }

  writing_ = true;
  const std::string frame = LineFramer::Frame(std::move(message));
  auto result = co_await WriteFrame(frame);
  writing_ = false;
  --active_sends_;

  if (result) {
    Logger()->debug(
        "StdioTransport sent message of {} bytes", frame.size() - 1);
  }
  co_return result;
}

auto StdioTransport::WriteFrame(std::string_view frame)
    -> asio::awaitable<std::expected<void, error::TransportError>> {
  std::string_view remaining = frame;
  std::size_t retries = 0;

  while (!remaining.empty()) {
    auto written = output_.Write(remaining);
    if (!written) {
      const std::error_code ec = written.error();
      if (IsWouldBlock(ec)) {
        ++retries;
        co_await RetryDelay();
        if (!IsConnected()) {
          Logger()->warn(
              "StdioTransport disconnected with {} bytes of a frame unsent",
              remaining.size());
          co_return TransportError::UnexpectedFromCode(
              TransportErrorCode::kNotConnected,
              "Transport disconnected while the output was busy");
        }
        continue;
      }
      if (IsInterrupted(ec)) {
        continue;
      }
      Logger()->error("StdioTransport write failed: {}", ec.message());
      if (ec.value() == ENOTCONN) {
        co_return TransportError::UnexpectedFromSystemError(
            TransportErrorCode::kNotConnected, ec, "Output not connected");
      }
      co_return TransportError::UnexpectedFromSystemError(
          TransportErrorCode::kWriteError, ec, "Failed to write to output");
    }

    if (*written == 0) {
      co_await RetryDelay();
      if (!IsConnected()) {
        co_return TransportError::UnexpectedFromCode(
            TransportErrorCode::kNotConnected,
            "Transport disconnected while the output was busy");
      }
      continue;
    }
    remaining.remove_prefix(*written);
  }

  if (retries > 0) {
    Logger()->debug(
        "StdioTransport output was busy, frame written after {} retries",
        retries);
  }
  co_return Ok();
}

auto StdioTransport::ReadLoop() -> asio::awaitable<void> {
  auto cancellation = co_await asio::this_coro::cancellation_state;
  auto is_cancelled = [&cancellation] {
    return cancellation.cancelled() != asio::cancellation_type::none;
  };

  std::array<char, kReadBufferSize> buffer{};
  std::optional<TransportError> failure;

  while (IsConnected() && !is_cancelled()) {
    auto bytes_read = input_.Read(buffer);
    if (!bytes_read) {
      const std::error_code ec = bytes_read.error();
      if (IsWouldBlock(ec)) {
        co_await RetryDelay();
        continue;
      }
      if (IsInterrupted(ec)) {
        continue;
      }
      Logger()->error("StdioTransport read error: {}", ec.message());
      failure = TransportError::FromSystemError(
          TransportErrorCode::kReadError, ec, "Failed to read from input");
      break;
    }

    if (*bytes_read == 0) {
      Logger()->info("StdioTransport received EOF");
      break;
    }

    auto messages =
        framer_.Append(std::string_view(buffer.data(), *bytes_read));
    for (auto &message : messages) {
      Logger()->debug(
          "StdioTransport received message of {} bytes", message.size());
      queue_.Push(std::move(message));
    }

    // Let Close() and consumers run between reads of a busy stream
    co_await asio::post(
        co_await asio::this_coro::executor, asio::use_awaitable);
  }

  queue_.Finish(std::move(failure));
  read_loop_active_ = false;
  Logger()->debug("StdioTransport read loop exited");
}

}  // namespace ndjsonrpc::transport
