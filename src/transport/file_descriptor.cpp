#include "ndjsonrpc/transport/file_descriptor.hpp"

#include <cerrno>
#include <csignal>
#include <ctime>

#include <fcntl.h>
#include <pthread.h>
#include <unistd.h>

#include <fmt/core.h>

namespace ndjsonrpc::transport {

using error::Ok;
using error::TransportError;
using error::TransportErrorCode;

namespace {
auto LastSystemError() -> std::error_code {
  return {errno, std::system_category()};
}

// Blocks SIGPIPE on the calling thread so a write to a pipe without a reader
// fails with EPIPE instead of terminating the process. A SIGPIPE raised while
// blocked is consumed on exit unless one was already pending.
class ScopedSigpipeBlock {
 public:
  ScopedSigpipeBlock() {
    sigemptyset(&sigpipe_);
    sigaddset(&sigpipe_, SIGPIPE);

    sigset_t pending;
    sigemptyset(&pending);
    if (::sigpending(&pending) == 0) {
      already_pending_ = sigismember(&pending, SIGPIPE) == 1;
    }
    blocked_ = ::pthread_sigmask(SIG_BLOCK, &sigpipe_, &previous_) == 0;
  }

  ~ScopedSigpipeBlock() {
    if (!blocked_) {
      return;
    }
    const int saved_errno = errno;
    if (!already_pending_) {
      sigset_t pending;
      sigemptyset(&pending);
      if (::sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1) {
        const timespec no_wait{0, 0};
        while (::sigtimedwait(&sigpipe_, nullptr, &no_wait) < 0 &&
               errno == EINTR) {
        }
      }
    }
    // Restoring a mask obtained from pthread_sigmask cannot fail
    (void)::pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
    errno = saved_errno;
  }

  ScopedSigpipeBlock(const ScopedSigpipeBlock&) = delete;
  auto operator=(const ScopedSigpipeBlock&) -> ScopedSigpipeBlock& = delete;

 private:
  sigset_t sigpipe_{};
  sigset_t previous_{};
  bool already_pending_{false};
  bool blocked_{false};
};
}  // namespace

FileDescriptor::~FileDescriptor() {
  // Nothing useful can be done about a failed close during destruction
  (void)Close();
}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept
    : handle_(std::exchange(other.handle_, -1)),
      owning_(std::exchange(other.owning_, false)) {
}

auto FileDescriptor::operator=(FileDescriptor&& other) noexcept
    -> FileDescriptor& {
  if (this != &other) {
    (void)Close();
    handle_ = std::exchange(other.handle_, -1);
    owning_ = std::exchange(other.owning_, false);
  }
  return *this;
}

auto FileDescriptor::StandardInput() -> FileDescriptor {
  return FileDescriptor(STDIN_FILENO);
}

auto FileDescriptor::StandardOutput() -> FileDescriptor {
  return FileDescriptor(STDOUT_FILENO);
}

auto FileDescriptor::Owning(int handle) -> FileDescriptor {
  return FileDescriptor(handle, true);
}

auto FileDescriptor::Pipe()
    -> std::expected<
        std::pair<FileDescriptor, FileDescriptor>, std::error_code> {
  int fds[2] = {-1, -1};
  if (::pipe(fds) != 0) {
    return std::unexpected(LastSystemError());
  }
  return std::pair{Owning(fds[0]), Owning(fds[1])};
}

auto FileDescriptor::SetNonBlocking()
    -> std::expected<void, error::TransportError> {
#if defined(F_GETFL) && defined(F_SETFL) && defined(O_NONBLOCK)
  if (!IsValid()) {
    return TransportError::UnexpectedFromSystemError(
        TransportErrorCode::kConfigurationError,
        std::error_code(EBADF, std::system_category()),
        "Failed to set non-blocking mode on invalid descriptor");
  }

  const int flags = ::fcntl(handle_, F_GETFL);
  if (flags < 0) {
    const auto ec = LastSystemError();
    return TransportError::UnexpectedFromSystemError(
        TransportErrorCode::kConfigurationError, ec,
        fmt::format("Failed to read flags of descriptor {}", handle_));
  }

  if (::fcntl(handle_, F_SETFL, flags | O_NONBLOCK) < 0) {
    const auto ec = LastSystemError();
    return TransportError::UnexpectedFromSystemError(
        TransportErrorCode::kConfigurationError, ec,
        fmt::format(
            "Failed to set non-blocking mode on descriptor {}", handle_));
  }
  return Ok();
#else
  return TransportError::UnexpectedFromCode(
      TransportErrorCode::kNotSupported,
      "Setting non-blocking mode not supported on this platform");
#endif
}

auto FileDescriptor::IsNonBlocking() const -> bool {
  if (!IsValid()) {
    return false;
  }
  const int flags = ::fcntl(handle_, F_GETFL);
  return flags >= 0 && (flags & O_NONBLOCK) != 0;
}

auto FileDescriptor::Read(std::span<char> buffer)
    -> std::expected<std::size_t, std::error_code> {
  const ssize_t n = ::read(handle_, buffer.data(), buffer.size());
  if (n < 0) {
    return std::unexpected(LastSystemError());
  }
  return static_cast<std::size_t>(n);
}

auto FileDescriptor::Write(std::string_view data)
    -> std::expected<std::size_t, std::error_code> {
  ssize_t n = 0;
  std::error_code ec;
  {
    const ScopedSigpipeBlock block_sigpipe;
    n = ::write(handle_, data.data(), data.size());
    if (n < 0) {
      ec = LastSystemError();
    }
  }
  if (n < 0) {
    return std::unexpected(ec);
  }
  return static_cast<std::size_t>(n);
}

auto FileDescriptor::Close() -> std::expected<void, std::error_code> {
  const int handle = std::exchange(handle_, -1);
  const bool owning = std::exchange(owning_, false);
  if (!owning || handle < 0) {
    return {};
  }
  if (::close(handle) != 0) {
    return std::unexpected(LastSystemError());
  }
  return {};
}

auto IsWouldBlock(const std::error_code& ec) -> bool {
  if (ec.category() != std::system_category()) {
    return false;
  }
  return ec.value() == EAGAIN || ec.value() == EWOULDBLOCK;
}

auto IsInterrupted(const std::error_code& ec) -> bool {
  return ec.category() == std::system_category() && ec.value() == EINTR;
}

}  // namespace ndjsonrpc::transport
