#pragma once

#include <cstddef>
#include <expected>
#include <span>
#include <string_view>
#include <system_error>
#include <utility>

#include "ndjsonrpc/error/error.hpp"

namespace ndjsonrpc::transport {

/**
 * @brief Thin wrapper around a POSIX file descriptor.
 *
 * A descriptor is either borrowed (the default, e.g. the standard streams)
 * or owning, in which case it is closed on destruction. Read and write
 * report raw system errors; classification into transport errors happens in
 * the transport.
 */
class FileDescriptor {
 public:
  FileDescriptor() = default;

  explicit FileDescriptor(int handle, bool owning = false)
      : handle_(handle), owning_(owning) {
  }

  ~FileDescriptor();

  FileDescriptor(const FileDescriptor&) = delete;
  auto operator=(const FileDescriptor&) -> FileDescriptor& = delete;

  FileDescriptor(FileDescriptor&& other) noexcept;
  auto operator=(FileDescriptor&& other) noexcept -> FileDescriptor&;

  static auto StandardInput() -> FileDescriptor;

  static auto StandardOutput() -> FileDescriptor;

  /// Takes ownership of @p handle; it is closed with this object.
  static auto Owning(int handle) -> FileDescriptor;

  /**
   * @brief Creates an anonymous pipe.
   * @return The read end and the write end, both owning.
   */
  static auto Pipe()
      -> std::expected<
          std::pair<FileDescriptor, FileDescriptor>, std::error_code>;

  [[nodiscard]] auto NativeHandle() const -> int {
    return handle_;
  }

  [[nodiscard]] auto IsValid() const -> bool {
    return handle_ >= 0;
  }

  [[nodiscard]] auto IsOwning() const -> bool {
    return owning_;
  }

  /**
   * @brief Adds O_NONBLOCK to the descriptor's status flags.
   *
   * Existing flags are preserved. Fails with kConfigurationError carrying
   * errno when fcntl fails, or kNotSupported when the platform has no
   * non-blocking mode.
   */
  auto SetNonBlocking() -> std::expected<void, error::TransportError>;

  [[nodiscard]] auto IsNonBlocking() const -> bool;

  /// Single read(2). Zero means end of stream.
  auto Read(std::span<char> buffer)
      -> std::expected<std::size_t, std::error_code>;

  /// Single write(2); may write fewer bytes than requested. A pipe without a
  /// reader fails with EPIPE; SIGPIPE is suppressed for the call.
  auto Write(std::string_view data)
      -> std::expected<std::size_t, std::error_code>;

  /// Closes an owning descriptor now. Borrowed descriptors are only detached.
  auto Close() -> std::expected<void, std::error_code>;

 private:
  int handle_{-1};
  bool owning_{false};
};

/// EAGAIN / EWOULDBLOCK: no data or capacity right now.
auto IsWouldBlock(const std::error_code& ec) -> bool;

/// EINTR: the call was interrupted before transferring anything.
auto IsInterrupted(const std::error_code& ec) -> bool;

}  // namespace ndjsonrpc::transport
