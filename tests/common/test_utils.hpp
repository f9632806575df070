#pragma once

#include <algorithm>
#include <chrono>
#include <exception>
#include <string>
#include <string_view>
#include <span>
#include <utility>

#include <asio.hpp>
#include <catch2/catch_test_macros.hpp>

#include "ndjsonrpc/transport/file_descriptor.hpp"

namespace ndjsonrpc::test {

using transport::FileDescriptor;

// Runs a coroutine test body to completion. Failures thrown inside the
// coroutine are rethrown out of io_ctx.run() so Catch2 reports them.
template <typename F>
void RunTest(F&& test_fn) {
  asio::io_context io_ctx;
  asio::co_spawn(
      io_ctx, std::forward<F>(test_fn)(io_ctx.get_executor()),
      [](const std::exception_ptr& e) {
        if (e) {
          std::rethrow_exception(e);
        }
      });
  io_ctx.run();
}

inline auto Delay(asio::any_io_executor executor, std::chrono::milliseconds ms)
    -> asio::awaitable<void> {
  asio::steady_timer timer(executor, ms);
  co_await timer.async_wait(asio::use_awaitable);
}

struct Pipe {
  FileDescriptor read_end;
  FileDescriptor write_end;
};

inline auto MakePipe() -> Pipe {
  auto pipe = FileDescriptor::Pipe();
  REQUIRE(pipe.has_value());
  return {std::move(pipe->first), std::move(pipe->second)};
}

// Blocking helpers for the test side of a pipe
inline void WriteAll(FileDescriptor& fd, std::string_view data) {
  while (!data.empty()) {
    auto written = fd.Write(data);
    REQUIRE(written.has_value());
    data.remove_prefix(*written);
  }
}

inline auto ReadExactly(FileDescriptor& fd, std::size_t size) -> std::string {
  std::string result;
  char buffer[1024];
  while (result.size() < size) {
    const std::size_t chunk = std::min(sizeof(buffer), size - result.size());
    auto n = fd.Read(std::span<char>(buffer, chunk));
    REQUIRE(n.has_value());
    REQUIRE(*n > 0);
    result.append(buffer, *n);
  }
  return result;
}

}  // namespace ndjsonrpc::test
