#include <optional>
#include <string>
#include <vector>

#include <asio.hpp>
#include <catch2/catch_test_macros.hpp>

#include "../common/test_utils.hpp"
#include "ndjsonrpc/transport/message_queue.hpp"

using ndjsonrpc::error::TransportError;
using ndjsonrpc::error::TransportErrorCode;
using ndjsonrpc::test::Delay;
using ndjsonrpc::test::RunTest;
using ndjsonrpc::transport::MessageQueue;

using namespace std::chrono_literals;

TEST_CASE("MessageQueue delivers messages in order", "[MessageQueue]") {
  RunTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    MessageQueue queue(executor);
    queue.Push("first");
    queue.Push("second");
    REQUIRE(queue.Size() == 2);

    auto first = co_await queue.Pop();
    auto second = co_await queue.Pop();
    REQUIRE(first.has_value());
    REQUIRE(*first == "first");
    REQUIRE(second.has_value());
    REQUIRE(*second == "second");
  });
}

TEST_CASE("MessageQueue completion without error", "[MessageQueue]") {
  RunTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    MessageQueue queue(executor);
    queue.Push("last");
    REQUIRE_FALSE(queue.IsFinished());
    REQUIRE(queue.Finish());
    REQUIRE(queue.IsFinished());
    REQUIRE_FALSE(queue.Finish());

    // Pushes after the terminal signal are dropped
    queue.Push("ignored");

    auto last = co_await queue.Pop();
    REQUIRE(last.has_value());
    REQUIRE(*last == "last");

    for (int i = 0; i < 3; ++i) {
      auto done = co_await queue.Pop();
      REQUIRE(done.has_value());
      REQUIRE_FALSE(done->has_value());
    }
  });
}

TEST_CASE("MessageQueue terminal error is delivered once", "[MessageQueue]") {
  RunTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    MessageQueue queue(executor);
    queue.Push("before error");
    queue.Finish(TransportError::FromCode(TransportErrorCode::kReadError));

    // A second terminal signal does not replace the first
    REQUIRE_FALSE(queue.Finish());

    auto message = co_await queue.Pop();
    REQUIRE(message.has_value());
    REQUIRE(*message == "before error");

    auto failed = co_await queue.Pop();
    REQUIRE_FALSE(failed.has_value());
    REQUIRE(failed.error().Code() == TransportErrorCode::kReadError);

    auto done = co_await queue.Pop();
    REQUIRE(done.has_value());
    REQUIRE_FALSE(done->has_value());
  });
}

TEST_CASE("MessageQueue wakes a waiting consumer", "[MessageQueue]") {
  RunTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    MessageQueue queue(executor);
    std::vector<std::string> received;
    bool completed = false;

    asio::co_spawn(
        executor,
        [&]() -> asio::awaitable<void> {
          while (true) {
            auto result = co_await queue.Pop();
            if (!result || !result->has_value()) {
              completed = true;
              co_return;
            }
            received.push_back(**result);
          }
        },
        asio::detached);

    co_await Delay(executor, 20ms);
    queue.Push("one");
    co_await Delay(executor, 20ms);
    queue.Push("two");
    co_await Delay(executor, 20ms);
    REQUIRE(received == std::vector<std::string>{"one", "two"});
    REQUIRE_FALSE(completed);

    queue.Finish();
    co_await Delay(executor, 20ms);
    REQUIRE(completed);
  });
}
