#include <cstdlib>
#include <memory>
#include <optional>
#include <string>

#include <asio.hpp>
#include <ndjsonrpc/transport/stdio_transport.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

using Json = nlohmann::json;
using ndjsonrpc::transport::FileDescriptor;
using ndjsonrpc::transport::StdioTransport;

/**
 * @brief Echo server over newline-delimited stdio.
 *
 * Every JSON-RPC request is answered with its own params as the result.
 * Notifications are ignored except "exit", which stops the server. Logs go
 * to a file because stdout carries the protocol.
 *
 * Environment:
 *   NDJSONRPC_LOG_LEVEL  spdlog level name (default "info")
 *   NDJSONRPC_LOG_FILE   log file path (default "logs/echo_server.log")
 */

namespace {

constexpr int kParseErrorCode = -32700;
constexpr int kInvalidRequestCode = -32600;

auto GetEnv(const char* name, std::string fallback) -> std::string {
  const char* value = std::getenv(name);
  return value != nullptr ? std::string(value) : fallback;
}

auto ConfigureLogging() -> std::shared_ptr<spdlog::logger> {
  auto logger = spdlog::basic_logger_mt(
      "echo_server", GetEnv("NDJSONRPC_LOG_FILE", "logs/echo_server.log"));
  spdlog::set_default_logger(logger);
  spdlog::set_level(
      spdlog::level::from_str(GetEnv("NDJSONRPC_LOG_LEVEL", "info")));
  spdlog::flush_on(spdlog::level::debug);
  return logger;
}

auto MakeError(const Json& id, int code, const std::string& message) -> Json {
  return {
      {"jsonrpc", "2.0"},
      {"id", id},
      {"error", {{"code", code}, {"message", message}}}};
}

// Builds the reply for one message, or nothing for notifications
auto HandleMessage(const std::string& message, bool& exit_requested)
    -> std::optional<Json> {
  const auto request = Json::parse(message, nullptr, false);
  if (request.is_discarded()) {
    spdlog::warn("Unparseable message of {} bytes", message.size());
    return MakeError(nullptr, kParseErrorCode, "Parse error");
  }

  if (!request.is_object()) {
    return MakeError(nullptr, kInvalidRequestCode, "Invalid request");
  }
  if (!request.contains("method") || !request["method"].is_string()) {
    return MakeError(
        request.value("id", Json()), kInvalidRequestCode, "Invalid request");
  }

  const auto method = request["method"].get<std::string>();
  if (!request.contains("id")) {
    spdlog::info("Notification: {}", method);
    if (method == "exit") {
      exit_requested = true;
    }
    return std::nullopt;
  }

  spdlog::debug("Request: {}", method);
  return Json{
      {"jsonrpc", "2.0"},
      {"id", request["id"]},
      {"result", request.value("params", Json())}};
}

auto Serve(StdioTransport& transport) -> asio::awaitable<void> {
  auto start_result = co_await transport.Start();
  if (!start_result) {
    spdlog::error(
        "Failed to start transport: {}", start_result.error().Message());
    co_return;
  }

  bool exit_requested = false;
  while (!exit_requested) {
    auto message = co_await transport.ReceiveMessage();
    if (!message) {
      spdlog::error("Receive failed: {}", message.error().Message());
      break;
    }
    if (!message->has_value()) {
      spdlog::info("Input closed");
      break;
    }

    auto reply = HandleMessage(**message, exit_requested);
    if (!reply) {
      continue;
    }

    auto send_result = co_await transport.SendMessage(reply->dump());
    if (!send_result) {
      spdlog::error("Send failed: {}", send_result.error().ToJson().dump());
      break;
    }
  }

  auto close_result = co_await transport.Close();
  if (!close_result) {
    spdlog::error("Close failed: {}", close_result.error().Message());
  }
}

}  // namespace

auto main() -> int {
  auto logger = ConfigureLogging();

  asio::io_context io_ctx;
  StdioTransport transport(
      io_ctx.get_executor(), FileDescriptor::StandardInput(),
      FileDescriptor::StandardOutput(), logger);

  asio::co_spawn(io_ctx, Serve(transport), asio::detached);
  io_ctx.run();

  spdlog::info("Echo server stopped");
  return 0;
}
