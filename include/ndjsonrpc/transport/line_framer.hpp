#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ndjsonrpc::transport {

/**
 * @brief Newline-delimited framing.
 *
 * Frames are a payload followed by a single '\n'. The framer keeps the bytes
 * received so far that do not yet end with a delimiter; empty lines are
 * dropped.
 */
class LineFramer {
 public:
  static constexpr char kDelimiter = '\n';

  static auto Frame(std::string message) -> std::string {
    message.push_back(kDelimiter);
    return message;
  }

  /**
   * @brief Appends received bytes and extracts every completed message.
   * @param data Bytes as read from the stream.
   * @return Complete non-empty messages, in stream order.
   */
  auto Append(std::string_view data) -> std::vector<std::string> {
    pending_.append(data);

    std::vector<std::string> messages;
    std::size_t start = 0;
    std::size_t newline = pending_.find(kDelimiter, start);
    while (newline != std::string::npos) {
      if (newline > start) {
        messages.emplace_back(pending_, start, newline - start);
      }
      start = newline + 1;
      newline = pending_.find(kDelimiter, start);
    }
    pending_.erase(0, start);

    return messages;
  }

  [[nodiscard]] auto Pending() const -> std::string_view {
    return pending_;
  }

  [[nodiscard]] auto PendingSize() const -> std::size_t {
    return pending_.size();
  }

  void Reset() {
    pending_.clear();
  }

 private:
  std::string pending_;
};

}  // namespace ndjsonrpc::transport
