#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace toolbridge {

class Codec {
public:
    /// Parse one line of JSON into a message.
    /// Throws ParseError on invalid JSON or when the object is not a
    /// recognizable request, notification or response.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Like parse(), but logs and swallows ParseError.
    [[nodiscard]] static std::optional<JsonRpcMessage> try_parse(std::string_view raw);

    /// Serialize a message to a single line of JSON (no trailing newline).
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);

private:
    static JsonRpcMessage parse_object(const nlohmann::json& j);
};

/// Splits an incoming byte stream into lines. Bytes after the last newline
/// stay buffered until the next append().
class LineFramer {
public:
    void append(std::string_view chunk);

    /// Next complete, non-empty line with the terminator (and any CR) removed.
    [[nodiscard]] std::optional<std::string> next_line();

    [[nodiscard]] size_t buffered() const noexcept { return buffer_.size() - pos_; }
    void clear() noexcept;

private:
    std::string buffer_;
    size_t pos_ = 0;
};

} // namespace toolbridge
