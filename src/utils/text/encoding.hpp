#pragma once
#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>

namespace Trawl {
namespace Utils {
namespace Text {

// Longest prefix of `text` of at most `max_bytes` bytes that does not end
// inside a UTF-8 sequence.
inline std::string truncate_utf8(const std::string& text, std::size_t max_bytes) {
    if (text.size() <= max_bytes)
        return text;
    std::size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80)
        --cut;
    return text.substr(0, cut);
}

// Serializes documents that may carry handler or page supplied text.
// Invalid UTF-8 is replaced with U+FFFD instead of throwing.
inline std::string dump_json(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace Text
}  // namespace Utils
}  // namespace Trawl
