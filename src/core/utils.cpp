#include "cdpflow/core/utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>

namespace cdpflow::utils {

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

auto base64_encode(std::string_view data) -> std::string {
    static constexpr std::string_view table =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    while (i + 2 < data.size()) {
        auto a = static_cast<uint8_t>(data[i++]);
        auto b = static_cast<uint8_t>(data[i++]);
        auto c = static_cast<uint8_t>(data[i++]);
        result += table[(a >> 2) & 0x3F];
        result += table[((a & 0x03) << 4) | ((b >> 4) & 0x0F)];
        result += table[((b & 0x0F) << 2) | ((c >> 6) & 0x03)];
        result += table[c & 0x3F];
    }
    if (i < data.size()) {
        auto a = static_cast<uint8_t>(data[i++]);
        result += table[(a >> 2) & 0x3F];
        if (i < data.size()) {
            auto b = static_cast<uint8_t>(data[i]);
            result += table[((a & 0x03) << 4) | ((b >> 4) & 0x0F)];
            result += table[((b & 0x0F) << 2)];
        } else {
            result += table[(a & 0x03) << 4];
            result += '=';
        }
        result += '=';
    }
    return result;
}

namespace {

constexpr uint8_t kInvalid = 0xFF;

constexpr auto make_b64_decode_table() -> std::array<uint8_t, 256> {
    std::array<uint8_t, 256> t{};
    for (auto& v : t) v = kInvalid;
    for (int i = 0; i < 26; ++i) t['A' + i] = static_cast<uint8_t>(i);
    for (int i = 0; i < 26; ++i) t['a' + i] = static_cast<uint8_t>(26 + i);
    for (int i = 0; i < 10; ++i) t['0' + i] = static_cast<uint8_t>(52 + i);
    t['+'] = 62;
    t['/'] = 63;
    return t;
}

} // namespace

auto base64_decode(std::string_view data) -> Result<std::string> {
    static constexpr auto table = make_b64_decode_table();

    std::string result;
    result.reserve((data.size() / 4) * 3);

    uint32_t buf = 0;
    int bits = 0;
    for (char c : data) {
        if (c == '=' || c == '\n' || c == '\r' || c == ' ') continue;
        auto value = table[static_cast<uint8_t>(c)];
        if (value == kInvalid) {
            return std::unexpected(make_error(
                ErrorCode::SerializationError, "Invalid base64 character",
                std::string(1, c)));
        }
        buf = (buf << 6) | value;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result += static_cast<char>((buf >> bits) & 0xFF);
        }
    }
    return result;
}

} // namespace cdpflow::utils
