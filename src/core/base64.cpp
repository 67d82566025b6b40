#include "codebox/core/base64.hpp"

#include <array>
#include <cstdint>

namespace codebox::core {

namespace {

constexpr std::string_view base64_chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789+/";

int decode_char(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

}  // namespace

std::string base64_encode(std::string_view data) {
    std::string ret;
    ret.reserve(((data.size() + 2) / 3) * 4);

    int i = 0;
    std::array<unsigned char, 3> char_array_3{};
    std::array<unsigned char, 4> char_array_4{};

    for (char c : data) {
        char_array_3[i++] = static_cast<unsigned char>(c);
        if (i == 3) {
            char_array_4[0] = (char_array_3[0] & 0xfc) >> 2;
            char_array_4[1] = ((char_array_3[0] & 0x03) << 4) + ((char_array_3[1] & 0xf0) >> 4);
            char_array_4[2] = ((char_array_3[1] & 0x0f) << 2) + ((char_array_3[2] & 0xc0) >> 6);
            char_array_4[3] = char_array_3[2] & 0x3f;

            for (i = 0; i < 4; i++)
                ret += base64_chars[char_array_4[i]];
            i = 0;
        }
    }

    if (i) {
        for (int j = i; j < 3; j++)
            char_array_3[j] = '\0';

        char_array_4[0] = (char_array_3[0] & 0xfc) >> 2;
        char_array_4[1] = ((char_array_3[0] & 0x03) << 4) + ((char_array_3[1] & 0xf0) >> 4);
        char_array_4[2] = ((char_array_3[1] & 0x0f) << 2) + ((char_array_3[2] & 0xc0) >> 6);

        for (int j = 0; j < i + 1; j++)
            ret += base64_chars[char_array_4[j]];

        while (i++ < 3)
            ret += '=';
    }

    return ret;
}

Result<std::string, Error> base64_decode(std::string_view encoded) {
    if (encoded.size() % 4 != 0) {
        return Result<std::string, Error>::err(
            ErrorCode::InvalidArgument,
            "base64 input length is not a multiple of 4"
        );
    }

    std::string out;
    out.reserve(encoded.size() / 4 * 3);

    for (size_t pos = 0; pos < encoded.size(); pos += 4) {
        const bool last_group = pos + 4 == encoded.size();
        std::array<int, 4> values{};
        int padding = 0;

        for (size_t k = 0; k < 4; ++k) {
            char c = encoded[pos + k];
            if (c == '=') {
                // Padding is only legal in the last two positions of the final group
                if (!last_group || k < 2) {
                    return Result<std::string, Error>::err(
                        ErrorCode::InvalidArgument, "misplaced base64 padding");
                }
                ++padding;
                values[k] = 0;
                continue;
            }
            if (padding > 0) {
                return Result<std::string, Error>::err(
                    ErrorCode::InvalidArgument, "data after base64 padding");
            }
            values[k] = decode_char(c);
            if (values[k] < 0) {
                return Result<std::string, Error>::err(
                    ErrorCode::InvalidArgument,
                    "invalid base64 character",
                    std::string(1, c)
                );
            }
        }

        uint32_t triple = (static_cast<uint32_t>(values[0]) << 18) |
                          (static_cast<uint32_t>(values[1]) << 12) |
                          (static_cast<uint32_t>(values[2]) << 6) |
                          static_cast<uint32_t>(values[3]);

        out += static_cast<char>((triple >> 16) & 0xff);
        if (padding < 2) out += static_cast<char>((triple >> 8) & 0xff);
        if (padding < 1) out += static_cast<char>(triple & 0xff);
    }

    return Result<std::string, Error>::ok(std::move(out));
}

}  // namespace codebox::core
