// SPDX-License-Identifier: Apache-2.0
#include "Base64.hpp"

#include <array>
#include <format>

namespace mcphub::base64
{

namespace
{
    constexpr auto Alphabet = std::string_view {
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"
    };

    constexpr auto decodeTable = [] {
        auto table = std::array<int8_t, 256> {};
        table.fill(-1);
        for (size_t i = 0; i < Alphabet.size(); ++i)
            table[static_cast<unsigned char>(Alphabet[i])] = static_cast<int8_t>(i);
        return table;
    }();
} // namespace

auto encode(std::span<const uint8_t> bytes) -> std::string
{
    auto out = std::string {};
    out.reserve((bytes.size() + 2) / 3 * 4);

    for (size_t i = 0; i < bytes.size(); i += 3)
    {
        auto n = static_cast<uint32_t>(bytes[i]) << 16;
        if (i + 1 < bytes.size())
            n |= static_cast<uint32_t>(bytes[i + 1]) << 8;
        if (i + 2 < bytes.size())
            n |= static_cast<uint32_t>(bytes[i + 2]);

        out.push_back(Alphabet[(n >> 18) & 0x3F]);
        out.push_back(Alphabet[(n >> 12) & 0x3F]);
        out.push_back(i + 1 < bytes.size() ? Alphabet[(n >> 6) & 0x3F] : '=');
        out.push_back(i + 2 < bytes.size() ? Alphabet[n & 0x3F] : '=');
    }

    return out;
}

auto decode(std::string_view text) -> Result<std::vector<uint8_t>>
{
    auto out = std::vector<uint8_t> {};
    out.reserve(text.size() / 4 * 3);

    uint32_t buffer = 0;
    int bits = 0;

    for (auto const c: text)
    {
        if (c == '=')
            break;
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t')
            continue;

        auto const value = decodeTable[static_cast<unsigned char>(c)];
        if (value < 0)
            return makeError(ErrorCode::ProtocolError, std::format("Invalid base64 character '{}'", c));

        buffer = (buffer << 6) | static_cast<uint32_t>(value);
        bits += 6;
        if (bits >= 8)
        {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((buffer >> bits) & 0xFF));
        }
    }

    return out;
}

} // namespace mcphub::base64
