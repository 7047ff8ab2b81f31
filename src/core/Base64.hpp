// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub::base64
{

/// @brief Encodes bytes as standard (RFC 4648) base64 with padding.
[[nodiscard]] auto encode(std::span<const uint8_t> bytes) -> std::string;

/// @brief Decodes standard base64. Whitespace is ignored, padding is optional.
/// @return The decoded bytes, or a ProtocolError on an invalid character.
[[nodiscard]] auto decode(std::string_view text) -> Result<std::vector<uint8_t>>;

} // namespace mcphub::base64
