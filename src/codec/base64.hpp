// SPDX-License-Identifier: Apache-2.0
// base64.hpp - URL-safe base64 (A-Z a-z 0-9 - _), no padding.
#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace urlprm::codec::base64 {

inline constexpr std::string_view ALPHABET = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

// 3 bytes -> 4 chars; a final group of 1 or 2 bytes emits 2 or 3 chars.
std::string encode(std::span<const uint8_t> bytes);

// Lenient decode: trailing '=' stripped, unknown characters read as 0, any length accepted.
std::vector<uint8_t> decode(std::string_view s);

// Strict decode: throws FormatError on characters outside ALPHABET or a length of 1 mod 4.
std::vector<uint8_t> decode_strict(std::string_view s);

// Number of characters encode() produces for n bytes.
constexpr size_t encoded_length(size_t n)
{
    return (n / 3) * 4 + (n % 3 == 0 ? 0 : n % 3 + 1);
}

} // namespace urlprm::codec::base64
