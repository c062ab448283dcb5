// SPDX-License-Identifier: Apache-2.0
#include "codec/base64.hpp"

#include "codec/errors.hpp"

#include <algorithm>
#include <array>

namespace urlprm::codec::base64 {

namespace {

constexpr int8_t INVALID = -1;

constexpr std::array<int8_t, 256> make_reverse_table()
{
    std::array<int8_t, 256> table{};
    for (auto &v : table)
        v = INVALID;
    for (size_t i = 0; i < ALPHABET.size(); ++i)
        table[static_cast<unsigned char>(ALPHABET[i])] = static_cast<int8_t>(i);
    return table;
}

constexpr std::array<int8_t, 256> REVERSE = make_reverse_table();

std::string_view strip_padding(std::string_view s)
{
    while (!s.empty() && s.back() == '=')
        s.remove_suffix(1);
    return s;
}

// Regroup 6-bit values (already looked up) into bytes. Missing trailing slots count as 0.
std::vector<uint8_t> regroup(std::string_view s, bool strict)
{
    std::vector<uint8_t> out;
    out.reserve(s.size() * 3 / 4);
    for (size_t i = 0; i < s.size(); i += 4) {
        size_t n = std::min<size_t>(4, s.size() - i);
        uint32_t group = 0;
        for (size_t j = 0; j < 4; ++j) {
            uint32_t v = 0;
            if (j < n) {
                int8_t r = REVERSE[static_cast<unsigned char>(s[i + j])];
                if (r == INVALID) {
                    if (strict)
                        throw FormatError("base64: invalid character at offset " + std::to_string(i + j));
                } else {
                    v = static_cast<uint32_t>(r);
                }
            }
            group = (group << 6) | v;
        }
        // n chars carry n*6 bits -> n-1 whole bytes
        if (n >= 2)
            out.push_back(static_cast<uint8_t>(group >> 16));
        if (n >= 3)
            out.push_back(static_cast<uint8_t>(group >> 8));
        if (n == 4)
            out.push_back(static_cast<uint8_t>(group));
    }
    return out;
}

} // namespace

std::string encode(std::span<const uint8_t> bytes)
{
    std::string out;
    out.reserve(encoded_length(bytes.size()));
    size_t i = 0;
    for (; i + 3 <= bytes.size(); i += 3) {
        uint32_t group = (uint32_t(bytes[i]) << 16) | (uint32_t(bytes[i + 1]) << 8) | bytes[i + 2];
        out.push_back(ALPHABET[(group >> 18) & 0x3f]);
        out.push_back(ALPHABET[(group >> 12) & 0x3f]);
        out.push_back(ALPHABET[(group >> 6) & 0x3f]);
        out.push_back(ALPHABET[group & 0x3f]);
    }
    size_t rest = bytes.size() - i;
    if (rest == 1) {
        uint32_t group = uint32_t(bytes[i]) << 16;
        out.push_back(ALPHABET[(group >> 18) & 0x3f]);
        out.push_back(ALPHABET[(group >> 12) & 0x3f]);
    } else if (rest == 2) {
        uint32_t group = (uint32_t(bytes[i]) << 16) | (uint32_t(bytes[i + 1]) << 8);
        out.push_back(ALPHABET[(group >> 18) & 0x3f]);
        out.push_back(ALPHABET[(group >> 12) & 0x3f]);
        out.push_back(ALPHABET[(group >> 6) & 0x3f]);
    }
    return out;
}

std::vector<uint8_t> decode(std::string_view s)
{
    return regroup(strip_padding(s), false);
}

std::vector<uint8_t> decode_strict(std::string_view s)
{
    s = strip_padding(s);
    if (s.size() % 4 == 1)
        throw FormatError("base64: dangling character (length " + std::to_string(s.size()) + ")");
    return regroup(s, true);
}

} // namespace urlprm::codec::base64
