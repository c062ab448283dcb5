// SPDX-License-Identifier: Apache-2.0
// unit_base64.cpp
// URL-safe alphabet, unpadded partial groups, lenient vs strict decoding.
#include "codec/base64.hpp"
#include "codec/errors.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using urlprm::codec::FormatError;
namespace b64 = urlprm::codec::base64;

static std::vector<uint8_t> bytes_of(const std::string &s)
{
    return std::vector<uint8_t>(s.begin(), s.end());
}

int main()
{
    // Known vectors
    assert(b64::encode(bytes_of("")) == "");
    assert(b64::encode(bytes_of("Man")) == "TWFu");
    assert(b64::encode(bytes_of("Ma")) == "TWE");
    assert(b64::encode(bytes_of("M")) == "TQ");
    assert(b64::encode(std::vector<uint8_t>{0xfb, 0xff}) == "-_8");
    assert(b64::encode(std::vector<uint8_t>{0xff}) == "_w");
    assert(b64::encode(std::vector<uint8_t>{0xfb, 0xff, 0xfc}) == "-__8");
    assert(b64::ALPHABET.size() == 64);
    for (size_t n = 0; n < 10; ++n)
        assert(b64::encode(std::vector<uint8_t>(n, 0x5a)).size() == b64::encoded_length(n));

    // Unpadded and padded input decode the same
    assert(b64::decode("TWE") == bytes_of("Ma"));
    assert(b64::decode("TWE=") == bytes_of("Ma"));
    assert(b64::decode("TQ==") == bytes_of("M"));
    assert(b64::decode("").empty());

    // Round trip for every length 0..64 with random content
    std::mt19937 rng(4242);
    for (size_t len = 0; len <= 64; ++len) {
        std::vector<uint8_t> data(len);
        for (auto &b : data)
            b = static_cast<uint8_t>(std::uniform_int_distribution<int>{0, 255}(rng));
        auto text = b64::encode(data);
        for (char c : text)
            assert(b64::ALPHABET.find(c) != std::string_view::npos);
        assert(b64::decode(text) == data);
        assert(b64::decode_strict(text) == data);
    }

    // Lenient: unknown characters read as zero, never throw
    auto lenient = b64::decode("T*Fu");
    assert(lenient.size() == 3);
    assert(lenient == b64::decode("TAFu"));
    assert(b64::decode("+/").size() == 1);
    assert(b64::decode("A").empty()); // lone character carries no whole byte

    // Strict: unknown characters and dangling characters rejected
    bool threw = false;
    try {
        (void)b64::decode_strict("T*Fu");
    } catch (const FormatError &) {
        threw = true;
    }
    assert(threw);
    threw = false;
    try {
        (void)b64::decode_strict("TWFuA");
    } catch (const FormatError &) {
        threw = true;
    }
    assert(threw);
    assert(b64::decode_strict("TWFu==") == bytes_of("Man"));

    std::cout << "unit_base64 OK" << std::endl;
    return 0;
}
