// SPDX-License-Identifier: Apache-2.0
// metrics.hpp
// Codec counters (atomics, relaxed ordering, no dynamic allocation).
#pragma once
#include <atomic>
#include <cstdint>
#include <string>

namespace urlprm::metrics {

struct CodecCounters
{
    std::atomic<uint64_t> encodes{0}; // encode() calls that produced text
    std::atomic<uint64_t> omitted_defaults{0}; // encode() calls answered with "absent"
    std::atomic<uint64_t> encoded_chars{0};
    std::atomic<uint64_t> range_errors{0}; // encode() inputs rejected by the codec
    std::atomic<uint64_t> decodes{0}; // decode() calls given text
    std::atomic<uint64_t> decode_fallbacks{0}; // malformed text replaced by the default
};

inline CodecCounters &codec()
{
    static CodecCounters inst;
    return inst;
}

inline void add_encode(uint64_t chars)
{
    auto &c = codec();
    c.encodes.fetch_add(1, std::memory_order_relaxed);
    c.encoded_chars.fetch_add(chars, std::memory_order_relaxed);
}

inline void add_omitted_default()
{
    codec().omitted_defaults.fetch_add(1, std::memory_order_relaxed);
}

inline void add_range_error()
{
    codec().range_errors.fetch_add(1, std::memory_order_relaxed);
}

inline void add_decode()
{
    codec().decodes.fetch_add(1, std::memory_order_relaxed);
}

inline void add_decode_fallback()
{
    codec().decode_fallbacks.fetch_add(1, std::memory_order_relaxed);
}

inline void reset()
{
    auto &c = codec();
    c.encodes.store(0, std::memory_order_relaxed);
    c.omitted_defaults.store(0, std::memory_order_relaxed);
    c.encoded_chars.store(0, std::memory_order_relaxed);
    c.range_errors.store(0, std::memory_order_relaxed);
    c.decodes.store(0, std::memory_order_relaxed);
    c.decode_fallbacks.store(0, std::memory_order_relaxed);
}

// name=value lines, one counter per line.
inline std::string dump()
{
    auto &c = codec();
    std::string out;
    auto line = [&out](const char *name, const std::atomic<uint64_t> &v) {
        out += name;
        out.push_back('=');
        out += std::to_string(v.load(std::memory_order_relaxed));
        out.push_back('\n');
    };
    line("encodes", c.encodes);
    line("omitted_defaults", c.omitted_defaults);
    line("encoded_chars", c.encoded_chars);
    line("range_errors", c.range_errors);
    line("decodes", c.decodes);
    line("decode_fallbacks", c.decode_fallbacks);
    return out;
}

} // namespace urlprm::metrics
