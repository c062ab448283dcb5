// SPDX-License-Identifier: Apache-2.0
// Structured logger (header-only). Provides:
//  - Level filtering via URLPRM_LOG_LEVEL (debug|info|warn|error) or set_level()
//  - JSON mode via URLPRM_LOG_JSON presence or set_json()
//  - Synchronous writes to stderr, serialized by a mutex
//  - Optional external callback (set_callback)

#pragma once

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <limits>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

namespace urlprm::log {

enum class level
{
    debug = 0,
    info = 1,
    warn = 2,
    error = 3
};

namespace detail {
inline std::atomic<int> g_level{static_cast<int>(level::info)};
inline std::atomic<bool> g_json{false};
inline std::once_flag g_env_once;
inline std::mutex g_io_mtx;
using cb_sig = void (*)(int, const char *, void *);
inline std::atomic<void *> g_cb_ptr{nullptr};
inline std::atomic<void *> g_cb_ud{nullptr};

inline cb_sig load_cb()
{
    return reinterpret_cast<cb_sig>(g_cb_ptr.load(std::memory_order_acquire));
}

inline const char *level_name(level lv)
{
    switch (lv) {
        case level::debug:
            return "debug";
        case level::info:
            return "info";
        case level::warn:
            return "warn";
        case level::error:
            return "error";
    }
    return "info";
}

inline int parse_level(const std::string &s)
{
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "debug")
        return (int)level::debug;
    if (v == "info")
        return (int)level::info;
    if (v == "warn" || v == "warning")
        return (int)level::warn;
    if (v == "error" || v == "err")
        return (int)level::error;
    return (int)level::info;
}

// Environment is read once, on first use; explicit set_level()/set_json() afterwards win.
inline void load_env()
{
    std::call_once(g_env_once, [] {
        if (const char *lvl = std::getenv("URLPRM_LOG_LEVEL"))
            g_level.store(parse_level(lvl), std::memory_order_relaxed);
        if (std::getenv("URLPRM_LOG_JSON"))
            g_json.store(true, std::memory_order_relaxed);
    });
}
} // namespace detail

namespace detail_format {
// One argument as text: bools as words, floating point with max_digits10 so logged values compare bit-for-bit.
template <typename T>
inline std::string arg_text(const T &v)
{
    using U = std::decay_t<T>;
    if constexpr (std::is_same_v<U, bool>) {
        return v ? "true" : "false";
    } else if constexpr (std::is_floating_point_v<U>) {
        std::ostringstream oss;
        oss << std::setprecision(std::numeric_limits<U>::max_digits10) << v;
        return oss.str();
    } else if constexpr (std::is_arithmetic_v<U>) {
        return std::to_string(v);
    } else if constexpr (std::is_pointer_v<U>) {
        return v ? std::string(v) : std::string();
    } else {
        return std::string(std::string_view(v));
    }
}

// Replaces the next "{}" in rest; an argument with no placeholder left is dropped.
inline void substitute(std::string &out, std::string_view &rest, const std::string &value)
{
    size_t p = rest.find("{}");
    if (p == std::string_view::npos)
        return;
    out.append(rest.substr(0, p));
    out += value;
    rest.remove_prefix(p + 2);
}

template <typename... Args>
inline std::string tiny_format(std::string_view fmt, const Args &...args)
{
    std::string out;
    out.reserve(fmt.size() + sizeof...(Args) * 8);
    (substitute(out, fmt, arg_text(args)), ...);
    out.append(fmt);
    return out;
}
} // namespace detail_format

namespace detail {
inline void write_json(std::ostream &os, level lv, const std::tm &tm, std::string_view msg)
{
    os << R"({"ts":")" << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << R"(","level":")" << level_name(lv)
       << R"(","msg":")";
    for (char c : msg) {
        switch (c) {
            case '"':
            case '\\':
                os << '\\' << c;
                break;
            case '\n':
                os << "\\n";
                break;
            default:
                os << c;
        }
    }
    os << "\"}\n";
}

inline void write_text(std::ostream &os, level lv, const std::tm &tm, std::string_view msg)
{
    static constexpr char TAGS[] = {'D', 'I', 'W', 'E'};
    os << '[' << TAGS[static_cast<int>(lv)] << ' ' << std::put_time(&tm, "%H:%M:%S") << "] " << msg << '\n';
}

inline void emit(level lv, const std::string &msg)
{
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    {
        std::lock_guard lk(g_io_mtx);
        if (g_json.load(std::memory_order_relaxed))
            write_json(std::cerr, lv, tm, msg);
        else
            write_text(std::cerr, lv, tm, msg);
        std::cerr.flush();
    }
    if (auto cb = load_cb())
        cb(static_cast<int>(lv), msg.c_str(), g_cb_ud.load(std::memory_order_relaxed));
}
} // namespace detail

inline void set_level(level lv) noexcept
{
    detail::load_env();
    detail::g_level.store(static_cast<int>(lv), std::memory_order_relaxed);
}

inline void set_level(const std::string &name)
{
    set_level(static_cast<level>(detail::parse_level(name)));
}

inline void set_json(bool on) noexcept
{
    detail::load_env();
    detail::g_json.store(on, std::memory_order_relaxed);
}

inline bool enabled(level lv)
{
    detail::load_env();
    return static_cast<int>(lv) >= detail::g_level.load(std::memory_order_relaxed);
}

inline void set_callback(void (*cb)(int, const char *, void *), void *ud) noexcept
{
    detail::g_cb_ptr.store(reinterpret_cast<void *>(cb), std::memory_order_release);
    detail::g_cb_ud.store(ud, std::memory_order_release);
}

inline void write(level lv, std::string_view msg)
{
    if (enabled(lv))
        detail::emit(lv, std::string(msg));
}

// Formats only when the level passes.
template <typename... Args>
inline void writef(level lv, const char *fmt, const Args &...args)
{
    if (enabled(lv))
        detail::emit(lv, detail_format::tiny_format(fmt, args...));
}

inline void debug(std::string_view m) { write(level::debug, m); }
inline void info(std::string_view m) { write(level::info, m); }
inline void warn(std::string_view m) { write(level::warn, m); }
inline void error(std::string_view m) { write(level::error, m); }

template <typename... Args>
inline void debug(const char *fmt, const Args &...args)
{
    writef(level::debug, fmt, args...);
}

template <typename... Args>
inline void info(const char *fmt, const Args &...args)
{
    writef(level::info, fmt, args...);
}

template <typename... Args>
inline void warn(const char *fmt, const Args &...args)
{
    writef(level::warn, fmt, args...);
}

template <typename... Args>
inline void error(const char *fmt, const Args &...args)
{
    writef(level::error, fmt, args...);
}

} // namespace urlprm::log
