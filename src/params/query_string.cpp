// SPDX-License-Identifier: Apache-2.0
#include "params/query_string.hpp"

#include <algorithm>

namespace urlprm::params {

namespace {

bool is_unreserved(unsigned char c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_'
           || c == '.' || c == '~';
}

int hex_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    return -1;
}

std::string_view strip_prefix(std::string_view query)
{
    if (!query.empty() && (query.front() == '?' || query.front() == '#'))
        query.remove_prefix(1);
    return query;
}

// Calls fn(key, value) for every non-empty '&' separated entry.
template <typename Fn>
void for_each_entry(std::string_view query, Fn &&fn)
{
    query = strip_prefix(query);
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string_view::npos)
            amp = query.size();
        std::string_view entry = query.substr(pos, amp - pos);
        if (!entry.empty()) {
            size_t eq = entry.find('=');
            if (eq == std::string_view::npos)
                fn(percent_decode(entry), std::string());
            else
                fn(percent_decode(entry.substr(0, eq)), percent_decode(entry.substr(eq + 1)));
        }
        pos = amp + 1;
    }
}

void append_entry(std::string &out, const std::string &key, const std::string *value)
{
    if (!out.empty())
        out.push_back('&');
    out += percent_encode(key);
    if (value) {
        out.push_back('=');
        out += percent_encode(*value);
    }
}

} // namespace

std::string percent_encode(std::string_view s)
{
    static constexpr char HEX[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (char ch : s) {
        auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c)) {
            out.push_back(ch);
        } else {
            out.push_back('%');
            out.push_back(HEX[c >> 4]);
            out.push_back(HEX[c & 0x0f]);
        }
    }
    return out;
}

std::string percent_decode(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < s.size() && hex_value(s[i + 1]) >= 0 && hex_value(s[i + 2]) >= 0) {
            out.push_back(static_cast<char>(hex_value(s[i + 1]) * 16 + hex_value(s[i + 2])));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string serialize_params(const ParamMap &params)
{
    std::string out;
    for (const auto &[key, value] : params) {
        if (!value)
            continue;
        append_entry(out, key, value->empty() ? nullptr : &*value);
    }
    return out;
}

ParamMap parse_params(std::string_view query)
{
    ParamMap out;
    for_each_entry(query, [&out](std::string key, std::string value) { out[std::move(key)] = std::move(value); });
    return out;
}

std::string serialize_multi_params(const MultiParamMap &params)
{
    std::string out;
    for (const auto &[key, values] : params)
        for (const auto &v : values)
            if (!v.empty())
                append_entry(out, key, &v);
    for (const auto &[key, values] : params)
        if (std::find(values.begin(), values.end(), std::string()) != values.end())
            append_entry(out, key, nullptr);
    return out;
}

MultiParamMap parse_multi_params(std::string_view query)
{
    MultiParamMap out;
    for_each_entry(query, [&out](std::string key, std::string value) { out[std::move(key)].push_back(std::move(value)); });
    return out;
}

} // namespace urlprm::params
