// SPDX-License-Identifier: Apache-2.0
// query_string.hpp
// key=value&key2 serialization for single and repeated keys. Never throws on malformed input.
#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace urlprm::params {

using Encoded = std::optional<std::string>; // nullopt: key absent, "": valueless key (?z)
using ParamMap = std::map<std::string, Encoded>;
using MultiParamMap = std::map<std::string, std::vector<std::string>>;

// Unreserved characters (A-Z a-z 0-9 - _ . ~) pass through, everything else becomes %XX.
std::string percent_encode(std::string_view s);
// %XX and '+' (space) decoded; malformed escapes are kept literally.
std::string percent_decode(std::string_view s);

// Absent values skipped, "" written as a bare key.
std::string serialize_params(const ParamMap &params);
// Leading '?' or '#' ignored; a key without '=' maps to ""; the last duplicate wins.
ParamMap parse_params(std::string_view query);

// Repeated keys in order; valueless entries are appended after all valued ones.
std::string serialize_multi_params(const MultiParamMap &params);
MultiParamMap parse_multi_params(std::string_view query);

} // namespace urlprm::params
