// SPDX-License-Identifier: Apache-2.0
#include "tool/config.hpp"

#include "codec/errors.hpp"
#include "codec/precision.hpp"

namespace urlprm::tool {

namespace {

params::FloatEncoding parse_encoding(const std::string &name)
{
    if (name == "base64")
        return params::FloatEncoding::base64;
    if (name == "string")
        return params::FloatEncoding::string;
    throw codec::FormatError("config: unknown encoding '" + name + "' (expected base64|string)");
}

ParamSpec parse_param(const YAML::Node &node)
{
    ParamSpec spec;
    if (!node["key"])
        throw codec::FormatError("config: param entry without 'key'");
    spec.key = node["key"].as<std::string>();
    if (spec.key.empty())
        throw codec::FormatError("config: empty param key");
    if (node["kind"])
        spec.kind = parse_kind(node["kind"].as<std::string>());

    // Points default to base64 with DEFAULT_SCHEME; float kinds default to decimal text.
    std::optional<params::FloatEncoding> encoding;
    if (node["encoding"])
        encoding = parse_encoding(node["encoding"].as<std::string>());
    std::optional<codec::PrecisionScheme> precision;
    if (node["precision"])
        precision = codec::parse_precision(node["precision"].as<std::string>());
    std::optional<int> decimals;
    if (node["decimals"])
        decimals = node["decimals"].as<int>();

    switch (spec.kind) {
        case ParamKind::single_float:
        case ParamKind::floats:
            if (encoding)
                spec.float_opts.encoding = *encoding;
            spec.float_opts.precision = precision;
            spec.float_opts.decimals = decimals;
            if (node["default"]) {
                if (spec.kind == ParamKind::single_float)
                    spec.float_opts.default_value = node["default"].as<double>();
                else
                    spec.floats_default = node["default"].as<std::vector<double>>();
            }
            spec.float_opts.validate();
            break;
        case ParamKind::point:
            if (encoding)
                spec.point_opts.encoding = *encoding;
            if (node["precision"])
                spec.point_opts.precision = precision;
            else if (node["lossless"] && node["lossless"].as<bool>())
                spec.point_opts.precision.reset();
            spec.point_opts.decimals = decimals;
            if (node["default"]) {
                auto xy = node["default"].as<std::vector<double>>();
                if (xy.size() != 2)
                    throw codec::FormatError("config: point default for '" + spec.key + "' needs [x, y]");
                spec.point_opts.default_value = codec::Point{xy[0], xy[1]};
            }
            spec.point_opts.validate();
            break;
    }
    return spec;
}

} // namespace

ParamKind parse_kind(const std::string &name)
{
    if (name == "float")
        return ParamKind::single_float;
    if (name == "point")
        return ParamKind::point;
    if (name == "floats")
        return ParamKind::floats;
    throw codec::FormatError("config: unknown param kind '" + name + "' (expected float|point|floats)");
}

const char *kind_name(ParamKind kind) noexcept
{
    switch (kind) {
        case ParamKind::single_float:
            return "float";
        case ParamKind::point:
            return "point";
        case ParamKind::floats:
            return "floats";
    }
    return "float";
}

ToolConfig parse_config(const YAML::Node &root)
{
    ToolConfig cfg;
    if (root["log_level"])
        cfg.log_level = root["log_level"].as<std::string>();
    if (root["log_json"])
        cfg.log_json = root["log_json"].as<bool>();
    if (root["print_stats"])
        cfg.print_stats = root["print_stats"].as<bool>();
    if (root["params"]) {
        for (const auto &node : root["params"]) {
            auto spec = parse_param(node);
            for (const auto &existing : cfg.params)
                if (existing.key == spec.key)
                    throw codec::FormatError("config: duplicate param key '" + spec.key + "'");
            cfg.params.push_back(std::move(spec));
        }
    }
    return cfg;
}

ToolConfig load_config(const std::string &path)
{
    return parse_config(YAML::LoadFile(path));
}

} // namespace urlprm::tool
