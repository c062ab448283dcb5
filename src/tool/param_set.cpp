// SPDX-License-Identifier: Apache-2.0
#include "tool/param_set.hpp"

#include "codec/errors.hpp"
#include "params/query_string.hpp"

#include <cmath>

namespace urlprm::tool {

namespace {

std::vector<double> parse_list(const std::string &text)
{
    std::vector<double> out;
    if (text.empty())
        return out;
    size_t pos = 0;
    while (true) {
        size_t comma = text.find(',', pos);
        out.push_back(params::strict::parse_decimal(std::string_view(text).substr(pos, comma - pos)));
        if (comma == std::string::npos)
            break;
        pos = comma + 1;
    }
    return out;
}

// Lossless payloads can carry inf/nan bit patterns; print those instead of rejecting them.
std::string format_number(double v)
{
    if (std::isnan(v))
        return "nan";
    if (std::isinf(v))
        return v < 0 ? "-inf" : "inf";
    return params::strict::format_decimal(v, std::nullopt);
}

std::string format_list(const std::vector<double> &values)
{
    std::string out;
    for (double v : values) {
        if (!out.empty())
            out.push_back(',');
        out += format_number(v);
    }
    return out;
}

std::optional<codec::Point> parse_point(const std::string &text)
{
    if (text == "none")
        return std::nullopt;
    auto xy = parse_list(text);
    if (xy.size() != 2)
        throw codec::FormatError("point value '" + text + "' needs x,y");
    return codec::Point{xy[0], xy[1]};
}

std::string format_point(const std::optional<codec::Point> &p)
{
    if (!p)
        return "none";
    return format_list({p->x, p->y});
}

} // namespace

ParamSet::ParamSet(const std::vector<ParamSpec> &specs)
{
    m_entries.reserve(specs.size());
    for (const auto &spec : specs) {
        Entry e;
        e.key = spec.key;
        e.kind = spec.kind;
        switch (spec.kind) {
            case ParamKind::single_float:
                e.single = params::float_param(spec.float_opts);
                break;
            case ParamKind::point:
                e.point = params::point_param(spec.point_opts);
                break;
            case ParamKind::floats:
                e.multi = params::multi_float_param(spec.floats_default, spec.float_opts);
                break;
        }
        m_entries.push_back(std::move(e));
    }
}

const ParamSet::Entry *ParamSet::find(const std::string &key) const
{
    for (const auto &e : m_entries)
        if (e.key == key)
            return &e;
    return nullptr;
}

std::string ParamSet::encode(const std::vector<Assignment> &assignments) const
{
    params::MultiParamMap out;
    for (const auto &[key, text] : assignments) {
        const Entry *e = find(key);
        if (!e)
            throw codec::FormatError("unknown param key '" + key + "'");
        switch (e->kind) {
            case ParamKind::single_float:
                if (auto enc = e->single->encode(params::strict::parse_decimal(text)))
                    out[key] = {*enc};
                else
                    out.erase(key);
                break;
            case ParamKind::point:
                if (auto enc = e->point->encode(parse_point(text)))
                    out[key] = {*enc};
                else
                    out.erase(key);
                break;
            case ParamKind::floats:
                out[key] = e->multi->encode(parse_list(text));
                break;
        }
    }
    return params::serialize_multi_params(out);
}

std::vector<Assignment> ParamSet::decode(std::string_view query) const
{
    auto parsed = params::parse_multi_params(query);
    std::vector<Assignment> out;
    out.reserve(m_entries.size());
    for (const auto &e : m_entries) {
        auto it = parsed.find(e.key);
        std::optional<std::string> single;
        if (it != parsed.end() && !it->second.empty())
            single = it->second.back();
        switch (e.kind) {
            case ParamKind::single_float:
                out.emplace_back(e.key, format_number(e.single->decode(single)));
                break;
            case ParamKind::point:
                out.emplace_back(e.key, format_point(e.point->decode(single)));
                break;
            case ParamKind::floats:
                out.emplace_back(e.key,
                                 format_list(e.multi->decode(it != parsed.end() ? it->second
                                                                                 : std::vector<std::string>{})));
                break;
        }
    }
    return out;
}

} // namespace urlprm::tool
