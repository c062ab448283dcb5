// SPDX-License-Identifier: Apache-2.0
// urlprm command-line tool: encode typed values into a URL query string, or decode one back, using the params
// declared in a YAML file.
#include "codec/errors.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "tool/config.hpp"
#include "tool/param_set.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

bool ends_with(const std::string &s, const std::string &suffix)
{
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void usage()
{
    std::cerr << "usage: urlprm [config.yaml] [--stats] [--log-level <lvl>] encode key=value...\n"
                 "       urlprm [config.yaml] [--stats] [--log-level <lvl>] decode <query>\n";
}

} // namespace

int main(int argc, char **argv)
{
    std::string config_path = "config/urlprm.yaml";
    std::string cli_log_level;
    bool cli_stats = false;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--stats") {
            cli_stats = true;
        } else if (a == "--log-level" && i + 1 < argc) {
            cli_log_level = argv[++i];
        } else if (a == "--help" || a == "-h") {
            usage();
            return 0;
        } else if (positional.empty() && (ends_with(a, ".yaml") || ends_with(a, ".yml"))) {
            config_path = a;
        } else {
            positional.push_back(a);
        }
    }
    if (positional.empty()) {
        usage();
        return 2;
    }

    urlprm::tool::ToolConfig cfg;
    try {
        cfg = urlprm::tool::load_config(config_path);
    } catch (const std::exception &ex) {
        urlprm::log::error("Failed to load config {}: {}", config_path, ex.what());
        return 1;
    }
    // Environment (URLPRM_LOG_LEVEL) beats the file, the command line beats both.
    if (!cli_log_level.empty())
        urlprm::log::set_level(cli_log_level);
    else if (std::getenv("URLPRM_LOG_LEVEL") == nullptr)
        urlprm::log::set_level(cfg.log_level);
    if (cfg.log_json)
        urlprm::log::set_json(true);
    urlprm::log::debug("Loaded {} params from {}", cfg.params.size(), config_path);
    for (const auto &p : cfg.params)
        urlprm::log::debug("  param '{}' kind={}", p.key, urlprm::tool::kind_name(p.kind));

    const std::string &command = positional[0];
    int rc = 0;
    try {
        urlprm::tool::ParamSet set(cfg.params);
        if (command == "encode") {
            std::vector<urlprm::tool::Assignment> assignments;
            for (size_t i = 1; i < positional.size(); ++i) {
                const auto &arg = positional[i];
                auto eq = arg.find('=');
                if (eq == std::string::npos) {
                    urlprm::log::error("Expected key=value, got '{}'", arg);
                    return 2;
                }
                assignments.emplace_back(arg.substr(0, eq), arg.substr(eq + 1));
            }
            std::cout << set.encode(assignments) << std::endl;
        } else if (command == "decode") {
            std::string query = positional.size() > 1 ? positional[1] : std::string();
            for (const auto &[key, value] : set.decode(query))
                std::cout << key << '=' << value << '\n';
            std::cout.flush();
        } else {
            urlprm::log::error("Unknown command '{}'", command);
            usage();
            rc = 1;
        }
    } catch (const urlprm::codec::RangeError &ex) {
        urlprm::log::error("Value out of range: {}", ex.what());
        rc = 1;
    } catch (const urlprm::codec::FormatError &ex) {
        urlprm::log::error("{}", ex.what());
        rc = 1;
    }

    if (cli_stats || cfg.print_stats)
        std::cerr << urlprm::metrics::dump();
    return rc;
}
