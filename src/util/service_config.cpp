#include "cryptostats/util/service_config.hpp"

#include <limits>
#include <sstream>
#include <stdexcept>

namespace cryptostats::util {

namespace {

unsigned long parse_unsigned(const std::string& flag, const std::string& value, unsigned long max)
{
    std::size_t used = 0;
    unsigned long parsed = 0;
    try {
        parsed = std::stoul(value, &used);
    }
    catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
    }
    if (used != value.size() || value[0] == '-' || parsed == 0 || parsed > max) {
        throw std::invalid_argument(flag + " out of range: '" + value + "'");
    }
    return parsed;
}

std::vector<std::string> split_list(const std::string& flag, const std::string& value)
{
    std::vector<std::string> items;
    std::istringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) items.push_back(item);
    }
    if (items.empty()) {
        throw std::invalid_argument(flag + " needs at least one file name");
    }
    return items;
}

bool is_log_level(const std::string& level)
{
    static const char* const LEVELS[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    for (const char* known : LEVELS) {
        if (level == known) return true;
    }
    return false;
}

}

ServiceConfig ServiceConfig::from_args(int argc, const char* const argv[])
{
    ServiceConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string flag = argv[i];
        std::string value;

        const auto eq = flag.find('=');
        if (eq != std::string::npos) {
            value = flag.substr(eq + 1);
            flag.erase(eq);
        }
        else {
            if (i + 1 >= argc) {
                throw std::invalid_argument(flag + " requires a value");
            }
            value = argv[++i];
        }

        if (value.empty()) {
            throw std::invalid_argument(flag + " requires a value");
        }

        if (flag == "--port") {
            config.port = static_cast<std::uint16_t>(
                parse_unsigned(flag, value, std::numeric_limits<std::uint16_t>::max()));
        }
        else if (flag == "--data-dir") {
            config.dataDir = value;
        }
        else if (flag == "--files") {
            config.files = split_list(flag, value);
        }
        else if (flag == "--rate-limit") {
            config.rateLimit = static_cast<std::uint32_t>(
                parse_unsigned(flag, value, std::numeric_limits<std::uint32_t>::max()));
        }
        else if (flag == "--rate-window") {
            config.rateWindow = std::chrono::seconds(
                parse_unsigned(flag, value, std::numeric_limits<std::uint32_t>::max()));
        }
        else if (flag == "--log-level") {
            if (!is_log_level(value)) {
                throw std::invalid_argument("unknown log level '" + value + "'");
            }
            config.logLevel = value;
        }
        else {
            throw std::invalid_argument("unknown option " + flag);
        }
    }

    return config;
}

}
