#ifndef SERVICE_CONFIG_HPP
#define SERVICE_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace cryptostats::util {

struct ServiceConfig {
    std::uint16_t            port = 8080;
    std::string              dataDir = "prices";
    std::vector<std::string> files = {
        "BTC_values.csv",
        "DOGE_values.csv",
        "ETH_values.csv",
        "LTC_values.csv",
        "XRP_values.csv"
    };

    // requests allowed per client address per window
    std::uint32_t        rateLimit = 10;
    std::chrono::seconds rateWindow{60};

    std::string logLevel = "info";

    // --port N, --data-dir DIR, --files A.csv,B.csv, --rate-limit N,
    // --rate-window SECONDS, --log-level LEVEL; "--key=value" also accepted.
    // Throws std::invalid_argument on unknown flags or bad values.
    static ServiceConfig from_args(int argc, const char* const argv[]);
};

}

#endif
