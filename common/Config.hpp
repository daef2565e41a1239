#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace arp_presence::common
{
    inline constexpr int DEFAULT_SCAN_INTERVAL_SECONDS = 15;
    inline constexpr int DEFAULT_CONSIDER_HOME_SECONDS = 180;
    inline constexpr double DEFAULT_TIMEOUT_SECONDS = 1.0;
    inline constexpr double DEFAULT_HOSTNAME_TIMEOUT_SECONDS = 2.0;
    inline constexpr bool DEFAULT_RESOLVE_HOSTNAMES = true;

    inline constexpr int MIN_SCAN_INTERVAL_SECONDS = 5;
    inline constexpr int MAX_SCAN_INTERVAL_SECONDS = 300;
    inline constexpr int MIN_CONSIDER_HOME_SECONDS = 10;
    inline constexpr int MAX_CONSIDER_HOME_SECONDS = 600;
    inline constexpr double MIN_TIMEOUT_SECONDS = 0.5;
    inline constexpr double MAX_TIMEOUT_SECONDS = 10.0;
    inline constexpr double MIN_HOSTNAME_TIMEOUT_SECONDS = 0.1;
    inline constexpr double MAX_HOSTNAME_TIMEOUT_SECONDS = 10.0;

    // Largest network a single cycle will sweep (65536 addresses).
    inline constexpr int MIN_NETWORK_PREFIX = 16;

    class ConfigError : public std::runtime_error
    {
    public:
        explicit ConfigError(const std::string &message) : std::runtime_error(message) {}
    };

    struct ScanConfig
    {
        std::optional<std::string> interface;
        std::optional<std::string> network;

        int scan_interval_seconds = DEFAULT_SCAN_INTERVAL_SECONDS;
        int consider_home_seconds = DEFAULT_CONSIDER_HOME_SECONDS;
        double timeout_seconds = DEFAULT_TIMEOUT_SECONDS;

        bool resolve_hostnames = DEFAULT_RESOLVE_HOSTNAMES;
        double hostname_timeout_seconds = DEFAULT_HOSTNAME_TIMEOUT_SECONDS;

        std::vector<std::string> include;
        std::vector<std::string> exclude;

        std::optional<std::string> oui_database_path;
        std::optional<std::string> import_oui_csv;

        bool run_once = false;
        bool show_help = false;
    };

    ScanConfig ParseArguments(int argc, char *argv[]);
    void ValidateConfig(const ScanConfig &config);

    // Splits "a, b,,c" into {"a", "b", "c"}.
    std::vector<std::string> SplitAddressList(const std::string &text);

    // Picks "--interface=X" and a bare CIDR token out of an arp-scan option
    // string. Fields already set on the config are left alone.
    void ApplyLegacyScanOptions(ScanConfig &config, const std::string &scan_options);

    std::string Usage(const std::string &program);
}
