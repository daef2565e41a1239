#include "Config.hpp"
#include "Ipv4Network.hpp"
#include <sstream>

namespace arp_presence::common
{
    namespace
    {
        std::string Trim(const std::string &text)
        {
            const char *whitespace = " \t\r\n";
            auto first = text.find_first_not_of(whitespace);
            if (first == std::string::npos)
                return "";
            auto last = text.find_last_not_of(whitespace);
            return text.substr(first, last - first + 1);
        }

        int ParseInt(const std::string &flag, const std::string &value)
        {
            try
            {
                size_t consumed = 0;
                int parsed = std::stoi(value, &consumed);
                if (consumed != value.size())
                    throw ConfigError(flag + " expects an integer, got '" + value + "'");
                return parsed;
            }
            catch (const std::logic_error &)
            {
                throw ConfigError(flag + " expects an integer, got '" + value + "'");
            }
        }

        double ParseDouble(const std::string &flag, const std::string &value)
        {
            try
            {
                size_t consumed = 0;
                double parsed = std::stod(value, &consumed);
                if (consumed != value.size())
                    throw ConfigError(flag + " expects a number, got '" + value + "'");
                return parsed;
            }
            catch (const std::logic_error &)
            {
                throw ConfigError(flag + " expects a number, got '" + value + "'");
            }
        }

        void AppendAll(std::vector<std::string> &target, const std::vector<std::string> &items)
        {
            target.insert(target.end(), items.begin(), items.end());
        }

        template <typename T>
        void CheckRange(const std::string &name, T value, T min, T max)
        {
            if (value < min || value > max)
            {
                std::ostringstream out;
                out << name << " must be between " << min << " and " << max << ", got " << value;
                throw ConfigError(out.str());
            }
        }

        void CheckAddressList(const std::string &name, const std::vector<std::string> &addresses)
        {
            for (const auto &address : addresses)
            {
                if (!ParseIpv4(address).has_value())
                    throw ConfigError(name + " entry '" + address + "' is not an IPv4 address");
            }
        }
    }

    std::vector<std::string> SplitAddressList(const std::string &text)
    {
        std::vector<std::string> items;
        std::stringstream ss(text);
        std::string item;

        while (std::getline(ss, item, ','))
        {
            item = Trim(item);
            if (!item.empty())
                items.push_back(item);
        }
        return items;
    }

    void ApplyLegacyScanOptions(ScanConfig &config, const std::string &scan_options)
    {
        const std::string interface_flag = "--interface=";
        // Options without an explicit interface are left to autodetection.
        if (scan_options.find(interface_flag) == std::string::npos)
            return;

        std::stringstream ss(scan_options);
        std::string part;

        while (ss >> part)
        {
            if (part.rfind(interface_flag, 0) == 0)
            {
                if (!config.interface.has_value())
                    config.interface = part.substr(interface_flag.size());
            }
            else if (part.find('/') != std::string::npos && part.find('.') != std::string::npos)
            {
                if (!config.network.has_value())
                    config.network = part;
            }
        }
    }

    ScanConfig ParseArguments(int argc, char *argv[])
    {
        ScanConfig config;
        std::optional<std::string> legacy_options;

        for (int i = 1; i < argc; ++i)
        {
            std::string flag = argv[i];

            auto next_value = [&]() -> std::string
            {
                if (i + 1 >= argc)
                    throw ConfigError(flag + " requires a value");
                return argv[++i];
            };

            if (flag == "--help" || flag == "-h")
                config.show_help = true;
            else if (flag == "--interface" || flag == "-i")
                config.interface = next_value();
            else if (flag == "--network" || flag == "-n")
                config.network = next_value();
            else if (flag == "--scan-interval")
                config.scan_interval_seconds = ParseInt(flag, next_value());
            else if (flag == "--consider-home")
                config.consider_home_seconds = ParseInt(flag, next_value());
            else if (flag == "--timeout")
                config.timeout_seconds = ParseDouble(flag, next_value());
            else if (flag == "--hostname-timeout")
                config.hostname_timeout_seconds = ParseDouble(flag, next_value());
            else if (flag == "--no-hostnames")
                config.resolve_hostnames = false;
            else if (flag == "--include")
                AppendAll(config.include, SplitAddressList(next_value()));
            else if (flag == "--exclude")
                AppendAll(config.exclude, SplitAddressList(next_value()));
            else if (flag == "--oui-db")
                config.oui_database_path = next_value();
            else if (flag == "--import-oui")
                config.import_oui_csv = next_value();
            else if (flag == "--scan-options")
                legacy_options = next_value();
            else if (flag == "--once")
                config.run_once = true;
            else
                throw ConfigError("Unknown option '" + flag + "'");
        }

        if (legacy_options.has_value())
            ApplyLegacyScanOptions(config, *legacy_options);

        return config;
    }

    void ValidateConfig(const ScanConfig &config)
    {
        CheckRange("scan interval", config.scan_interval_seconds,
                   MIN_SCAN_INTERVAL_SECONDS, MAX_SCAN_INTERVAL_SECONDS);
        CheckRange("consider home", config.consider_home_seconds,
                   MIN_CONSIDER_HOME_SECONDS, MAX_CONSIDER_HOME_SECONDS);
        CheckRange("timeout", config.timeout_seconds,
                   MIN_TIMEOUT_SECONDS, MAX_TIMEOUT_SECONDS);
        CheckRange("hostname timeout", config.hostname_timeout_seconds,
                   MIN_HOSTNAME_TIMEOUT_SECONDS, MAX_HOSTNAME_TIMEOUT_SECONDS);

        if (config.interface.has_value() && config.interface->empty())
            throw ConfigError("interface must not be empty");

        if (config.network.has_value())
        {
            auto network = Ipv4Network::Parse(*config.network);
            if (!network.has_value())
                throw ConfigError("network '" + *config.network + "' is not an IPv4 CIDR");
            if (network->Prefix() < MIN_NETWORK_PREFIX)
                throw ConfigError("network '" + *config.network + "' is larger than /" +
                                  std::to_string(MIN_NETWORK_PREFIX));
        }

        CheckAddressList("include", config.include);
        CheckAddressList("exclude", config.exclude);
    }

    std::string Usage(const std::string &program)
    {
        std::ostringstream out;
        out << "Usage: " << program << " [options]\n"
            << "  -i, --interface <name>      interface to probe (default: default route)\n"
            << "  -n, --network <cidr>        network to probe (default: from interface)\n"
            << "  --scan-interval <seconds>   " << MIN_SCAN_INTERVAL_SECONDS << "-" << MAX_SCAN_INTERVAL_SECONDS
            << " (default " << DEFAULT_SCAN_INTERVAL_SECONDS << ")\n"
            << "  --consider-home <seconds>   " << MIN_CONSIDER_HOME_SECONDS << "-" << MAX_CONSIDER_HOME_SECONDS
            << " (default " << DEFAULT_CONSIDER_HOME_SECONDS << ")\n"
            << "  --timeout <seconds>         " << MIN_TIMEOUT_SECONDS << "-" << MAX_TIMEOUT_SECONDS
            << " (default " << DEFAULT_TIMEOUT_SECONDS << ")\n"
            << "  --hostname-timeout <sec>    reverse lookup bound (default " << DEFAULT_HOSTNAME_TIMEOUT_SECONDS << ")\n"
            << "  --no-hostnames              skip reverse name resolution\n"
            << "  --include <ip,ip,...>       only track these addresses\n"
            << "  --exclude <ip,ip,...>       ignore these addresses (unused with --include)\n"
            << "  --oui-db <path>             SQLite vendor database\n"
            << "  --import-oui <oui.csv>      fill --oui-db from an IEEE CSV and exit\n"
            << "  --scan-options <string>     legacy arp-scan options (--interface=X, CIDR)\n"
            << "  --once                      run one cycle, print devices and exit\n";
        return out.str();
    }
}
