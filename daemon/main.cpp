#include "../common/Config.hpp"
#include "../presence/PresenceTracker.hpp"
#include "../presence/ScanPipeline.hpp"
#include "../presence/ScanScheduler.hpp"
#include "../scanner/ArpProber.hpp"
#include "../scanner/Enricher.hpp"
#include "../scanner/HostnameResolver.hpp"
#include "../scanner/InterfaceResolver.hpp"
#include "../scanner/OuiDatabase.hpp"
#include <chrono>
#include <csignal>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <thread>

using namespace arp_presence;

namespace
{
    volatile std::sig_atomic_t g_stop_requested = 0;

    void HandleSignal(int)
    {
        g_stop_requested = 1;
    }

    std::string FormatTimestamp(const std::optional<common::Timestamp> &timestamp)
    {
        if (!timestamp.has_value())
            return "-";

        std::time_t t = common::Clock::to_time_t(*timestamp);
        std::tm local;
        localtime_r(&t, &local);

        std::ostringstream out;
        out << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
        return out.str();
    }

    void PrintReport(const std::vector<presence::DeviceStatus> &report)
    {
        std::cout << std::left
                  << std::setw(19) << "MAC"
                  << std::setw(17) << "IP"
                  << std::setw(7) << "STATE"
                  << std::setw(21) << "LAST SEEN"
                  << std::setw(28) << "VENDOR"
                  << "NAME\n";

        for (const auto &status : report)
        {
            std::cout << std::setw(19) << status.device.mac
                      << std::setw(17) << status.device.ip
                      << std::setw(7) << presence::ToString(status.state)
                      << std::setw(21) << FormatTimestamp(status.last_seen)
                      << std::setw(28) << status.device.vendor
                      << common::DisplayName(status.device) << "\n";
        }
        std::cout << std::right;
    }

    int ImportVendors(const common::ScanConfig &config)
    {
        if (!config.oui_database_path.has_value())
        {
            std::cerr << "[Daemon] --import-oui needs --oui-db to name the database file\n";
            return 1;
        }

        scanner::OuiDatabase db;
        if (!db.Open(*config.oui_database_path))
            return 1;

        int loaded = db.ImportCsv(*config.import_oui_csv);
        return loaded < 0 ? 1 : 0;
    }

    std::shared_ptr<scanner::VendorLookup> OpenVendors(const common::ScanConfig &config)
    {
        if (!config.oui_database_path.has_value())
        {
            std::cout << "[Daemon] No vendor database configured, vendors will be reported as Unknown\n";
            return std::make_shared<scanner::NullVendorLookup>();
        }

        auto db = std::make_shared<scanner::OuiDatabase>();
        if (!db->Open(*config.oui_database_path))
        {
            std::cerr << "[Daemon] Vendor database unavailable, vendors will be reported as Unknown\n";
            return std::make_shared<scanner::NullVendorLookup>();
        }

        std::cout << "[Daemon] Vendor database has " << db->Count() << " entries\n";
        return db;
    }
}

int main(int argc, char *argv[])
{
    common::ScanConfig config;
    try
    {
        config = common::ParseArguments(argc, argv);
        if (config.show_help)
        {
            std::cout << common::Usage(argv[0]);
            return 0;
        }
        common::ValidateConfig(config);
    }
    catch (const common::ConfigError &e)
    {
        std::cerr << "[Config] " << e.what() << "\n"
                  << common::Usage(argv[0]);
        return 1;
    }

    if (config.import_oui_csv.has_value())
        return ImportVendors(config);

    scanner::InterfaceResolver resolver;
    if (!config.interface.has_value())
    {
        std::cout << "[Daemon] Usable interfaces:";
        for (const auto &name : resolver.ListUsableInterfaces())
            std::cout << " " << name;
        std::cout << "\n";
    }

    std::shared_ptr<scanner::HostnameResolver> hostnames;
    if (config.resolve_hostnames)
    {
        auto timeout = std::chrono::milliseconds(static_cast<long long>(config.hostname_timeout_seconds * 1000.0));
        hostnames = std::make_shared<scanner::ReverseDnsResolver>(timeout);
    }
    else
    {
        hostnames = std::make_shared<scanner::NullHostnameResolver>();
    }

    scanner::ArpProber prober;
    scanner::Enricher enricher(OpenVendors(config), hostnames, config.resolve_hostnames);
    presence::ScanPipeline pipeline(config, resolver, prober, enricher);
    presence::PresenceTracker tracker(std::chrono::seconds(config.consider_home_seconds));
    presence::ScanScheduler scheduler(pipeline, tracker, std::chrono::seconds(config.scan_interval_seconds));

    try
    {
        scheduler.Setup();
    }
    catch (const presence::SetupError &e)
    {
        std::cerr << "[Daemon] Setup failed: " << e.what() << "\n";
        return 1;
    }

    if (config.run_once)
    {
        PrintReport(tracker.Report(common::Clock::now()));
        return 0;
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    scheduler.Start([](const common::ScanSnapshot &, const std::vector<presence::PresenceChange> &changes)
                    {
                        if (!changes.empty())
                            std::cout << "[Daemon] " << changes.size() << " presence changes this cycle\n";
                    });

    std::cout << "[Daemon] Running. Consider-home window " << config.consider_home_seconds << "s\n";

    auto last_evaluation = std::chrono::steady_clock::now();
    while (!g_stop_requested)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        auto now = std::chrono::steady_clock::now();
        if (now - last_evaluation < std::chrono::seconds(1))
            continue;
        last_evaluation = now;

        for (const auto &change : tracker.Evaluate(common::Clock::now()))
        {
            std::cout << "[Presence] " << change.mac << " (" << change.device.ip << ") "
                      << presence::ToString(change.from) << " -> " << presence::ToString(change.to) << "\n";
        }
    }

    std::cout << "[Daemon] Stopping\n";
    scheduler.Stop();
    PrintReport(tracker.Report(common::Clock::now()));
    return 0;
}
