#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include "../common/Config.hpp"
#include "../common/ScanTypes.hpp"
#include "../scanner/DeviceFilter.hpp"
#include "../scanner/Enricher.hpp"
#include "../scanner/InterfaceResolver.hpp"
#include "../scanner/Prober.hpp"

namespace arp_presence::presence
{
    // resolve target -> probe -> enrich -> filter, once per call.
    class ScanPipeline
    {
    public:
        using ClockFn = std::function<common::Timestamp()>;

        ScanPipeline(const common::ScanConfig &config,
                     const scanner::InterfaceResolver &resolver,
                     scanner::Prober &prober,
                     const scanner::Enricher &enricher,
                     ClockFn clock = common::Clock::now);

        common::ScanSnapshot RunOnce();

    private:
        std::optional<std::string> m_interface;
        std::optional<std::string> m_network;
        std::chrono::milliseconds m_timeout;

        const scanner::InterfaceResolver &m_resolver;
        scanner::Prober &m_prober;
        const scanner::Enricher &m_enricher;
        scanner::DeviceFilter m_filter;
        ClockFn m_clock;
    };
}
