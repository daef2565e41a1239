#include "ScanPipeline.hpp"
#include <iostream>

namespace arp_presence::presence
{
    ScanPipeline::ScanPipeline(const common::ScanConfig &config,
                               const scanner::InterfaceResolver &resolver,
                               scanner::Prober &prober,
                               const scanner::Enricher &enricher,
                               ClockFn clock)
        : m_interface(config.interface),
          m_network(config.network),
          m_timeout(static_cast<long long>(config.timeout_seconds * 1000.0)),
          m_resolver(resolver),
          m_prober(prober),
          m_enricher(enricher),
          m_filter(config.include, config.exclude),
          m_clock(std::move(clock))
    {
    }

    common::ScanSnapshot ScanPipeline::RunOnce()
    {
        common::ScanSnapshot snapshot;

        std::string reason;
        auto target = m_resolver.ResolveTarget(m_interface, m_network, reason);
        if (!target.has_value())
        {
            std::cerr << "[Scheduler] No scan target: " << reason << "\n";
            snapshot.taken_at = m_clock();
            snapshot.condition = common::ScanCondition::TargetUnresolved;
            snapshot.detail = reason;
            return snapshot;
        }
        snapshot.target = *target;

        common::ProbeOutcome outcome = m_prober.Probe(*target, m_timeout);
        snapshot.taken_at = m_clock();
        snapshot.condition = outcome.condition;
        snapshot.detail = outcome.detail;

        auto enriched = m_enricher.Enrich(outcome.results);
        auto devices = m_filter.Apply(enriched);
        if (devices.size() < enriched.size())
        {
            std::cout << "[Filter] Kept " << devices.size() << " of " << enriched.size() << " devices\n";
        }

        for (auto &device : devices)
        {
            std::string mac = device.mac;
            snapshot.devices.emplace(std::move(mac), std::move(device));
        }

        return snapshot;
    }
}
