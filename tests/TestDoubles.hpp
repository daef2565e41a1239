#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "../scanner/HostnameResolver.hpp"
#include "../scanner/InterfaceResolver.hpp"
#include "../scanner/Prober.hpp"
#include "../scanner/VendorLookup.hpp"

namespace arp_presence::test_support
{
    // Resolver that never touches the host: a fixed default interface and
    // per-interface networks.
    class StaticInterfaceResolver : public scanner::InterfaceResolver
    {
    public:
        StaticInterfaceResolver(std::optional<std::string> default_interface,
                                std::map<std::string, std::string> networks)
            : scanner::InterfaceResolver("/nonexistent/route", "/nonexistent/net"),
              m_default(std::move(default_interface)),
              m_networks(std::move(networks))
        {
        }

        std::optional<std::string> ResolveNetwork(const std::string &interface) const override
        {
            auto it = m_networks.find(interface);
            if (it == m_networks.end())
                return std::nullopt;
            return it->second;
        }

        std::optional<std::string> ResolveDefaultInterface() const override { return m_default; }

    private:
        std::optional<std::string> m_default;
        std::map<std::string, std::string> m_networks;
    };

    // Replays queued outcomes; repeats the last one when the queue runs dry.
    class ScriptedProber : public scanner::Prober
    {
    public:
        void Push(common::ProbeOutcome outcome)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_outcomes.push_back(std::move(outcome));
        }

        void SetDelay(std::chrono::milliseconds delay) { m_delay = delay; }

        common::ProbeOutcome Probe(const common::NetworkTarget &target, std::chrono::milliseconds timeout) override
        {
            ++m_calls;
            ++m_active;
            int active = m_active.load();
            int seen = m_max_active.load();
            while (active > seen && !m_max_active.compare_exchange_weak(seen, active))
            {
            }

            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_targets.push_back(target);
                m_timeouts.push_back(timeout);
            }

            if (m_delay.count() > 0)
                std::this_thread::sleep_for(m_delay);

            common::ProbeOutcome outcome;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (!m_outcomes.empty())
                {
                    outcome = m_outcomes.front();
                    if (m_outcomes.size() > 1)
                        m_outcomes.erase(m_outcomes.begin());
                }
            }

            --m_active;
            return outcome;
        }

        int Calls() const { return m_calls; }
        int MaxConcurrent() const { return m_max_active; }

        std::vector<common::NetworkTarget> Targets() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_targets;
        }

        std::vector<std::chrono::milliseconds> Timeouts() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_timeouts;
        }

    private:
        mutable std::mutex m_mutex;
        std::vector<common::ProbeOutcome> m_outcomes;
        std::vector<common::NetworkTarget> m_targets;
        std::vector<std::chrono::milliseconds> m_timeouts;
        std::chrono::milliseconds m_delay{0};
        std::atomic<int> m_calls{0};
        std::atomic<int> m_active{0};
        std::atomic<int> m_max_active{0};
    };

    class MapVendorLookup : public scanner::VendorLookup
    {
    public:
        explicit MapVendorLookup(std::map<std::string, std::string> vendors) : m_vendors(std::move(vendors)) {}

        std::optional<std::string> Lookup(const std::string &mac) override
        {
            auto it = m_vendors.find(mac);
            if (it == m_vendors.end())
                return std::nullopt;
            return it->second;
        }

    private:
        std::map<std::string, std::string> m_vendors;
    };

    class MapHostnameResolver : public scanner::HostnameResolver
    {
    public:
        explicit MapHostnameResolver(std::map<std::string, std::string> names) : m_names(std::move(names)) {}

        std::optional<std::string> Resolve(const std::string &ip) override
        {
            ++m_calls;
            auto it = m_names.find(ip);
            if (it == m_names.end())
                return std::nullopt;
            return it->second;
        }

        int Calls() const { return m_calls; }

    private:
        std::map<std::string, std::string> m_names;
        int m_calls = 0;
    };

    inline common::ProbeOutcome Replies(std::vector<common::ProbeResult> results)
    {
        common::ProbeOutcome outcome;
        outcome.results = std::move(results);
        return outcome;
    }

    inline common::ProbeOutcome Failure(common::ScanCondition condition, const std::string &detail)
    {
        common::ProbeOutcome outcome;
        outcome.condition = condition;
        outcome.detail = detail;
        return outcome;
    }
}
