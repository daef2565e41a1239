#include "PresenceTracker.hpp"

namespace arp_presence::presence
{
    const char *ToString(PresenceState state)
    {
        switch (state)
        {
        case PresenceState::Unknown:
            return "unknown";
        case PresenceState::Home:
            return "home";
        case PresenceState::Away:
            return "away";
        }
        return "unknown";
    }

    bool IsWithinConsiderHome(const std::optional<common::Timestamp> &last_seen,
                              common::Timestamp now,
                              std::chrono::seconds consider_home)
    {
        if (!last_seen.has_value())
            return false;
        return now - *last_seen <= consider_home;
    }

    PresenceTracker::PresenceTracker(std::chrono::seconds consider_home)
        : m_consider_home(consider_home)
    {
    }

    std::vector<PresenceChange> PresenceTracker::Update(const common::ScanSnapshot &snapshot)
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        std::vector<PresenceChange> changes;
        std::set<std::string> latest;

        for (const auto &[mac, device] : snapshot.devices)
        {
            latest.insert(mac);

            auto it = m_records.find(mac);
            if (it == m_records.end())
            {
                PresenceRecord record;
                record.mac = mac;
                record.last_seen = snapshot.taken_at;
                record.last_device = device;
                record.reported = PresenceState::Home;
                m_records.emplace(mac, record);

                changes.push_back({mac, PresenceState::Unknown, PresenceState::Home, device, snapshot.taken_at});
                continue;
            }

            PresenceRecord &record = it->second;
            record.last_seen = snapshot.taken_at;
            record.last_device = device;

            if (record.reported != PresenceState::Home)
            {
                changes.push_back({mac, record.reported, PresenceState::Home, device, snapshot.taken_at});
                record.reported = PresenceState::Home;
            }
        }

        m_latest_macs = std::move(latest);

        auto aged = EvaluateLocked(snapshot.taken_at);
        changes.insert(changes.end(), aged.begin(), aged.end());
        return changes;
    }

    std::vector<PresenceChange> PresenceTracker::Evaluate(common::Timestamp now)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return EvaluateLocked(now);
    }

    std::vector<PresenceChange> PresenceTracker::EvaluateLocked(common::Timestamp now)
    {
        std::vector<PresenceChange> changes;

        for (auto &[mac, record] : m_records)
        {
            if (record.reported == PresenceState::Home && !IsConnectedLocked(record, now))
            {
                changes.push_back({mac, PresenceState::Home, PresenceState::Away, record.last_device, now});
                record.reported = PresenceState::Away;
            }
        }
        return changes;
    }

    bool PresenceTracker::IsConnectedLocked(const PresenceRecord &record, common::Timestamp now) const
    {
        if (m_latest_macs.count(record.mac) > 0)
            return true;
        return IsWithinConsiderHome(record.last_seen, now, m_consider_home);
    }

    bool PresenceTracker::IsConnected(const std::string &mac, common::Timestamp now) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_records.find(mac);
        if (it == m_records.end())
            return false;
        return IsConnectedLocked(it->second, now);
    }

    PresenceState PresenceTracker::StateOf(const std::string &mac, common::Timestamp now) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_records.find(mac);
        if (it == m_records.end())
            return PresenceState::Unknown;
        return IsConnectedLocked(it->second, now) ? PresenceState::Home : PresenceState::Away;
    }

    std::optional<common::Timestamp> PresenceTracker::LastSeen(const std::string &mac) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_records.find(mac);
        if (it == m_records.end())
            return std::nullopt;
        return it->second.last_seen;
    }

    std::vector<DeviceStatus> PresenceTracker::Report(common::Timestamp now) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        std::vector<DeviceStatus> report;
        report.reserve(m_records.size());

        for (const auto &[mac, record] : m_records)
        {
            bool connected = IsConnectedLocked(record, now);
            report.push_back({record.last_device, connected, record.last_seen,
                              connected ? PresenceState::Home : PresenceState::Away});
        }
        return report;
    }

    size_t PresenceTracker::Size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_records.size();
    }
}
