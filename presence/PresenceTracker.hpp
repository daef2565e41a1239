#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "../common/ScanTypes.hpp"

namespace arp_presence::presence
{
    enum class PresenceState
    {
        Unknown,
        Home,
        Away
    };

    const char *ToString(PresenceState state);

    // True while now - last_seen <= window. A device never seen is not home.
    bool IsWithinConsiderHome(const std::optional<common::Timestamp> &last_seen,
                              common::Timestamp now,
                              std::chrono::seconds consider_home);

    struct PresenceRecord
    {
        std::string mac;
        std::optional<common::Timestamp> last_seen;
        common::Device last_device;
        PresenceState reported = PresenceState::Unknown;
    };

    struct PresenceChange
    {
        std::string mac;
        PresenceState from;
        PresenceState to;
        common::Device device;
        common::Timestamp at;
    };

    struct DeviceStatus
    {
        common::Device device;
        bool connected;
        std::optional<common::Timestamp> last_seen;
        PresenceState state;
    };

    // Owns one record per MAC ever observed. Records are never removed.
    class PresenceTracker
    {
    public:
        explicit PresenceTracker(std::chrono::seconds consider_home);

        // Refreshes last_seen for every device in the snapshot, then ages out
        // the rest as of the snapshot time.
        std::vector<PresenceChange> Update(const common::ScanSnapshot &snapshot);

        // Reports Home -> Away transitions whose window elapsed before `now`.
        std::vector<PresenceChange> Evaluate(common::Timestamp now);

        bool IsConnected(const std::string &mac, common::Timestamp now) const;
        PresenceState StateOf(const std::string &mac, common::Timestamp now) const;
        std::optional<common::Timestamp> LastSeen(const std::string &mac) const;

        std::vector<DeviceStatus> Report(common::Timestamp now) const;
        size_t Size() const;

        std::chrono::seconds ConsiderHome() const { return m_consider_home; }

    private:
        bool IsConnectedLocked(const PresenceRecord &record, common::Timestamp now) const;
        std::vector<PresenceChange> EvaluateLocked(common::Timestamp now);

        std::chrono::seconds m_consider_home;
        std::map<std::string, PresenceRecord> m_records;
        std::set<std::string> m_latest_macs;
        mutable std::mutex m_mutex;
    };
}
