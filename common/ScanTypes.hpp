#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace arp_presence::common
{
    using Clock = std::chrono::system_clock;
    using Timestamp = Clock::time_point;

    inline constexpr const char *UNKNOWN_VENDOR = "Unknown";

    enum class ScanCondition
    {
        Ok,
        TargetUnresolved,
        PermissionDenied,
        ProbeFailed
    };

    inline const char *ToString(ScanCondition condition)
    {
        switch (condition)
        {
        case ScanCondition::Ok:
            return "Ok";
        case ScanCondition::TargetUnresolved:
            return "TargetUnresolved";
        case ScanCondition::PermissionDenied:
            return "PermissionDenied";
        case ScanCondition::ProbeFailed:
            return "ProbeFailed";
        }
        return "Unknown";
    }

    struct NetworkTarget
    {
        std::string interface;
        std::string cidr;
    };

    struct ProbeResult
    {
        std::string ip;
        std::string mac;
    };

    struct ProbeOutcome
    {
        std::vector<ProbeResult> results;
        ScanCondition condition = ScanCondition::Ok;
        std::string detail;
    };

    struct Device
    {
        std::string ip;
        std::string mac;
        std::string vendor = UNKNOWN_VENDOR;
        std::optional<std::string> hostname;
    };

    // Filtered output of one scan cycle, keyed by canonical MAC.
    struct ScanSnapshot
    {
        Timestamp taken_at;
        NetworkTarget target;
        ScanCondition condition = ScanCondition::Ok;
        std::string detail;
        std::map<std::string, Device> devices;
    };

    // Hostname when known, otherwise the MAC without separators.
    inline std::string DisplayName(const Device &device)
    {
        if (device.hostname.has_value() && !device.hostname->empty())
            return *device.hostname;

        std::string name;
        name.reserve(device.mac.size());
        for (char c : device.mac)
        {
            if (c != ':')
                name += c;
        }
        return name;
    }
}
