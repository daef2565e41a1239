#pragma once

#include <set>
#include <string>
#include <vector>
#include "../common/ScanTypes.hpp"

namespace arp_presence::scanner
{
    // IP-based include/exclude lists. A non-empty include list wins and the
    // exclude list is ignored.
    class DeviceFilter
    {
    public:
        DeviceFilter() = default;
        DeviceFilter(const std::vector<std::string> &include, const std::vector<std::string> &exclude);

        bool IsMatch(const common::Device &device) const;
        std::vector<common::Device> Apply(const std::vector<common::Device> &devices) const;

    private:
        std::set<std::string> m_include;
        std::set<std::string> m_exclude;
    };
}
