#include "DeviceFilter.hpp"

namespace arp_presence::scanner
{
    DeviceFilter::DeviceFilter(const std::vector<std::string> &include, const std::vector<std::string> &exclude)
        : m_include(include.begin(), include.end()), m_exclude(exclude.begin(), exclude.end())
    {
    }

    bool DeviceFilter::IsMatch(const common::Device &device) const
    {
        if (!m_include.empty())
            return m_include.count(device.ip) > 0;

        if (!m_exclude.empty())
            return m_exclude.count(device.ip) == 0;

        return true;
    }

    std::vector<common::Device> DeviceFilter::Apply(const std::vector<common::Device> &devices) const
    {
        std::vector<common::Device> kept;
        kept.reserve(devices.size());

        for (const auto &device : devices)
        {
            if (IsMatch(device))
                kept.push_back(device);
        }
        return kept;
    }
}
