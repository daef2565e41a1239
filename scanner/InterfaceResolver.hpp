#pragma once

#include <istream>
#include <optional>
#include <string>
#include <vector>
#include "../common/ScanTypes.hpp"

namespace arp_presence::scanner
{
    // Interface of the first route whose destination is 0.0.0.0.
    std::optional<std::string> ParseDefaultRouteInterface(std::istream &route_table);

    class InterfaceResolver
    {
    public:
        explicit InterfaceResolver(std::string route_table_path = "/proc/net/route",
                                   std::string sys_class_net = "/sys/class/net");
        virtual ~InterfaceResolver() = default;

        virtual std::optional<std::string> ResolveDefaultInterface() const;
        virtual std::optional<std::string> ResolveNetwork(const std::string &interface) const;
        std::vector<std::string> ListUsableInterfaces() const;

        // Fills in whichever half of the target was not configured.
        std::optional<common::NetworkTarget> ResolveTarget(const std::optional<std::string> &interface,
                                                           const std::optional<std::string> &network,
                                                           std::string &failure_reason) const;

    private:
        bool InterfaceExists(const std::string &interface) const;

        std::string m_route_table_path;
        std::string m_sys_class_net;
    };
}
