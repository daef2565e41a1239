#include "InterfaceResolver.hpp"
#include "../common/Config.hpp"
#include "../common/Ipv4Network.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <fstream>
#include <iostream>
#include <net/if.h>
#include <netinet/in.h>
#include <sstream>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>

namespace arp_presence::scanner
{
    namespace
    {
        const char *FALLBACK_INTERFACES[] = {"eth0", "ens18", "enp0s3", "wlan0"};

        bool ReadInterfaceAddress(int fd, const std::string &interface, unsigned long request, std::uint32_t &out)
        {
            struct ifreq ifr;
            std::memset(&ifr, 0, sizeof(ifr));
            std::strncpy(ifr.ifr_name, interface.c_str(), IFNAMSIZ - 1);

            if (ioctl(fd, request, &ifr) < 0)
                return false;

            // SIOCGIFNETMASK fills ifr_netmask, which aliases ifr_addr.
            auto *addr = reinterpret_cast<struct sockaddr_in *>(&ifr.ifr_addr);
            out = ntohl(addr->sin_addr.s_addr);
            return true;
        }
    }

    std::optional<std::string> ParseDefaultRouteInterface(std::istream &route_table)
    {
        std::string line;
        std::getline(route_table, line);

        while (std::getline(route_table, line))
        {
            std::stringstream ss(line);
            std::string iface, destination;
            if (!(ss >> iface >> destination))
                continue;

            if (destination == "00000000")
                return iface;
        }
        return std::nullopt;
    }

    InterfaceResolver::InterfaceResolver(std::string route_table_path, std::string sys_class_net)
        : m_route_table_path(std::move(route_table_path)), m_sys_class_net(std::move(sys_class_net))
    {
    }

    bool InterfaceResolver::InterfaceExists(const std::string &interface) const
    {
        struct stat info;
        std::string path = m_sys_class_net + "/" + interface;
        return stat(path.c_str(), &info) == 0;
    }

    std::optional<std::string> InterfaceResolver::ResolveDefaultInterface() const
    {
        std::ifstream route_file(m_route_table_path);
        if (route_file.is_open())
        {
            auto iface = ParseDefaultRouteInterface(route_file);
            if (iface.has_value())
                return iface;
        }
        else
        {
            std::cerr << "[Resolver] Cannot read routing table " << m_route_table_path << "\n";
        }

        for (const char *candidate : FALLBACK_INTERFACES)
        {
            if (InterfaceExists(candidate))
                return std::string(candidate);
        }
        return std::nullopt;
    }

    std::optional<std::string> InterfaceResolver::ResolveNetwork(const std::string &interface) const
    {
        if (interface.empty() || interface.size() >= IFNAMSIZ)
            return std::nullopt;

        int fd = socket(AF_INET, SOCK_DGRAM, 0);
        if (fd < 0)
        {
            std::cerr << "[Resolver] socket() failed: " << std::strerror(errno) << "\n";
            return std::nullopt;
        }

        std::uint32_t address = 0;
        std::uint32_t mask = 0;
        bool ok = ReadInterfaceAddress(fd, interface, SIOCGIFADDR, address) &&
                  ReadInterfaceAddress(fd, interface, SIOCGIFNETMASK, mask);
        close(fd);

        if (!ok)
            return std::nullopt;

        auto network = common::Ipv4Network::FromAddressAndMask(address, mask);
        if (!network.has_value())
            return std::nullopt;
        return network->ToString();
    }

    std::vector<std::string> InterfaceResolver::ListUsableInterfaces() const
    {
        std::vector<std::string> interfaces;

        DIR *dir = opendir(m_sys_class_net.c_str());
        if (!dir)
            return interfaces;

        while (struct dirent *entry = readdir(dir))
        {
            std::string name = entry->d_name;
            if (name == "." || name == ".." || name == "lo")
                continue;

            std::ifstream operstate(m_sys_class_net + "/" + name + "/operstate");
            std::string state;
            if (!operstate.is_open() || !(operstate >> state) || state != "up")
                continue;

            if (ResolveNetwork(name).has_value())
                interfaces.push_back(name);
        }
        closedir(dir);

        return interfaces;
    }

    std::optional<common::NetworkTarget> InterfaceResolver::ResolveTarget(const std::optional<std::string> &interface,
                                                                          const std::optional<std::string> &network,
                                                                          std::string &failure_reason) const
    {
        common::NetworkTarget target;

        if (interface.has_value())
        {
            target.interface = *interface;
        }
        else
        {
            auto detected = ResolveDefaultInterface();
            if (!detected.has_value())
            {
                failure_reason = "cannot determine a network interface (no default route)";
                return std::nullopt;
            }
            target.interface = *detected;
        }

        std::optional<std::string> cidr = network;
        if (!cidr.has_value())
            cidr = ResolveNetwork(target.interface);

        if (!cidr.has_value())
        {
            failure_reason = "cannot resolve network for interface " + target.interface;
            return std::nullopt;
        }

        auto parsed = common::Ipv4Network::Parse(*cidr);
        if (!parsed.has_value())
        {
            failure_reason = "invalid network '" + *cidr + "' for interface " + target.interface;
            return std::nullopt;
        }
        if (parsed->Prefix() < common::MIN_NETWORK_PREFIX)
        {
            failure_reason = "network " + parsed->ToString() + " on " + target.interface +
                             " is larger than /" + std::to_string(common::MIN_NETWORK_PREFIX);
            return std::nullopt;
        }

        target.cidr = parsed->ToString();
        return target;
    }
}
