#include "Ipv4Network.hpp"
#include <arpa/inet.h>
#include <cctype>

namespace arp_presence::common
{
    std::optional<std::uint32_t> ParseIpv4(const std::string &text)
    {
        struct in_addr addr;
        if (inet_pton(AF_INET, text.c_str(), &addr) != 1)
            return std::nullopt;
        return ntohl(addr.s_addr);
    }

    std::string FormatIpv4(std::uint32_t address)
    {
        struct in_addr addr;
        addr.s_addr = htonl(address);

        char buffer[INET_ADDRSTRLEN];
        if (inet_ntop(AF_INET, &addr, buffer, sizeof(buffer)) == nullptr)
            return "";
        return buffer;
    }

    std::optional<int> MaskToPrefix(std::uint32_t mask)
    {
        int prefix = 0;
        while (prefix < 32 && (mask & (0x80000000u >> prefix)))
            ++prefix;

        std::uint32_t expected = prefix == 0 ? 0 : (0xFFFFFFFFu << (32 - prefix));
        if (mask != expected)
            return std::nullopt;
        return prefix;
    }

    Ipv4Network::Ipv4Network(std::uint32_t address, int prefix)
        : m_prefix(prefix)
    {
        m_network = address & Netmask();
    }

    std::optional<Ipv4Network> Ipv4Network::Parse(const std::string &cidr)
    {
        auto slash = cidr.find('/');
        std::string address_part = cidr.substr(0, slash);

        auto address = ParseIpv4(address_part);
        if (!address.has_value())
            return std::nullopt;

        int prefix = 32;
        if (slash != std::string::npos)
        {
            std::string prefix_part = cidr.substr(slash + 1);
            if (prefix_part.empty() || prefix_part.size() > 2)
                return std::nullopt;
            for (char c : prefix_part)
            {
                if (!std::isdigit(static_cast<unsigned char>(c)))
                    return std::nullopt;
            }
            prefix = std::stoi(prefix_part);
            if (prefix > 32)
                return std::nullopt;
        }

        return Ipv4Network(*address, prefix);
    }

    std::optional<Ipv4Network> Ipv4Network::FromAddressAndMask(std::uint32_t address, std::uint32_t mask)
    {
        auto prefix = MaskToPrefix(mask);
        if (!prefix.has_value())
            return std::nullopt;
        return Ipv4Network(address, *prefix);
    }

    std::uint32_t Ipv4Network::Netmask() const
    {
        if (m_prefix == 0)
            return 0;
        return 0xFFFFFFFFu << (32 - m_prefix);
    }

    std::uint64_t Ipv4Network::Size() const
    {
        return std::uint64_t{1} << (32 - m_prefix);
    }

    bool Ipv4Network::Contains(std::uint32_t address) const
    {
        return (address & Netmask()) == m_network;
    }

    std::vector<std::uint32_t> Ipv4Network::Addresses() const
    {
        std::vector<std::uint32_t> addresses;
        addresses.reserve(static_cast<size_t>(Size()));

        for (std::uint64_t i = 0; i < Size(); ++i)
        {
            addresses.push_back(m_network + static_cast<std::uint32_t>(i));
        }
        return addresses;
    }

    std::string Ipv4Network::ToString() const
    {
        return FormatIpv4(m_network) + "/" + std::to_string(m_prefix);
    }
}
