#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace arp_presence::common
{
    // Addresses are host byte order throughout.
    std::optional<std::uint32_t> ParseIpv4(const std::string &text);
    std::string FormatIpv4(std::uint32_t address);

    // Rejects masks whose set bits are not contiguous from the top.
    std::optional<int> MaskToPrefix(std::uint32_t mask);

    class Ipv4Network
    {
    public:
        Ipv4Network() = default;
        Ipv4Network(std::uint32_t address, int prefix);

        // "a.b.c.d/n" or a bare address (/32). Host bits are masked off.
        static std::optional<Ipv4Network> Parse(const std::string &cidr);
        static std::optional<Ipv4Network> FromAddressAndMask(std::uint32_t address, std::uint32_t mask);

        std::uint32_t Network() const { return m_network; }
        int Prefix() const { return m_prefix; }
        std::uint32_t Netmask() const;
        std::uint64_t Size() const;

        bool Contains(std::uint32_t address) const;
        std::vector<std::uint32_t> Addresses() const;
        std::string ToString() const;

        bool operator==(const Ipv4Network &other) const
        {
            return m_network == other.m_network && m_prefix == other.m_prefix;
        }

    private:
        std::uint32_t m_network = 0;
        int m_prefix = 32;
    };
}
