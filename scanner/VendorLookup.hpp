#pragma once

#include <optional>
#include <string>

namespace arp_presence::scanner
{
    class VendorLookup
    {
    public:
        virtual ~VendorLookup() = default;
        virtual std::optional<std::string> Lookup(const std::string &mac) = 0;
    };

    class NullVendorLookup : public VendorLookup
    {
    public:
        std::optional<std::string> Lookup(const std::string &) override { return std::nullopt; }
    };
}
