#include "MacAddress.hpp"
#include <algorithm>
#include <cctype>

namespace arp_presence::common
{
    namespace
    {
        std::optional<std::string> HexDigits(const std::string &text)
        {
            std::string digits;
            digits.reserve(12);

            char separator = 0;
            size_t group = 0;

            for (char c : text)
            {
                if (c == ':' || c == '-')
                {
                    if (separator == 0)
                        separator = c;
                    if (c != separator || group != 2)
                        return std::nullopt;
                    group = 0;
                    continue;
                }

                if (!std::isxdigit(static_cast<unsigned char>(c)))
                    return std::nullopt;

                digits += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                ++group;
            }

            if (digits.size() != 12)
                return std::nullopt;
            if (separator != 0 && group != 2)
                return std::nullopt;
            return digits;
        }
    }

    std::optional<std::string> CanonicalMac(const std::string &text)
    {
        auto digits = HexDigits(text);
        if (!digits.has_value())
            return std::nullopt;

        std::string mac;
        mac.reserve(17);
        for (size_t i = 0; i < digits->size(); i += 2)
        {
            if (i != 0)
                mac += ':';
            mac += digits->substr(i, 2);
        }
        return mac;
    }

    std::optional<std::string> OuiPrefix(const std::string &mac)
    {
        auto digits = HexDigits(mac);
        if (!digits.has_value())
            return std::nullopt;

        std::string prefix = digits->substr(0, 6);
        std::transform(prefix.begin(), prefix.end(), prefix.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });
        return prefix;
    }
}
