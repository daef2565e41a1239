#pragma once

#include <optional>
#include <string>

namespace arp_presence::common
{
    // Accepts "AA:BB:CC:DD:EE:FF", "aa-bb-cc-dd-ee-ff" or "aabbccddeeff".
    // Returns lowercase, colon-separated form.
    std::optional<std::string> CanonicalMac(const std::string &text);

    // Upper-case six hex digit vendor prefix, e.g. "AABBCC".
    std::optional<std::string> OuiPrefix(const std::string &mac);
}
