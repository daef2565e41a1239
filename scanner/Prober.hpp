#pragma once

#include <chrono>
#include "../common/ScanTypes.hpp"

namespace arp_presence::scanner
{
    class Prober
    {
    public:
        virtual ~Prober() = default;

        // Never throws; failures come back as the outcome's condition.
        virtual common::ProbeOutcome Probe(const common::NetworkTarget &target,
                                           std::chrono::milliseconds timeout) = 0;
    };
}
