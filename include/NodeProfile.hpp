/*
 *  TrustLB, trust-weighted load balancing testbed
 *  Copyright (C) 2026 TrustLB developers
 *
 *  This file is part of TrustLB.
 *
 *  TrustLB is free software; you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation; either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  TrustLB is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with TrustLB; if not, see <http://www.gnu.org/licenses/>.
 */

#ifndef NODEPROFILE_H_
#define NODEPROFILE_H_

#include <ostream>
#include <stdint.h>
#include "Time.hpp"


/**
 * \brief Baseline performance of a simulated node.
 *
 * The profile is drawn once, when the node is created, from a generator seeded with the node
 * ID. Thus, the same node has the same profile every time it is restarted.
 */
class NodeProfile {
public:
    NodeProfile() : baseLatency(), baseCpuLoad(0.0), workloadVariation(0.0), jitter(), packetLoss(0.0),
        stability(1.0), phase(0.0), baseMemory(0.0) {}

    /**
     * Draws the profile of a node.
     * @param nodeId The node ID, which seeds the generator.
     */
    static NodeProfile generate(uint32_t nodeId);

    /// Latency of an unloaded request, between 10 and 50 ms.
    Duration getBaseLatency() const {
        return baseLatency;
    }

    /// CPU usage fraction with load factor 1, between 0.2 and 0.5.
    double getBaseCpuLoad() const {
        return baseCpuLoad;
    }

    /// Relative amplitude of the traffic cycles, between 0.3 and 0.7.
    double getWorkloadVariation() const {
        return workloadVariation;
    }

    /// Standard deviation of the network noise, between 2 and 15 ms.
    Duration getJitter() const {
        return jitter;
    }

    /// Probability of a retransmission, between 0.001 and 0.02.
    double getPacketLoss() const {
        return packetLoss;
    }

    /// How steady the node is, between 0.7 and 1.0. Steadier nodes oscillate less.
    double getStability() const {
        return stability;
    }

    /// Phase of the traffic cycle, so that nodes do not peak at the same time.
    double getPhase() const {
        return phase;
    }

    /// Resident memory right after a garbage collection, in bytes.
    double getBaseMemory() const {
        return baseMemory;
    }

    friend std::ostream & operator<<(std::ostream & os, const NodeProfile & p);

private:
    Duration baseLatency;
    double baseCpuLoad;
    double workloadVariation;
    Duration jitter;
    double packetLoss;
    double stability;
    double phase;
    double baseMemory;
};

#endif /* NODEPROFILE_H_ */
