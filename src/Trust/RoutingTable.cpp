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

#include "RoutingTable.hpp"


double RoutingTable::getWeight(uint32_t nodeId) const {
    std::map<uint32_t, double>::const_iterator it = weights.find(nodeId);
    return it == weights.end() ? 0.0 : it->second;
}


double RoutingTable::getTotalWeight() const {
    double total = 0.0;
    for (std::map<uint32_t, double>::const_iterator it = weights.begin(); it != weights.end(); ++it)
        total += it->second;
    return total;
}


RoutingTable::Mode RoutingTable::getMode() const {
    return (degraded || weights.empty() || getTotalWeight() <= 0.0) ? ROUND_ROBIN : TRUST_WEIGHTED;
}


const char * RoutingTable::getModeName(Mode m) {
    switch (m) {
        case TRUST_WEIGHTED: return "trust-weighted";
        case ROUND_ROBIN: return "round-robin";
    }
    return "unknown";
}


std::ostream & operator<<(std::ostream & os, const RoutingTable & t) {
    os << RoutingTable::getModeName(t.getMode()) << (t.degraded ? " (degraded)" : "");
    for (std::map<uint32_t, double>::const_iterator it = t.weights.begin(); it != t.weights.end(); ++it)
        os << " node-" << it->first << '=' << it->second;
    return os;
}
