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

#ifndef ROUTINGTABLE_H_
#define ROUTINGTABLE_H_

#include <map>
#include <ostream>
#include <stdint.h>
#include <boost/shared_ptr.hpp>
#include "Time.hpp"


/**
 * \brief Routing weight of each node, as computed by a refresh.
 *
 * A table is never modified once published. Each refresh builds a new one and swaps it into
 * the RoutingTableHandle.
 */
class RoutingTable {
public:
    enum Mode {
        TRUST_WEIGHTED = 0,
        ROUND_ROBIN
    };

    /// An empty table, which makes the dispatcher go round-robin.
    RoutingTable() : degraded(false), timestamp() {}

    /**
     * @param w Weight of each node.
     * @param d Whether the weights come from a fallback, without classifier.
     * @param t When the weights were computed.
     */
    RoutingTable(const std::map<uint32_t, double> & w, bool d, Time t) : weights(w), degraded(d), timestamp(t) {}

    const std::map<uint32_t, double> & getWeights() const {
        return weights;
    }

    /// Returns the weight of a node, 0 if it is not in the table.
    double getWeight(uint32_t nodeId) const;

    double getTotalWeight() const;

    bool isDegraded() const {
        return degraded;
    }

    bool empty() const {
        return weights.empty();
    }

    Time getTimestamp() const {
        return timestamp;
    }

    /**
     * Returns how requests are dispatched with this table: round-robin when it is empty,
     * degraded or all its weights are 0, weighted otherwise.
     */
    Mode getMode() const;

    static const char * getModeName(Mode m);

    friend std::ostream & operator<<(std::ostream & os, const RoutingTable & t);

private:
    std::map<uint32_t, double> weights;
    bool degraded;
    Time timestamp;
};


/**
 * \brief Shared reference to the current routing table.
 *
 * The refresh loop publishes a new table while the dispatchers read the current one; the
 * pointer is swapped atomically, so readers never block and never see a partial table.
 */
class RoutingTableHandle {
public:
    typedef boost::shared_ptr<const RoutingTable> Ptr;

    RoutingTableHandle() : table(new RoutingTable) {}

    Ptr get() const {
        return boost::atomic_load(&table);
    }

    void publish(Ptr t) {
        boost::atomic_store(&table, t);
    }

private:
    Ptr table;

    // Non-copyable
    RoutingTableHandle(const RoutingTableHandle &);
    RoutingTableHandle & operator=(const RoutingTableHandle &);
};

#endif /* ROUTINGTABLE_H_ */
