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

#ifndef DISPATCHER_H_
#define DISPATCHER_H_

#include <map>
#include <vector>
#include <ostream>
#include <stdint.h>
#include <boost/thread/mutex.hpp>
#include <boost/random/mersenne_twister.hpp>
#include "RoutingTable.hpp"
#include "NodeGateway.hpp"


/**
 * Counters of the requests dispatched so far.
 */
struct DispatchStatistics {
    struct Counters {
        Counters() : dispatched(0), successes(0), errors(0), failures(0), timeouts(0), totalLatency() {}
        unsigned long dispatched, successes, errors, failures, timeouts;
        Duration totalLatency;

        void add(const ForwardResult & r);
    };

    std::map<uint32_t, Counters> nodes;   ///< Per node
    Counters modes[2];                    ///< Per dispatch mode
    Counters total;

    friend std::ostream & operator<<(std::ostream & os, const DispatchStatistics & s);
};


/**
 * \brief Chooses a node for each request and forwards it.
 *
 * With a usable routing table, node i is chosen with probability w_i / sum_j w_j. With an
 * empty, degraded or all-zero table, nodes are chosen round-robin. Every dispatch is tagged
 * with the mode that chose it. Failed requests are never retried; they reach the weights
 * through the telemetry of the next refresh.
 */
class Dispatcher {
public:
    struct Selection {
        uint32_t nodeId;
        RoutingTable::Mode mode;
    };

    struct Record {
        Selection selection;
        ForwardResult result;
    };

    /**
     * @param nodes IDs of the known nodes, at least one.
     * @param handle Source of the current routing table. It must outlive the dispatcher.
     * @param gateway Path to the nodes. It must outlive the dispatcher.
     * @param seed Seed of the weighted selection.
     * @throws std::invalid_argument If there are no nodes.
     */
    Dispatcher(const std::vector<uint32_t> & nodes, const RoutingTableHandle & handle, NodeGateway & gateway,
            uint32_t seed = 1);

    /// Chooses the node for the next request, thread-safe.
    Selection select();

    /**
     * Chooses a node, forwards a request to it and accounts the result. Thread-safe.
     */
    Record dispatch();

    DispatchStatistics getStatistics() const;

    const std::vector<uint32_t> & getNodes() const {
        return nodes;
    }

private:
    std::vector<uint32_t> nodes;
    const RoutingTableHandle & handle;
    NodeGateway & gateway;

    mutable boost::mutex mutex;   ///< Protects the selection state and statistics
    boost::random::mt19937 gen;
    std::size_t nextRoundRobin;
    DispatchStatistics stats;
};

#endif /* DISPATCHER_H_ */
