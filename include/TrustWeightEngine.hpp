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

#ifndef TRUSTWEIGHTENGINE_H_
#define TRUSTWEIGHTENGINE_H_

#include <map>
#include <string>
#include <vector>
#include <stdint.h>
#include <boost/shared_ptr.hpp>
#include <boost/scoped_ptr.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/asio/thread_pool.hpp>
#include "Time.hpp"
#include "MetricsSource.hpp"
#include "TrustClassifier.hpp"
#include "WeightBands.hpp"
#include "RoutingTable.hpp"


/**
 * What the weight engine knows about a node after the last refresh.
 */
struct TrustState {
    TrustState() : nodeId(0), classified(false), pFaulty(0.0), weight(1.0), lastUpdate() {}

    uint32_t nodeId;
    bool classified;                        ///< False if there was no prediction in the last refresh
    TrustClassifier::Prediction prediction; ///< Last prediction, empty if unavailable
    double pFaulty;
    double weight;
    Time lastUpdate;
    std::string lastError;                  ///< Why the last refresh could not classify the node
};


/**
 * \brief Periodically turns the telemetry of the nodes into routing weights.
 *
 * In each refresh, the observation of every node is fetched and classified in a worker pool,
 * with a deadline. A node whose observation or prediction fails or arrives late gets the
 * default weight for this refresh, without affecting the rest. The resulting table is then
 * published in the routing table handle.
 *
 * Without an available classifier the engine is degraded: every node gets the default
 * weight and the table is marked so that the dispatcher goes round-robin.
 */
class TrustWeightEngine {
public:
    /**
     * @param nodes IDs of the known nodes.
     * @param source Where observations come from. It must outlive the engine.
     * @param classifier The classifier, possibly a NullClassifier.
     * @param bands Weight bands.
     * @param handle Where tables are published. It must outlive the engine.
     * @param workers Number of nodes processed at the same time.
     */
    TrustWeightEngine(const std::vector<uint32_t> & nodes, MetricsSource & source,
            boost::shared_ptr<TrustClassifier> classifier, const WeightBands & bands,
            RoutingTableHandle & handle, unsigned int workers = 16);

    /// Waits for the pending node evaluations.
    ~TrustWeightEngine();

    /**
     * Sets the class whose probability is the faulty probability. Empty means 1 - P(benign).
     */
    void setPrimaryFault(const std::string & p) {
        primaryFault = p;
    }

    void setMetricsWindow(Duration w) {
        window = w;
    }

    /// Sets the deadline of each node evaluation, from the start of the refresh.
    void setTimeout(Duration t) {
        timeout = t;
    }

    /**
     * Performs a refresh and publishes its table.
     * @return The published table.
     */
    RoutingTableHandle::Ptr refresh();

    /// Returns a snapshot of the state of every node.
    std::map<uint32_t, TrustState> getStates() const;

    /// Returns a snapshot of the state of a node, the default one if unknown.
    TrustState getState(uint32_t nodeId) const;

    bool isDegraded() const {
        return !classifier->isAvailable();
    }

    unsigned long getNumRefreshes() const;

private:
    /// Fetches, classifies and bands a node. May throw.
    TrustState evaluate(uint32_t nodeId);

    void logSummary(const RoutingTable & table);

    // Non-copyable
    TrustWeightEngine(const TrustWeightEngine &);
    TrustWeightEngine & operator=(const TrustWeightEngine &);

    std::vector<uint32_t> nodes;
    MetricsSource & source;
    boost::shared_ptr<TrustClassifier> classifier;
    WeightBands bands;
    RoutingTableHandle & handle;
    std::string primaryFault;
    Duration window;
    Duration timeout;
    boost::scoped_ptr<boost::asio::thread_pool> pool;

    mutable boost::mutex mutex;   ///< Protects states and refreshes
    std::map<uint32_t, TrustState> states;
    unsigned long refreshes;
};

#endif /* TRUSTWEIGHTENGINE_H_ */
