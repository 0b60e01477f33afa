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

#ifndef LOADBALANCER_H_
#define LOADBALANCER_H_

#include <vector>
#include <stdint.h>
#include <boost/scoped_ptr.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/asio/thread_pool.hpp>
#include "Time.hpp"
#include "RoutingTable.hpp"
#include "TrustWeightEngine.hpp"
#include "Dispatcher.hpp"
#include "PeriodicTask.hpp"
#include "HttpServer.hpp"


/**
 * \brief Trust-weighted load balancer.
 *
 * Runs two independent loops that only share the routing table: the refresh loop, which
 * recomputes the weights, and the dispatch loop, which sends a request to a node every
 * period. Dispatches run in a worker pool, so that a stalled node does not delay the next
 * ones. Optionally, a front end dispatches every client request it receives and relays the
 * response of the node.
 */
class LoadBalancer {
public:
    LoadBalancer(const std::vector<uint32_t> & nodes, MetricsSource & source,
            boost::shared_ptr<TrustClassifier> classifier, const WeightBands & bands, NodeGateway & gateway,
            uint32_t seed, unsigned int refreshWorkers, unsigned int dispatchWorkers);

    ~LoadBalancer();

    /**
     * Starts the loops.
     * @param refreshPeriod Time between refreshes.
     * @param dispatchPeriod Time between dispatches, 0 disables the dispatch loop.
     * @param frontendPort Port of the front end, 0 disables it.
     */
    void start(Duration refreshPeriod, Duration dispatchPeriod, uint16_t frontendPort);

    /**
     * Stops accepting new work and waits for the dispatches in progress.
     */
    void stop();

    TrustWeightEngine & getWeightEngine() {
        return weightEngine;
    }

    Dispatcher & getDispatcher() {
        return dispatcher;
    }

    const RoutingTableHandle & getRoutingTable() const {
        return table;
    }

    /// Port of the front end, 0 if disabled.
    uint16_t getFrontendPort() const {
        return frontend.get() ? frontend->getPort() : 0;
    }

    /**
     * Dispatches a client request and relays the response of the node. A node that does not
     * answer produces a 502, or a 504 if it timed out.
     */
    void handleClientRequest(const HttpServer::Request & req, HttpServer::Response & res);

private:
    void scheduleDispatch();

    // Non-copyable
    LoadBalancer(const LoadBalancer &);
    LoadBalancer & operator=(const LoadBalancer &);

    RoutingTableHandle table;
    TrustWeightEngine weightEngine;
    Dispatcher dispatcher;
    unsigned int numDispatchWorkers;

    boost::scoped_ptr<boost::asio::thread_pool> dispatchPool;
    boost::scoped_ptr<PeriodicTask> refreshTask, dispatchTask;
    boost::scoped_ptr<HttpServer> frontend;

    boost::mutex mutex;           ///< Protects inFlight
    unsigned int inFlight;
};

#endif /* LOADBALANCER_H_ */
