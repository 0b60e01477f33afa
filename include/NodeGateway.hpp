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

#ifndef NODEGATEWAY_H_
#define NODEGATEWAY_H_

#include <map>
#include <string>
#include <stdint.h>
#include "Time.hpp"
class FaultEngine;
class WindowedMetricsStore;


/**
 * Outcome of forwarding a request to a node, as seen by the dispatcher.
 */
struct ForwardResult {
    enum Status {
        SUCCESS = 0,     ///< The node answered with a 2xx status
        ERROR_RESPONSE,  ///< The node answered with another status
        FAILURE,         ///< The node did not answer, the connection failed or was dropped
        TIMEOUT          ///< The node did not answer in time
    };

    ForwardResult() : status(FAILURE), httpStatus(0) {}

    Status status;
    unsigned int httpStatus;   ///< Status code of the answer, 0 if there is none
    Duration latency;          ///< Time until the answer or the failure
    std::string contentType;
    std::string body;

    bool hasResponse() const {
        return status == SUCCESS || status == ERROR_RESPONSE;
    }

    static const char * getStatusName(Status s);
};


/**
 * \brief Forwards requests to the nodes.
 *
 * Implementations must be thread-safe, the dispatcher forwards several requests at a time.
 */
class NodeGateway {
public:
    virtual ~NodeGateway() {}

    /**
     * Forwards a process request to a node. It never throws, failures are results.
     */
    virtual ForwardResult forward(uint32_t nodeId) = 0;
};


/**
 * Gateway to nodes served over HTTP. Node i listens on basePort + i - 1.
 */
class HttpNodeGateway : public NodeGateway {
public:
    HttpNodeGateway(const std::string & host, uint16_t basePort, Duration timeout)
        : host(host), basePort(basePort), timeout(timeout) {}

    virtual ForwardResult forward(uint32_t nodeId);

    uint16_t getPort(uint32_t nodeId) const {
        return basePort + nodeId - 1;
    }

private:
    std::string host;
    uint16_t basePort;
    Duration timeout;
};


/**
 * \brief Gateway to fault engines in the same process.
 *
 * The latency of a request is the one computed by the engine, and it times out when it is
 * longer than the timeout. Every request is recorded in a metrics store with the real latency
 * and the gauges of the node, as a Prometheus server scraping the nodes would do. Timeouts are
 * recorded without status and crashes as failures, so that both count as errors.
 */
class LocalNodeGateway : public NodeGateway {
public:
    /**
     * @param store Where telemetry is recorded, may be NULL.
     */
    LocalNodeGateway(Duration timeout, WindowedMetricsStore * store) : timeout(timeout), store(store) {}

    /// Adds a node. The engine must outlive the gateway.
    void addNode(FaultEngine & engine);

    virtual ForwardResult forward(uint32_t nodeId);

private:
    Duration timeout;
    WindowedMetricsStore * store;
    std::map<uint32_t, FaultEngine *> engines;
};

#endif /* NODEGATEWAY_H_ */
