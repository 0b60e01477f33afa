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

#ifndef NODESERVICE_H_
#define NODESERVICE_H_

#include <string>
#include <boost/thread/mutex.hpp>
#include <boost/thread/condition_variable.hpp>
#include <nlohmann/json.hpp>
#include "HttpServer.hpp"
#include "MetricsRegistry.hpp"
#include "FaultEngine.hpp"


/**
 * \brief HTTP surface of a node.
 *
 * Serves three paths:
 * - /process runs a request through the fault engine.
 * - /health reports liveness, uptime, fault class and number of requests.
 * - /metrics exposes the counters, latency histogram and resource gauges of the node.
 *
 * When the engine crashes, the connection is dropped without response and the service
 * signals its termination, so that the process can exit like a crashed server.
 */
class NodeService {
public:
    NodeService(FaultEngine & engine, uint16_t port, unsigned int workers);

    void start();

    void stop();

    /**
     * Blocks until the node crashes or a shutdown is requested.
     * @return True if the node crashed.
     */
    bool waitForTermination();

    /// Makes waitForTermination return.
    void requestShutdown();

    uint16_t getPort() const {
        return server.getPort();
    }

    const MetricsRegistry & getMetrics() const {
        return metrics;
    }

    void handleProcess(const HttpServer::Request & req, HttpServer::Response & res);

    void handleHealth(const HttpServer::Request & req, HttpServer::Response & res);

    void handleMetrics(const HttpServer::Request & req, HttpServer::Response & res);

    /// Body of the response to a request that misbehaves with an error.
    static const char * errorBody;

    /// JSON body of a successful /process response, with the latency the node reports.
    static nlohmann::json processBody(const std::string & node, const RequestOutcome & result);

    /// Formats a duration as seconds with three decimals and an "s" suffix.
    static std::string formatSeconds(Duration d);

private:
    void terminate(bool crash);

    FaultEngine & engine;
    std::string name;
    MetricsRegistry::Labels nodeLabels;
    MetricsRegistry metrics;
    HttpServer server;

    boost::mutex mutex;
    boost::condition_variable terminated;
    bool finished, crashed;
};

#endif /* NODESERVICE_H_ */
