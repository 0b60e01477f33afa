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

#include <cstdio>
#include <boost/bind/bind.hpp>
#include <nlohmann/json.hpp>
#include "NodeService.hpp"
#include "Logger.hpp"
using namespace boost::placeholders;
namespace http = boost::beast::http;


const char * NodeService::errorBody = "500 Internal Server Error (Byzantine Fault)";


std::string NodeService::formatSeconds(Duration d) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.3fs", d.seconds());
    return buffer;
}


NodeService::NodeService(FaultEngine & e, uint16_t port, unsigned int workers) : engine(e), name(e.getName()),
        server(port, workers), finished(false), crashed(false) {
    nodeLabels.push_back(std::make_pair("node_id", name));
    metrics.declare("http_requests_total", MetricsRegistry::COUNTER, "Total HTTP Requests");
    metrics.declare("request_latency_seconds", MetricsRegistry::HISTOGRAM, "Request latency distribution");
    metrics.declare("node_cpu_usage_percent", MetricsRegistry::GAUGE, "Simulated CPU usage of the node");
    metrics.declare("node_memory_bytes", MetricsRegistry::GAUGE, "Simulated resident memory of the node");
    metrics.set("node_cpu_usage_percent", nodeLabels, engine.getCpuUsage());
    metrics.set("node_memory_bytes", nodeLabels, engine.getMemoryUsage());

    server.route("/process", boost::bind(&NodeService::handleProcess, this, _1, _2));
    server.route("/health", boost::bind(&NodeService::handleHealth, this, _1, _2));
    server.route("/metrics", boost::bind(&NodeService::handleMetrics, this, _1, _2));
}


void NodeService::start() {
    server.start();
    LogMsg("Node.Http", INFO) << name << " serving on port " << server.getPort();
}


void NodeService::stop() {
    server.stop();
}


bool NodeService::waitForTermination() {
    boost::mutex::scoped_lock lock(mutex);
    while (!finished)
        terminated.wait(lock);
    return crashed;
}


void NodeService::requestShutdown() {
    terminate(false);
}


void NodeService::terminate(bool crash) {
    {
        boost::mutex::scoped_lock lock(mutex);
        finished = true;
        crashed = crashed || crash;
    }
    terminated.notify_all();
}


void NodeService::handleProcess(const HttpServer::Request &, HttpServer::Response & res) {
    RequestOutcome result;
    try {
        result = engine.handleRequest();
    } catch (NodeCrashed & e) {
        MetricsRegistry::Labels labels(nodeLabels);
        labels.push_back(std::make_pair("status", "error"));
        metrics.increment("http_requests_total", labels);
        LogMsg("Node.Http", ERROR) << e.what() << ", exiting";
        terminate(true);
        throw HttpServer::AbortConnection();
    }

    MetricsRegistry::Labels labels(nodeLabels);
    metrics.set("node_cpu_usage_percent", nodeLabels, engine.getCpuUsage());
    metrics.set("node_memory_bytes", nodeLabels, engine.getMemoryUsage());
    if (result.status == RequestOutcome::SERVER_ERROR) {
        labels.push_back(std::make_pair("status", "500"));
        metrics.increment("http_requests_total", labels);
        res.result(http::status::internal_server_error);
        res.set(http::field::content_type, "text/plain");
        res.body() = errorBody;
        return;
    }

    labels.push_back(std::make_pair("status", "success"));
    metrics.increment("http_requests_total", labels);
    // The histogram sees the real latency, only the body carries the reported one
    metrics.observe("request_latency_seconds", nodeLabels, result.latency.seconds());
    res.set(http::field::content_type, "application/json");
    res.body() = processBody(name, result).dump();
}


nlohmann::json NodeService::processBody(const std::string & node, const RequestOutcome & result) {
    nlohmann::json body;
    body["node"] = node;
    body["status"] = "ok";
    body["processed_in"] = formatSeconds(result.reportedLatency);
    body["load_factor"] = result.loadFactor;
    body["request_num"] = result.requestNum;
    return body;
}


void NodeService::handleHealth(const HttpServer::Request &, HttpServer::Response & res) {
    HealthReport h = engine.getHealth();
    nlohmann::json body;
    body["node"] = name;
    body["status"] = h.alive ? "alive" : "crashed";
    body["uptime_seconds"] = h.uptime.seconds();
    body["fault_type"] = h.fault.getName();
    body["total_requests"] = h.totalRequests;
    res.set(http::field::content_type, "application/json");
    res.body() = body.dump();
}


void NodeService::handleMetrics(const HttpServer::Request &, HttpServer::Response & res) {
    res.set(http::field::content_type, MetricsRegistry::contentType);
    res.body() = metrics.expose();
}
