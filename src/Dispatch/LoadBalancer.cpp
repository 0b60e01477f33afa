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

#include <boost/bind/bind.hpp>
#include <boost/asio/post.hpp>
#include "LoadBalancer.hpp"
#include "Logger.hpp"
using namespace boost::placeholders;
namespace http = boost::beast::http;


LoadBalancer::LoadBalancer(const std::vector<uint32_t> & nodes, MetricsSource & source,
        boost::shared_ptr<TrustClassifier> classifier, const WeightBands & bands, NodeGateway & gateway,
        uint32_t seed, unsigned int refreshWorkers, unsigned int dispatchWorkers)
        : weightEngine(nodes, source, classifier, bands, table, refreshWorkers), dispatcher(nodes, table, gateway, seed),
          numDispatchWorkers(dispatchWorkers == 0 ? 1 : dispatchWorkers), inFlight(0) {}


LoadBalancer::~LoadBalancer() {
    stop();
}


void LoadBalancer::start(Duration refreshPeriod, Duration dispatchPeriod, uint16_t frontendPort) {
    dispatchPool.reset(new boost::asio::thread_pool(numDispatchWorkers));
    refreshTask.reset(new PeriodicTask("refresh", refreshPeriod, boost::bind(&TrustWeightEngine::refresh, &weightEngine)));
    refreshTask->start();
    if (dispatchPeriod > Duration()) {
        dispatchTask.reset(new PeriodicTask("dispatch", dispatchPeriod, boost::bind(&LoadBalancer::scheduleDispatch, this)));
        dispatchTask->start();
    }
    if (frontendPort != 0) {
        frontend.reset(new HttpServer(frontendPort, numDispatchWorkers));
        frontend->setDefaultHandler(boost::bind(&LoadBalancer::handleClientRequest, this, _1, _2));
        frontend->start();
    }
    LogMsg("Dsp", INFO) << "Load balancer started over " << dispatcher.getNodes().size() << " nodes";
}


void LoadBalancer::stop() {
    // First stop generating requests, then let the ones in progress finish
    if (dispatchTask.get()) dispatchTask->stop();
    if (frontend.get()) frontend->stop();
    if (refreshTask.get()) refreshTask->stop();
    if (dispatchPool.get()) {
        dispatchPool->join();
        dispatchPool.reset();
        LogMsg("Dsp", INFO) << "Load balancer stopped";
    }
}


void LoadBalancer::scheduleDispatch() {
    {
        boost::mutex::scoped_lock lock(mutex);
        // Do not pile up requests behind stalled nodes
        if (inFlight >= 2 * numDispatchWorkers) {
            LogMsg("Dsp", DEBUG) << "All workers busy, skipping dispatch";
            return;
        }
        ++inFlight;
    }
    boost::asio::post(*dispatchPool, [this] () {
        try {
            dispatcher.dispatch();
        } catch (std::exception & e) {
            LogMsg("Dsp", ERROR) << "Dispatch failed: " << e.what();
        }
        boost::mutex::scoped_lock lock(mutex);
        --inFlight;
    });
}


void LoadBalancer::handleClientRequest(const HttpServer::Request &, HttpServer::Response & res) {
    Dispatcher::Record r = dispatcher.dispatch();
    switch (r.result.status) {
        case ForwardResult::SUCCESS:
        case ForwardResult::ERROR_RESPONSE:
            res.result(r.result.httpStatus);
            if (!r.result.contentType.empty())
                res.set(http::field::content_type, r.result.contentType);
            res.body() = r.result.body;
            break;
        case ForwardResult::FAILURE:
            res.result(http::status::bad_gateway);
            res.set(http::field::content_type, "text/plain");
            res.body() = "502 Bad Gateway\n";
            break;
        case ForwardResult::TIMEOUT:
            res.result(http::status::gateway_timeout);
            res.set(http::field::content_type, "text/plain");
            res.body() = "504 Gateway Timeout\n";
            break;
    }
}
