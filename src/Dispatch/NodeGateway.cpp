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

#include "NodeGateway.hpp"
#include "HttpClient.hpp"
#include "FaultEngine.hpp"
#include "NodeService.hpp"
#include "WindowedMetricsStore.hpp"
#include "Logger.hpp"


const char * ForwardResult::getStatusName(Status s) {
    switch (s) {
        case SUCCESS: return "success";
        case ERROR_RESPONSE: return "error";
        case FAILURE: return "failure";
        case TIMEOUT: return "timeout";
    }
    return "unknown";
}


ForwardResult HttpNodeGateway::forward(uint32_t nodeId) {
    ForwardResult result;
    Time start = Time::getWallClockTime();
    try {
        HttpClient::Reply reply = HttpClient::get(host, getPort(nodeId), "/process", timeout);
        result.httpStatus = reply.status;
        result.status = (reply.status >= 200 && reply.status < 300) ? ForwardResult::SUCCESS : ForwardResult::ERROR_RESPONSE;
        result.contentType = reply.contentType;
        result.body = reply.body;
    } catch (HttpError & e) {
        result.status = e.isTimeout() ? ForwardResult::TIMEOUT : ForwardResult::FAILURE;
        result.body = e.what();
    }
    result.latency = Time::getWallClockTime() - start;
    return result;
}


void LocalNodeGateway::addNode(FaultEngine & engine) {
    engines[engine.getId()] = &engine;
}


ForwardResult LocalNodeGateway::forward(uint32_t nodeId) {
    ForwardResult result;
    std::map<uint32_t, FaultEngine *>::iterator it = engines.find(nodeId);
    if (it == engines.end()) {
        result.body = "unknown node";
        return result;
    }
    FaultEngine & engine = *it->second;
    try {
        RequestOutcome outcome = engine.handleRequest();
        bool late = outcome.latency > timeout;
        // An answer later than the timeout is recorded without status
        if (store != NULL)
            store->record(nodeId, late ? 0 : outcome.getHttpStatus(), outcome.latency, engine.getCpuUsage(),
                    engine.getMemoryUsage());
        if (late) {
            result.status = ForwardResult::TIMEOUT;
            result.latency = timeout;
            return result;
        }
        result.httpStatus = outcome.getHttpStatus();
        result.latency = outcome.latency;
        if (outcome.status == RequestOutcome::SUCCESS) {
            result.status = ForwardResult::SUCCESS;
            result.contentType = "application/json";
            result.body = NodeService::processBody(engine.getName(), outcome).dump();
        } else {
            result.status = ForwardResult::ERROR_RESPONSE;
            result.contentType = "text/plain";
            result.body = NodeService::errorBody;
        }
    } catch (NodeCrashed & e) {
        if (store != NULL)
            store->recordFailure(nodeId);
        result.status = ForwardResult::FAILURE;
        result.body = e.what();
    }
    return result;
}
