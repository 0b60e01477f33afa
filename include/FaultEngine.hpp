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

#ifndef FAULTENGINE_H_
#define FAULTENGINE_H_

#include <string>
#include <stdexcept>
#include <stdint.h>
#include <boost/thread/mutex.hpp>
#include <boost/random/mersenne_twister.hpp>
#include "Time.hpp"
#include "FaultClass.hpp"
#include "NodeProfile.hpp"
#include "WorkloadEnvironment.hpp"


/**
 * Result of a request that a node managed to answer.
 */
struct RequestOutcome {
    enum Status {
        SUCCESS = 0,
        SERVER_ERROR
    };

    RequestOutcome() : status(SUCCESS), latency(), reportedLatency(), loadFactor(1.0), requestNum(0), misbehaved(false) {}

    unsigned int getHttpStatus() const {
        return status == SUCCESS ? 200 : 500;
    }

    Status status;
    Duration latency;           ///< Time the request really took
    Duration reportedLatency;   ///< Time the node claims the request took
    double loadFactor;          ///< Load factor applied to the request
    unsigned long requestNum;   ///< Sequence number of the request in this node
    bool misbehaved;            ///< Whether the fault of the node was triggered
};


/**
 * Diagnostic information about a node.
 */
struct HealthReport {
    uint32_t nodeId;
    bool alive;
    Duration uptime;
    FaultClass fault;
    unsigned long totalRequests;
};


/**
 * Thrown when a node crashes while handling a request. The request gets no answer at all.
 */
class NodeCrashed : public std::runtime_error {
public:
    explicit NodeCrashed(uint32_t id);

    uint32_t getNodeId() const {
        return nodeId;
    }

private:
    uint32_t nodeId;
};


/**
 * \brief Fault behaviour of a simulated backend node.
 *
 * Each request goes through the same phases: network noise, load factor, fault decision,
 * workload and resource gauge update. The probability of misbehaving grows with the uptime
 * of the node until it saturates, so a detector must follow a moving target.
 *
 * Every engine owns its random generators, seeded with the node ID. Engines share no state,
 * and concurrent requests to the same engine are serialized while they update it.
 */
class FaultEngine {
public:
    /// Uptime after which the fault probability stops growing.
    static const Duration rampWindow;
    /// Factor over the base fault probability once saturated.
    static const double saturationFactor;
    /// Period of the traffic cycles.
    static const Duration loadPeriod;
    /// Probability of a load spike in a request.
    static const double spikeProbability;
    /// Probability of extra I/O latency in a request.
    static const double ioProbability;
    /// Number of requests between two simulated garbage collections.
    static const unsigned long memoryResetWindow;
    /// Memory leaked by each request, in bytes.
    static const double memoryPerRequest;

    /**
     * Creates the engine of a node. Its start time is the current time.
     * @param id Node ID, from 1 to N.
     * @param f Fault class of the node.
     * @param env Environment where the work is performed. It must outlive the engine.
     */
    FaultEngine(uint32_t id, FaultClass f, WorkloadEnvironment & env);

    /**
     * Handles a request.
     * @return The outcome, which may be an error one.
     * @throws NodeCrashed If the node crashes during this request or has already crashed.
     */
    RequestOutcome handleRequest();

    /**
     * Returns liveness, uptime, fault class and number of requests.
     */
    HealthReport getHealth() const;

    /**
     * Probability that a node of a certain class misbehaves after some uptime. It grows
     * linearly from the base probability to saturationFactor times it in rampWindow, and it
     * is never greater than 1.
     */
    static double getFaultProbability(FaultClass f, Duration uptime);

    /// Probability that this node misbehaves in its next request.
    double getFaultProbability() const;

    uint32_t getId() const {
        return id;
    }

    /// Returns the name of the node, node-<id>.
    std::string getName() const;

    FaultClass getFaultClass() const {
        return fault;
    }

    const NodeProfile & getProfile() const {
        return profile;
    }

    Time getStartTime() const {
        return startTime;
    }

    /// Returns the CPU usage gauge, in percent.
    double getCpuUsage() const;

    /// Returns the resident memory gauge, in bytes.
    double getMemoryUsage() const;

    unsigned long getTotalRequests() const;

    bool isAlive() const;

private:
    // Decisions taken for one request before any time passes
    struct RequestPlan;

    Duration drawNetworkDelay();
    double drawLoadFactor(Duration uptime);
    void updateGauges(double loadFactor);
    double uniform(double min, double max);
    double normal(double mu, double sigma);

    const uint32_t id;
    const FaultClass fault;
    const NodeProfile profile;
    WorkloadEnvironment & env;
    const Time startTime;

    mutable boost::mutex mutex;   ///< Protects the runtime state below
    boost::random::mt19937 gen;   ///< Request-level random generator
    unsigned long requests;
    double cpuUsage;
    double memoryUsage;
    bool crashed;

    // Non-copyable
    FaultEngine(const FaultEngine &);
    FaultEngine & operator=(const FaultEngine &);
};

#endif /* FAULTENGINE_H_ */
