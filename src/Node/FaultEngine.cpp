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

#include <cmath>
#include <sstream>
#include <algorithm>
#include <boost/lexical_cast.hpp>
#include <boost/random/uniform_real_distribution.hpp>
#include <boost/random/normal_distribution.hpp>
#include "FaultEngine.hpp"
#include "Logger.hpp"


const Duration FaultEngine::rampWindow(300.0);
const double FaultEngine::saturationFactor = 1.5;
const Duration FaultEngine::loadPeriod(300.0);
const double FaultEngine::spikeProbability = 0.05;
const double FaultEngine::ioProbability = 0.3;
const unsigned long FaultEngine::memoryResetWindow = 1000;
const double FaultEngine::memoryPerRequest = 64.0 * 1024.0;


NodeCrashed::NodeCrashed(uint32_t id)
        : std::runtime_error("node-" + boost::lexical_cast<std::string>(id) + " crashed"), nodeId(id) {}


struct FaultEngine::RequestPlan {
    RequestPlan() : network(), stall(), hidden(), work(), io(), loadFactor(1.0), requestNum(0),
        misbehaved(false), error(false) {}

    Duration network;   ///< Network noise and retransmissions
    Duration stall;     ///< Stall of a delay fault
    Duration hidden;    ///< Work that the node does not report
    Duration work;      ///< Reported CPU-bound work
    Duration io;        ///< Extra I/O wait
    double loadFactor;
    unsigned long requestNum;
    bool misbehaved;
    bool error;
};


FaultEngine::FaultEngine(uint32_t i, FaultClass f, WorkloadEnvironment & e)
        : id(i), fault(f), profile(NodeProfile::generate(i)), env(e), startTime(Time::getCurrentTime()),
          gen(i ^ 0x5bd1e995u), requests(0), cpuUsage(0.0), memoryUsage(profile.getBaseMemory()), crashed(false) {
    LogMsg("Node", INFO) << getName() << " starts as " << fault << ": " << profile;
}


std::string FaultEngine::getName() const {
    std::ostringstream oss;
    oss << "node-" << id;
    return oss.str();
}


double FaultEngine::uniform(double min, double max) {
    return boost::random::uniform_real_distribution<double>(min, max)(gen);
}


double FaultEngine::normal(double mu, double sigma) {
    if (sigma <= 0.0) return mu;
    return boost::random::normal_distribution<double>(mu, sigma)(gen);
}


double FaultEngine::getFaultProbability(FaultClass f, Duration uptime) {
    double base = f.getBaseProbability();
    if (uptime.is_negative()) uptime = Duration();
    double ramp = std::min(uptime.seconds() / rampWindow.seconds(), 1.0);
    return std::min(base * (1.0 + (saturationFactor - 1.0) * ramp), 1.0);
}


double FaultEngine::getFaultProbability() const {
    return getFaultProbability(fault, Time::getCurrentTime() - startTime);
}


Duration FaultEngine::drawNetworkDelay() {
    double delay = std::max(normal(0.0, profile.getJitter().milliseconds()), 0.0);
    if (uniform(0.0, 1.0) < profile.getPacketLoss())
        delay += uniform(50.0, 150.0);
    return Duration::milliseconds(delay);
}


double FaultEngine::drawLoadFactor(Duration uptime) {
    const double pi = 3.14159265358979323846;
    double amplitude = profile.getWorkloadVariation() * (1.5 - profile.getStability());
    double cycle = 2.0 * pi * uptime.seconds() / loadPeriod.seconds() + profile.getPhase();
    double factor = 1.0 + amplitude * std::sin(cycle);
    if (uniform(0.0, 1.0) < spikeProbability)
        factor *= uniform(1.5, 3.0);
    return factor;
}


void FaultEngine::updateGauges(double loadFactor) {
    cpuUsage = std::min(std::max(profile.getBaseCpuLoad() * loadFactor * 100.0 + normal(0.0, 10.0), 0.0), 100.0);
    memoryUsage = profile.getBaseMemory() + (requests % memoryResetWindow) * memoryPerRequest
            + normal(0.0, 512.0 * 1024.0);
    if (memoryUsage < 0.0) memoryUsage = 0.0;
}


RequestOutcome FaultEngine::handleRequest() {
    RequestPlan plan;
    {
        boost::mutex::scoped_lock lock(mutex);
        if (crashed)
            throw NodeCrashed(id);
        plan.requestNum = ++requests;
        Duration uptime = Time::getCurrentTime() - startTime;
        plan.network = drawNetworkDelay();
        plan.loadFactor = drawLoadFactor(uptime);
        plan.misbehaved = uniform(0.0, 1.0) < getFaultProbability(fault, uptime);

        switch (fault) {
            case FaultClass::BENIGN:
                plan.misbehaved = false;
                break;
            case FaultClass::CRASH:
                if (plan.misbehaved) {
                    crashed = true;
                    LogMsg("Node", WARN) << getName() << " crashes at request " << plan.requestNum;
                    throw NodeCrashed(id);
                }
                break;
            case FaultClass::DELAY:
                if (plan.misbehaved)
                    plan.stall = Duration(uniform(6.0, 7.0))
                            + Duration::milliseconds(std::fabs(normal(0.0, profile.getJitter().milliseconds())));
                break;
            case FaultClass::ERROR_500:
                plan.error = plan.misbehaved;
                break;
            case FaultClass::LIE_LATENCY:
                if (plan.misbehaved)
                    plan.hidden = Duration(uniform(3.0, 4.0));
                break;
        }

        // A failing request returns before doing any work
        if (!plan.error) {
            plan.work = profile.getBaseLatency() * (plan.loadFactor * uniform(0.8, 1.2));
            if (uniform(0.0, 1.0) < ioProbability)
                plan.io = Duration::milliseconds(uniform(5.0, 30.0));
        }
    }

    RequestOutcome result;
    result.requestNum = plan.requestNum;
    result.loadFactor = plan.loadFactor;
    result.misbehaved = plan.misbehaved;
    result.status = plan.error ? RequestOutcome::SERVER_ERROR : RequestOutcome::SUCCESS;
    Duration hiddenTime;
    result.latency = env.stall(plan.network);
    if (plan.stall != Duration())
        result.latency += env.stall(plan.stall);
    if (plan.hidden != Duration()) {
        hiddenTime = env.compute(plan.hidden);
        result.latency += hiddenTime;
    }
    if (plan.work != Duration())
        result.latency += env.compute(plan.work);
    if (plan.io != Duration())
        result.latency += env.stall(plan.io);
    result.reportedLatency = result.latency - hiddenTime;

    {
        boost::mutex::scoped_lock lock(mutex);
        updateGauges(plan.loadFactor);
    }

    LogMsg("Node", DEBUG) << getName() << " request " << result.requestNum << " -> " << result.getHttpStatus()
            << " in " << result.latency << (plan.misbehaved ? " (misbehaved)" : "");
    return result;
}


HealthReport FaultEngine::getHealth() const {
    boost::mutex::scoped_lock lock(mutex);
    HealthReport h;
    h.nodeId = id;
    h.alive = !crashed;
    h.uptime = Time::getCurrentTime() - startTime;
    h.fault = fault;
    h.totalRequests = requests;
    return h;
}


double FaultEngine::getCpuUsage() const {
    boost::mutex::scoped_lock lock(mutex);
    return cpuUsage;
}


double FaultEngine::getMemoryUsage() const {
    boost::mutex::scoped_lock lock(mutex);
    return memoryUsage;
}


unsigned long FaultEngine::getTotalRequests() const {
    boost::mutex::scoped_lock lock(mutex);
    return requests;
}


bool FaultEngine::isAlive() const {
    boost::mutex::scoped_lock lock(mutex);
    return !crashed;
}
