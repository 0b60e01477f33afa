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

#ifndef WORKLOADENVIRONMENT_H_
#define WORKLOADENVIRONMENT_H_

#include <boost/thread/mutex.hpp>
#include "Time.hpp"


/**
 * \brief Interface for the environment in which a node performs its work.
 *
 * The fault engine decides how long each phase of a request lasts; the environment makes that
 * time pass. In real time the thread actually waits or burns CPU, while a simulation just
 * accounts for it.
 */
class WorkloadEnvironment {
public:
    virtual ~WorkloadEnvironment() {}

    /**
     * Waits for a period without using the CPU, like a network transfer or an I/O operation.
     * @param d The nominal length of the wait.
     * @return The time actually spent.
     */
    virtual Duration stall(Duration d) = 0;

    /**
     * Performs CPU-bound work for a period.
     * @param d The nominal length of the work.
     * @return The time actually spent.
     */
    virtual Duration compute(Duration d) = 0;
};


/**
 * Environment that makes time pass in the real world.
 */
class RealTimeEnvironment : public WorkloadEnvironment {
public:
    virtual Duration stall(Duration d);
    virtual Duration compute(Duration d);
};


/**
 * Environment for simulations and tests, where every phase takes exactly its nominal length
 * and returns immediately. It may be shared by engines serving requests concurrently.
 */
class SimulatedEnvironment : public WorkloadEnvironment {
public:
    SimulatedEnvironment() : busyTime(0.0) {}

    virtual Duration stall(Duration d) {
        return d.is_negative() ? Duration() : d;
    }

    virtual Duration compute(Duration d) {
        if (d.is_negative()) return Duration();
        boost::mutex::scoped_lock lock(mutex);
        busyTime += d;
        return d;
    }

    /// Total CPU time requested through compute.
    Duration getBusyTime() const {
        boost::mutex::scoped_lock lock(mutex);
        return busyTime;
    }

private:
    mutable boost::mutex mutex;
    Duration busyTime;
};

#endif /* WORKLOADENVIRONMENT_H_ */
