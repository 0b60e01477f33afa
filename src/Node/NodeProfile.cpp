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
#include <boost/random/mersenne_twister.hpp>
#include <boost/random/uniform_real_distribution.hpp>
#include "NodeProfile.hpp"


NodeProfile NodeProfile::generate(uint32_t nodeId) {
    typedef boost::random::uniform_real_distribution<double> uniform;
    const double pi = 3.14159265358979323846;
    boost::random::mt19937 gen(nodeId);
    NodeProfile p;
    p.baseLatency = Duration::milliseconds(uniform(10.0, 50.0)(gen));
    p.baseCpuLoad = uniform(0.2, 0.5)(gen);
    p.workloadVariation = uniform(0.3, 0.7)(gen);
    p.jitter = Duration::milliseconds(uniform(2.0, 15.0)(gen));
    p.packetLoss = uniform(0.001, 0.02)(gen);
    p.stability = uniform(0.7, 1.0)(gen);
    p.phase = uniform(0.0, 2.0 * pi)(gen);
    p.baseMemory = uniform(40.0, 80.0)(gen) * 1024.0 * 1024.0;
    return p;
}


std::ostream & operator<<(std::ostream & os, const NodeProfile & p) {
    return os << "latency " << p.baseLatency.milliseconds() << "ms, cpu " << p.baseCpuLoad
           << ", variation " << p.workloadVariation << ", jitter " << p.jitter.milliseconds()
           << "ms, loss " << p.packetLoss << ", stability " << p.stability;
}
