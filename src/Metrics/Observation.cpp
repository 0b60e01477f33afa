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
#include <limits>
#include "MetricsSource.hpp"


namespace {
const double missing = std::numeric_limits<double>::quiet_NaN();

double sanitize(double v) {
    return (std::isnan(v) || std::isinf(v)) ? 0.0 : v;
}

const char * featureNames[Observation::numFeatures] = {
    "latency_ms", "error_500_count", "cpu_usage_rate", "resident_mem_mb"
};
}


Observation::Observation() : nodeId(0), timestamp(Time::getCurrentTime()), latency(missing), errors(missing),
        cpuRate(missing), memory(missing) {}


unsigned int Observation::countMissing() const {
    return std::isnan(latency) + std::isnan(errors) + std::isnan(cpuRate) + std::isnan(memory);
}


Observation Observation::sanitized() const {
    Observation o(*this);
    o.latency = sanitize(latency);
    o.errors = sanitize(errors);
    o.cpuRate = sanitize(cpuRate);
    o.memory = sanitize(memory);
    return o;
}


std::vector<double> Observation::toFeatures() const {
    std::vector<double> f(numFeatures);
    f[0] = latency * 1000.0;
    f[1] = errors;
    f[2] = cpuRate;
    f[3] = memory / (1024.0 * 1024.0);
    return f;
}


const char * Observation::getFeatureName(unsigned int i) {
    return i < numFeatures ? featureNames[i] : "";
}


std::ostream & operator<<(std::ostream & os, const Observation & o) {
    return os << "node-" << o.nodeId << " latency " << o.latency << "s, errors " << o.errors
           << ", cpu " << o.cpuRate << ", mem " << o.memory / (1024.0 * 1024.0) << "MB";
}
