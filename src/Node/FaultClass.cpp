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

#include <stdexcept>
#include <sstream>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include "FaultClass.hpp"
#include "Properties.hpp"


const char * FaultClass::getName() const {
    switch (type) {
        case BENIGN: return "benign";
        case CRASH: return "crash";
        case DELAY: return "delay";
        case ERROR_500: return "error-500";
        case LIE_LATENCY: return "lie-latency";
    }
    return "unknown";
}


double FaultClass::getBaseProbability() const {
    switch (type) {
        case BENIGN: return 0.0;
        case CRASH: return 0.001;
        case DELAY: return 0.5;
        case ERROR_500: return 0.4;
        case LIE_LATENCY: return 0.7;
    }
    return 0.0;
}


FaultClass FaultClass::fromName(const std::string & name) {
    std::string n = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name));
    if (n == "benign" || n == "none") return BENIGN;
    else if (n == "crash") return CRASH;
    else if (n == "delay") return DELAY;
    else if (n == "error-500" || n == "500-error") return ERROR_500;
    else if (n == "lie-latency") return LIE_LATENCY;
    throw std::invalid_argument("Unknown fault class: " + name);
}


std::string FaultClass::getVariableName(uint32_t nodeId) {
    std::ostringstream oss;
    oss << "NODE_" << nodeId << "_FAULT";
    return oss.str();
}


FaultClass FaultClass::forNode(uint32_t nodeId, const Properties & assignment) {
    Properties::const_iterator it = assignment.find(getVariableName(nodeId));
    if (it == assignment.end()) return BENIGN;
    return fromName(it->second);
}
