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

#ifndef FAULTCLASS_H_
#define FAULTCLASS_H_

#include <string>
#include <ostream>
#include <stdint.h>
class Properties;


/**
 * \brief Kind of misbehaviour of a simulated node.
 *
 * The set of classes is closed. Code that behaves differently for each class switches over
 * FaultClass::Type without a default label, so that the compiler points out every place
 * that needs a new case when a class is added.
 */
class FaultClass {
public:
    enum Type {
        BENIGN = 0,
        CRASH,
        DELAY,
        ERROR_500,
        LIE_LATENCY
    };

    enum { numTypes = 5 };

    FaultClass(Type t = BENIGN) : type(t) {}

    operator Type() const {
        return type;
    }

    /**
     * Returns the canonical name of the class, as used in the fault assignment and in the
     * classifier labels: benign, crash, delay, error-500 or lie-latency.
     */
    const char * getName() const;

    /**
     * Returns the probability of misbehaving in a single request right after the node starts.
     */
    double getBaseProbability() const;

    /**
     * Parses a fault class name. Case is ignored, and "500-error" is accepted as an alias
     * of error-500.
     * @throws std::invalid_argument If the name is unknown.
     */
    static FaultClass fromName(const std::string & name);

    /**
     * Returns the name of the variable that holds the fault class of a node, NODE_<id>_FAULT.
     */
    static std::string getVariableName(uint32_t nodeId);

    /**
     * Looks up the fault class of a node in a fault assignment. Nodes without entry are benign.
     * @throws std::invalid_argument If the entry has an unknown value.
     */
    static FaultClass forNode(uint32_t nodeId, const Properties & assignment);

    friend std::ostream & operator<<(std::ostream & os, const FaultClass & f) {
        return os << f.getName();
    }

private:
    Type type;
};

#endif /* FAULTCLASS_H_ */
