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
#include <stdexcept>
#include "WeightBands.hpp"


WeightBands::WeightBands(double l, double h, double trusted, double suspicious, double faulty) : low(l), high(h) {
    if (!(low >= 0.0 && low <= high && high <= 1.0))
        throw std::invalid_argument("weight band cut points must satisfy 0 <= low <= high <= 1");
    if (trusted < 0.0 || suspicious < 0.0 || faulty < 0.0)
        throw std::invalid_argument("weights cannot be negative");
    weights[TRUSTED] = trusted;
    weights[SUSPICIOUS] = suspicious;
    weights[FAULTY] = faulty;
}


WeightBands::Band WeightBands::getBand(double pFaulty) const {
    if (std::isnan(pFaulty) || pFaulty < low) return TRUSTED;
    else if (pFaulty < high) return SUSPICIOUS;
    else return FAULTY;
}


const char * WeightBands::getBandName(Band b) {
    switch (b) {
        case TRUSTED: return "trusted";
        case SUSPICIOUS: return "suspicious";
        case FAULTY: return "faulty";
    }
    return "unknown";
}


std::ostream & operator<<(std::ostream & os, const WeightBands & b) {
    return os << "[0," << b.low << ")->" << b.weights[WeightBands::TRUSTED] << " [" << b.low << ',' << b.high
           << ")->" << b.weights[WeightBands::SUSPICIOUS] << " [" << b.high << ",1]->"
           << b.weights[WeightBands::FAULTY];
}
