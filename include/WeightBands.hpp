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

#ifndef WEIGHTBANDS_H_
#define WEIGHTBANDS_H_

#include <ostream>


/**
 * \brief Maps a faulty probability to a discrete routing weight.
 *
 * Probabilities below the low cut point are trusted, those below the high cut point are
 * suspicious and the rest are faulty. Cut points belong to the higher band.
 */
class WeightBands {
public:
    enum Band {
        TRUSTED = 0,
        SUSPICIOUS,
        FAULTY
    };

    /**
     * @throws std::invalid_argument Unless 0 <= low <= high <= 1 and every weight is
     *         non-negative.
     */
    WeightBands(double low = 0.20, double high = 0.60, double trusted = 1.0, double suspicious = 0.5,
            double faulty = 0.1);

    /// Returns the band of a probability. An undefined probability is trusted.
    Band getBand(double pFaulty) const;

    double getWeight(Band b) const {
        return weights[b];
    }

    double getWeight(double pFaulty) const {
        return weights[getBand(pFaulty)];
    }

    /// Weight of a node that could not be classified.
    double getDefaultWeight() const {
        return weights[TRUSTED];
    }

    static const char * getBandName(Band b);

    friend std::ostream & operator<<(std::ostream & os, const WeightBands & b);

private:
    double low, high;
    double weights[3];
};

#endif /* WEIGHTBANDS_H_ */
