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

#include <boost/thread/thread.hpp>
#include <boost/chrono/duration.hpp>
#include "WorkloadEnvironment.hpp"


Duration RealTimeEnvironment::stall(Duration d) {
    if (d.is_negative() || d == Duration()) return Duration();
    Time start = Time::getWallClockTime();
    boost::this_thread::sleep_for(boost::chrono::microseconds(d.microseconds()));
    return Time::getWallClockTime() - start;
}


Duration RealTimeEnvironment::compute(Duration d) {
    Time start = Time::getWallClockTime(), end = start + d;
    volatile uint64_t sink = 0;
    do {
        // Sum of squares in small chunks, checking the clock between them
        uint64_t acc = 0;
        for (uint64_t i = 0; i < 20000; ++i)
            acc += i * i;
        sink = sink + acc;
    } while (Time::getWallClockTime() < end);
    return Time::getWallClockTime() - start;
}
