/*
 *  PeerComp - Highly Scalable Distributed Computing Architecture
 *  Copyright (C) 2007 Javier Celaya
 *
 *  This file is part of PeerComp.
 *
 *  PeerComp is free software; you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation; either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  PeerComp is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with PeerComp; if not, write to the Free Software Foundation, Inc.,
 *  51 Franklin St, Fifth Floor, Boston, MA  02110-1301  USA
 *
 */

#include <boost/bind/bind.hpp>
#include "PeriodicTask.hpp"
#include "Logger.hpp"
namespace net = boost::asio;
using boost::bind;


PeriodicTask::PeriodicTask(const std::string & n, Duration p, Task f) : name(n), period(p), task(f), runs(0),
        timer(io) {}


PeriodicTask::~PeriodicTask() {
    stop();
}


void PeriodicTask::start() {
    if (t.get()) return;
    timer.expires_from_now(boost::posix_time::microseconds(0));
    timer.async_wait(bind(&PeriodicTask::handleTimer, this, net::placeholders::error));
    t.reset(new boost::thread([this] () { io.run(); }));
    LogMsg("Core", DEBUG) << "Task " << name << " runs every " << period;
}


void PeriodicTask::stop() {
    if (t.get()) {
        io.stop();
        t->join();
        t.reset();
        LogMsg("Core", DEBUG) << "Task " << name << " stopped after " << runs.load() << " runs";
    }
}


void PeriodicTask::handleTimer(const boost::system::error_code & error) {
    if (error) return;
    ++runs;
    try {
        task();
    } catch (std::exception & e) {
        LogMsg("Core", ERROR) << "Task " << name << " failed: " << e.what();
    }
    // Program next run
    timer.expires_at(timer.expires_at() + period.to_posix_duration());
    timer.async_wait(bind(&PeriodicTask::handleTimer, this, net::placeholders::error));
}
