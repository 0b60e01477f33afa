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

#ifndef PERIODICTASK_H_
#define PERIODICTASK_H_

#include <string>
#include <boost/asio.hpp>
#include <boost/function.hpp>
#include <boost/scoped_ptr.hpp>
#include <boost/atomic.hpp>
#include <boost/thread/thread.hpp>
#include "Time.hpp"


/**
 * \brief Runs a function at a fixed rate in its own thread.
 *
 * Each run is scheduled one period after the previous one was scheduled, not after it
 * finished. When a run lasts longer than a period, the next one starts right after it.
 */
class PeriodicTask {
public:
    typedef boost::function<void ()> Task;

    PeriodicTask(const std::string & name, Duration period, Task task);

    ~PeriodicTask();

    /**
     * Starts the thread. The first run happens immediately.
     */
    void start();

    /**
     * Cancels the next runs and waits for the current one to finish.
     */
    void stop();

    bool isRunning() const {
        return t.get() != NULL;
    }

    unsigned long getNumRuns() const {
        return runs.load();
    }

private:
    void handleTimer(const boost::system::error_code & error);

    // Non-copyable
    PeriodicTask(const PeriodicTask &);
    PeriodicTask & operator=(const PeriodicTask &);

    std::string name;
    Duration period;
    Task task;
    boost::atomic<unsigned long> runs;

    boost::asio::io_context io;
    boost::asio::deadline_timer timer;
    boost::scoped_ptr<boost::thread> t;
};

#endif /* PERIODICTASK_H_ */
