/*
 *  STaRS, Scalable Task Routing approach to distributed Scheduling
 *  Copyright (C) 2012 Javier Celaya
 *
 *  This file is part of STaRS.
 *
 *  STaRS is free software; you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation; either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  STaRS is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with STaRS; if not, see <http://www.gnu.org/licenses/>.
 */

#ifndef SIMULATOR_H_
#define SIMULATOR_H_

#include <string>
#include <vector>
#include <stdint.h>
#include <boost/filesystem/path.hpp>
#include "Time.hpp"
#include "Properties.hpp"
#include "FaultClass.hpp"
#include "Dispatcher.hpp"
class ConfigurationManager;


/**
 * Main simulator class.
 *
 * Closes the loop between the nodes, the weight engine and the dispatcher in a single
 * process, over a virtual clock. Nodes are fault engines that spend no real time, the
 * dispatcher reaches them through a local gateway and their telemetry goes to a windowed
 * metrics store instead of Prometheus.
 */
class Simulator {
public:
    /**
     * Returns the singleton instance.
     */
    static Simulator & getInstance() {
        static Simulator instance;
        return instance;
    }

    /**
     * Returns the virtual time.
     */
    Time getCurrentTime() const {
        return now;
    }

    /**
     * Runs a simulation with the given configuration and prints its results.
     * @return The statistics of the dispatched requests.
     */
    DispatchStatistics run(const ConfigurationManager & cfg);

    /**
     * Parses a comma-separated list of fault classes.
     * @throws std::invalid_argument If a class is unknown or the list is empty.
     */
    static std::vector<FaultClass> parseFaultTypes(const std::string & list);

    /**
     * Chooses some faulty nodes at random, each with a random class among the given ones.
     * The rest are benign.
     * @param numNodes Number of nodes, with IDs from 1 to numNodes.
     * @param numFaulty Number of faulty nodes.
     * @param types Classes to choose from.
     * @param seed Seed of the choice.
     * @return A NODE_<id>_FAULT entry for every node.
     */
    static Properties assignFaults(unsigned int numNodes, unsigned int numFaulty,
            const std::vector<FaultClass> & types, uint32_t seed);

    /**
     * Writes a fault assignment as a .env file, one NODE_<id>_FAULT line per node.
     * @throws std::runtime_error If the file cannot be written.
     */
    static void writeEnvFile(const Properties & faults, unsigned int numNodes, const boost::filesystem::path & file);

    /// Stops the simulation after the current dispatch.
    void stop() {
        end = true;
    }

private:
    Simulator() : now(Time::getWallClockTime()), end(false) {}

    Time now;                    ///< Virtual time
    volatile bool end;
};

#endif /* SIMULATOR_H_ */
