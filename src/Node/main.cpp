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

#include <iostream>
#include <csignal>
#include <boost/asio.hpp>
#include <boost/scoped_ptr.hpp>
#include <boost/thread/thread.hpp>
#include "ConfigurationManager.hpp"
#include "Logger.hpp"
#include "Properties.hpp"
#include "FaultClass.hpp"
#include "FaultEngine.hpp"
#include "NodeService.hpp"
#include "WorkloadEnvironment.hpp"
namespace fs = boost::filesystem;

extern char ** environ;


int main(int argc, char * argv[]) {
    try {
        // Try to load default config file
        fs::path defaultConfigFile(".trustlbrc");
        if (fs::exists(defaultConfigFile))
            ConfigurationManager::getInstance().loadConfigFile(defaultConfigFile);
        // Command line overrides config file
        if (ConfigurationManager::getInstance().loadCommandLine(argc, argv, "trustlb-node")) return 0;
        ConfigurationManager & cfg = ConfigurationManager::getInstance();
        // Start logging
        LogMsg::initLog(cfg.getLogConfig());
        LogMsg::addConsoleLogging();
        if (!cfg.getLogFile().empty())
            LogMsg::addFileLogging(cfg.getLogFile());

        // The environment overrides the fault assignment file
        Properties faults;
        if (!faults.loadFromFile(cfg.getFaultsFile()))
            LogMsg("Node", INFO) << "No fault assignment file " << cfg.getFaultsFile();
        faults.loadFromEnvironment(environ, "NODE_");
        FaultClass fault = FaultClass::forNode(cfg.getNodeId(), faults);

        boost::scoped_ptr<WorkloadEnvironment> env;
        if (cfg.isRealTime())
            env.reset(new RealTimeEnvironment);
        else
            env.reset(new SimulatedEnvironment);
        FaultEngine engine(cfg.getNodeId(), fault, *env);
        NodeService service(engine, cfg.getPort(), cfg.getWorkers());
        service.start();

        boost::asio::io_context io;
        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&service] (const boost::system::error_code & error, int) {
            if (!error) service.requestShutdown();
        });
        boost::thread signalThread([&io] () { io.run(); });

        bool crashed = service.waitForTermination();
        io.stop();
        signalThread.join();
        service.stop();
        if (crashed) {
            LogMsg("Node", FATAL) << engine.getName() << " crashed after " << engine.getTotalRequests() << " requests";
            return 1;
        }
        LogMsg("Node", INFO) << "Gracely exiting";
        return 0;
    } catch (std::exception & e) {
        std::cerr << "Exception caught: " << e.what() << std::endl;
        return 1;
    }
}
