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

#include <iostream>
#include <stdexcept>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem/fstream.hpp>
#include <log4cpp/Category.hh>
#include <log4cpp/Priority.hh>
#include <log4cpp/PatternLayout.hh>
#include <log4cpp/OstreamAppender.hh>
#include <log4cpp/LayoutAppender.hh>
#include "Logger.hpp"
namespace fs = boost::filesystem;


namespace {
// time_duration fix >2 hour digits
struct fix2hourdigits {
    fix2hourdigits() {
        static const char * format = "%O:%M:%S%F";
        boost::posix_time::time_facet::default_time_duration_format = format;
    }
} fix2hourdigits_var;


const char * defaultPattern = "%d{%H:%M:%S.%l} %p %c : %m%n";


class BoostFileAppender : public log4cpp::LayoutAppender {
protected:
    virtual void _append(const log4cpp::LoggingEvent & event) {
        os << _getLayout().format(event);
        os.flush();
    }

    fs::ofstream os;

public:
    /**
     * Constructs a BoostFileAppender.
     * @param name the name of the Appender.
     * @param fileName the name of the file to which the Appender has to log.
     * @param append whether the Appender has to truncate the file or
     * just append to it if it already exists.
     */
    BoostFileAppender(const std::string & name, const fs::path & fileName, bool append) :
            log4cpp::LayoutAppender(name) {
        os.open(fileName, std::ios_base::out | (append ? std::ios_base::app : std::ios_base::trunc));
    }

    virtual ~BoostFileAppender() {
        close();
    }

    void close() {
        os.close();
    }
};
}


void LogMsg::addConsoleLogging() {
    log4cpp::OstreamAppender * console = new log4cpp::OstreamAppender("ConsoleAppender", &std::cout);
    log4cpp::PatternLayout * layout = new log4cpp::PatternLayout();
    layout->setConversionPattern(defaultPattern);
    console->setLayout(layout);
    log4cpp::Category::getRoot().addAppender(console);
}


void LogMsg::addFileLogging(const fs::path & logFile, bool append) {
    BoostFileAppender * file = new BoostFileAppender(logFile.string(), logFile, append);
    log4cpp::PatternLayout * layout = new log4cpp::PatternLayout();
    layout->setConversionPattern(defaultPattern);
    file->setLayout(layout);
    log4cpp::Category::getRoot().addAppender(file);
}


void LogMsg::setPriority(const std::string & catPrio) {
    int pos = catPrio.find_first_of('=');
    if (pos == (int)std::string::npos) return;
    std::string category = catPrio.substr(0, pos);
    std::string priority = catPrio.substr(pos + 1);
    try {
        log4cpp::Priority::Value p = log4cpp::Priority::getPriorityValue(priority);
        if (category == "root") {
            log4cpp::Category::setRootPriority(p);
        } else {
            log4cpp::Category::getInstance(category).setPriority(p);
        }
    } catch (std::invalid_argument & e) {
        std::cerr << "Unknown log priority in \"" << catPrio << "\": " << e.what() << std::endl;
    }
}


bool LogMsg::isEnabled(const char * category, int priority) {
    return log4cpp::Category::getInstance(category).isPriorityEnabled(priority);
}


void LogMsg::log(const char * category, int priority, LogMsg::AbstractTypeContainer * values) {
    log4cpp::Category & cat = log4cpp::Category::getInstance(category);
    if (cat.isPriorityEnabled(priority)) {
        log4cpp::CategoryStream cs = cat.getStream(priority);
        for (AbstractTypeContainer * it = values; it != NULL; it = it->next)
            cs << *it;
    }
}
