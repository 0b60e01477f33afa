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

#ifndef LOGGER_H_
#define LOGGER_H_

#include <string>
#include <ostream>
#include <boost/filesystem/path.hpp>


/**
 * \brief Log message builder.
 *
 * A LogMsg collects the values streamed into it and hands them to the log4cpp category
 * when it is destroyed, at the end of the full expression:
 * @code
 * LogMsg("Dsp", INFO) << "Routing to node-" << id;
 * @endcode
 * Values are kept by reference, so a LogMsg must never outlive its statement.
 */
class LogMsg {
public:
    class AbstractTypeContainer {
    public:
        AbstractTypeContainer() : next(NULL) {}
        virtual ~AbstractTypeContainer() {}
        virtual void output(std::ostream & os) const = 0;
        friend std::ostream & operator<<(std::ostream & os, const AbstractTypeContainer & r) {
            r.output(os);
            return os;
        }

        AbstractTypeContainer * next;
    };

    /**
     * Initializes the logging facility with a configuration string. The string contains
     * category=PRIORITY pairs, separated by a semicolon, like "root=WARN;Dsp=DEBUG".
     * @param config String with the configuration of the priorities.
     */
    static void initLog(const std::string & config) {
        int start = 0, end = config.find_first_of(';');
        while (end != (int)std::string::npos) {
            setPriority(config.substr(start, end - start));
            start = end + 1;
            end = config.find_first_of(';', start);
        }
        setPriority(config.substr(start));
    }

    /**
     * Adds an appender to the root category that writes to the standard output.
     */
    static void addConsoleLogging();

    /**
     * Adds an appender to the root category that writes to a file.
     * @param logFile Path of the log file.
     * @param append Whether to append to an existing file or truncate it.
     */
    static void addFileLogging(const boost::filesystem::path & logFile, bool append = true);

    LogMsg(const char * c, int p) : first(NULL), last(NULL), category(c), priority(p) {}

    ~LogMsg() {
        if (first != NULL) {
            log(category, priority, first);
            while (first != NULL) {
                AbstractTypeContainer * next = first->next;
                delete first;
                first = next;
            }
        }
    }

    template <typename T> LogMsg & operator<<(const T & value) {
        AbstractTypeContainer * n = new TypeReference<T>(value);
        if (first == NULL)
            first = last = n;
        else
            last = last->next = n;
        return *this;
    }

    /**
     * Returns whether a message of a certain priority would be output in a category.
     */
    static bool isEnabled(const char * category, int priority);

private:
    template <typename T> class TypeReference : public AbstractTypeContainer {
        const T * value;
    public:
        TypeReference(const T & i) : value(&i) {}
        void output(std::ostream & os) const {
            os << *value;
        }
    };

    AbstractTypeContainer * first, * last;
    const char * category;
    int priority;

    static void log(const char * category, int priority, AbstractTypeContainer * values);
    static void setPriority(const std::string & catPrio);

    // Non-copyable, it owns the value list
    LogMsg(const LogMsg &);
    LogMsg & operator=(const LogMsg &);
};


typedef enum {
    EMERG  = 0,
    FATAL  = 0,
    ALERT  = 100,
    CRIT   = 200,
    ERROR  = 300,
    WARN   = 400,
    NOTICE = 500,
    INFO   = 600,
    DEBUG  = 700,
    NOTSET = 800
} log4cppPriorityLevel;

#endif /*LOGGER_H_*/
