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

#include <cstring>
#include <boost/filesystem/fstream.hpp>
#include "Properties.hpp"
namespace fs = boost::filesystem;


std::ostream & operator<<(std::ostream & os, const Properties & o) {
    for (Properties::const_iterator it = o.begin(); it != o.end(); it++) {
        os << it->first << "=" << it->second << " ";
    }
    return os;
}


void Properties::loadFrom(std::istream & is) {
    std::string nextLine;

    while (std::getline(is, nextLine)) {
        // Remove a trailing CR of files edited in other systems
        if (!nextLine.empty() && nextLine[nextLine.length() - 1] == '\r')
            nextLine.erase(nextLine.length() - 1);
        // If it is just an empty line, skip it
        if (nextLine.length() == 0) continue;
        // If it is a comment, skip it
        if (nextLine[0] == '#') continue;
        if (nextLine.compare(0, 7, "export ") == 0)
            nextLine.erase(0, 7);

        // Get key
        size_t equalPos = nextLine.find_first_of('=');
        if (equalPos == std::string::npos) continue; // wrong format
        // Get Value
        // BEWARE!! Spaces are not ignored, as they can be part of valid values
        std::string value = nextLine.substr(equalPos + 1);
        if (value.length() >= 2 && value[0] == '"' && value[value.length() - 1] == '"')
            value = value.substr(1, value.length() - 2);
        (*this)[nextLine.substr(0, equalPos)] = value;
    }
}


bool Properties::loadFromFile(const fs::path & fileName) {
    fs::ifstream ifs(fileName);
    if (!ifs.is_open()) return false;
    loadFrom(ifs);
    return true;
}


void Properties::loadFromEnvironment(char ** env, const std::string & prefix) {
    if (env == NULL) return;
    for (char ** var = env; *var != NULL; ++var) {
        const char * equal = std::strchr(*var, '=');
        if (equal == NULL) continue;
        std::string key(*var, equal - *var);
        if (key.compare(0, prefix.length(), prefix) == 0)
            (*this)[key] = std::string(equal + 1);
    }
}
