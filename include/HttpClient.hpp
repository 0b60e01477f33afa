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

#ifndef HTTPCLIENT_H_
#define HTTPCLIENT_H_

#include <string>
#include <stdexcept>
#include <stdint.h>
#include "Time.hpp"


/**
 * Transport failure of an HTTP request: the server could not be reached, the connection
 * was dropped or the deadline passed.
 */
class HttpError : public std::runtime_error {
public:
    HttpError(const std::string & what, bool t) : std::runtime_error(what), timeout(t) {}

    bool isTimeout() const {
        return timeout;
    }

private:
    bool timeout;
};


/**
 * \brief Blocking HTTP GET client with a deadline.
 *
 * Each request uses its own connection and IO context, so several threads can issue requests
 * at the same time.
 */
class HttpClient {
public:
    struct Reply {
        Reply() : status(0) {}
        unsigned int status;
        std::string contentType;
        std::string body;
        Duration elapsed;
    };

    /**
     * Sends a GET request and waits for its response.
     * @param host Server host name or address.
     * @param port Server port.
     * @param target Path and query string.
     * @param timeout Deadline for the whole exchange, from name resolution to the last byte.
     * @return The response, whatever its status.
     * @throws HttpError If no response arrives before the deadline.
     */
    static Reply get(const std::string & host, uint16_t port, const std::string & target, Duration timeout);

    /**
     * Encodes a string for the query part of a URL.
     */
    static std::string urlEncode(const std::string & s);
};

#endif /* HTTPCLIENT_H_ */
