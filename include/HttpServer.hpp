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

#ifndef HTTPSERVER_H_
#define HTTPSERVER_H_

#include <map>
#include <string>
#include <stdexcept>
#include <stdint.h>
#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/function.hpp>
#include <boost/scoped_ptr.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/thread/thread.hpp>
#include "Time.hpp"


/**
 * \brief Minimal HTTP/1.1 server.
 *
 * An IO thread accepts connections and hands each of them to a worker pool, where a session
 * reads one request, runs the handler of its path and writes the response. A client that
 * does not send its request before the read timeout is disconnected. Handlers may run
 * concurrently, so they must be thread-safe.
 */
class HttpServer {
public:
    typedef boost::beast::http::request<boost::beast::http::string_body> Request;
    typedef boost::beast::http::response<boost::beast::http::string_body> Response;
    /// Fills in the response to a request. The response starts as an empty 200 OK.
    typedef boost::function<void (const Request &, Response &)> Handler;

    /**
     * Thrown by a handler to close the connection without sending any response.
     */
    class AbortConnection : public std::runtime_error {
    public:
        AbortConnection() : std::runtime_error("connection aborted by handler") {}
    };

    /**
     * Creates a server.
     * @param port Port to listen to, 0 for an ephemeral one.
     * @param workers Number of sessions served at the same time.
     * @param readTimeout Time a session waits for the request.
     */
    HttpServer(uint16_t port, unsigned int workers, Duration readTimeout = Duration(30.0));

    ~HttpServer();

    /**
     * Sets the handler of a path. The query string is not part of the path.
     */
    void route(const std::string & path, Handler h);

    /**
     * Sets the handler for the paths without their own handler. Without it, they get a 404.
     */
    void setDefaultHandler(Handler h) {
        defaultHandler = h;
    }

    /**
     * Starts listening to incoming connections. Call it only once.
     */
    void start();

    /**
     * Stops accepting connections and waits for the sessions in progress to finish. Idle
     * sessions finish at most after the read timeout.
     */
    void stop();

    /**
     * Returns the port the server listens to, once started.
     */
    uint16_t getPort() const;

    /// Returns the path of a request target, without the query string.
    static std::string getPath(const Request & req);

    /// Returns the value of a query string parameter, or an empty string.
    static std::string getParameter(const Request & req, const std::string & name);

private:
    /// A connection with its own event loop, so that the worker can wait for it with a deadline
    struct Session {
        Session() : stream(io) {}
        boost::asio::io_context io;
        boost::beast::tcp_stream stream;
    };

    void accept();
    void handleAccept(const boost::system::error_code & error);
    void serve(boost::shared_ptr<Session> session);

    // Non-copyable
    HttpServer(const HttpServer &);
    HttpServer & operator=(const HttpServer &);

    uint16_t port;
    unsigned int numWorkers;
    Duration readTimeout;
    std::map<std::string, Handler> handlers;
    Handler defaultHandler;

    boost::asio::io_context io;                         ///< IO object from asio lib
    boost::asio::ip::tcp::acceptor acceptor;            ///< Acceptor for incoming connections
    boost::shared_ptr<Session> incoming;                ///< Session for an incoming connection
    boost::scoped_ptr<boost::thread> t;                 ///< Thread for the handling of asynchronous events
    boost::scoped_ptr<boost::asio::thread_pool> pool;   ///< Workers running the sessions
};

#endif /* HTTPSERVER_H_ */
