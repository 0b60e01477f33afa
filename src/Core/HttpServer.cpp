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

#include <chrono>
#include <boost/bind/bind.hpp>
#include <boost/beast/core.hpp>
#include "HttpServer.hpp"
#include "Logger.hpp"
namespace net = boost::asio;
namespace http = boost::beast::http;
using net::ip::tcp;
using boost::bind;


HttpServer::HttpServer(uint16_t p, unsigned int workers, Duration timeout) : port(p),
        numWorkers(workers == 0 ? 1 : workers), readTimeout(timeout), acceptor(io) {}


HttpServer::~HttpServer() {
    stop();
}


void HttpServer::route(const std::string & path, Handler h) {
    handlers[path] = h;
}


void HttpServer::start() {
    // Start async accept before creating the thread. It will maintain the thread alive.
    acceptor.open(tcp::v4());
    acceptor.set_option(tcp::acceptor::reuse_address(true));
    acceptor.bind(tcp::endpoint(tcp::v4(), port));
    acceptor.listen();
    port = acceptor.local_endpoint().port();
    pool.reset(new net::thread_pool(numWorkers));
    accept();
    t.reset(new boost::thread([this] () { io.run(); }));
    LogMsg("Net", INFO) << "Thread " << t->get_id() << " accepting connections on port " << port;
}


void HttpServer::stop() {
    if (t.get()) {
        io.stop();
        t->join();
        t.reset();
        boost::system::error_code ec;
        acceptor.close(ec);
        // Let the sessions in progress finish
        pool->join();
        pool.reset();
        LogMsg("Net", INFO) << "Stopped listening on port " << port;
    }
}


uint16_t HttpServer::getPort() const {
    return port;
}


void HttpServer::accept() {
    incoming.reset(new Session);
    acceptor.async_accept(incoming->stream.socket(), bind(&HttpServer::handleAccept, this, net::placeholders::error));
}


void HttpServer::handleAccept(const boost::system::error_code & error) {
    if (!error) {
        net::post(*pool, bind(&HttpServer::serve, this, incoming));
        accept();
    } else if (error != net::error::operation_aborted) {
        LogMsg("Net", WARN) << "Error accepting connection: " << error.message();
        accept();
    }
}


void HttpServer::serve(boost::shared_ptr<Session> session) {
    boost::system::error_code ec;
    boost::beast::flat_buffer buffer;
    Request req;
    session->stream.expires_after(std::chrono::microseconds(readTimeout.microseconds()));
    http::async_read(session->stream, buffer, req, [&ec] (const boost::system::error_code & e, std::size_t) { ec = e; });
    session->io.run();
    if (ec) {
        if (ec == boost::beast::error::timeout)
            LogMsg("Net", DEBUG) << "No request after " << readTimeout << ", closing connection";
        else if (ec != http::error::end_of_stream)
            LogMsg("Net", DEBUG) << "Error reading request: " << ec.message();
        session->stream.close();
        return;
    }
    session->stream.expires_never();
    tcp::socket & socket = session->stream.socket();

    std::string path = getPath(req);
    Response res(http::status::ok, req.version());
    res.set(http::field::server, "trustlb");
    res.keep_alive(false);
    try {
        std::map<std::string, Handler>::iterator it = handlers.find(path);
        if (it != handlers.end())
            it->second(req, res);
        else if (defaultHandler)
            defaultHandler(req, res);
        else {
            res.result(http::status::not_found);
            res.set(http::field::content_type, "text/plain");
            res.body() = "Not Found\n";
        }
    } catch (AbortConnection &) {
        LogMsg("Net", DEBUG) << "Dropping connection for " << path;
        socket.shutdown(tcp::socket::shutdown_both, ec);
        socket.close(ec);
        return;
    } catch (std::exception & e) {
        LogMsg("Net", ERROR) << "Handler of " << path << " failed: " << e.what();
        res = Response(http::status::internal_server_error, req.version());
        res.keep_alive(false);
        res.set(http::field::content_type, "text/plain");
        res.body() = "Internal Server Error\n";
    }
    res.prepare_payload();

    http::write(session->stream, res, ec);
    if (ec)
        LogMsg("Net", DEBUG) << "Error writing response to " << path << ": " << ec.message();
    socket.shutdown(tcp::socket::shutdown_send, ec);
}


std::string HttpServer::getPath(const Request & req) {
    std::string target(req.target().data(), req.target().size());
    return target.substr(0, target.find('?'));
}


std::string HttpServer::getParameter(const Request & req, const std::string & name) {
    std::string target(req.target().data(), req.target().size());
    std::size_t q = target.find('?');
    if (q == std::string::npos) return std::string();
    std::string query = target.substr(q + 1);
    std::size_t start = 0;
    while (start <= query.size()) {
        std::size_t end = query.find('&', start);
        if (end == std::string::npos) end = query.size();
        std::string pair = query.substr(start, end - start);
        std::size_t eq = pair.find('=');
        if (pair.substr(0, eq) == name)
            return eq == std::string::npos ? std::string() : pair.substr(eq + 1);
        start = end + 1;
    }
    return std::string();
}
