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

#include <cctype>
#include <chrono>
#include <cstdio>
#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/lexical_cast.hpp>
#include "HttpClient.hpp"
#include "Logger.hpp"
namespace net = boost::asio;
namespace http = boost::beast::http;
using net::ip::tcp;
using boost::system::error_code;


HttpClient::Reply HttpClient::get(const std::string & host, uint16_t port, const std::string & target, Duration timeout) {
    // Beast synchronous operations have no deadline, so run the asynchronous ones in a
    // private IO context with a timer that cancels them.
    net::io_context io;
    tcp::resolver resolver(io);
    tcp::socket socket(io);
    net::steady_timer timer(io);
    boost::beast::flat_buffer buffer;
    http::request<http::empty_body> req(http::verb::get, target, 11);
    http::response<http::string_body> res;
    error_code error;
    const char * stage = "resolve";
    bool timedOut = false, done = false;
    Time start = Time::getWallClockTime();

    req.set(http::field::host, host);
    req.set(http::field::user_agent, "trustlb");
    req.keep_alive(false);

    timer.expires_after(std::chrono::microseconds(timeout.is_negative() ? 0 : timeout.microseconds()));
    timer.async_wait([&] (const error_code & ec) {
        if (!ec && !done) {
            timedOut = true;
            error_code ignored;
            resolver.cancel();
            socket.close(ignored);
        }
    });

    // Stops the exchange, successful or not
    auto finish = [&] (const error_code & ec) {
        done = true;
        error = ec;
        timer.cancel();
        error_code ignored;
        socket.shutdown(tcp::socket::shutdown_both, ignored);
        socket.close(ignored);
    };

    resolver.async_resolve(host, boost::lexical_cast<std::string>(port),
            [&] (const error_code & ec, tcp::resolver::results_type results) {
        if (ec) return finish(ec);
        stage = "connect";
        net::async_connect(socket, results, [&] (const error_code & ec, const tcp::endpoint &) {
            if (ec) return finish(ec);
            stage = "send";
            http::async_write(socket, req, [&] (const error_code & ec, std::size_t) {
                if (ec) return finish(ec);
                stage = "receive";
                http::async_read(socket, buffer, res, [&] (const error_code & ec, std::size_t) {
                    finish(ec);
                });
            });
        });
    });

    io.run();

    if (timedOut) {
        LogMsg("Net", DEBUG) << "GET " << host << ':' << port << target << " timed out in " << stage;
        throw HttpError("timeout in " + std::string(stage) + " after " + boost::lexical_cast<std::string>(timeout.seconds()) + "s", true);
    }
    if (error) {
        LogMsg("Net", DEBUG) << "GET " << host << ':' << port << target << " failed in " << stage << ": " << error.message();
        throw HttpError(std::string(stage) + " failed: " + error.message(), false);
    }

    Reply reply;
    reply.status = res.result_int();
    boost::beast::string_view type = res[http::field::content_type];
    reply.contentType.assign(type.data(), type.size());
    reply.body = res.body();
    reply.elapsed = Time::getWallClockTime() - start;
    return reply;
}


std::string HttpClient::urlEncode(const std::string & s) {
    std::string result;
    for (std::string::const_iterator i = s.begin(); i != s.end(); ++i) {
        unsigned char c = *i;
        if (isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
            result += c;
        else {
            char hex[4];
            std::snprintf(hex, sizeof(hex), "%%%02X", c);
            result += hex;
        }
    }
    return result;
}
