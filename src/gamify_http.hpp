/*
 * File: src/gamify_http.hpp
 * Project: Gamification Demo API
 * Purpose: HTTP routing, CORS and the Beast accept/session loop
 * Notes:
 *  - handle_request() is socket-free so tests can drive it directly
 *  - One request per connection; the session shuts down after writing
 *  - Error bodies use {"detail": ...}
 * Last updated: 2026-10-19
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "gamify_state.hpp"
#include "gamify_handlers.hpp"
#include "db_probe.hpp"

namespace http = boost::beast::http;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

inline constexpr const char *kServerName = "gamify-beast";
inline constexpr const char *kAllowedMethods = "DELETE, GET, HEAD, OPTIONS, PATCH, POST, PUT";

// -------- request helpers --------

// Path component of the target, query string dropped and %XX decoded.
inline std::string request_path(const Request &req)
{
    const auto t = req.target();
    std::string target(t.data(), t.size());
    auto q = target.find('?');
    if (q != std::string::npos)
        target.resize(q);

    auto hex = [](char c) -> int
    {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    };

    std::string out;
    out.reserve(target.size());
    for (size_t i = 0; i < target.size(); ++i)
    {
        if (target[i] == '%' && i + 2 < target.size())
        {
            int hi = hex(target[i + 1]);
            int lo = hex(target[i + 2]);
            if (hi >= 0 && lo >= 0)
            {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(target[i]);
    }
    return out;
}

inline std::string header_value(const Request &req, http::field f)
{
    auto it = req.find(f);
    if (it == req.end())
        return {};
    const auto v = it->value();
    return std::string(v.data(), v.size());
}

inline Response json_response(http::status st, unsigned version, const nlohmann::json &body)
{
    Response res{st, version};
    res.set(http::field::content_type, "application/json");
    // Invalid UTF-8 from collaborators becomes U+FFFD instead of throwing.
    res.body() = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    res.prepare_payload();
    return res;
}

inline Response detail_response(http::status st, unsigned version, const std::string &detail)
{
    return json_response(st, version, nlohmann::json{{"detail", detail}});
}

// Any origin is allowed with credentials, so the Origin is echoed back rather
// than answered with "*". Requests without Origin get no CORS headers.
inline void add_cors(const Request &req, Response &res)
{
    const std::string origin = header_value(req, http::field::origin);
    if (origin.empty())
        return;
    res.set(http::field::access_control_allow_origin, origin);
    res.set(http::field::access_control_allow_credentials, "true");
    res.set(http::field::vary, "Origin");
}

inline bool is_preflight(const Request &req)
{
    return req.method() == http::verb::options &&
           !header_value(req, http::field::origin).empty() &&
           !header_value(req, http::field::access_control_request_method).empty();
}

inline Response preflight_response(const Request &req)
{
    Response res{http::status::ok, req.version()};
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.set(http::field::access_control_allow_methods, kAllowedMethods);
    res.set(http::field::access_control_max_age, "600");
    const std::string requested = header_value(req, http::field::access_control_request_headers);
    if (!requested.empty())
        res.set(http::field::access_control_allow_headers, requested);
    res.body() = "OK";
    res.prepare_payload();
    return res;
}

// -------- routing --------

inline constexpr const char *kUserPrefix = "/api/demo/user/";

// True when `path` names one of the routes below, whatever the method.
inline bool is_route_path(const std::string &path)
{
    static const char *const fixed[] = {
        "/", "/api/health", "/api/demo/leaderboard", "/api/demo/badges",
        "/api/demo/users", "/api/demo/award", "/test"};
    for (const char *p : fixed)
    {
        if (path == p)
            return true;
    }
    const std::string prefix = kUserPrefix;
    if (path.rfind(prefix, 0) != 0)
        return false;
    const std::string id = path.substr(prefix.size());
    return !id.empty() && id.find('/') == std::string::npos;
}

inline Response route(const Request &req, const GamifyState &state)
{
    const std::string path = request_path(req);
    const auto method = req.method();
    const unsigned v = req.version();

    auto method_not_allowed = [&](const char *allow)
    {
        auto res = detail_response(http::status::method_not_allowed, v, "Method Not Allowed");
        res.set(http::field::allow, allow);
        return res;
    };

    // GET /
    if (path == "/")
    {
        if (method != http::verb::get)
            return method_not_allowed("GET");
        return json_response(http::status::ok, v, root_message());
    }

    // GET /api/health
    if (path == "/api/health")
    {
        if (method != http::verb::get)
            return method_not_allowed("GET");
        return json_response(http::status::ok, v, health(state.config));
    }

    // GET /api/demo/leaderboard
    if (path == "/api/demo/leaderboard")
    {
        if (method != http::verb::get)
            return method_not_allowed("GET");
        return json_response(http::status::ok, v, list_leaderboard(state.data));
    }

    // GET /api/demo/badges
    if (path == "/api/demo/badges")
    {
        if (method != http::verb::get)
            return method_not_allowed("GET");
        return json_response(http::status::ok, v, list_badges(state.data));
    }

    // GET /api/demo/users
    if (path == "/api/demo/users")
    {
        if (method != http::verb::get)
            return method_not_allowed("GET");
        return json_response(http::status::ok, v, list_users(state.data));
    }

    // GET /api/demo/user/{user_id}
    const std::string user_prefix = kUserPrefix;
    if (path.rfind(user_prefix, 0) == 0)
    {
        const std::string user_id = path.substr(user_prefix.size());
        if (!user_id.empty() && user_id.find('/') == std::string::npos)
        {
            if (method != http::verb::get)
                return method_not_allowed("GET");
            try
            {
                return json_response(http::status::ok, v,
                                     user_summary_to_json(get_user_summary(state.data, user_id)));
            }
            catch (const NotFound &e)
            {
                return detail_response(http::status::not_found, v, e.what());
            }
        }
    }

    // POST /api/demo/award  Body (JSON): { "action": "...", "points": 0? }
    if (path == "/api/demo/award")
    {
        if (method != http::verb::post)
            return method_not_allowed("POST");
        try
        {
            return json_response(http::status::ok, v, award_points(parse_award_action(req.body())));
        }
        catch (const BadBody &e)
        {
            return detail_response(http::status::unprocessable_entity, v, e.what());
        }
    }

    // GET /test
    if (path == "/test")
    {
        if (method != http::verb::get)
            return method_not_allowed("GET");
        return json_response(http::status::ok, v, probe_database(state.database));
    }

    // "/x/" redirects to "/x" when "/x" is a route. Location is built from the
    // raw target so the query string and percent-encoding are kept.
    if (path.size() > 1 && path.back() == '/' && is_route_path(path.substr(0, path.size() - 1)))
    {
        const auto t = req.target();
        std::string target(t.data(), t.size());
        const auto q = std::min(target.find('?'), target.size());
        if (q > 1 && target[q - 1] == '/')
        {
            Response res{http::status::temporary_redirect, v};
            res.set(http::field::location, target.substr(0, q - 1) + target.substr(q));
            res.prepare_payload();
            return res;
        }
    }

    return detail_response(http::status::not_found, v, "Not Found");
}

// Runs `fn`; anything it throws becomes a 500 with the exception text.
template <class Fn>
Response with_error_mapping(unsigned version, Fn &&fn)
{
    try
    {
        return fn();
    }
    catch (const std::exception &e)
    {
        return json_response(http::status::internal_server_error, version,
                             nlohmann::json{{"detail", "Internal Server Error"}, {"what", e.what()}});
    }
    catch (...)
    {
        return json_response(http::status::internal_server_error, version,
                             nlohmann::json{{"detail", "Internal Server Error"}, {"what", "unknown error"}});
    }
}

// Full request handling: CORS preflight, routing, error mapping.
inline Response handle_request(const Request &req, const GamifyState &state)
{
    Response res;
    if (is_preflight(req))
        res = preflight_response(req);
    else
        res = with_error_mapping(req.version(), [&]
                                 { return route(req, state); });
    add_cors(req, res);
    res.set(http::field::server, kServerName);
    res.keep_alive(false);
    return res;
}

// -------- HTTP server --------

class HttpServer
{
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::ip::tcp::socket socket_;
    const GamifyState &state_;

public:
    HttpServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, const GamifyState &s)
        : acceptor_(ioc), socket_(ioc), state_(s)
    {
        boost::system::error_code ec;
        acceptor_.open(ep.protocol(), ec);
        if (ec)
            throw std::runtime_error("open failed: " + ec.message());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
        if (ec)
            throw std::runtime_error("set reuse_address failed: " + ec.message());
        acceptor_.bind(ep, ec);
        if (ec)
            throw std::runtime_error("bind failed: " + ec.message());
        acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec)
            throw std::runtime_error("listen failed: " + ec.message());
        do_accept();
    }

private:
    void do_accept()
    {
        acceptor_.async_accept(socket_, [this](boost::system::error_code ec)
                               {
            if (!ec)
                std::make_shared<Session>(std::move(socket_), state_)->run();
            else if (ec != boost::asio::error::operation_aborted)
                std::cerr << "WARN: accept failed: " << ec.message() << "\n";
            if (acceptor_.is_open())
                do_accept(); });
    }

    struct Session : std::enable_shared_from_this<Session>
    {
        boost::asio::ip::tcp::socket socket;
        boost::beast::flat_buffer buffer;
        Request req;
        const GamifyState &state;

        Session(boost::asio::ip::tcp::socket &&s, const GamifyState &st)
            : socket(std::move(s)), state(st) {}

        void run() { do_read(); }

        void do_read()
        {
            auto self = shared_from_this();
            http::async_read(socket, buffer, req, [self](boost::beast::error_code ec, std::size_t)
                             {
                if (!ec) self->respond(handle_request(self->req, self->state)); });
        }

        // response must outlive async_write
        void respond(Response &&res)
        {
            auto self = shared_from_this();
            auto sp = std::make_shared<Response>(std::move(res));

            http::async_write(socket, *sp, [self, sp](boost::beast::error_code, std::size_t)
                              {
                boost::system::error_code ignored;
                self->socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored); });
        }
    };
};
