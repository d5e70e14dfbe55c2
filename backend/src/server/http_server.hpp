#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

// One request per connection. Handlers run on the io_context the server was
// built with; run that context on a single thread to keep handlers serialized.
class HttpServer {
public:
    using HandlerFn = std::function<void(const http::request<http::string_body>&, http::response<http::string_body>&)>;

    struct Options {
        std::uint64_t body_limit{64 * 1024};
        bool log_requests{true};
    };

    HttpServer(boost::asio::io_context& ioc, tcp::endpoint ep, HandlerFn handler)
        : HttpServer(ioc, ep, std::move(handler), Options{}) {}

    HttpServer(boost::asio::io_context& ioc, tcp::endpoint ep, HandlerFn handler, Options opts)
    : ioc_(ioc), acceptor_(ioc), handler_(std::move(handler)), opts_(opts) {
        boost::beast::error_code ec;
        acceptor_.open(ep.protocol(), ec);
        if (ec) throw std::runtime_error("open: " + ec.message());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
        if (ec) throw std::runtime_error("set_option: " + ec.message());
        acceptor_.bind(ep, ec);
        if (ec) throw std::runtime_error("bind: " + ec.message());
        acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec) throw std::runtime_error("listen: " + ec.message());
    }

    void run() { do_accept(); }

    // Fills res for req: common headers, CORS preflight, then the handler.
    // A handler that throws yields a 500 instead of unwinding the io_context.
    static void build_response(const HandlerFn& handler,
                               const http::request<http::string_body>& req,
                               http::response<http::string_body>& res) {
        res.version(req.version());
        res.keep_alive(false);
        res.set(http::field::server, "escrow-exchange/0.1");

        // CORS
        res.set(http::field::access_control_allow_origin, "*");
        res.set(http::field::access_control_allow_headers, "*");
        res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
        if (req.method() == http::verb::options) {
            res.result(http::status::ok);
            res.set(http::field::content_type, "text/plain");
            res.body() = "";
        } else {
            try {
                handler(req, res);
            } catch (const std::exception& e) {
                std::cerr << "[http] handler failed: " << e.what() << std::endl;
                res.result(http::status::internal_server_error);
                res.set(http::field::content_type, "application/json");
                res.body() = R"({"error":"internal","message":"request handler failed"})";
            }
        }
        res.prepare_payload();
    }

private:
    struct Session : public std::enable_shared_from_this<Session> {
        tcp::socket socket_;
        boost::beast::flat_buffer buffer_;
        std::shared_ptr<http::request_parser<http::string_body>> parser_;
        const HttpServer::HandlerFn& handler_;
        const Options& opts_;

        Session(tcp::socket s, const HandlerFn& h, const Options& o)
            : socket_(std::move(s)), handler_(h), opts_(o) {}

        void run() { do_read(); }

        void do_read() {
            auto self = shared_from_this();
            parser_ = std::make_shared<http::request_parser<http::string_body>>();
            parser_->body_limit(opts_.body_limit);
            http::async_read(socket_, buffer_, *parser_,
                [self](boost::beast::error_code ec, std::size_t){
                    if (ec == http::error::end_of_stream) return self->do_close();
                    if (ec == http::error::body_limit) return self->reject_too_large();
                    if (ec) return;
                    self->respond(self->parser_->get());
                });
        }

        void respond(const http::request<http::string_body>& req) {
            auto res = std::make_shared<http::response<http::string_body>>();
            HttpServer::build_response(handler_, req, *res);

            if (opts_.log_requests) {
                std::cout << "[http] " << req.method_string() << " " << req.target()
                          << " -> " << res->result_int() << std::endl;
            }
            write(res);
        }

        void reject_too_large() {
            auto res = std::make_shared<http::response<http::string_body>>();
            res->result(http::status::payload_too_large);
            res->keep_alive(false);
            res->set(http::field::content_type, "application/json");
            res->body() = R"({"error":"invalid_argument","message":"request body too large"})";
            res->prepare_payload();
            write(res);
        }

        void write(const std::shared_ptr<http::response<http::string_body>>& res) {
            auto self = shared_from_this();
            http::async_write(socket_, *res,
                [self, res](boost::beast::error_code, std::size_t){
                    self->do_close();
                });
        }

        void do_close() {
            boost::beast::error_code ec;
            socket_.shutdown(tcp::socket::shutdown_send, ec);
        }
    };

    void do_accept() {
        acceptor_.async_accept(
            boost::asio::make_strand(ioc_),
            [this](boost::beast::error_code ec, tcp::socket s){
                if (ec) {
                    std::cerr << "[http] accept failed: " << ec.message() << std::endl;
                } else {
                    std::make_shared<Session>(std::move(s), handler_, opts_)->run();
                }
                do_accept();
            });
    }

    boost::asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    HandlerFn handler_;
    Options opts_;
};
