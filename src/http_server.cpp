// src/http_server.cpp
#include "stexporter/http_server.hpp"
#include "stexporter/log.hpp"
#include "stexporter/metrics_export.hpp"
#include <boost/beast.hpp>
#include <exception>
#include <stdexcept>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace stexporter {

namespace {

std::string landing_page(const std::string& metrics_path) {
  return "<html><head><title>SmartThings Exporter</title></head><body>"
         "<h1>SmartThings Exporter</h1><p><a href=\"" +
         metrics_path + "\">Metrics</a></p></body></html>\n";
}

} // namespace

HttpServer::Reply HttpServer::handle(const std::string& method,
                                     const std::string& target,
                                     const std::string& metrics_path,
                                     const prometheus::Collectable& collectable) {
  const std::string path = target.substr(0, target.find('?'));

  if (path == metrics_path) {
    if (method != "GET")
      return {405, "text/plain; charset=utf-8", "method not allowed\n"};
    try {
      std::string body = serialize_text(collectable.Collect());
      g_scrapes_total.fetch_add(1, std::memory_order_relaxed);
      return {200, kExpositionContentType, std::move(body)};
    } catch (const std::exception& e) {
      g_render_errors_total.fetch_add(1, std::memory_order_relaxed);
      log_err("HTTP", std::string("render failed: ") + e.what());
      return {500, "text/plain; charset=utf-8",
              std::string("render failed: ") + e.what() + "\n"};
    }
  }

  if (path == "/" && method == "GET")
    return {200, "text/html; charset=utf-8", landing_page(metrics_path)};

  return {404, "text/plain; charset=utf-8", "not found\n"};
}

struct HttpServer::Session
    : public std::enable_shared_from_this<HttpServer::Session> {
  tcp::socket socket;
  const Config& cfg;
  const prometheus::Collectable& collectable;

  beast::flat_buffer buffer;
  http::request<http::string_body> req;
  http::response<http::string_body> res;

  // strand от executora сокета: корректный тип под any_io_executor
  net::strand<net::any_io_executor> strand;

  Session(tcp::socket s, const Config& c, const prometheus::Collectable& col)
      : socket(std::move(s)), cfg(c), collectable(col),
        strand(net::make_strand(socket.get_executor())) {}

  void run() { read_request(); }

  void read_request() {
    auto self = shared_from_this();
    http::async_read(
        socket, buffer, req,
        net::bind_executor(strand, [self](beast::error_code ec, std::size_t) {
          if (!ec)
            self->handle_request();
          else if (ec != http::error::end_of_stream)
            log_dbg("HTTP", "read error: " + ec.message());
        }));
  }

  void handle_request() {
    auto reply = HttpServer::handle(std::string(req.method_string()),
                                    std::string(req.target()),
                                    cfg.metrics_path, collectable);
    write_response(reply.status, reply.content_type, std::move(reply.body));
  }

  void write_response(int status, const std::string& content_type,
                      std::string body) {
    res.version(req.version());
    res.keep_alive(false);
    res.result(static_cast<http::status>(status));
    res.set(http::field::content_type, content_type);
    if (status == 405)
      res.set(http::field::allow, "GET");
    res.body() = std::move(body);
    res.prepare_payload();

    auto self = shared_from_this();
    http::async_write(
        socket, res,
        net::bind_executor(strand, [self](beast::error_code ec, std::size_t) {
          if (ec)
            log_dbg("HTTP", "write error: " + ec.message());
          beast::error_code sec;
          self->socket.shutdown(tcp::socket::shutdown_send, sec);
        }));
  }
};

HttpServer::HttpServer(net::io_context& ioc, const Config& cfg,
                       SampleSource source)
    : ioc_(ioc), cfg_(cfg),
      collectable_(std::move(source), cfg_.emit_timestamps), acceptor_(ioc),
      socket_(ioc) {
  beast::error_code ec;
  tcp::endpoint ep{net::ip::make_address(cfg_.host, ec),
                   static_cast<unsigned short>(cfg_.port)};
  if (!ec)
    acceptor_.open(ep.protocol(), ec);
  if (!ec)
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  if (!ec)
    acceptor_.bind(ep, ec);
  if (!ec)
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
  if (ec) {
    throw std::runtime_error("cannot listen on " + cfg_.host + ":" +
                             std::to_string(cfg_.port) + ": " + ec.message());
  }
}

unsigned short HttpServer::port() const {
  return acceptor_.local_endpoint().port();
}

void HttpServer::run() {
  if (running_.exchange(true))
    return;
  do_accept();
}

void HttpServer::stop() {
  if (!running_.exchange(false))
    return;
  beast::error_code ec;
  acceptor_.close(ec);
}

void HttpServer::do_accept() {
  acceptor_.async_accept(socket_, [this](beast::error_code ec) {
    if (!ec) {
      std::make_shared<Session>(std::move(socket_), cfg_, collectable_)->run();
    } else if (ec != net::error::operation_aborted) {
      log_warn("HTTP", "accept failed: " + ec.message());
    }
    if (running_)
      do_accept();
  });
}

} // namespace stexporter
