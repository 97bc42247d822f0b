#include "stexporter/http_transport.hpp"
#include "stexporter/errors.hpp"

#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <functional>
#include <stdexcept>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace stexporter {

namespace {

constexpr const char *kUserAgent = "smartthings-exporter/1.0";

int parse_retry_after(const http::response<http::string_body> &res) {
  auto it = res.find(http::field::retry_after);
  if (it == res.end())
    return -1;
  try {
    return std::stoi(std::string(it->value()));
  } catch (const std::exception &) {
    return -1; // HTTP-date формат не поддерживаем
  }
}

// Асинхронная цепочка resolve → connect → [handshake] → write → read.
// Дедлайн на connect/handshake/write/read держит tcp_stream::expires_after,
// resolve ограничиваем через run_for.
template <class Stream>
beast::error_code exchange(net::io_context &ioc, tcp::resolver &resolver,
                           Stream &stream, const Url &u,
                           http::request<http::empty_body> &req,
                           http::response<http::string_body> &res,
                           std::chrono::milliseconds timeout,
                           std::function<void(std::function<void(
                               beast::error_code)>)> handshake) {
  beast::error_code result = net::error::would_block;
  beast::flat_buffer buffer;
  auto &lowest = beast::get_lowest_layer(stream);

  auto on_read = [&](beast::error_code ec, std::size_t) { result = ec; };
  auto do_write = [&](beast::error_code ec) {
    if (ec) {
      result = ec;
      return;
    }
    http::async_write(stream, req, [&](beast::error_code wec, std::size_t) {
      if (wec) {
        result = wec;
        return;
      }
      http::async_read(stream, buffer, res, on_read);
    });
  };

  resolver.async_resolve(
      u.host, u.port,
      [&](beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
          result = ec;
          return;
        }
        lowest.expires_after(timeout);
        lowest.async_connect(
            results, [&](beast::error_code cec, tcp::endpoint) {
              if (cec) {
                result = cec;
                return;
              }
              if (handshake)
                handshake(do_write);
              else
                do_write({});
            });
      });

  ioc.run_for(timeout + std::chrono::milliseconds(500));
  if (!ioc.stopped()) {
    resolver.cancel();
    beast::error_code ignored;
    lowest.socket().close(ignored);
    ioc.restart();
    ioc.run();
    return net::error::timed_out;
  }
  return result;
}

} // namespace

Url parse_url(const std::string &url) {
  Url u;
  const auto sep = url.find("://");
  if (sep == std::string::npos)
    throw std::invalid_argument("url without scheme: " + url);
  u.scheme = url.substr(0, sep);
  if (u.scheme != "http" && u.scheme != "https")
    throw std::invalid_argument("unsupported url scheme: " + u.scheme);

  const auto host_begin = sep + 3;
  const auto path_begin = url.find('/', host_begin);
  std::string authority = url.substr(host_begin, path_begin == std::string::npos
                                                     ? std::string::npos
                                                     : path_begin - host_begin);
  u.target = path_begin == std::string::npos ? "/" : url.substr(path_begin);

  const auto colon = authority.rfind(':');
  if (colon != std::string::npos) {
    u.host = authority.substr(0, colon);
    u.port = authority.substr(colon + 1);
  } else {
    u.host = authority;
    u.port = u.scheme == "https" ? "443" : "80";
  }
  if (u.host.empty())
    throw std::invalid_argument("url without host: " + url);
  return u;
}

BeastHttpTransport::BeastHttpTransport() : ssl_ctx_(ssl::context::tls_client) {
  ssl_ctx_.set_default_verify_paths();
  ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

HttpResponse BeastHttpTransport::get(const std::string &url,
                                     const std::string &bearer,
                                     std::chrono::milliseconds timeout) {
  Url u;
  try {
    u = parse_url(url);
  } catch (const std::invalid_argument &e) {
    throw NetworkError(e.what(), 0);
  }

  http::request<http::empty_body> req{http::verb::get, u.target, 11};
  req.set(http::field::host, u.host);
  req.set(http::field::user_agent, kUserAgent);
  req.set(http::field::accept, "application/json");
  if (!bearer.empty())
    req.set(http::field::authorization, "Bearer " + bearer);

  http::response<http::string_body> res;
  net::io_context ioc;
  tcp::resolver resolver(ioc);
  beast::error_code ec;

  if (u.scheme == "https") {
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ssl_ctx_);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), u.host.c_str()))
      throw NetworkError("TLS SNI setup failed for " + u.host, 0);
    stream.set_verify_callback(ssl::host_name_verification(u.host));
    ec = exchange(ioc, resolver, stream, u, req, res, timeout,
                  [&stream](std::function<void(beast::error_code)> next) {
                    stream.async_handshake(ssl::stream_base::client,
                                           std::move(next));
                  });
  } else {
    beast::tcp_stream stream(ioc);
    ec = exchange(ioc, resolver, stream, u, req, res, timeout, nullptr);
    beast::error_code ignored;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
  }

  if (ec) {
    const bool timed_out =
        ec == beast::error::timeout || ec == net::error::timed_out;
    throw NetworkError(std::string(timed_out ? "timeout" : "transport error") +
                           " on GET " + u.host + u.target + ": " +
                           ec.message(),
                       0);
  }

  HttpResponse out;
  out.status = static_cast<int>(res.result_int());
  out.body = std::move(res.body());
  out.retry_after_s = parse_retry_after(res);
  return out;
}

} // namespace stexporter
