#pragma once
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <string>

namespace stexporter {

struct HttpResponse {
  int status{0};
  std::string body;
  int retry_after_s{-1}; // заголовок Retry-After, -1 если нет
};

struct Url {
  std::string scheme; // http | https
  std::string host;
  std::string port;
  std::string target; // путь + query, всегда начинается с '/'
};

// Бросает std::invalid_argument на неподдерживаемой схеме или пустом хосте
Url parse_url(const std::string &url);

// Транспорт одного GET-запроса с bearer-токеном.
// Сетевые сбои и таймаут -> NetworkError со status 0; любой HTTP-ответ
// (включая 4xx/5xx) возвращается как есть.
class HttpTransport {
public:
  virtual ~HttpTransport() = default;

  virtual HttpResponse get(const std::string &url, const std::string &bearer,
                           std::chrono::milliseconds timeout) = 0;
};

class BeastHttpTransport : public HttpTransport {
public:
  BeastHttpTransport();

  HttpResponse get(const std::string &url, const std::string &bearer,
                   std::chrono::milliseconds timeout) override;

private:
  boost::asio::ssl::context ssl_ctx_;
};

} // namespace stexporter
