// include/stexporter/http_server.hpp
#pragma once
#include "exposition.hpp"
#include "types.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace stexporter {

// Отдаёт текущий снимок по GET <metrics_path> в текстовом формате.
class HttpServer {
public:
  // Бросает std::runtime_error, если не удалось занять адрес
  HttpServer(boost::asio::io_context& ioc, const Config& cfg,
             SampleSource source);

  void run();
  void stop();

  unsigned short port() const;

  // Ответ на один запрос; вынесено для тестов без сокетов
  struct Reply {
    int status;
    std::string content_type;
    std::string body;
  };
  static Reply handle(const std::string& method, const std::string& target,
                      const std::string& metrics_path,
                      const prometheus::Collectable& collectable);

private:
  struct Session;
  void do_accept();

  boost::asio::io_context& ioc_;
  const Config cfg_;
  SnapshotCollectable collectable_;
  boost::asio::ip::tcp::acceptor acceptor_;
  boost::asio::ip::tcp::socket socket_;
  std::atomic<bool> running_{false};
};

} // namespace stexporter
