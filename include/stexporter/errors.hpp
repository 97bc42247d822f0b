#pragma once
#include <stdexcept>
#include <string>

namespace stexporter {

// Ошибки удалённой платформы. status == 0, если HTTP-ответа не было.
class RemoteError : public std::runtime_error {
public:
  RemoteError(const std::string &msg, int status)
      : std::runtime_error(msg), status_(status) {}

  int status() const noexcept { return status_; }

private:
  int status_;
};

class AuthError : public RemoteError {
public:
  using RemoteError::RemoteError;
};

class NetworkError : public RemoteError {
public:
  using RemoteError::RemoteError;
};

class NotFoundError : public RemoteError {
public:
  using RemoteError::RemoteError;
};

// Битая запись в таблице маппинга; фатально при старте
class MappingError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace stexporter
