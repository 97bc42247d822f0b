#pragma once
#include <boost/thread.hpp>
#include <cstdint>
#include <exception>
#include <functional>
#include <string>

namespace stexporter {

// Токен доступа к платформе. Обновление single-flight: пока идёт один
// refresh, остальные вызывающие ждут и получают его результат.
class Credential {
public:
  using Source = std::function<std::string()>;

  struct Token {
    std::string value;
    std::uint64_t generation{0};
  };

  Credential(std::string token, Source refresh_source);

  Token current() const;

  // seen_generation: поколение токена, получившего 401/403.
  // Если токен уже обновили после него, возвращает свежий без повторного
  // refresh. Ошибка источника пробрасывается всем ожидающим.
  Token refresh(std::uint64_t seen_generation);

  std::uint64_t refresh_count() const;

private:
  mutable boost::mutex m_;
  boost::condition_variable cv_;
  std::string token_;
  std::uint64_t generation_{0};
  std::uint64_t refreshes_{0};
  bool refreshing_{false};
  std::exception_ptr last_error_;
  Source source_;
};

// Источник токена из файла (первая непустая строка, пробелы обрезаются)
Credential::Source file_token_source(const std::string &path);

} // namespace stexporter
