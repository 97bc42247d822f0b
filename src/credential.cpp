#include "stexporter/credential.hpp"
#include "stexporter/errors.hpp"
#include "stexporter/log.hpp"

#include <fstream>
#include <utility>

namespace stexporter {

namespace {

std::string trim(const std::string &s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos)
    return {};
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

} // namespace

Credential::Credential(std::string token, Source refresh_source)
    : token_(std::move(token)), source_(std::move(refresh_source)) {}

Credential::Token Credential::current() const {
  boost::lock_guard<boost::mutex> lk(m_);
  return Token{token_, generation_};
}

std::uint64_t Credential::refresh_count() const {
  boost::lock_guard<boost::mutex> lk(m_);
  return refreshes_;
}

Credential::Token Credential::refresh(std::uint64_t seen_generation) {
  boost::unique_lock<boost::mutex> lk(m_);
  if (generation_ != seen_generation)
    return Token{token_, generation_};

  if (refreshing_) {
    cv_.wait(lk, [&] { return !refreshing_; });
    if (generation_ != seen_generation)
      return Token{token_, generation_};
    if (last_error_)
      std::rethrow_exception(last_error_);
    throw AuthError("credential refresh did not produce a new token", 0);
  }

  refreshing_ = true;
  lk.unlock();

  std::string fresh;
  std::exception_ptr err;
  try {
    if (!source_)
      throw AuthError("credential has no refresh source", 0);
    fresh = trim(source_());
    if (fresh.empty())
      throw AuthError("credential refresh returned an empty token", 0);
  } catch (...) {
    // сохраняем и пробрасываем ниже, после снятия флага refreshing_
    err = std::current_exception();
  }

  lk.lock();
  refreshing_ = false;
  ++refreshes_;
  if (err) {
    last_error_ = err;
    cv_.notify_all();
    std::rethrow_exception(err);
  }
  last_error_ = nullptr;
  token_ = std::move(fresh);
  ++generation_;
  const Token out{token_, generation_};
  cv_.notify_all();
  lk.unlock();

  log_info("AUTH", "credential refreshed (generation " +
                       std::to_string(out.generation) + ")");
  return out;
}

Credential::Source file_token_source(const std::string &path) {
  return [path]() {
    std::ifstream f(path);
    if (!f)
      throw AuthError("cannot read token file " + path, 0);
    std::string line;
    while (std::getline(f, line)) {
      line = trim(line);
      if (!line.empty())
        return line;
    }
    throw AuthError("token file " + path + " is empty", 0);
  };
}

} // namespace stexporter
