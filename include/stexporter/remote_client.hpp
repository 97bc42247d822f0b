#pragma once
#include "credential.hpp"
#include "http_transport.hpp"
#include "types.hpp"

#include <atomic>
#include <boost/thread.hpp>
#include <chrono>
#include <functional>
#include <random>
#include <string>
#include <vector>

namespace stexporter {

// Контракт удалённой платформы, который видит Collector.
// Ошибки: AuthError | NetworkError | NotFoundError (см. errors.hpp).
class RemoteClient {
public:
  virtual ~RemoteClient() = default;

  virtual std::vector<Device> list_devices() = 0;
  virtual std::vector<CapabilityReading>
  get_capabilities(const std::string &device_id) = 0;
};

// Экспоненциальная задержка с jitter: половина фиксирована, половина
// случайна. attempt считается с 1.
struct RetryPolicy {
  int max_attempts{4};
  std::chrono::milliseconds base_delay{500};
  std::chrono::milliseconds max_delay{8000};

  std::chrono::milliseconds delay_for(int attempt, std::mt19937_64 &rng) const;
};

class SmartThingsClient : public RemoteClient {
public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  // sleeper пустой -> boost::this_thread::sleep_for
  SmartThingsClient(std::string base_url, HttpTransport &transport,
                    Credential &credential, RetryPolicy retry,
                    std::chrono::milliseconds call_timeout,
                    Sleeper sleeper = {});

  std::vector<Device> list_devices() override;
  std::vector<CapabilityReading>
  get_capabilities(const std::string &device_id) override;

  unsigned long long requests_total() const noexcept {
    return requests_.load(std::memory_order_relaxed);
  }

private:
  HttpResponse call(const std::string &url);
  void backoff(int attempt, int retry_after_s);

  std::string base_url_;
  HttpTransport &transport_;
  Credential &credential_;
  const RetryPolicy retry_;
  const std::chrono::milliseconds call_timeout_;
  Sleeper sleeper_;
  std::atomic<unsigned long long> requests_{0};

  boost::mutex rng_m_;
  std::mt19937_64 rng_;
};

// camelCase -> snake_case ("airConditionerMode" -> "air_conditioner_mode")
std::string to_snake_case(const std::string &name);

// Разбор ответа GET /devices. В next_url кладётся _links.next.href или "".
std::vector<Device> parse_device_page(const std::string &body,
                                      std::string &next_url);

// Разбор ответа GET /devices/{id}/status в плоский список чтений
std::vector<CapabilityReading> parse_device_status(const std::string &device_id,
                                                   const std::string &body);

} // namespace stexporter
