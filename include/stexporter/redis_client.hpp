#pragma once

#include "types.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sw {
namespace redis {
class Redis;
} // namespace redis
} // namespace sw

namespace stexporter {

struct RedisConfig {
  bool redis_enabled{false};
  std::string redis_host{"127.0.0.1"};
  int redis_port{6379};
};

// Зеркало последних значений в Redis-хэш smartthings:device:<id>.
// Ошибки Redis только логируются: опрос и отдача метрик от него не зависят.
class RedisClient {
public:
  explicit RedisClient(const RedisConfig &cfg);
  ~RedisClient();

  bool is_enabled() const noexcept { return enabled_; }

  void save_device(const std::string &device_id,
                   const std::vector<MetricSample> &samples);

private:
  bool enabled_{false};
  std::unique_ptr<sw::redis::Redis> redis_;
};

} // namespace stexporter
