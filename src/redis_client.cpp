#include "stexporter/redis_client.hpp"
#include "stexporter/exposition.hpp"
#include "stexporter/log.hpp"
#include "stexporter/time_utils.hpp"

#include <sstream>
#include <sw/redis++/redis++.h>
#include <unordered_map>

namespace stexporter {

using sw::redis::Redis;

RedisClient::RedisClient(const RedisConfig &cfg) {
  if (!cfg.redis_enabled) {
    enabled_ = false;
    return;
  }

  try {
    std::ostringstream uri;
    uri << "tcp://" << cfg.redis_host << ":" << cfg.redis_port;

    redis_ = std::make_unique<Redis>(uri.str());
    redis_->ping(); // проверяем, что соединение живое
    enabled_ = true;
    log_info("REDIS", "mirroring samples to " + uri.str());
  } catch (const sw::redis::Error &e) {
    enabled_ = false;
    redis_.reset();
    log_warn("REDIS", std::string("disabled, connect failed: ") + e.what());
  }
}

RedisClient::~RedisClient() = default;

void RedisClient::save_device(const std::string &device_id,
                              const std::vector<MetricSample> &samples) {
  if (!enabled_ || !redis_ || samples.empty()) {
    return;
  }

  std::unordered_map<std::string, std::string> fields;
  for (const auto &s : samples) {
    const std::string key = series_key(s.name, s.labels);
    fields[key] = std::to_string(s.value);
    fields[key + ":ts"] =
        std::to_string(to_time_t_seconds(static_cast<int64_t>(s.updated_ms)));
  }

  try {
    const std::string redis_key = "smartthings:device:" + device_id;
    // пакет устройства заменяем целиком, как и в кэше
    auto tx = redis_->transaction();
    tx.del(redis_key).hset(redis_key, fields.begin(), fields.end()).exec();
  } catch (const sw::redis::Error &e) {
    log_warn("REDIS", "save of device " + device_id + " failed: " + e.what());
  }
}

} // namespace stexporter
