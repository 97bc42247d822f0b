#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace stexporter {

struct Config {
  // HTTP (эндпоинт для скрейпера)
  std::string host = "0.0.0.0";
  unsigned short port = 9555;
  std::size_t http_threads = 2;
  std::string metrics_path = "/metrics";

  // опрос
  int poll_interval_s = 30;
  int device_refresh_interval_s = 300;
  std::size_t max_inflight_fetches = 4;
  int call_timeout_ms = 10000;
  int max_retry_attempts = 4;
  int retry_base_delay_ms = 500;
  int retry_max_delay_ms = 8000;

  // удалённая платформа
  std::string api_base_url = "https://api.smartthings.com/v1";
  std::string token;
  std::string token_file;
  std::vector<std::string> device_names; // пусто = все устройства

  std::string mapping_file = "mapping.json";
  bool emit_timestamps = false;
  std::string log_level = "info";

  // Redis (зеркало последних значений)
  bool redis_enabled{false};
  std::string redis_host{"127.0.0.1"};
  int redis_port{6379};
};

struct Device {
  std::string id;
  std::string label; // заданное пользователем, может быть пустым
  std::string name;  // имя модели от платформы, может быть пустым
  std::vector<std::string> capabilities;

  // label, иначе name, иначе id
  const std::string &display_name() const {
    if (!label.empty())
      return label;
    return name.empty() ? id : name;
  }
};

// Значение атрибута после разбора JSON: число, булево или строка
using CapabilityValue = std::variant<double, bool, std::string>;

struct CapabilityReading {
  std::string device_id;
  std::string component; // "main" для основного компонента
  std::string name;      // snake_case имя атрибута
  CapabilityValue value;
  std::int64_t timestamp_ms{0};
};

enum class MetricKind { Gauge, Counter, Info };

const char *to_string(MetricKind kind) noexcept;

using Labels = std::map<std::string, std::string>;

struct MetricSample {
  std::string name;
  MetricKind kind{MetricKind::Gauge};
  std::string help;
  std::string unit;
  Labels labels;
  double value{0.0};
  std::int64_t updated_ms{0};
};

} // namespace stexporter
