#include "stexporter/config.hpp"
#include "stexporter/errors.hpp"
#include "stexporter/log.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <set>
#include <sstream>
#include <type_traits>

using json = nlohmann::json;

namespace stexporter {

namespace {

constexpr std::size_t kMaxThreads = 256;

const std::set<std::string> kKnownKeys = {
    "host",
    "port",
    "http_threads",
    "metrics_path",
    "poll_interval",
    "poll_interval_s",
    "device_refresh_interval",
    "device_refresh_interval_s",
    "max_inflight_fetches",
    "call_timeout",
    "call_timeout_ms",
    "max_retry_attempts",
    "retry_base_delay_ms",
    "retry_max_delay_ms",
    "api_base_url",
    "token",
    "token_file",
    "device_names",
    "mapping_file",
    "emit_timestamps",
    "log_level",
    "redis_enabled",
    "redis_host",
    "redis_port",
};

void split_listen(const std::string &listen, Config &c) {
  const auto colon = listen.rfind(':');
  if (colon == std::string::npos || colon + 1 == listen.size())
    throw ConfigError("--listen expects host:port, got '" + listen + "'");
  int port = 0;
  try {
    port = std::stoi(listen.substr(colon + 1));
  } catch (const std::exception &) {
    throw ConfigError("--listen has a bad port: '" + listen + "'");
  }
  if (port < 0 || port > 65535)
    throw ConfigError("--listen port out of range: '" + listen + "'");
  if (colon > 0)
    c.host = listen.substr(0, colon);
  c.port = static_cast<unsigned short>(port);
}

} // namespace

CliOptions parse_cli(int argc, char **argv) {
  CliOptions o;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    auto value = [&]() -> std::string {
      if (i + 1 >= argc)
        throw ConfigError("option " + a + " needs a value");
      return argv[++i];
    };
    if (a == "--config" || a == "-c")
      o.config_path = value();
    else if (a == "--listen" || a == "-l")
      o.listen = value();
    else if (a == "--token" || a == "-t")
      o.token = value();
    else if (a == "--mapping" || a == "-m")
      o.mapping_file = value();
    else
      throw ConfigError("unknown option " + a);
  }
  return o;
}

Config config_from_json(const std::string &text) {
  Config c;
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error &e) {
    throw ConfigError(std::string("config is not valid JSON: ") + e.what());
  }
  if (!j.is_object())
    throw ConfigError("config must be a JSON object");

  auto get = [&](auto key, auto def) {
    try {
      return j.contains(key)
                 ? j[key].template get<std::decay_t<decltype(def)>>()
                 : def;
    } catch (const json::type_error &e) {
      throw ConfigError(std::string("config key '") + key +
                        "' has the wrong type: " + e.what());
    }
  };

  // счётчики читаем со знаком: -1 в size_t превратился бы в SIZE_MAX
  auto get_count = [&](const char *key, std::size_t def) {
    const long long v = get(key, static_cast<long long>(def));
    if (v < 1 || v > static_cast<long long>(kMaxThreads))
      throw ConfigError(std::string(key) + " must be in 1.." +
                        std::to_string(kMaxThreads));
    return static_cast<std::size_t>(v);
  };

  // имя без суффикса единиц и имя с суффиксом задают одно и то же
  auto get_aliased = [&](const char *alias, const char *key, int def) {
    if (j.contains(alias) && j.contains(key))
      throw ConfigError(std::string("set either '") + alias + "' or '" + key +
                        "', not both");
    return j.contains(alias) ? get(alias, def) : get(key, def);
  };

  for (const auto &item : j.items()) {
    if (!kKnownKeys.count(item.key()))
      log_warn("CFG", "unknown config key '" + item.key() + "' ignored");
  }

  c.host = get("host", c.host);
  c.port = static_cast<unsigned short>(get("port", (int)c.port));
  c.http_threads = get_count("http_threads", c.http_threads);
  c.metrics_path = get("metrics_path", c.metrics_path);

  c.poll_interval_s =
      get_aliased("poll_interval", "poll_interval_s", c.poll_interval_s);
  c.device_refresh_interval_s =
      get_aliased("device_refresh_interval", "device_refresh_interval_s",
                  c.device_refresh_interval_s);
  c.max_inflight_fetches =
      get_count("max_inflight_fetches", c.max_inflight_fetches);
  c.call_timeout_ms =
      get_aliased("call_timeout", "call_timeout_ms", c.call_timeout_ms);
  c.max_retry_attempts = get("max_retry_attempts", c.max_retry_attempts);
  c.retry_base_delay_ms = get("retry_base_delay_ms", c.retry_base_delay_ms);
  c.retry_max_delay_ms = get("retry_max_delay_ms", c.retry_max_delay_ms);

  c.api_base_url = get("api_base_url", c.api_base_url);
  c.token = get("token", c.token);
  c.token_file = get("token_file", c.token_file);
  c.device_names = get("device_names", c.device_names);

  c.mapping_file = get("mapping_file", c.mapping_file);
  c.emit_timestamps = get("emit_timestamps", c.emit_timestamps);
  c.log_level = get("log_level", c.log_level);

  c.redis_enabled = get("redis_enabled", c.redis_enabled);
  c.redis_host = get("redis_host", c.redis_host);
  c.redis_port = get("redis_port", c.redis_port);

  if (j.contains("port")) {
    const int port = j["port"].get<int>();
    if (port < 0 || port > 65535)
      throw ConfigError("port is out of range (0..65535)");
  }
  return c;
}

Config load_config(const std::string &path) {
  std::ifstream f(path);
  if (!f) {
    log_info("CFG", "no config at " + path + ", using defaults");
    return Config{};
  }
  std::stringstream ss;
  ss << f.rdbuf();
  return config_from_json(ss.str());
}

void apply_overrides(Config &cfg, const CliOptions &cli, const char *env_token) {
  if (!cli.listen.empty())
    split_listen(cli.listen, cfg);
  if (!cli.mapping_file.empty())
    cfg.mapping_file = cli.mapping_file;

  if (!cli.token.empty())
    cfg.token = cli.token;
  else if (env_token && *env_token)
    cfg.token = env_token;
}

void validate(const Config &cfg) {
  if (cfg.poll_interval_s <= 0)
    throw ConfigError("poll_interval_s must be positive");
  if (cfg.device_refresh_interval_s < 0)
    throw ConfigError("device_refresh_interval_s must not be negative");
  if (cfg.max_inflight_fetches < 1 || cfg.max_inflight_fetches > kMaxThreads)
    throw ConfigError("max_inflight_fetches must be in 1.." +
                      std::to_string(kMaxThreads));
  if (cfg.max_retry_attempts < 1)
    throw ConfigError("max_retry_attempts must be at least 1");
  if (cfg.call_timeout_ms <= 0)
    throw ConfigError("call_timeout_ms must be positive");
  if (cfg.retry_base_delay_ms < 0 || cfg.retry_max_delay_ms < 0)
    throw ConfigError("retry delays must not be negative");
  if (cfg.http_threads < 1 || cfg.http_threads > kMaxThreads)
    throw ConfigError("http_threads must be in 1.." +
                      std::to_string(kMaxThreads));
  if (cfg.metrics_path.empty() || cfg.metrics_path[0] != '/')
    throw ConfigError("metrics_path must start with '/'");
  if (cfg.redis_port < 0 || cfg.redis_port > 65535)
    throw ConfigError("redis_port is out of range (0..65535)");
}

} // namespace stexporter
