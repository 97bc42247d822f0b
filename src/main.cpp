#include "stexporter/collector.hpp"
#include "stexporter/config.hpp"
#include "stexporter/credential.hpp"
#include "stexporter/errors.hpp"
#include "stexporter/http_server.hpp"
#include "stexporter/http_transport.hpp"
#include "stexporter/log.hpp"
#include "stexporter/mapping_table.hpp"
#include "stexporter/metric_cache.hpp"
#include "stexporter/metrics_export.hpp"
#include "stexporter/redis_client.hpp"
#include "stexporter/remote_client.hpp"
#include <algorithm>
#include <boost/thread.hpp>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>

static void term_handler() {
  try {
    throw; // поймать текущее исключение
  } catch (const std::exception &e) {
    std::fprintf(stderr, "[FATAL] std::terminate: %s\n", e.what());
  } catch (...) {
    std::fprintf(stderr, "[FATAL] std::terminate: unknown exception\n");
  }
  std::fflush(stderr);
  std::abort();
}

int main(int argc, char **argv) {
  std::set_terminate(term_handler);

  using namespace stexporter;

  Config cfg;
  std::unique_ptr<Credential> credential;
  std::unique_ptr<MappingTable> table;
  try {
    const auto cli = parse_cli(argc, argv);
    cfg = load_config(cli.config_path);
    apply_overrides(cfg, cli, std::getenv("SMARTTHINGS_TOKEN"));
    validate(cfg);
    set_log_level(parse_log_level(cfg.log_level));

    Credential::Source refresh;
    if (!cfg.token_file.empty()) {
      refresh = file_token_source(cfg.token_file);
      if (cfg.token.empty())
        cfg.token = refresh();
    }
    if (cfg.token.empty())
      throw ConfigError("no SmartThings token: use --token, SMARTTHINGS_TOKEN, "
                        "'token' or 'token_file'");
    credential = std::make_unique<Credential>(cfg.token, std::move(refresh));

    table = std::make_unique<MappingTable>(MappingTable::load(cfg.mapping_file));
    log_info("MAIN", "mapping table " + cfg.mapping_file + ": " +
                         std::to_string(table->size()) + " capability rule(s)");
  } catch (const std::exception &e) {
    std::cerr << "[FATAL] startup error: " << e.what() << std::endl;
    return 1;
  }

  BeastHttpTransport transport;
  RetryPolicy retry;
  retry.max_attempts = cfg.max_retry_attempts;
  retry.base_delay = std::chrono::milliseconds(cfg.retry_base_delay_ms);
  retry.max_delay = std::chrono::milliseconds(cfg.retry_max_delay_ms);
  SmartThingsClient client(cfg.api_base_url, transport, *credential, retry,
                           std::chrono::milliseconds(cfg.call_timeout_ms));

  // неверный токен при старте фатален; недоступность платформы: нет
  try {
    const auto listed = client.list_devices();
    log_info("MAIN", "credential accepted, " + std::to_string(listed.size()) +
                         " device(s) visible");
  } catch (const AuthError &e) {
    std::cerr << "[FATAL] startup error: credential rejected: " << e.what()
              << std::endl;
    return 1;
  } catch (const RemoteError &e) {
    log_warn("MAIN", std::string("platform not reachable at startup: ") +
                         e.what());
  }

  MetricCache cache;
  Collector collector(client, *table, cache, collector_options(cfg));

  RedisClient redis(RedisConfig{cfg.redis_enabled, cfg.redis_host,
                                cfg.redis_port});
  if (redis.is_enabled()) {
    collector.set_commit_observer(
        [&redis](const std::string &id, const std::vector<MetricSample> &s) {
          redis.save_device(id, s);
        });
  }

  // кодировка enum-правил не меняется за время жизни процесса
  const auto encodings = table->encoding_samples();
  SampleSource source = [&]() {
    auto out = cache.snapshot();
    out.insert(out.end(), encodings.begin(), encodings.end());
    auto self = collector.self_metrics();
    out.insert(out.end(), self.begin(), self.end());
    auto proc = process_samples();
    out.insert(out.end(), proc.begin(), proc.end());

    MetricSample api;
    api.name = "smartthings_exporter_api_requests_total";
    api.kind = MetricKind::Counter;
    api.help = "HTTP requests sent to the SmartThings API";
    api.value = static_cast<double>(client.requests_total());
    out.push_back(api);

    MetricSample refreshes;
    refreshes.name = "smartthings_exporter_credential_refreshes_total";
    refreshes.kind = MetricKind::Counter;
    refreshes.help = "Credential refresh attempts";
    refreshes.value = static_cast<double>(credential->refresh_count());
    out.push_back(refreshes);
    return out;
  };

  boost::asio::io_context ioc;
  auto guard = boost::asio::make_work_guard(ioc.get_executor());

  std::unique_ptr<HttpServer> server;
  try {
    server = std::make_unique<HttpServer>(ioc, cfg, source);
    collector.start(); // первый цикл опроса стартует сразу
    server->run();
  } catch (const std::exception &e) {
    std::cerr << "[FATAL] startup error: " << e.what() << std::endl;
    collector.stop();
    return 1;
  }

  const std::size_t n_threads = std::max<std::size_t>(1, cfg.http_threads);

  std::vector<std::unique_ptr<boost::thread>> threads;
  threads.reserve(n_threads - 1);

  for (std::size_t i = 0; i + 1 < n_threads; ++i) {
    threads.emplace_back(std::make_unique<boost::thread>([&ioc] { ioc.run(); }));
  }

  log_info("MAIN", "serving " + cfg.metrics_path + " on " + cfg.host + ":" +
                       std::to_string(cfg.port) + ", polling every " +
                       std::to_string(cfg.poll_interval_s) + "s");

  boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code &, int sig) {
    log_info("SIG", "signal " + std::to_string(sig) + ", stopping");
    server->stop();
    guard.reset(); // отпускаем «несгораемую» работу
    ioc.stop();    // будим все потоки, чтобы они вышли из run()
  });

  // Главный поток тоже крутит ioc
  ioc.run();

  for (auto &t : threads)
    t->join();
  collector.stop();
  return 0;
}
