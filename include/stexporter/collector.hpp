#pragma once
#include "fetch_pool.hpp"
#include "mapping_table.hpp"
#include "metric_cache.hpp"
#include "remote_client.hpp"
#include "types.hpp"

#include <atomic>
#include <boost/chrono.hpp>
#include <boost/thread.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace stexporter {

struct CollectorOptions {
  boost::chrono::milliseconds poll_interval{boost::chrono::seconds(30)};
  // 0 = обновлять список устройств каждый цикл
  boost::chrono::milliseconds device_refresh_interval{
      boost::chrono::seconds(300)};
  std::size_t max_inflight_fetches{4};
  std::vector<std::string> device_names; // пусто = все
};

CollectorOptions collector_options(const Config &cfg);

// Периодический опрос: список устройств (реже), затем статус каждого
// устройства через пул, маппинг и атомарная запись пакета в кэш.
class Collector {
public:
  using CommitObserver = std::function<void(
      const std::string &device_id, const std::vector<MetricSample> &)>;

  // Столько подряд неудачных обновлений списка устройств -> degraded
  static constexpr int kDegradedAfterFailures = 3;

  Collector(RemoteClient &client, const MappingTable &table, MetricCache &cache,
            CollectorOptions opts);
  ~Collector();

  // Фоновый цикл: первый опрос сразу, дальше раз в poll_interval
  void start();
  void stop();

  // Один цикл опроса. false, если предыдущий цикл ещё идёт (пропуск).
  bool run_cycle();

  bool healthy() const noexcept;
  int consecutive_list_failures() const noexcept;
  std::vector<Device> devices() const;
  unsigned long long device_failures(const std::string &device_id) const;

  // Собственные метрики экспортера
  std::vector<MetricSample> self_metrics() const;

  void set_commit_observer(CommitObserver observer);

private:
  void loop();
  bool refresh_due(boost::chrono::steady_clock::time_point now) const;
  void refresh_devices();
  bool name_selected(const Device &d) const;
  void poll_device(const Device &device);
  std::vector<MetricSample>
  map_readings(const Device &device,
               const std::vector<CapabilityReading> &readings,
               std::int64_t fetched_ms) const;

  RemoteClient &client_;
  const MappingTable &table_;
  MetricCache &cache_;
  const CollectorOptions opts_;
  CommitObserver observer_;
  FetchPool pool_;

  mutable boost::mutex state_m_;
  std::vector<Device> devices_;
  std::set<std::string> gone_; // NotFound до следующего обновления списка
  std::map<std::string, unsigned long long> failures_;
  std::map<std::string, std::int64_t> last_success_ms_;
  bool listed_once_{false};
  bool last_list_failed_{false};
  boost::chrono::steady_clock::time_point last_refresh_;

  std::atomic<bool> cycle_running_{false};
  std::atomic<int> consecutive_list_failures_{0};
  std::atomic<unsigned long long> cycles_total_{0};
  std::atomic<unsigned long long> skipped_cycles_total_{0};

  std::atomic<bool> running_{false};
  std::unique_ptr<boost::thread> thread_;
  boost::mutex wake_m_;
  boost::condition_variable wake_cv_;
};

} // namespace stexporter
