#include "stexporter/collector.hpp"
#include "stexporter/errors.hpp"
#include "stexporter/exposition.hpp"
#include "stexporter/log.hpp"
#include "stexporter/time_utils.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace stexporter {

namespace {

MetricSample self_sample(const std::string &name, MetricKind kind,
                         const std::string &help, double value,
                         Labels labels = {}) {
  MetricSample s;
  s.name = name;
  s.kind = kind;
  s.help = help;
  s.value = value;
  s.labels = std::move(labels);
  return s;
}

const char *error_kind(const RemoteError &e) {
  if (dynamic_cast<const AuthError *>(&e))
    return "auth";
  if (dynamic_cast<const NotFoundError *>(&e))
    return "not found";
  return "network";
}

} // namespace

CollectorOptions collector_options(const Config &cfg) {
  CollectorOptions o;
  o.poll_interval = boost::chrono::seconds(cfg.poll_interval_s);
  o.device_refresh_interval =
      boost::chrono::seconds(std::max(cfg.device_refresh_interval_s, 0));
  o.max_inflight_fetches = cfg.max_inflight_fetches;
  o.device_names = cfg.device_names;
  return o;
}

Collector::Collector(RemoteClient &client, const MappingTable &table,
                     MetricCache &cache, CollectorOptions opts)
    : client_(client), table_(table), cache_(cache), opts_(std::move(opts)),
      pool_(opts_.max_inflight_fetches,
            [this](const Device &d) { poll_device(d); }) {
  pool_.start();
}

Collector::~Collector() {
  stop();
  pool_.stop();
}

void Collector::set_commit_observer(CommitObserver observer) {
  observer_ = std::move(observer);
}

void Collector::start() {
  if (running_.exchange(true))
    return;
  thread_ = std::make_unique<boost::thread>([this] { loop(); });
}

void Collector::stop() {
  if (!running_.exchange(false))
    return;
  {
    boost::lock_guard<boost::mutex> lk(wake_m_);
  }
  wake_cv_.notify_all();
  if (thread_ && thread_->joinable())
    thread_->join();
  thread_.reset();
}

void Collector::loop() {
  using clock = boost::chrono::steady_clock;
  const auto interval = opts_.poll_interval;
  auto next = clock::now();

  while (running_) {
    try {
      run_cycle();
    } catch (const std::exception &e) {
      log_err("POLL", std::string("cycle failed: ") + e.what());
    }

    next += interval;
    const auto now = clock::now();
    if (now > next) {
      // цикл не уложился в интервал: пропущенные старты не копим
      const auto missed = (now - next) / interval + 1;
      skipped_cycles_total_.fetch_add(static_cast<unsigned long long>(missed),
                                      std::memory_order_relaxed);
      log_warn("POLL", "cycle overran poll interval, skipping " +
                           std::to_string(missed) + " start(s)");
      next += interval * missed;
    }

    boost::unique_lock<boost::mutex> lk(wake_m_);
    wake_cv_.wait_until(lk, next, [this] { return !running_; });
  }
}

bool Collector::run_cycle() {
  if (cycle_running_.exchange(true)) {
    skipped_cycles_total_.fetch_add(1, std::memory_order_relaxed);
    log_warn("POLL", "previous cycle still running, skipping this one");
    return false;
  }

  try {
    if (refresh_due(boost::chrono::steady_clock::now()))
      refresh_devices();

    std::vector<Device> targets;
    {
      boost::lock_guard<boost::mutex> lk(state_m_);
      for (const auto &d : devices_) {
        if (!gone_.count(d.id))
          targets.push_back(d);
      }
    }

    if (!pool_.run_all(targets))
      log_warn("POLL", "fetch pool stopped before the cycle completed");
  } catch (...) {
    cycle_running_ = false;
    throw;
  }

  cycles_total_.fetch_add(1, std::memory_order_relaxed);
  cycle_running_ = false;
  return true;
}

bool Collector::refresh_due(boost::chrono::steady_clock::time_point now) const {
  boost::lock_guard<boost::mutex> lk(state_m_);
  // после неудачи пробуем каждый цикл, иначе не наберём подряд идущие сбои
  if (!listed_once_ || last_list_failed_)
    return true;
  return now - last_refresh_ >= opts_.device_refresh_interval;
}

// фильтр device_names сверяет и label, и имя от платформы
bool Collector::name_selected(const Device &d) const {
  for (const auto &n : opts_.device_names) {
    if (n == d.label || n == d.name)
      return true;
  }
  return false;
}

void Collector::refresh_devices() {
  std::vector<Device> listed;
  try {
    listed = client_.list_devices();
  } catch (const RemoteError &e) {
    const int failures =
        consecutive_list_failures_.fetch_add(1, std::memory_order_relaxed) + 1;
    {
      boost::lock_guard<boost::mutex> lk(state_m_);
      last_list_failed_ = true;
    }
    log_warn("POLL", std::string("device list refresh failed (") +
                         error_kind(e) + ", status " +
                         std::to_string(e.status()) + "): " + e.what() +
                         "; keeping previous list");
    if (failures == kDegradedAfterFailures)
      log_err("POLL", "device list failed " + std::to_string(failures) +
                          " times in a row, health degraded");
    return;
  }

  if (!opts_.device_names.empty()) {
    listed.erase(std::remove_if(listed.begin(), listed.end(),
                                [this](const Device &d) {
                                  return !name_selected(d);
                                }),
                 listed.end());
  }

  std::vector<std::string> removed;
  {
    boost::lock_guard<boost::mutex> lk(state_m_);
    std::set<std::string> ids;
    for (const auto &d : listed)
      ids.insert(d.id);
    for (const auto &d : devices_) {
      if (!ids.count(d.id))
        removed.push_back(d.id);
    }
    for (const auto &id : removed) {
      failures_.erase(id);
      last_success_ms_.erase(id);
    }
    devices_ = listed;
    gone_.clear();
    listed_once_ = true;
    last_list_failed_ = false;
    last_refresh_ = boost::chrono::steady_clock::now();
  }
  consecutive_list_failures_.store(0, std::memory_order_relaxed);

  // удалённое на платформе устройство: не временный сбой, чистим кэш
  for (const auto &id : removed) {
    cache_.remove(id);
    log_info("POLL", "device " + id + " no longer listed, dropped");
  }
  log_info("POLL", "device list refreshed: " + std::to_string(listed.size()) +
                       " device(s)");
}

void Collector::poll_device(const Device &device) {
  const std::int64_t fetched_ms = now_ms();
  std::vector<CapabilityReading> readings;
  try {
    readings = client_.get_capabilities(device.id);
  } catch (const NotFoundError &e) {
    boost::lock_guard<boost::mutex> lk(state_m_);
    gone_.insert(device.id);
    ++failures_[device.id];
    log_warn("POLL", "device " + device.id + " not found upstream (" +
                         e.what() + "), skipped until next refresh");
    return;
  } catch (const RemoteError &e) {
    {
      boost::lock_guard<boost::mutex> lk(state_m_);
      ++failures_[device.id];
    }
    log_warn("POLL", "device " + device.id + " (" + device.display_name() +
                         ") fetch failed (" + error_kind(e) + ", status " +
                         std::to_string(e.status()) + "): " + e.what());
    return;
  }

  auto samples = map_readings(device, readings, fetched_ms);
  log_dbg("POLL", "device " + device.id + ": " +
                      std::to_string(readings.size()) + " reading(s), " +
                      std::to_string(samples.size()) + " sample(s)");

  if (observer_)
    observer_(device.id, samples);
  cache_.commit(device.id, std::move(samples));

  boost::lock_guard<boost::mutex> lk(state_m_);
  last_success_ms_[device.id] = fetched_ms;
}

std::vector<MetricSample>
Collector::map_readings(const Device &device,
                        const std::vector<CapabilityReading> &readings,
                        std::int64_t fetched_ms) const {
  std::vector<MetricSample> out;
  std::map<std::string, std::size_t> index; // series key -> позиция в out
  for (const auto &r : readings) {
    auto fragment = table_.resolve(r.name, r.value);
    if (!fragment)
      continue;

    MetricSample s;
    s.name = std::move(fragment->metric_name);
    s.kind = fragment->kind;
    s.help = std::move(fragment->help);
    s.unit = std::move(fragment->unit);
    s.labels = std::move(fragment->labels);
    s.labels["device_id"] = device.id;
    s.labels["device_name"] = device.display_name();
    if (!r.component.empty() && r.component != "main")
      s.labels["component"] = r.component;
    s.value = fragment->value;
    s.updated_ms = fetched_ms;

    // один и тот же атрибут может прийти из двух capability: берём последний
    const std::string key = series_key(s.name, s.labels);
    auto it = index.find(key);
    if (it != index.end()) {
      out[it->second] = std::move(s);
    } else {
      index.emplace(key, out.size());
      out.push_back(std::move(s));
    }
  }
  return out;
}

bool Collector::healthy() const noexcept {
  return consecutive_list_failures_.load(std::memory_order_relaxed) <
         kDegradedAfterFailures;
}

int Collector::consecutive_list_failures() const noexcept {
  return consecutive_list_failures_.load(std::memory_order_relaxed);
}

std::vector<Device> Collector::devices() const {
  boost::lock_guard<boost::mutex> lk(state_m_);
  return devices_;
}

unsigned long long Collector::device_failures(const std::string &device_id) const {
  boost::lock_guard<boost::mutex> lk(state_m_);
  auto it = failures_.find(device_id);
  return it == failures_.end() ? 0 : it->second;
}

std::vector<MetricSample> Collector::self_metrics() const {
  std::vector<MetricSample> out;
  out.push_back(self_sample("smartthings_exporter_healthy", MetricKind::Gauge,
                            "1 if the device list is being refreshed, 0 after "
                            "repeated consecutive failures",
                            healthy() ? 1.0 : 0.0));
  out.push_back(self_sample(
      "smartthings_exporter_device_list_consecutive_failures",
      MetricKind::Gauge, "Consecutive failed device list refreshes",
      consecutive_list_failures()));
  out.push_back(self_sample("smartthings_exporter_poll_cycles_total",
                            MetricKind::Counter, "Completed poll cycles",
                            static_cast<double>(cycles_total_.load())));
  out.push_back(self_sample("smartthings_exporter_skipped_cycles_total",
                            MetricKind::Counter,
                            "Poll cycles skipped because the previous one "
                            "was still running",
                            static_cast<double>(skipped_cycles_total_.load())));

  boost::lock_guard<boost::mutex> lk(state_m_);
  out.push_back(self_sample("smartthings_exporter_known_devices",
                            MetricKind::Gauge, "Devices in the active list",
                            static_cast<double>(devices_.size())));
  for (const auto &d : devices_) {
    auto f = failures_.find(d.id);
    out.push_back(self_sample(
        "smartthings_device_poll_failures_total", MetricKind::Counter,
        "Failed status fetches per device",
        f == failures_.end() ? 0.0 : static_cast<double>(f->second),
        {{"device_id", d.id}}));
    auto ok = last_success_ms_.find(d.id);
    if (ok != last_success_ms_.end()) {
      out.push_back(self_sample(
          "smartthings_device_last_success_timestamp_seconds",
          MetricKind::Gauge, "Unix time of the last successful status fetch",
          static_cast<double>(ok->second) / 1000.0, {{"device_id", d.id}}));
    }
  }
  return out;
}

} // namespace stexporter
