#include "stexporter/metric_cache.hpp"

#include <boost/thread/locks.hpp>

namespace stexporter {

void MetricCache::commit(const std::string &device_id,
                         std::vector<MetricSample> samples) {
  // пакет собираем вне блокировки, под ней только подмена указателя
  auto batch =
      std::make_shared<const std::vector<MetricSample>>(std::move(samples));
  boost::unique_lock<boost::shared_mutex> lk(m_);
  batches_[device_id] = std::move(batch);
}

bool MetricCache::remove(const std::string &device_id) {
  boost::unique_lock<boost::shared_mutex> lk(m_);
  return batches_.erase(device_id) > 0;
}

std::vector<MetricSample> MetricCache::snapshot() const {
  std::vector<Batch> held;
  {
    boost::shared_lock<boost::shared_mutex> lk(m_);
    held.reserve(batches_.size());
    for (const auto &kv : batches_)
      held.push_back(kv.second);
  }
  std::size_t total = 0;
  for (const auto &b : held)
    total += b->size();
  std::vector<MetricSample> out;
  out.reserve(total);
  for (const auto &b : held)
    out.insert(out.end(), b->begin(), b->end());
  return out;
}

std::vector<MetricSample>
MetricCache::device_samples(const std::string &device_id) const {
  Batch b;
  {
    boost::shared_lock<boost::shared_mutex> lk(m_);
    auto it = batches_.find(device_id);
    if (it == batches_.end())
      return {};
    b = it->second;
  }
  return *b;
}

std::vector<std::string> MetricCache::devices() const {
  boost::shared_lock<boost::shared_mutex> lk(m_);
  std::vector<std::string> out;
  out.reserve(batches_.size());
  for (const auto &kv : batches_)
    out.push_back(kv.first);
  return out;
}

std::size_t MetricCache::sample_count() const {
  boost::shared_lock<boost::shared_mutex> lk(m_);
  std::size_t total = 0;
  for (const auto &kv : batches_)
    total += kv.second->size();
  return total;
}

} // namespace stexporter
