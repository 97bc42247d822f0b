#pragma once
#include "types.hpp"

#include <boost/thread/shared_mutex.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace stexporter {

// Последние известные сэмплы по устройствам. Один писатель (Collector),
// много читателей (скрейпы). Пакет устройства заменяется целиком под
// эксклюзивной блокировкой, поэтому snapshot() никогда не смешивает два
// цикла опроса одного устройства.
class MetricCache {
public:
  void commit(const std::string &device_id, std::vector<MetricSample> samples);

  // Удаляет все сэмплы устройства; false, если их не было
  bool remove(const std::string &device_id);

  std::vector<MetricSample> snapshot() const;
  std::vector<MetricSample> device_samples(const std::string &device_id) const;
  std::vector<std::string> devices() const;
  std::size_t sample_count() const;

private:
  using Batch = std::shared_ptr<const std::vector<MetricSample>>;

  mutable boost::shared_mutex m_;
  std::map<std::string, Batch> batches_;
};

} // namespace stexporter
