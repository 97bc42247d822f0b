#pragma once
#include "types.hpp"

#include <functional>
#include <string>
#include <vector>

#include <prometheus/collectable.h>
#include <prometheus/metric_family.h>

namespace stexporter {

constexpr const char *kExpositionContentType =
    "text/plain; version=0.0.4; charset=utf-8";

// Источник сэмплов для одного скрейпа. Не должен ходить в сеть.
using SampleSource = std::function<std::vector<MetricSample>()>;

// name{a="1",b="2"}: ключ серии, одинаковый для одинаковых name+labels
std::string series_key(const std::string &name, const Labels &labels);

// Группирует сэмплы в семейства: по одному на имя, порядок по имени,
// внутри семейства по меткам. info отдаётся как gauge со значением 1.
std::vector<prometheus::MetricFamily>
to_families(std::vector<MetricSample> samples, bool timestamps = false);

// Текстовый формат 0.0.4
std::string serialize_text(const std::vector<prometheus::MetricFamily> &families);

// Снимок кэша и счётчиков как prometheus::Collectable
class SnapshotCollectable : public prometheus::Collectable {
public:
  explicit SnapshotCollectable(SampleSource source, bool timestamps = false);

  std::vector<prometheus::MetricFamily> Collect() const override;

private:
  SampleSource source_;
  bool timestamps_;
};

} // namespace stexporter
