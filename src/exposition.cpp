#include "stexporter/exposition.hpp"

#include <algorithm>
#include <utility>

#include <prometheus/client_metric.h>
#include <prometheus/text_serializer.h>

namespace stexporter {

namespace {

prometheus::MetricType family_type(MetricKind kind) {
  return kind == MetricKind::Counter ? prometheus::MetricType::Counter
                                     : prometheus::MetricType::Gauge;
}

// экранирование только для ключа, сериализацией занимается TextSerializer
void append_quoted(std::string &out, const std::string &v) {
  out.push_back('"');
  for (char c : v) {
    if (c == '\\' || c == '"')
      out.push_back('\\');
    if (c == '\n') {
      out += "\\n";
      continue;
    }
    out.push_back(c);
  }
  out.push_back('"');
}

} // namespace

const char *to_string(MetricKind kind) noexcept {
  switch (kind) {
  case MetricKind::Gauge:
    return "gauge";
  case MetricKind::Counter:
    return "counter";
  case MetricKind::Info:
    return "info";
  }
  return "gauge";
}

std::string series_key(const std::string &name, const Labels &labels) {
  std::string out = name;
  if (labels.empty())
    return out;
  out.push_back('{');
  bool first = true;
  for (const auto &[k, v] : labels) {
    if (!first)
      out.push_back(',');
    first = false;
    out += k;
    out.push_back('=');
    append_quoted(out, v);
  }
  out.push_back('}');
  return out;
}

std::vector<prometheus::MetricFamily>
to_families(std::vector<MetricSample> samples, bool timestamps) {
  std::stable_sort(samples.begin(), samples.end(),
                   [](const MetricSample &a, const MetricSample &b) {
                     if (a.name != b.name)
                       return a.name < b.name;
                     return a.labels < b.labels;
                   });

  std::vector<prometheus::MetricFamily> families;
  for (auto &s : samples) {
    if (families.empty() || families.back().name != s.name) {
      prometheus::MetricFamily f;
      f.name = s.name;
      f.help = s.help;
      f.type = family_type(s.kind);
      families.push_back(std::move(f));
    }
    auto &family = families.back();

    prometheus::ClientMetric m;
    m.label.reserve(s.labels.size());
    for (const auto &[k, v] : s.labels)
      m.label.push_back({k, v});
    if (family.type == prometheus::MetricType::Counter)
      m.counter.value = s.value;
    else
      m.gauge.value = s.value;
    if (timestamps)
      m.timestamp_ms = s.updated_ms;
    family.metric.push_back(std::move(m));
  }
  return families;
}

std::string
serialize_text(const std::vector<prometheus::MetricFamily> &families) {
  const prometheus::TextSerializer serializer;
  return serializer.Serialize(families);
}

SnapshotCollectable::SnapshotCollectable(SampleSource source, bool timestamps)
    : source_(std::move(source)), timestamps_(timestamps) {}

std::vector<prometheus::MetricFamily> SnapshotCollectable::Collect() const {
  return to_families(source_(), timestamps_);
}

} // namespace stexporter
