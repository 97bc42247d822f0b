#include "stexporter/metrics_export.hpp"

namespace stexporter {

std::atomic<unsigned long long> g_scrapes_total{0};
std::atomic<unsigned long long> g_render_errors_total{0};

std::vector<MetricSample> process_samples() {
  std::vector<MetricSample> out(2);
  out[0].name = "smartthings_exporter_scrapes_total";
  out[0].kind = MetricKind::Counter;
  out[0].help = "Metrics scrapes served";
  out[0].value = static_cast<double>(
      g_scrapes_total.load(std::memory_order_relaxed));

  out[1].name = "smartthings_exporter_render_errors_total";
  out[1].kind = MetricKind::Counter;
  out[1].help = "Metrics scrapes that failed to render";
  out[1].value = static_cast<double>(
      g_render_errors_total.load(std::memory_order_relaxed));
  return out;
}

} // namespace stexporter
