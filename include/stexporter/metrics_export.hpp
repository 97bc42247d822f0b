#pragma once
#include "types.hpp"

#include <atomic>
#include <vector>

namespace stexporter {
// сколько раз отдали /metrics (counter)
extern std::atomic<unsigned long long> g_scrapes_total;
// сколько раз рендер упал с 500 (counter, в норме 0)
extern std::atomic<unsigned long long> g_render_errors_total;

// Счётчики процесса в виде сэмплов для экспозиции
std::vector<MetricSample> process_samples();
} // namespace stexporter
