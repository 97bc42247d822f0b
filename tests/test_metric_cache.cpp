#include <gtest/gtest.h>
#include <stexporter/metric_cache.hpp>

#include <atomic>
#include <boost/thread.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace stexporter;

namespace {

std::vector<MetricSample> batch(const std::string &device, double cycle,
                                int n) {
  std::vector<MetricSample> out;
  for (int i = 0; i < n; ++i) {
    MetricSample s;
    s.name = "m" + std::to_string(i);
    s.labels = {{"device_id", device}};
    s.value = cycle;
    s.updated_ms = static_cast<std::int64_t>(cycle);
    out.push_back(s);
  }
  return out;
}

} // namespace

TEST(MetricCache, CommitReplacesWholeDeviceBatch) {
  MetricCache cache;
  cache.commit("ac-1", batch("ac-1", 1, 3));
  cache.commit("ac-2", batch("ac-2", 1, 2));
  EXPECT_EQ(cache.sample_count(), 5u);

  cache.commit("ac-1", batch("ac-1", 2, 1));
  auto samples = cache.device_samples("ac-1");
  ASSERT_EQ(samples.size(), 1u);
  EXPECT_DOUBLE_EQ(samples[0].value, 2);
  EXPECT_EQ(cache.device_samples("ac-2").size(), 2u);
  EXPECT_EQ(cache.sample_count(), 3u);
}

TEST(MetricCache, RemoveDropsOnlyThatDevice) {
  MetricCache cache;
  cache.commit("ac-1", batch("ac-1", 1, 2));
  cache.commit("ac-2", batch("ac-2", 1, 2));
  EXPECT_TRUE(cache.remove("ac-1"));
  EXPECT_FALSE(cache.remove("ac-1"));
  EXPECT_EQ(cache.devices(), std::vector<std::string>{"ac-2"});
  EXPECT_TRUE(cache.device_samples("ac-1").empty());
}

TEST(MetricCache, EmptyCommitKeepsDeviceKnown) {
  MetricCache cache;
  cache.commit("ac-1", {});
  EXPECT_EQ(cache.devices().size(), 1u);
  EXPECT_TRUE(cache.snapshot().empty());
}

// Читатели никогда не видят смесь двух циклов в пределах одного устройства
TEST(MetricCache, SnapshotNeverTearsADeviceBatch) {
  MetricCache cache;
  constexpr int kSamples = 16;
  cache.commit("ac-1", batch("ac-1", 0, kSamples));
  cache.commit("ac-2", batch("ac-2", 0, kSamples));

  std::atomic<bool> done{false};
  std::atomic<int> torn{0};
  std::vector<std::unique_ptr<boost::thread>> readers;
  for (int r = 0; r < 4; ++r) {
    readers.emplace_back(std::make_unique<boost::thread>([&] {
      while (!done) {
        std::map<std::string, std::vector<double>> by_device;
        for (const auto &s : cache.snapshot())
          by_device[s.labels.at("device_id")].push_back(s.value);
        for (const auto &kv : by_device) {
          if (kv.second.size() != kSamples)
            ++torn;
          for (double v : kv.second) {
            if (v != kv.second.front())
              ++torn;
          }
        }
      }
    }));
  }

  for (int cycle = 1; cycle <= 2000; ++cycle) {
    cache.commit("ac-1", batch("ac-1", cycle, kSamples));
    cache.commit("ac-2", batch("ac-2", cycle, kSamples));
  }
  done = true;
  for (auto &t : readers)
    t->join();

  EXPECT_EQ(torn.load(), 0);
  for (const auto &s : cache.snapshot())
    EXPECT_DOUBLE_EQ(s.value, 2000);
}
