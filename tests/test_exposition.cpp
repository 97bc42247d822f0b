#include <gtest/gtest.h>
#include <stexporter/exposition.hpp>

#include <cmath>
#include <cstdlib>
#include <sstream>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

using namespace stexporter;

namespace {

MetricSample sample(const std::string &name, Labels labels, double v,
                    MetricKind kind = MetricKind::Gauge) {
  MetricSample s;
  s.name = name;
  s.kind = kind;
  s.help = "help for " + name;
  s.labels = std::move(labels);
  s.value = v;
  return s;
}

struct ParsedLine {
  std::string name;
  Labels labels;
  double value;
};

// Разбор строки сэмпла по грамматике текстового формата 0.0.4
ParsedLine parse_sample_line(const std::string &line) {
  ParsedLine p;
  std::size_t i = 0;
  while (i < line.size() && line[i] != '{' && line[i] != ' ')
    p.name.push_back(line[i++]);
  if (i < line.size() && line[i] == '{') {
    ++i;
    while (line[i] != '}') {
      std::string key;
      while (line[i] != '=')
        key.push_back(line[i++]);
      i += 2; // ="
      std::string value;
      while (line[i] != '"') {
        if (line[i] == '\\') {
          ++i;
          value.push_back(line[i] == 'n' ? '\n' : line[i]);
        } else {
          value.push_back(line[i]);
        }
        ++i;
      }
      ++i; // закрывающая кавычка
      if (line[i] == ',')
        ++i;
      p.labels[key] = value;
    }
    ++i;
  }
  std::istringstream rest(line.substr(i));
  std::string value;
  rest >> value;
  if (value == "+Inf")
    p.value = HUGE_VAL;
  else if (value == "-Inf")
    p.value = -HUGE_VAL;
  else
    p.value = std::strtod(value.c_str(), nullptr);
  return p;
}

std::string render(std::vector<MetricSample> samples, bool timestamps = false) {
  return serialize_text(to_families(std::move(samples), timestamps));
}

std::vector<std::string> lines_of(const std::string &text) {
  std::vector<std::string> out;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line))
    out.push_back(line);
  return out;
}

} // namespace

TEST(Exposition, FamiliesGroupedByNameAndSorted) {
  const auto families = to_families({
      sample("b_metric", {{"device_id", "2"}}, 2),
      sample("a_metric", {}, 0, MetricKind::Counter),
      sample("b_metric", {{"device_id", "1"}}, 1),
  });
  ASSERT_EQ(families.size(), 2u);
  EXPECT_EQ(families[0].name, "a_metric");
  EXPECT_EQ(families[0].type, prometheus::MetricType::Counter);
  EXPECT_EQ(families[1].name, "b_metric");
  EXPECT_EQ(families[1].type, prometheus::MetricType::Gauge);
  ASSERT_EQ(families[1].metric.size(), 2u);
  EXPECT_EQ(families[1].metric[0].label.at(0).value, "1");
  EXPECT_DOUBLE_EQ(families[1].metric[1].gauge.value, 2.0);
}

TEST(Exposition, HeaderOncePerMetricName) {
  std::vector<MetricSample> samples = {
      sample("ac_switch_state", {{"device_id", "ac-2"}}, 0),
      sample("ac_temperature_celsius", {{"device_id", "ac-1"}}, 22.5),
      sample("ac_switch_state", {{"device_id", "ac-1"}}, 1),
      sample("ac_energy_wh_total", {{"device_id", "ac-1"}}, 1200,
             MetricKind::Counter),
  };
  const auto lines = lines_of(render(samples));
  const std::vector<std::string> expected = {
      "# HELP ac_energy_wh_total help for ac_energy_wh_total",
      "# TYPE ac_energy_wh_total counter",
      "ac_energy_wh_total{device_id=\"ac-1\"} 1200",
      "# HELP ac_switch_state help for ac_switch_state",
      "# TYPE ac_switch_state gauge",
      "ac_switch_state{device_id=\"ac-1\"} 1",
      "ac_switch_state{device_id=\"ac-2\"} 0",
      "# HELP ac_temperature_celsius help for ac_temperature_celsius",
      "# TYPE ac_temperature_celsius gauge",
      "ac_temperature_celsius{device_id=\"ac-1\"} 22.5",
  };
  EXPECT_EQ(lines, expected);
}

TEST(Exposition, InfoRendersAsGauge) {
  auto text = render(
      {sample("ac_firmware_info", {{"version", "1.0"}}, 1, MetricKind::Info)});
  EXPECT_NE(text.find("# TYPE ac_firmware_info gauge\n"), std::string::npos);
}

TEST(Exposition, EscapesLabelValues) {
  auto s = sample("m", {{"device_name", "Living \"Room\"\\A/C\nmain"}}, 1);
  auto text = render({s});
  EXPECT_NE(text.find("m{device_name=\"Living \\\"Room\\\"\\\\A/C\\nmain\"} 1\n"),
            std::string::npos);
}

TEST(Exposition, OptionalTimestamps) {
  auto s = sample("m", {}, 2);
  s.updated_ms = 1700000000123;
  EXPECT_NE(render({s}).find("m 2\n"), std::string::npos);
  EXPECT_NE(render({s}, true).find("m 2 1700000000123\n"),
            std::string::npos);
}

TEST(Exposition, RenderedSampleParsesBack) {
  const std::vector<MetricSample> samples = {
      sample("ac_temperature_celsius",
             {{"device_id", "ac-1"}, {"device_name", "Room \"A/C\""}}, 22.5),
      sample("ac_power_w", {{"device_id", "x\\y"}, {"component", "sub\n1"}},
             0.1),
      sample("ac_counter_total", {}, 1e21, MetricKind::Counter),
      sample("ac_negative", {{"device_id", "n"}}, -273.15),
  };
  const auto text = render(samples);

  std::vector<std::tuple<std::string, Labels, double>> parsed;
  for (const auto &line : lines_of(text)) {
    if (line.empty() || line[0] == '#')
      continue;
    auto p = parse_sample_line(line);
    parsed.emplace_back(p.name, p.labels, p.value);
  }
  ASSERT_EQ(parsed.size(), samples.size());
  for (const auto &s : samples) {
    bool found = false;
    for (const auto &[name, labels, value] : parsed) {
      if (name == s.name && labels == s.labels) {
        EXPECT_EQ(value, s.value) << s.name;
        found = true;
      }
    }
    EXPECT_TRUE(found) << s.name;
  }
}

TEST(Exposition, SeriesKeyIsStable) {
  EXPECT_EQ(series_key("m", {}), "m");
  EXPECT_EQ(series_key("m", {{"b", "2"}, {"a", "1"}}), "m{a=\"1\",b=\"2\"}");
}

TEST(Exposition, CollectableReadsSourceOnEveryCollect) {
  int calls = 0;
  SnapshotCollectable c([&calls] {
    ++calls;
    return std::vector<MetricSample>{sample("m", {}, calls)};
  });
  EXPECT_DOUBLE_EQ(c.Collect().at(0).metric.at(0).gauge.value, 1.0);
  EXPECT_DOUBLE_EQ(c.Collect().at(0).metric.at(0).gauge.value, 2.0);
}
