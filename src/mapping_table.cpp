#include "stexporter/mapping_table.hpp"
#include "stexporter/errors.hpp"
#include "stexporter/exposition.hpp"
#include "stexporter/log.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <prometheus/check_names.h>
#include <sstream>
#include <type_traits>
#include <unordered_map>

using json = nlohmann::json;

namespace stexporter {

namespace {

// метки, которые Collector ставит сам
const std::set<std::string> kReservedLabels = {"device_id", "device_name",
                                               "component"};

// префиксы собственных метрик экспортёра
const char *const kReservedPrefixes[] = {"smartthings_exporter_",
                                         "smartthings_device_"};

[[noreturn]] void fail(const std::string &capability, const std::string &msg) {
  throw MappingError("mapping for capability '" + capability + "': " + msg);
}

std::string optional_string(const json &entry, const char *key,
                            const std::string &capability) {
  if (!entry.contains(key))
    return {};
  if (!entry[key].is_string())
    fail(capability, std::string("'") + key + "' must be a string");
  return entry[key].get<std::string>();
}

std::set<std::string> string_set(const json &entry, const char *key,
                                 const std::string &capability,
                                 std::set<std::string> def) {
  if (!entry.contains(key))
    return def;
  if (!entry[key].is_array())
    fail(capability, std::string("'") + key + "' must be an array of strings");
  std::set<std::string> out;
  for (const auto &v : entry[key]) {
    if (!v.is_string())
      fail(capability, std::string("'") + key + "' must be an array of strings");
    out.insert(v.get<std::string>());
  }
  return out;
}

MetricKind parse_kind(const std::string &s, const std::string &capability) {
  if (s == "gauge")
    return MetricKind::Gauge;
  if (s == "counter")
    return MetricKind::Counter;
  if (s == "info")
    return MetricKind::Info;
  fail(capability, "unknown kind '" + s + "' (expected gauge|counter|info)");
}

Transform parse_transform(const std::string &s, const std::string &capability) {
  if (s == "identity")
    return Transform::Identity;
  if (s == "boolean")
    return Transform::Boolean;
  if (s == "enum")
    return Transform::Enum;
  if (s == "label")
    return Transform::Label;
  fail(capability,
       "unknown transform '" + s + "' (expected identity|boolean|enum|label)");
}

MappingRule parse_rule(const std::string &capability, const json &entry) {
  if (!entry.is_object())
    fail(capability, "entry must be an object");

  MappingRule r;
  r.capability = capability;
  r.metric_name = optional_string(entry, "metric_name", capability);
  if (r.metric_name.empty())
    fail(capability, "'metric_name' is required");
  if (!prometheus::CheckMetricName(r.metric_name))
    fail(capability, "invalid metric name '" + r.metric_name + "'");
  for (const char *prefix : kReservedPrefixes) {
    if (r.metric_name.rfind(prefix, 0) == 0)
      fail(capability, "metric name '" + r.metric_name +
                           "' uses reserved prefix '" + prefix + "'");
  }

  const std::string kind = optional_string(entry, "kind", capability);
  if (kind.empty())
    fail(capability, "'kind' is required");
  r.kind = parse_kind(kind, capability);

  r.unit = optional_string(entry, "unit", capability);
  r.help = optional_string(entry, "help", capability);
  if (r.help.empty()) {
    r.help = "SmartThings capability " + capability;
    if (!r.unit.empty())
      r.help += " (" + r.unit + ")";
  }

  const std::string transform = optional_string(entry, "transform", capability);
  if (transform.empty())
    r.transform = r.kind == MetricKind::Info ? Transform::Label
                                             : Transform::Identity;
  else
    r.transform = parse_transform(transform, capability);

  if ((r.kind == MetricKind::Info) != (r.transform == Transform::Label))
    fail(capability, "kind 'info' goes with transform 'label' and only with it");
  if (r.kind == MetricKind::Counter && r.transform != Transform::Identity)
    fail(capability, "counter metrics take numeric values only");

  switch (r.transform) {
  case Transform::Enum: {
    if (!entry.contains("values") || !entry["values"].is_object() ||
        entry["values"].empty())
      fail(capability, "enum transform needs a non-empty 'values' object");
    std::set<long long> codes;
    for (const auto &[name, code] : entry["values"].items()) {
      if (!code.is_number_integer())
        fail(capability, "enum code for '" + name + "' must be an integer");
      const auto c = code.get<long long>();
      if (!codes.insert(c).second)
        fail(capability, "enum code " + std::to_string(c) + " used twice");
      r.enum_values.emplace(name, c);
    }
    break;
  }
  case Transform::Boolean: {
    r.true_values = string_set(entry, "true_values", capability, {"on", "true"});
    r.false_values =
        string_set(entry, "false_values", capability, {"off", "false"});
    for (const auto &v : r.true_values) {
      if (r.false_values.count(v))
        fail(capability, "'" + v + "' is both a true and a false value");
    }
    break;
  }
  case Transform::Label: {
    const std::string label = optional_string(entry, "label", capability);
    if (!label.empty())
      r.label = label;
    if (!prometheus::CheckLabelName(r.label, prometheus::MetricType::Gauge) ||
        kReservedLabels.count(r.label))
      fail(capability, "invalid label name '" + r.label + "'");
    break;
  }
  case Transform::Identity:
    break;
  }
  return r;
}

std::string describe(const CapabilityValue &v) {
  if (const auto *s = std::get_if<std::string>(&v))
    return "string '" + *s + "'";
  if (const auto *b = std::get_if<bool>(&v))
    return *b ? "boolean true" : "boolean false";
  return "number " + json(std::get<double>(v)).dump();
}

} // namespace

MappingTable MappingTable::from_json(const std::string &text) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error &e) {
    throw MappingError(std::string("mapping table is not valid JSON: ") +
                       e.what());
  }
  if (!j.is_object() || !j.contains("capabilities") ||
      !j["capabilities"].is_object())
    throw MappingError("mapping table needs a top-level 'capabilities' object");

  MappingTable table;
  std::unordered_map<std::string, const MappingRule *> by_metric;
  for (const auto &[capability, entry] : j["capabilities"].items()) {
    if (capability.empty())
      throw MappingError("mapping table has an empty capability name");
    auto rule = parse_rule(capability, entry);
    table.rules_.emplace(capability, std::move(rule));
  }

  // одно имя метрики: один тип; имена encoding-метрик не должны пересекаться
  for (const auto &[capability, rule] : table.rules_) {
    auto [it, inserted] = by_metric.emplace(rule.metric_name, &rule);
    if (!inserted && it->second->kind != rule.kind)
      fail(capability, "metric '" + rule.metric_name +
                           "' already declared with kind " +
                           to_string(it->second->kind));
  }
  for (const auto &[capability, rule] : table.rules_) {
    if (rule.transform == Transform::Enum &&
        by_metric.count(rule.metric_name + "_encoding_info"))
      fail(capability, "metric '" + rule.metric_name +
                           "_encoding_info' clashes with the enum encoding");
  }
  return table;
}

MappingTable MappingTable::load(const std::string &path) {
  std::ifstream f(path);
  if (!f)
    throw MappingError("cannot open mapping table " + path);
  std::stringstream ss;
  ss << f.rdbuf();
  return from_json(ss.str());
}

const MappingRule *MappingTable::find(const std::string &capability) const {
  auto it = rules_.find(capability);
  return it == rules_.end() ? nullptr : &it->second;
}

std::optional<SampleFragment>
MappingTable::resolve(const std::string &capability,
                      const CapabilityValue &raw) const {
  const MappingRule *rule = find(capability);
  if (!rule)
    return std::nullopt;

  SampleFragment f;
  f.metric_name = rule->metric_name;
  f.kind = rule->kind;
  f.unit = rule->unit;
  f.help = rule->help;

  bool ok = false;
  switch (rule->transform) {
  case Transform::Identity:
    if (const auto *d = std::get_if<double>(&raw)) {
      f.value = *d;
      ok = true;
    }
    break;
  case Transform::Boolean:
    if (const auto *b = std::get_if<bool>(&raw)) {
      f.value = *b ? 1.0 : 0.0;
      ok = true;
    } else if (const auto *s = std::get_if<std::string>(&raw)) {
      if (rule->true_values.count(*s)) {
        f.value = 1.0;
        ok = true;
      } else if (rule->false_values.count(*s)) {
        f.value = 0.0;
        ok = true;
      }
    }
    break;
  case Transform::Enum:
    if (const auto *s = std::get_if<std::string>(&raw)) {
      auto it = rule->enum_values.find(*s);
      if (it != rule->enum_values.end()) {
        f.value = static_cast<double>(it->second);
        ok = true;
      }
    }
    break;
  case Transform::Label:
    f.value = 1.0;
    f.labels[rule->label] = std::visit(
        [](const auto &v) -> std::string {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::string>)
            return v;
          else if constexpr (std::is_same_v<T, bool>)
            return v ? "true" : "false";
          else
            return json(v).dump();
        },
        raw);
    ok = true;
    break;
  }

  if (!ok) {
    log_warn("MAP", "capability '" + capability + "': " + describe(raw) +
                        " does not fit its mapping rule, skipped");
    return std::nullopt;
  }
  return f;
}

std::vector<MetricSample> MappingTable::encoding_samples() const {
  std::vector<MetricSample> out;
  std::set<std::string> seen;
  for (const auto &[capability, rule] : rules_) {
    if (rule.transform != Transform::Enum)
      continue;
    for (const auto &[value, code] : rule.enum_values) {
      const Labels labels{{"value", value}, {"code", std::to_string(code)}};
      // два capability могут делить одну enum-метрику
      if (!seen.insert(series_key(rule.metric_name, labels)).second)
        continue;
      MetricSample s;
      s.name = rule.metric_name + "_encoding_info";
      s.kind = MetricKind::Info;
      s.help = "Value encoding used by " + rule.metric_name;
      s.labels = labels;
      s.value = 1.0;
      out.push_back(std::move(s));
    }
  }
  return out;
}

} // namespace stexporter
