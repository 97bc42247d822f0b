#pragma once
#include "types.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace stexporter {

enum class Transform { Identity, Boolean, Enum, Label };

struct MappingRule {
  std::string capability;
  std::string metric_name;
  MetricKind kind{MetricKind::Gauge};
  std::string unit;
  std::string help;
  Transform transform{Transform::Identity};
  std::map<std::string, long long> enum_values;  // Enum
  std::set<std::string> true_values;             // Boolean
  std::set<std::string> false_values;            // Boolean
  std::string label{"value"};                    // Label
};

// Результат применения правила к одному значению
struct SampleFragment {
  std::string metric_name;
  MetricKind kind{MetricKind::Gauge};
  std::string unit;
  std::string help;
  double value{0.0};
  Labels labels; // метки, извлечённые из значения (Label)
};

// Декларативная таблица capability -> метрика. Загружается один раз,
// дальше неизменяема и безопасна для чтения из любых потоков.
class MappingTable {
public:
  // Бросает MappingError на любой битой записи
  static MappingTable from_json(const std::string &text);
  static MappingTable load(const std::string &path);

  // nullopt: capability не в таблице (молча) или значение не подходит
  // правилу (с предупреждением в лог)
  std::optional<SampleFragment> resolve(const std::string &capability,
                                        const CapabilityValue &raw) const;

  const MappingRule *find(const std::string &capability) const;

  // info-метрики с кодировкой enum-правил: <metric>_encoding_info{value,code} 1
  std::vector<MetricSample> encoding_samples() const;

  std::size_t size() const noexcept { return rules_.size(); }

private:
  std::map<std::string, MappingRule> rules_;
};

} // namespace stexporter
