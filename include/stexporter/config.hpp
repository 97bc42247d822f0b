#pragma once
#include "types.hpp"

#include <string>

namespace stexporter {

struct CliOptions {
  std::string config_path = "server.json";
  std::string listen;  // host:port
  std::string token;
  std::string mapping_file;
};

// --config, --listen/-l, --token/-t, --mapping/-m. Бросает ConfigError.
CliOptions parse_cli(int argc, char **argv);

// Нет файла -> значения по умолчанию; битый JSON или тип -> ConfigError
Config load_config(const std::string &path);
Config config_from_json(const std::string &text);

// Приоритет: CLI > SMARTTHINGS_TOKEN > файл. Затем validate().
void apply_overrides(Config &cfg, const CliOptions &cli, const char *env_token);

// Бросает ConfigError на недопустимых значениях
void validate(const Config &cfg);

} // namespace stexporter
