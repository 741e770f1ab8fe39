#include "gftmax/config.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <set>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace gftmax {

Config loadConfig(const std::string &path, Config base) {
  std::ifstream in(path);
  if (!in.is_open())
    throw InvalidConfiguration("cannot open config file: " + path);

  json doc;
  try {
    doc = json::parse(in);
  } catch (const json::parse_error &e) {
    throw InvalidConfiguration("config " + path + ": " + e.what());
  }
  if (!doc.is_object())
    throw InvalidConfiguration("config " + path + ": expected a JSON object");

  Config cfg = base;
  try {
    for (auto it = doc.begin(); it != doc.end(); ++it) {
      const std::string &key = it.key();
      if (key == "horizon")
        cfg.horizon = it->get<int>();
      else if (key == "seed")
        cfg.seed = it->get<std::uint64_t>();
      else if (key == "constrained")
        cfg.constrained = it->get<bool>();
      else if (key == "replay_path")
        cfg.replay_path = it->get<std::string>();
      else if (key == "band")
        cfg.band = it->get<double>();
      else if (key == "log_dir")
        cfg.log_dir = it->get<std::string>();
      else if (key == "log_level")
        cfg.log_level = it->get<std::string>();
      else if (key == "write_rounds")
        cfg.write_rounds = it->get<bool>();
      else
        spdlog::warn("[Config] Ignoring unknown key '{}' in {}", key, path);
    }
  } catch (const json::type_error &e) {
    throw InvalidConfiguration("config " + path + ": " + e.what());
  }

  return cfg;
}

void validateConfig(const Config &cfg) {
  static const std::set<std::string> levels = {
      "trace", "debug", "info", "warn", "error", "critical", "off"};

  if (cfg.horizon <= 0)
    throw InvalidConfiguration("horizon must be positive, got " +
                               std::to_string(cfg.horizon));
  if (cfg.band < 0.0 || cfg.band > 0.5)
    throw InvalidConfiguration("band must lie in [0, 0.5], got " +
                               std::to_string(cfg.band));
  if (levels.count(cfg.log_level) == 0)
    throw InvalidConfiguration("unknown log level: " + cfg.log_level);
}

} // namespace gftmax
