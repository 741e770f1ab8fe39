#pragma once
#include "gftmax/common.hpp"
#include "gftmax/mechanism.hpp"
#include <fstream>
#include <string>

namespace gftmax {

// Writes <log_dir>/rounds.csv (one row per round, truncated per run) and
// appends one row per run to <log_dir>/runs.csv.
class RunLogger {
public:
  explicit RunLogger(const std::string &log_dir = "logs",
                     bool write_rounds = true);
  ~RunLogger();

  void logRound(const TradeMechanism::RoundRecord &rec);
  void logSummary(const TradeMechanism::RunSummary &summary,
                  const Config &cfg);

private:
  std::string log_dir_;
  bool write_rounds_;
  std::ofstream rounds_csv_;
  std::ofstream runs_csv_;
};

} // namespace gftmax
