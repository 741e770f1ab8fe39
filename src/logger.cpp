#include "gftmax/logger.hpp"
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <spdlog/spdlog.h>
#include <sstream>

namespace gftmax {

static std::string timestamp() {
  auto now = std::chrono::system_clock::now();
  auto t = std::chrono::system_clock::to_time_t(now);
  std::ostringstream ss;
  ss << std::put_time(std::localtime(&t), "%Y-%m-%dT%H:%M:%S");
  return ss.str();
}

RunLogger::RunLogger(const std::string &log_dir, bool write_rounds)
    : log_dir_(log_dir), write_rounds_(write_rounds) {
  std::filesystem::create_directories(log_dir_);

  if (write_rounds_) {
    rounds_csv_.open(log_dir_ + "/rounds.csv", std::ios::trunc);
    rounds_csv_ << "round,phase,ask,bid,sell,buy,traded,rescaled,budget,gft\n";
  }

  auto runs_path = std::filesystem::path(log_dir_) / "runs.csv";
  runs_csv_.open(runs_path, std::ios::app);
  if (std::filesystem::file_size(runs_path) == 0) {
    runs_csv_ << "timestamp,horizon,seed,constrained,rounds,trades,"
                 "rescaled_rounds,switch_round,budget,gft,best_gft\n";
  }
}

RunLogger::~RunLogger() {
  if (rounds_csv_.is_open())
    rounds_csv_.close();
  if (runs_csv_.is_open())
    runs_csv_.close();
}

void RunLogger::logRound(const TradeMechanism::RoundRecord &rec) {
  if (!write_rounds_)
    return;
  rounds_csv_ << rec.round << "," << phaseName(rec.phase) << "," << std::fixed
              << std::setprecision(6) << rec.posted.ask << ","
              << rec.posted.bid << "," << rec.valuations.sell << ","
              << rec.valuations.buy << "," << (rec.traded ? 1 : 0) << ","
              << (rec.rescaled ? 1 : 0) << "," << rec.budget << "," << rec.gft
              << "\n";
}

void RunLogger::logSummary(const TradeMechanism::RunSummary &s,
                           const Config &cfg) {
  if (rounds_csv_.is_open())
    rounds_csv_.flush();

  runs_csv_ << timestamp() << "," << cfg.horizon << "," << cfg.seed << ","
            << (cfg.constrained ? 1 : 0) << "," << s.rounds << "," << s.trades
            << "," << s.rescaled_rounds << ","
            << (s.switch_round ? std::to_string(*s.switch_round) : "") << ","
            << std::fixed << std::setprecision(6) << s.budget << "," << s.gft
            << "," << s.best_profit_expert.gft << "\n";
  runs_csv_.flush();

  spdlog::info("── Run ── rounds={}, trades={}, rescaled={}, elapsed={:.1f}ms",
               s.rounds, s.trades, s.rescaled_rounds, s.elapsed_ms);
  if (s.switch_round)
    spdlog::info("  ├─ switched to GFT_MAX at round {}", *s.switch_round);
  else
    spdlog::info("  ├─ stayed in PROFIT_MAX");
  spdlog::info("  ├─ budget={:.4f} gft={:.4f}", s.budget, s.gft);
  spdlog::info("  ├─ best profit-grid expert ({:.4f}, {:.4f}) gft={:.4f}",
               s.best_profit_expert.expert.ask,
               s.best_profit_expert.expert.bid, s.best_profit_expert.gft);
  spdlog::info("  └─ best gft-grid expert ({:.4f}, {:.4f}) gft={:.4f}",
               s.best_gft_expert.expert.ask, s.best_gft_expert.expert.bid,
               s.best_gft_expert.gft);
}

} // namespace gftmax
