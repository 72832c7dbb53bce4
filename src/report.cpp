#include "bjsim/report.h"
#include "bjsim/game_utils.hpp"
#include "spdlog/fmt/fmt.h"
#include <string>

namespace bj_sim {

// --- Mise en page ---
static constexpr int REPORT_WIDTH = 80;
static constexpr int LABEL_WIDTH  = 36;

namespace {

std::string line(const std::string& label, const std::string& value) {
    return fmt::format("{:<{}}{:>{}}\n", label, LABEL_WIDTH, value, REPORT_WIDTH - LABEL_WIDTH);
}

} // namespace

std::string format_stats(const AggregateStats& s) {
    std::string out = fmt::format("{:-^{}}\n", " " + s.strategy_name + " ", REPORT_WIDTH);
    out += line("runs (aggregated / requested)", fmt::format("{} / {}", s.runs_aggregated, s.runs_requested));
    if (s.runs_failed > 0) out += line("runs excluded", std::to_string(s.runs_failed));
    out += line("mean net profit", fmt::format("{:.2f}", s.mean_net_profit));
    out += line("std dev of net profit", fmt::format("{:.2f}", s.stddev_net_profit));
    out += line("profit per unit bet", fmt::format("{:.4f}", s.profit_per_unit_bet));
    out += line("win / loss / push rate", fmt::format("{:.4f} / {:.4f} / {:.4f}",
                                                      s.win_rate, s.loss_rate, s.push_rate));
    out += line("average hands played", fmt::format("{:.1f}", s.average_hands_played));
    out += line("total hands", std::to_string(s.total_hands));
    out += line("total wagered", fmt::format("{:.2f}", s.total_wagered));
    out += line("number of player blackjacks", std::to_string(s.player_blackjacks));
    out += line("bankrupt / hand limit / table broke",
                fmt::format("{} / {} / {}", s.bankrupt_runs, s.hand_limit_runs, s.table_broke_runs));
    out += std::string(REPORT_WIDTH, '-') + "\n";
    return out;
}

std::string format_result(const SimulationResult& r) {
    return fmt::format("{:<18} #{:<5} hands {:>6}  balance {:>10.2f} -> {:>10.2f}  net {:>+10.2f}  W/L/P {}/{}/{}  {}\n",
                       r.strategy_name, r.run_index, r.hands_played, r.starting_balance, r.ending_balance,
                       r.net_profit(), r.wins, r.losses, r.pushes, terminal_reason_to_string(r.terminal_reason));
}

void write_report(std::ostream& out, const SimulationReport& report, bool per_run) {
    for (const std::string& name : report.strategy_order) {
        const auto it = report.stats.find(name);
        if (it != report.stats.end()) out << format_stats(it->second);
    }

    if (per_run && !report.results.empty()) {
        out << "\n" << fmt::format("{:-^{}}\n", " per simulation ", REPORT_WIDTH);
        for (const SimulationResult& r : report.results) out << format_result(r);
    }

    for (const UnitFailure& f : report.failures) {
        out << fmt::format("excluded: {} run #{} ({})\n", f.strategy_name, f.run_index, f.reason);
    }
    out << fmt::format("{} of {} runs aggregated{}\n", report.runs_aggregated, report.runs_requested,
                       report.stopped ? " (stopped)" : "");
}

} // namespace bj_sim
