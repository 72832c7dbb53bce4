#include "bjsim/aggregator.h"
#include <algorithm> // Pour std::sort
#include <cmath>     // Pour std::sqrt
#include <utility>

namespace bj_sim {

void Aggregator::expect(const std::string& strategy_name, int runs_requested) {
    requested_[strategy_name] = runs_requested;
    results_[strategy_name]; // crée le groupe vide
}

void Aggregator::add_result(SimulationResult result) {
    const std::string name = result.strategy_name;
    results_[name].push_back(std::move(result));
}

void Aggregator::add_failure(const std::string& strategy_name) {
    ++failed_[strategy_name];
    results_[strategy_name];
}

size_t Aggregator::result_count() const {
    size_t n = 0;
    for (const auto& [name, group] : results_) n += group.size();
    return n;
}

std::map<std::string, AggregateStats> Aggregator::stats() const {
    std::map<std::string, AggregateStats> out;
    for (const auto& [name, group] : results_) {
        const auto req  = requested_.find(name);
        const auto fail = failed_.find(name);
        const int failed    = fail != failed_.end() ? fail->second : 0;
        const int requested = req != requested_.end() ? req->second
                                                       : static_cast<int>(group.size()) + failed;
        out.emplace(name, reduce(name, group, requested, failed));
    }
    return out;
}

AggregateStats Aggregator::reduce(const std::string& strategy_name,
                                  std::vector<SimulationResult> results,
                                  int runs_requested, int runs_failed) {
    // Ordre canonique : les sommes flottantes sont identiques quel que soit l'ordre d'arrivée
    std::sort(results.begin(), results.end(), [](const SimulationResult& a, const SimulationResult& b) {
        if (a.run_index != b.run_index) return a.run_index < b.run_index;
        return a.seed < b.seed;
    });

    AggregateStats s;
    s.strategy_name   = strategy_name;
    s.runs_requested  = runs_requested;
    s.runs_aggregated = static_cast<int>(results.size());
    s.runs_failed     = runs_failed;
    if (results.empty()) return s;

    double sum_net = 0.0;
    long long wins = 0, losses = 0, pushes = 0, surrenders = 0;
    for (const SimulationResult& r : results) {
        sum_net           += r.net_profit();
        s.total_wagered   += r.total_wagered;
        s.total_hands     += r.hands_played;
        s.player_blackjacks += r.player_blackjacks;
        wins       += r.wins;
        losses     += r.losses;
        pushes     += r.pushes;
        surrenders += r.surrenders;
        switch (r.terminal_reason) {
            case TerminalReason::HAND_LIMIT_REACHED: ++s.hand_limit_runs;  break;
            case TerminalReason::BANKRUPT:           ++s.bankrupt_runs;    break;
            case TerminalReason::TABLE_BROKE:        ++s.table_broke_runs; break;
        }
    }

    const double n = static_cast<double>(results.size());
    s.mean_net_profit      = sum_net / n;
    s.average_hands_played = static_cast<double>(s.total_hands) / n;
    s.profit_per_unit_bet  = s.total_wagered > 0.0 ? sum_net / s.total_wagered : 0.0;

    // Écart-type corrigé (n - 1)
    if (results.size() > 1) {
        double sq = 0.0;
        for (const SimulationResult& r : results) {
            const double d = r.net_profit() - s.mean_net_profit;
            sq += d * d;
        }
        s.stddev_net_profit = std::sqrt(sq / (n - 1.0));
    }

    const long long settled = wins + losses + pushes + surrenders;
    if (settled > 0) {
        s.win_rate  = static_cast<double>(wins)   / static_cast<double>(settled);
        s.loss_rate = static_cast<double>(losses) / static_cast<double>(settled);
        s.push_rate = static_cast<double>(pushes) / static_cast<double>(settled);
    }
    return s;
}

} // namespace bj_sim
