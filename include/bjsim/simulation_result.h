#ifndef BJSIM_SIMULATION_RESULT_H
#define BJSIM_SIMULATION_RESULT_H

#include "bjsim/common_types.h"
#include <cstdint>
#include <string>

namespace bj_sim {

// Résultat d'une simulation (stratégie, run). Immuable une fois produit.
struct SimulationResult {
    std::string    strategy_name;
    int            run_index        = 0;
    uint64_t       seed             = 0;
    double         starting_balance = 0.0;
    double         ending_balance   = 0.0;
    int            hands_played     = 0;
    TerminalReason terminal_reason  = TerminalReason::HAND_LIMIT_REACHED;

    int    wins              = 0;
    int    losses            = 0;
    int    pushes            = 0;
    int    surrenders        = 0;
    int    player_blackjacks = 0;
    double total_wagered     = 0.0;
    int    reshuffles        = 0;

    double net_profit() const { return ending_balance - starting_balance; }
};

// Statistiques agrégées d'une stratégie.
struct AggregateStats {
    std::string strategy_name;
    int runs_requested  = 0;
    int runs_aggregated = 0;
    int runs_failed     = 0;

    double mean_net_profit       = 0.0;
    double stddev_net_profit     = 0.0;
    double profit_per_unit_bet   = 0.0; // somme des gains / somme des mises
    double win_rate              = 0.0; // par main réglée
    double loss_rate             = 0.0;
    double push_rate             = 0.0;
    double average_hands_played  = 0.0;

    long long total_hands         = 0;
    double    total_wagered       = 0.0;
    int       player_blackjacks   = 0;
    int       bankrupt_runs       = 0;
    int       hand_limit_runs     = 0;
    int       table_broke_runs    = 0;
};

} // namespace bj_sim

#endif // BJSIM_SIMULATION_RESULT_H
