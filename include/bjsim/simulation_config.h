#ifndef BJSIM_SIMULATION_CONFIG_H
#define BJSIM_SIMULATION_CONFIG_H

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>
#include "bjsim/common_types.h"
#include "bjsim/simulation_runner.h"
#include "bjsim/strategy.h"

namespace bj_sim {

// Configuration complète d'un lancement. Construite une fois, passée par
// référence à run(), jamais modifiée ensuite.
struct SimulationConfig {
    // --- Table ---
    double table_balance   = std::numeric_limits<double>::infinity();
    int    num_decks       = 6;
    double penetration     = 0.8;
    double min_bet         = 5.0;
    double bet_margin      = 2.0;

    // --- Règles ---
    bool   allow_surrender     = false;
    bool   allow_insurance     = false;
    bool   dealer_hits_soft_17 = false;
    bool   double_after_split  = true;
    bool   hit_split_aces      = false;
    int    max_split_hands     = 4;
    double blackjack_payout    = 1.5;

    // --- Joueur / simulation ---
    double player_balance               = 500.0;
    int    num_simulations_per_strategy = 100;
    int    max_hands                    = 200;

    // --- Sortie ---
    bool                       show_per_simulation_output = true;
    std::optional<std::string> output_file;             // nullopt : sortie standard

    // Vide : toutes les stratégies fournies
    std::vector<StrategyPtr> strategies;

    // Graine de base ; nullopt : entropie fraîche à chaque lancement
    std::optional<uint64_t> seed;
    // 0 : std::thread::hardware_concurrency()
    int num_workers = 0;

    // Lève ConfigurationError au premier paramètre invalide.
    void validate() const;

    TableRules table_rules() const;
    RunParameters run_parameters() const;

    // Stratégies effectives (built-ins si la liste est vide)
    std::vector<StrategyPtr> resolved_strategies() const;
};

} // namespace bj_sim

#endif // BJSIM_SIMULATION_CONFIG_H
