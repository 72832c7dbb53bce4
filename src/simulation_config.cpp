#include "bjsim/simulation_config.h"
#include "bjsim/counting_strategies.h"
#include "bjsim/errors.h"
#include <cmath> // Pour std::isnan
#include <set>
#include <string>

namespace bj_sim {

void SimulationConfig::validate() const {
    if (num_decks <= 0) {
        throw ConfigurationError("num_decks must be > 0 (got " + std::to_string(num_decks) + ")");
    }
    if (std::isnan(penetration) || penetration <= 0.0 || penetration > 1.0) {
        throw ConfigurationError("penetration must be in (0, 1] (got " + std::to_string(penetration) + ")");
    }
    if (std::isnan(min_bet) || min_bet <= 0.0) {
        throw ConfigurationError("min_bet must be > 0");
    }
    if (std::isnan(table_balance) || min_bet > table_balance) {
        throw ConfigurationError("min_bet (" + std::to_string(min_bet) +
                                 ") exceeds the table balance (" + std::to_string(table_balance) + ")");
    }
    if (std::isnan(player_balance) || player_balance < 0.0) {
        throw ConfigurationError("player_balance must be >= 0");
    }
    if (std::isnan(bet_margin) || bet_margin < 0.0) {
        throw ConfigurationError("bet_margin must be >= 0");
    }
    if (num_simulations_per_strategy <= 0) {
        throw ConfigurationError("num_simulations_per_strategy must be > 0");
    }
    if (max_hands < 0) {
        throw ConfigurationError("max_hands must be >= 0");
    }
    if (max_split_hands < 1) {
        throw ConfigurationError("max_split_hands must be >= 1");
    }
    if (std::isnan(blackjack_payout) || blackjack_payout <= 0.0) {
        throw ConfigurationError("blackjack_payout must be > 0");
    }
    if (num_workers < 0) {
        throw ConfigurationError("num_workers must be >= 0");
    }

    std::set<std::string> names;
    for (const StrategyPtr& s : strategies) {
        if (!s) throw ConfigurationError("Null strategy in the strategy set");
        if (!names.insert(s->name()).second) {
            throw ConfigurationError("Duplicate strategy name: " + s->name());
        }
    }
}

TableRules SimulationConfig::table_rules() const {
    TableRules rules;
    rules.min_bet             = min_bet;
    rules.bet_margin          = bet_margin;
    rules.num_decks           = num_decks;
    rules.penetration         = penetration;
    rules.allow_surrender     = allow_surrender;
    rules.allow_insurance     = allow_insurance;
    rules.dealer_hits_soft_17 = dealer_hits_soft_17;
    rules.double_after_split  = double_after_split;
    rules.hit_split_aces      = hit_split_aces;
    rules.max_split_hands     = max_split_hands;
    rules.blackjack_payout    = blackjack_payout;
    return rules;
}

RunParameters SimulationConfig::run_parameters() const {
    RunParameters params;
    params.rules          = table_rules();
    params.table_balance  = table_balance;
    params.player_balance = player_balance;
    params.max_hands      = max_hands;
    return params;
}

std::vector<StrategyPtr> SimulationConfig::resolved_strategies() const {
    if (strategies.empty()) return builtin_strategies();
    return strategies;
}

} // namespace bj_sim
