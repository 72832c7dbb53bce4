#include "bjsim/simulation_runner.h"
#include "bjsim/errors.h"
#include "bjsim/game_utils.hpp"
#include "bjsim/round.h"
#include "spdlog/spdlog.h"

namespace bj_sim {

// --- Constantes ---
// Valeur dure maximale d'une main du joueur : on ne tire qu'à 21 dur ou moins, +10 au plus
static constexpr int MAX_PLAYER_HAND_VALUE = 31;
// Le croupier ne tire qu'à 16 dur ou moins (soft 17 compris)
static constexpr int MAX_DEALER_HAND_VALUE = 26;

int SimulationRunner::round_value_reserve(const TableRules& rules) {
    return rules.max_split_hands * MAX_PLAYER_HAND_VALUE + MAX_DEALER_HAND_VALUE;
}

SimulationRunner::SimulationRunner(const Strategy& strategy, const RunParameters& params,
                                   uint64_t seed, int run_index)
    : strategy_(strategy),
      params_(params),
      seed_(seed),
      run_index_(run_index),
      shoe_(params.rules.num_decks, params.rules.penetration, seed),
      tracker_(strategy, shoe_),
      table_(params.rules, params.table_balance),
      account_(params.player_balance) {}

void SimulationRunner::reshuffle_if_needed() {
    if (shoe_.needs_reshuffle() || shoe_.remaining_value() < round_value_reserve(params_.rules)) {
        shoe_.reshuffle();
        tracker_.reset();
    }
}

std::optional<SimulationResult> SimulationRunner::run(const std::atomic<bool>* stop_flag) {
    const TableRules& rules = params_.rules;

    SimulationResult result;
    result.strategy_name    = strategy_.name();
    result.run_index        = run_index_;
    result.seed             = seed_;
    result.starting_balance = account_.balance();

    while (true) {
        if (stop_flag != nullptr && stop_flag->load(std::memory_order_relaxed)) {
            spdlog::debug("[{}] Run {} interrompu après {} mains.", result.strategy_name, run_index_,
                          result.hands_played);
            return std::nullopt;
        }

        // --- Conditions terminales ---
        if (result.hands_played >= params_.max_hands) {
            result.terminal_reason = TerminalReason::HAND_LIMIT_REACHED;
            break;
        }
        if (account_.balance() < rules.min_bet) {
            result.terminal_reason = TerminalReason::BANKRUPT;
            break;
        }
        if (!table_.can_cover(rules.min_bet)) {
            result.terminal_reason = TerminalReason::TABLE_BROKE;
            break;
        }

        reshuffle_if_needed();

        RoundOutcome outcome;
        try {
            Round round(strategy_, table_, account_, shoe_, tracker_);
            outcome = round.play();
        } catch (const InsufficientFunds& e) {
            spdlog::debug("[{}] Run {} : {}", result.strategy_name, run_index_, e.what());
            result.terminal_reason = TerminalReason::BANKRUPT;
            break;
        }

        ++result.hands_played;
        result.wins              += outcome.wins;
        result.losses            += outcome.losses;
        result.pushes            += outcome.pushes;
        result.surrenders        += outcome.surrenders;
        result.player_blackjacks += outcome.player_blackjacks;
        result.total_wagered     += outcome.wagered;
    }

    result.ending_balance = account_.balance();
    result.reshuffles     = shoe_.reshuffle_count();
    spdlog::debug("[{}] Run {} terminé : {} mains, solde {} -> {} ({})",
                  result.strategy_name, run_index_, result.hands_played, result.starting_balance,
                  result.ending_balance, terminal_reason_to_string(result.terminal_reason));
    return result;
}

} // namespace bj_sim
