#include "bjsim/game_utils.hpp"

namespace bj_sim {

std::string decision_to_string(Decision d) {
    switch (d) {
        case Decision::HIT:       return "HIT";
        case Decision::STAND:     return "STAND";
        case Decision::DOUBLE:    return "DOUBLE";
        case Decision::SPLIT:     return "SPLIT";
        case Decision::SURRENDER: return "SURRENDER";
        default:                  return "UNKNOWN_DECISION";
    }
}

std::string round_state_to_string(RoundState s) {
    switch (s) {
        case RoundState::BET_PLACED:      return "BetPlaced";
        case RoundState::INITIAL_DEAL:    return "InitialDeal";
        case RoundState::INSURANCE_OFFER: return "InsuranceOffer";
        case RoundState::PLAYER_TURN:     return "PlayerTurn";
        case RoundState::DEALER_TURN:     return "DealerTurn";
        case RoundState::SETTLEMENT:      return "Settlement";
        case RoundState::DONE:            return "Done";
        default:                          return "UnknownState";
    }
}

// Libellés du rapport
std::string terminal_reason_to_string(TerminalReason r) {
    switch (r) {
        case TerminalReason::HAND_LIMIT_REACHED: return "hand-limit-reached";
        case TerminalReason::BANKRUPT:           return "bankrupt";
        case TerminalReason::TABLE_BROKE:        return "table-broke";
        default:                                 return "unknown";
    }
}

} // namespace bj_sim
