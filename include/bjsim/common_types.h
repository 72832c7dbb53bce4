#ifndef BJSIM_COMMON_TYPES_H
#define BJSIM_COMMON_TYPES_H

namespace bj_sim {

// Décisions de jeu renvoyées par une stratégie
enum class Decision {
    HIT,
    STAND,
    DOUBLE,
    SPLIT,
    SURRENDER
};

// États de la machine d'état d'une main (voir Round)
enum class RoundState {
    BET_PLACED,
    INITIAL_DEAL,
    INSURANCE_OFFER,
    PLAYER_TURN,
    DEALER_TURN,
    SETTLEMENT,
    DONE
};

// Raison de fin d'une simulation
enum class TerminalReason {
    HAND_LIMIT_REACHED,
    BANKRUPT,
    TABLE_BROKE
};

// Règles de la table. Immuables pendant toute la durée d'une simulation,
// partagées en lecture seule entre tous les workers.
struct TableRules {
    double min_bet             = 5.0;
    double bet_margin          = 2.0;
    int    num_decks           = 6;
    double penetration         = 0.8;
    bool   allow_surrender     = false;
    bool   allow_insurance     = false;
    bool   dealer_hits_soft_17 = false;
    bool   double_after_split  = true;
    bool   hit_split_aces      = false;
    int    max_split_hands     = 4;   // 3 splits au maximum
    double blackjack_payout    = 1.5; // 3:2
    double insurance_payout    = 2.0; // 2:1
};

} // namespace bj_sim

#endif // BJSIM_COMMON_TYPES_H
