#ifndef BJSIM_ROUND_H
#define BJSIM_ROUND_H

#include <deque>
#include <string>
#include <vector>
#include "core/cards.hpp"
#include "core/shoe.hpp"
#include "bjsim/common_types.h"
#include "bjsim/count_tracker.h"
#include "bjsim/hand.h"
#include "bjsim/strategy.h"
#include "bjsim/table.h"

namespace bj_sim {

// Bilan d'une main complète (toutes les mains du joueur après splits).
struct RoundOutcome {
    int    hands_settled     = 0; // mains du joueur réglées (1 + nombre de splits)
    int    wins              = 0;
    int    losses            = 0;
    int    pushes            = 0;
    int    surrenders        = 0;
    int    player_blackjacks = 0;
    int    doubles           = 0;
    int    splits            = 0;
    bool   insurance_taken   = false;
    bool   insurance_won     = false;
    bool   dealer_blackjack  = false;
    double initial_bet       = 0.0;
    double wagered           = 0.0; // mises + doubles + splits + assurance
    double net               = 0.0; // variation du solde du joueur
};

// Machine d'état d'une main :
// BET_PLACED -> INITIAL_DEAL -> INSURANCE_OFFER -> PLAYER_TURN -> DEALER_TURN -> SETTLEMENT -> DONE
//
// Ne possède rien : le sabot, le compteur, la table et le compte appartiennent
// à la simulation qui crée la Round. Les retours de la stratégie sont normalisés
// (mise bornée, coup illégal remplacé par STAND).
class Round {
public:
    Round(const Strategy& strategy, Table& table, PlayerAccount& account,
          Shoe& shoe, CountTracker& tracker);

    // Exécute l'état courant et passe au suivant. Sans effet une fois DONE.
    // Lève InsufficientFunds si la mise ne peut pas être placée.
    void step();

    // Joue la main jusqu'à DONE.
    RoundOutcome play();

    RoundState state() const { return state_; }
    bool is_done() const { return state_ == RoundState::DONE; }

    const std::vector<Hand>& player_hands() const { return hands_; }
    const Hand& dealer_hand() const { return dealer_; }
    const RoundOutcome& outcome() const { return outcome_; }

    std::string toString() const;

private:
    // --- Étapes ---
    void place_bet();
    void initial_deal();
    void offer_insurance();
    void player_turn();
    void dealer_turn();
    void settle();

    // --- Utilitaires ---
    Card draw_visible(Hand& hand);
    void reveal_hole_card();
    Card dealer_upcard() const;
    void play_hand(size_t hand_index);
    Decision normalize(const Hand& hand, size_t hand_index, Decision requested) const;
    void split_hand(size_t hand_index);
    bool has_live_hand() const;

    const Strategy& strategy_;
    Table&          table_;
    PlayerAccount&  account_;
    Shoe&           shoe_;
    CountTracker&   tracker_;

    RoundState          state_ = RoundState::BET_PLACED;
    std::vector<Hand>   hands_;        // indexées comme les mises du compte
    std::deque<size_t>  active_hands_; // file de travail du tour du joueur
    Hand                dealer_;
    bool                hole_card_revealed_ = false;
    double              insurance_stake_    = 0.0;
    double              balance_before_     = 0.0;
    RoundOutcome        outcome_;
};

} // namespace bj_sim

#endif // BJSIM_ROUND_H
