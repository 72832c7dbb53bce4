#include "bjsim/round.h"
#include "bjsim/errors.h"
#include "bjsim/game_utils.hpp" // Pour decision_to_string
#include "spdlog/spdlog.h"
#include <algorithm> // Pour std::min, std::max, std::any_of
#include <cmath>     // Pour std::isfinite
#include <sstream>
#include <stdexcept>

namespace bj_sim {

// --- Constantes ---
static constexpr int DEALER_STANDS_ON = 17;

// -----------------------------------------------------------------------------
//  Constructeur
// -----------------------------------------------------------------------------
Round::Round(const Strategy& strategy, Table& table, PlayerAccount& account,
             Shoe& shoe, CountTracker& tracker)
    : strategy_(strategy),
      table_(table),
      account_(account),
      shoe_(shoe),
      tracker_(tracker),
      dealer_(Hand::DEALER_INDEX),
      balance_before_(account.balance())
{
    hands_.reserve(static_cast<size_t>(std::max(1, table.rules().max_split_hands)));
}

// -----------------------------------------------------------------------------
//  Boucle principale
// -----------------------------------------------------------------------------
void Round::step() {
    switch (state_) {
        case RoundState::BET_PLACED:
            place_bet();
            state_ = RoundState::INITIAL_DEAL;
            break;
        case RoundState::INITIAL_DEAL:
            initial_deal();
            state_ = RoundState::INSURANCE_OFFER;
            break;
        case RoundState::INSURANCE_OFFER:
            offer_insurance();
            // Blackjack du croupier : on passe directement au règlement
            state_ = outcome_.dealer_blackjack ? RoundState::SETTLEMENT : RoundState::PLAYER_TURN;
            break;
        case RoundState::PLAYER_TURN:
            player_turn();
            state_ = RoundState::DEALER_TURN;
            break;
        case RoundState::DEALER_TURN:
            dealer_turn();
            state_ = RoundState::SETTLEMENT;
            break;
        case RoundState::SETTLEMENT:
            settle();
            state_ = RoundState::DONE;
            break;
        case RoundState::DONE:
            break;
    }
}

RoundOutcome Round::play() {
    while (state_ != RoundState::DONE) {
        step();
    }
    return outcome_;
}

// -----------------------------------------------------------------------------
//  Étapes
// -----------------------------------------------------------------------------
void Round::place_bet() {
    const TableRules& rules = table_.rules();
    const double balance = account_.balance();
    const double requested = strategy_.bet_amount(tracker_.true_count(), rules, balance);

    double bet = std::isfinite(requested) ? requested : rules.min_bet;
    if (bet < rules.min_bet || bet > balance) {
        spdlog::warn("[{}] Mise demandée {} hors limites [{}, {}], bornée.",
                     strategy_.name(), requested, rules.min_bet, balance);
    }
    bet = std::max(bet, rules.min_bet);
    bet = std::min(bet, balance);
    bet = std::min(bet, table_.max_coverable_bet());

    if (bet < rules.min_bet) {
        throw InsufficientFunds("Balance " + std::to_string(balance) +
                                " below table minimum " + std::to_string(rules.min_bet));
    }

    hands_.emplace_back(0, false);
    account_.open_bet(bet);
    outcome_.initial_bet = bet;
    outcome_.wagered     = bet;
    spdlog::trace("[{}] Mise {} (TC={:.2f}, solde {})", strategy_.name(), bet, tracker_.true_count(), balance);
}

void Round::initial_deal() {
    // Ordre de la table : joueur, croupier (visible), joueur, croupier (cachée)
    Hand& player = hands_.front();
    draw_visible(player);
    draw_visible(dealer_);
    draw_visible(player);
    dealer_.add_card(shoe_.deal_one());
    hole_card_revealed_ = false;
    active_hands_.push_back(0);
}

void Round::offer_insurance() {
    const TableRules& rules = table_.rules();
    const Card up = dealer_upcard();

    if (rules.allow_insurance && is_ace(up) && strategy_.insurance_decision(tracker_.true_count())) {
        const double stake = outcome_.initial_bet / 2.0;
        if (account_.can_afford(stake)) {
            account_.debit(stake);
            insurance_stake_          = stake;
            outcome_.insurance_taken  = true;
            outcome_.wagered         += stake;
        } else {
            spdlog::debug("[{}] Assurance refusée : solde insuffisant.", strategy_.name());
        }
    }

    // Le croupier vérifie sa carte cachée avec un as ou un dix visible
    if (is_ace(up) || is_ten_value(up)) {
        outcome_.dealer_blackjack = dealer_.is_blackjack();
    }

    if (outcome_.insurance_taken) {
        if (outcome_.dealer_blackjack) {
            table_.pay(account_, insurance_stake_, rules.insurance_payout);
            outcome_.insurance_won = true;
        } else {
            table_.collect(insurance_stake_);
        }
    }

    if (outcome_.dealer_blackjack) {
        reveal_hole_card();
        active_hands_.clear();
        spdlog::trace("Blackjack du croupier : {}", dealer_.toString());
    }
}

void Round::player_turn() {
    while (!active_hands_.empty()) {
        const size_t idx = active_hands_.front();
        active_hands_.pop_front();
        play_hand(idx);
    }
}

void Round::dealer_turn() {
    reveal_hole_card();
    // Aucune main à comparer : le croupier ne tire pas
    if (!has_live_hand()) return;

    const bool hits_soft_17 = table_.rules().dealer_hits_soft_17;
    while (true) {
        const HandValue v = dealer_.value();
        const bool must_hit = v.total < DEALER_STANDS_ON
                           || (hits_soft_17 && v.is_soft && v.total == DEALER_STANDS_ON);
        if (!must_hit) break;
        draw_visible(dealer_);
    }
    spdlog::trace("Croupier : {}", dealer_.toString());
}

void Round::settle() {
    reveal_hole_card();
    const TableRules& rules = table_.rules();
    const HandValue dealer_value = dealer_.value();
    const bool dealer_bust = dealer_.is_bust();
    const bool dealer_bj   = dealer_.is_blackjack();

    for (size_t i = 0; i < hands_.size(); ++i) {
        const Hand& hand = hands_[i];
        const double stake = account_.bet(i);

        if (hand.is_surrendered()) {
            // Déjà réglée au moment de l'abandon
            continue;
        }
        if (hand.is_blackjack()) {
            if (dealer_bj) {
                table_.pay(account_, stake, 0.0);
                ++outcome_.pushes;
            } else {
                table_.pay(account_, stake, rules.blackjack_payout);
                ++outcome_.wins;
                ++outcome_.player_blackjacks;
            }
            continue;
        }
        if (hand.is_bust() || dealer_bj) {
            table_.collect(stake);
            ++outcome_.losses;
            continue;
        }

        const int player_total = hand.value().total;
        if (dealer_bust || player_total > dealer_value.total) {
            table_.pay(account_, stake, 1.0);
            ++outcome_.wins;
        } else if (player_total == dealer_value.total) {
            table_.pay(account_, stake, 0.0);
            ++outcome_.pushes;
        } else {
            table_.collect(stake);
            ++outcome_.losses;
        }
    }

    account_.clear_bets();
    outcome_.hands_settled = static_cast<int>(hands_.size());
    outcome_.net = account_.balance() - balance_before_;
    spdlog::trace("[{}] Règlement : net {} ({})", strategy_.name(), outcome_.net, toString());
}

// -----------------------------------------------------------------------------
//  Tour du joueur
// -----------------------------------------------------------------------------
void Round::play_hand(size_t hand_index) {
    const TableRules& rules = table_.rules();

    // Main issue d'un split : elle reçoit sa seconde carte maintenant
    if (hands_[hand_index].size() < 2) {
        draw_visible(hands_[hand_index]);
    }
    if (hands_[hand_index].is_split_aces() && !rules.hit_split_aces) {
        hands_[hand_index].stand();
        return;
    }

    while (!hands_[hand_index].is_finished()) {
        Hand& hand = hands_[hand_index];
        const Decision requested = strategy_.play_decision(hand, dealer_upcard(), tracker_.true_count(), rules);
        const Decision decision  = normalize(hand, hand_index, requested);

        switch (decision) {
            case Decision::HIT:
                draw_visible(hand);
                break;
            case Decision::STAND:
                hand.stand();
                break;
            case Decision::DOUBLE: {
                const double extra = account_.bet(hand_index);
                account_.raise_bet(hand_index, extra);
                outcome_.wagered += extra;
                ++outcome_.doubles;
                draw_visible(hand);
                hand.mark_doubled();
                break;
            }
            case Decision::SPLIT:
                split_hand(hand_index);
                // Les aces splittés ne reçoivent qu'une carte
                if (hands_[hand_index].is_split_aces() && !rules.hit_split_aces) {
                    hands_[hand_index].stand();
                }
                break;
            case Decision::SURRENDER: {
                const double stake = account_.bet(hand_index);
                hand.mark_surrendered();
                table_.refund_half(account_, stake);
                ++outcome_.surrenders;
                break;
            }
        }
    }
}

Decision Round::normalize(const Hand& hand, size_t hand_index, Decision requested) const {
    const TableRules& rules = table_.rules();
    const double stake = account_.bet(hand_index);

    bool legal = true;
    bool resource_limited = false;
    switch (requested) {
        case Decision::HIT:
        case Decision::STAND:
            break;
        case Decision::DOUBLE:
            legal = hand.can_double(rules);
            if (legal && !account_.can_afford(stake)) { legal = false; resource_limited = true; }
            break;
        case Decision::SPLIT:
            legal = hand.can_split();
            if (legal && (static_cast<int>(hands_.size()) >= rules.max_split_hands
                          || !account_.can_afford(stake))) {
                legal = false;
                resource_limited = true;
            }
            break;
        case Decision::SURRENDER:
            legal = rules.allow_surrender && hand.size() == 2 && !hand.is_split_hand() && hands_.size() == 1;
            break;
    }
    if (legal) return requested;

    if (resource_limited) {
        spdlog::debug("[{}] {} impossible sur {} (limite de splits ou solde), STAND.",
                      strategy_.name(), decision_to_string(requested), hand.toString());
    } else {
        spdlog::warn("[{}] Coup illégal {} sur {}, remplacé par STAND.",
                     strategy_.name(), decision_to_string(requested), hand.toString());
    }
    return Decision::STAND;
}

void Round::split_hand(size_t hand_index) {
    const double stake = account_.bet(hand_index);
    const Card moved = hands_[hand_index].split_off();

    Hand new_hand(static_cast<int>(hands_.size()), true);
    new_hand.add_card(moved);
    hands_.push_back(new_hand); // invalide les références sur hands_
    const size_t bet_index = account_.open_bet(stake);
    if (bet_index != hands_.size() - 1) {
        throw std::logic_error("Split bet index does not match hand index");
    }
    outcome_.wagered += stake;
    ++outcome_.splits;

    draw_visible(hands_[hand_index]);
    active_hands_.push_back(hands_.size() - 1);
}

// -----------------------------------------------------------------------------
//  Utilitaires
// -----------------------------------------------------------------------------
Card Round::draw_visible(Hand& hand) {
    const Card c = shoe_.deal_one();
    hand.add_card(c);
    tracker_.observe(c);
    return c;
}

void Round::reveal_hole_card() {
    if (hole_card_revealed_ || dealer_.size() < 2) return;
    tracker_.observe(dealer_.cards()[1]);
    hole_card_revealed_ = true;
}

Card Round::dealer_upcard() const {
    if (dealer_.cards().empty()) throw std::logic_error("Dealer has no upcard yet");
    return dealer_.cards().front();
}

bool Round::has_live_hand() const {
    return std::any_of(hands_.begin(), hands_.end(), [](const Hand& h) {
        return !h.is_bust() && !h.is_surrendered() && !h.is_blackjack();
    });
}

std::string Round::toString() const {
    std::stringstream ss;
    ss << round_state_to_string(state_) << " | " << dealer_.toString();
    for (const Hand& h : hands_) ss << " | " << h.toString();
    return ss.str();
}

} // namespace bj_sim
