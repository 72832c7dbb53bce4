#ifndef BJSIM_HAND_H
#define BJSIM_HAND_H

#include "core/cards.hpp"
#include "bjsim/common_types.h"
#include <vector>
#include <optional>
#include <string>

namespace bj_sim {

// Total d'une main : is_soft indique qu'un as est compté 11.
struct HandValue {
    int  total   = 0;
    bool is_soft = false;

    bool operator==(const HandValue& other) const {
        return total == other.total && is_soft == other.is_soft;
    }
};

// Main du joueur (index >= 0) ou du croupier (DEALER_INDEX).
// Détruite à la fin de la main.
class Hand {
public:
    static constexpr int DEALER_INDEX = -1;

    explicit Hand(int index = 0, bool is_split_hand = false);

    void add_card(Card card);

    // (total, souple) : as à 11 si le total dur est <= 11, sinon total dur.
    HandValue value() const;
    int hard_total() const;

    bool is_bust() const { return hard_total() > 21; }
    bool is_blackjack() const;
    bool can_split() const;
    bool can_double(const TableRules& rules) const;
    bool is_split_aces() const;

    // Retire la seconde carte pour former une nouvelle main (split).
    Card split_off();

    void mark_doubled()     { has_doubled_ = true; stood_ = true; }
    void mark_surrendered() { is_surrendered_ = true; stood_ = true; }
    void stand()            { stood_ = true; }

    const std::vector<Card>& cards() const { return cards_; }
    size_t size() const { return cards_.size(); }
    int  index() const { return index_; }
    bool is_dealer() const { return index_ == DEALER_INDEX; }
    bool is_split_hand() const { return is_split_hand_; }
    bool has_doubled() const { return has_doubled_; }
    bool is_surrendered() const { return is_surrendered_; }

    // La main n'accepte plus de décision (debout, doublée, abandonnée, 21 ou bust).
    bool is_finished() const;

    std::string toString() const;

private:
    std::vector<Card> cards_;
    int  index_;
    bool is_split_hand_  = false;
    bool has_doubled_    = false;
    bool is_surrendered_ = false;
    bool stood_          = false;
    mutable std::optional<HandValue> cached_value_;
};

} // namespace bj_sim

#endif // BJSIM_HAND_H
