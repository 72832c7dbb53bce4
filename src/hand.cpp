#include "bjsim/hand.h"
#include <stdexcept>
#include <sstream>

namespace bj_sim {

Hand::Hand(int index, bool is_split_hand)
    : index_(index),
      is_split_hand_(is_split_hand)
{
    cards_.reserve(4);
}

void Hand::add_card(Card card) {
    cards_.push_back(card);
    cached_value_.reset();
}

int Hand::hard_total() const {
    int total = 0;
    for (const Card& c : cards_) total += blackjack_value(c);
    return total;
}

HandValue Hand::value() const {
    if (cached_value_) return *cached_value_;

    const int hard = hard_total();
    bool has_ace = false;
    for (const Card& c : cards_) {
        if (is_ace(c)) { has_ace = true; break; }
    }

    HandValue v{hard, false};
    // Un seul as peut compter 11 ; hard <= 11 garantit un total souple <= 21
    if (has_ace && hard <= 11) {
        v.total   = hard + 10;
        v.is_soft = true;
    }
    cached_value_ = v;
    return v;
}

bool Hand::is_blackjack() const {
    return cards_.size() == 2 && !is_split_hand_ && value().total == 21;
}

bool Hand::can_split() const {
    return cards_.size() == 2 && blackjack_value(cards_[0]) == blackjack_value(cards_[1]);
}

bool Hand::can_double(const TableRules& rules) const {
    if (cards_.size() != 2) return false;
    if (is_split_hand_ && !rules.double_after_split) return false;
    return true;
}

bool Hand::is_split_aces() const {
    return is_split_hand_ && !cards_.empty() && is_ace(cards_.front());
}

Card Hand::split_off() {
    if (!can_split()) {
        throw std::logic_error("Hand::split_off called on a non splittable hand " + toString());
    }
    Card moved = cards_.back();
    cards_.pop_back();
    is_split_hand_ = true;
    cached_value_.reset();
    return moved;
}

bool Hand::is_finished() const {
    return stood_ || is_bust() || value().total >= 21;
}

std::string Hand::toString() const {
    std::stringstream ss;
    ss << (is_dealer() ? std::string("D") : "H" + std::to_string(index_)) << " "
       << to_string(cards_) << " = ";
    const HandValue v = value();
    ss << (v.is_soft ? "soft " : "") << v.total;
    if (has_doubled_) ss << " (double)";
    if (is_surrendered_) ss << " (abandon)";
    return ss.str();
}

} // namespace bj_sim
