#include "core/shoe.hpp"
#include "bjsim/errors.h"
#include "spdlog/spdlog.h"
#include <stdexcept>
#include <algorithm> // Pour std::shuffle
#include <cmath>

namespace bj_sim {

Shoe::Shoe(int num_decks, double penetration, uint64_t seed)
    : num_decks_(num_decks),
      penetration_(penetration),
      rng_(seed)
{
    if (num_decks <= 0) {
        throw std::invalid_argument("Shoe needs at least one deck.");
    }
    if (!(penetration > 0.0 && penetration <= 1.0)) {
        throw std::invalid_argument("Shoe penetration must be in (0, 1].");
    }
    build();
    cut_card_pos_ = static_cast<size_t>(std::floor(static_cast<double>(cards_.size()) * penetration_));
    std::shuffle(cards_.begin(), cards_.end(), rng_);
}

// Multiset trié : D x (4 couleurs x 13 rangs)
void Shoe::build() {
    cards_.clear();
    remaining_value_ = 0;
    cards_.reserve(static_cast<size_t>(num_decks_) * CARDS_PER_DECK);
    for (int d = 0; d < num_decks_; ++d) {
        for (int s = 0; s < NUM_SUITS; ++s) {
            for (int r = 0; r < NUM_RANKS; ++r) {
                cards_.push_back(make_card(static_cast<Rank>(r), static_cast<Suit>(s)));
                remaining_value_ += blackjack_value(static_cast<Rank>(r));
            }
        }
    }
    cursor_ = 0;
}

Card Shoe::deal_one() {
    if (cursor_ >= cards_.size()) {
        throw ShoeExhausted("Shoe is exhausted (" + std::to_string(cards_.size()) +
                            " cards dealt), reshuffle was not triggered.");
    }
    const Card card = cards_[cursor_++];
    remaining_value_ -= blackjack_value(card);
    return card;
}

bool Shoe::needs_reshuffle() const {
    return cursor_ >= cut_card_pos_;
}

void Shoe::reshuffle() {
    for (size_t i = 0; i < cursor_; ++i) remaining_value_ += blackjack_value(cards_[i]);
    std::shuffle(cards_.begin(), cards_.end(), rng_);
    cursor_ = 0;
    ++reshuffle_count_;
    spdlog::trace("Sabot remélangé ({} cartes, remélange #{})", cards_.size(), reshuffle_count_);
}

void Shoe::stack_for_testing(const std::vector<Card>& top_cards) {
    if (top_cards.size() > remaining()) {
        throw std::invalid_argument("Cannot stack more cards than remain in the shoe.");
    }
    for (size_t i = 0; i < top_cards.size(); ++i) {
        const size_t pos = cursor_ + i;
        auto it = std::find(cards_.begin() + static_cast<std::ptrdiff_t>(pos), cards_.end(), top_cards[i]);
        if (it == cards_.end()) {
            throw std::invalid_argument("Card " + to_string(top_cards[i]) +
                                        " is not available in the undealt part of the shoe.");
        }
        std::iter_swap(cards_.begin() + static_cast<std::ptrdiff_t>(pos), it);
    }
}

} // namespace bj_sim
