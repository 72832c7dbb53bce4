#include "bjsim/count_tracker.h"
#include "spdlog/spdlog.h"
#include <algorithm> // Pour std::max

namespace bj_sim {

CountTracker::CountTracker(const Strategy& strategy, const Shoe& shoe)
    : strategy_(strategy),
      shoe_(shoe) {}

void CountTracker::observe(Card card) {
    running_count_ += strategy_.card_weight(card);
    ++cards_observed_;
    if (spdlog::default_logger_raw()->should_log(spdlog::level::trace)) {
        spdlog::trace("Compte [{}] : {} -> RC={}", strategy_.name(), to_string(card), running_count_);
    }
}

void CountTracker::reset() {
    running_count_  = 0;
    cards_observed_ = 0;
}

double CountTracker::estimated_decks_remaining() const {
    const double decks = static_cast<double>(shoe_.remaining()) / static_cast<double>(CARDS_PER_DECK);
    return std::max(1.0, decks);
}

double CountTracker::true_count() const {
    return static_cast<double>(running_count_) / estimated_decks_remaining();
}

} // namespace bj_sim
