#ifndef BJSIM_COUNT_TRACKER_H
#define BJSIM_COUNT_TRACKER_H

#include "core/cards.hpp"
#include "core/shoe.hpp"
#include "bjsim/strategy.h"

namespace bj_sim {

// Running count / true count d'une simulation.
// Générique : les poids viennent de Strategy::card_weight.
// N'observe que les cartes visibles du joueur (la carte cachée du croupier
// est observée au moment où elle est retournée).
class CountTracker {
public:
    CountTracker(const Strategy& strategy, const Shoe& shoe);

    void observe(Card card);

    // Remis à zéro à chaque remélange du sabot.
    void reset();

    int running_count() const { return running_count_; }
    int cards_observed() const { return cards_observed_; }

    // (taille du sabot - curseur) / 52, plancher à 1 jeu.
    double estimated_decks_remaining() const;

    double true_count() const;

private:
    const Strategy& strategy_;
    const Shoe&     shoe_;
    int running_count_  = 0;
    int cards_observed_ = 0;
};

} // namespace bj_sim

#endif // BJSIM_COUNT_TRACKER_H
