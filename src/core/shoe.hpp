#ifndef BJSIM_CORE_SHOE_HPP
#define BJSIM_CORE_SHOE_HPP

#include "core/cards.hpp"
#include <vector>
#include <random>
#include <cstdint>

namespace bj_sim {

// Sabot de D jeux. Propriété exclusive d'une seule simulation.
class Shoe {
public:
    Shoe(int num_decks, double penetration, uint64_t seed);
    ~Shoe() = default;

    // Lève ShoeExhausted si le curseur a atteint la fin du sabot.
    Card deal_one();

    // Vrai dès que la carte de coupe est atteinte (cursor >= floor(size * penetration)).
    bool needs_reshuffle() const;

    // Remet le curseur à 0 et re-permute toutes les cartes.
    // L'appelant doit remettre le compteur à zéro (voir CountTracker::reset).
    void reshuffle();

    size_t size() const { return cards_.size(); }
    size_t cursor() const { return cursor_; }
    size_t remaining() const { return cards_.size() - cursor_; }
    // Somme des valeurs dures (as = 1) des cartes non distribuées
    int remaining_value() const { return remaining_value_; }
    size_t cut_card_position() const { return cut_card_pos_; }
    int num_decks() const { return num_decks_; }
    double penetration() const { return penetration_; }
    int reshuffle_count() const { return reshuffle_count_; }

    // Place les cartes demandées (dans l'ordre) en tête de la partie non distribuée.
    // Le multiset du sabot est conservé ; lève std::invalid_argument si une carte manque.
    void stack_for_testing(const std::vector<Card>& top_cards);

private:
    void build();

    std::vector<Card> cards_;
    size_t            cursor_ = 0;
    size_t            cut_card_pos_ = 0;
    int               remaining_value_ = 0;
    int               num_decks_;
    double            penetration_;
    int               reshuffle_count_ = 0;
    std::mt19937_64   rng_;
};

} // namespace bj_sim

#endif // BJSIM_CORE_SHOE_HPP
