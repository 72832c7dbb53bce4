#ifndef BJSIM_COUNTING_STRATEGIES_H
#define BJSIM_COUNTING_STRATEGIES_H

#include "bjsim/strategy.h"
#include "bjsim/basic_strategy.h"
#include <array>
#include <string>
#include <vector>

namespace bj_sim {

// Poids par rang (indexé par Rank), séparés rouge/noir pour Red Seven et KISS.
using WeightTable = std::array<int, NUM_RANKS>;

struct CountingSystem {
    std::string name;
    WeightTable red_weights{};
    WeightTable black_weights{};
    double index_scale     = 1.0; // multiplicateur des indices Hi-Lo (niveau du comptage)
    double weight_scale    = 1.0; // poids entiers = poids réels x weight_scale (Halves : 2)
    double bet_threshold   = 0.0; // TC à partir duquel la mise augmente
    double insurance_index = 3.0; // avant multiplication par index_scale
};

// Construit un système dont les poids ne dépendent pas de la couleur.
// Ordre des poids : A 2 3 4 5 6 7 8 9 T (J Q K = T)
CountingSystem make_counting_system(const std::string& name, const std::array<int, 10>& weights,
                                    double index_scale = 1.0, double bet_threshold = 0.0);

// Stratégie composée : comptage + basic strategy + écarts + mise proportionnelle.
// Les variantes ne diffèrent que par leurs données (CountingSystem).
class CountingStrategy : public Strategy {
public:
    explicit CountingStrategy(CountingSystem system);

    std::string name() const override { return system_.name; }

    // min_bet + min_bet * marge * max(0, floor(TC / weight_scale) - seuil),
    // borné à [min_bet, bankroll]. La rampe suit le compte réel, pas les poids entiers.
    double bet_amount(double true_count, const TableRules& rules, double bankroll) const override;

    Decision play_decision(const Hand& hand, Card dealer_upcard,
                           double true_count, const TableRules& rules) const override;

    bool insurance_decision(double true_count) const override;

    int card_weight(Card card) const override;

    // Somme des poids sur un jeu complet : 0 pour un comptage équilibré.
    int weight_per_deck() const;
    bool is_balanced() const { return weight_per_deck() == 0; }

    const CountingSystem& system() const { return system_; }
    const DeviationTable& deviations() const { return deviations_; }

private:
    CountingSystem system_;
    DeviationTable deviations_;
    BasicStrategy  basic_;
};

// Systèmes fournis
CountingSystem hi_lo();
CountingSystem knock_out();
CountingSystem hi_opt_i();
CountingSystem hi_opt_ii();
CountingSystem omega_ii();
CountingSystem zen_count();
CountingSystem unbalanced_zen_2();
CountingSystem wong_halves();
CountingSystem red_seven();
CountingSystem ace_five();
CountingSystem silver_fox();
CountingSystem kiss_ii();
CountingSystem kiss_iii();

// Registre : une instance de chaque stratégie fournie
std::vector<StrategyPtr> builtin_strategies();

// nullptr si le nom est inconnu
StrategyPtr find_builtin_strategy(const std::string& name);

} // namespace bj_sim

#endif // BJSIM_COUNTING_STRATEGIES_H
