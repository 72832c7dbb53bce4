#ifndef BJSIM_BASIC_STRATEGY_H
#define BJSIM_BASIC_STRATEGY_H

#include "core/cards.hpp"
#include "bjsim/common_types.h"
#include "bjsim/hand.h"
#include <array>
#include <vector>

namespace bj_sim {

// Écart au basic strategy déclenché par le true count :
// si TC >= index -> at_or_above, sinon -> below (pour cette case uniquement).
struct Deviation {
    enum class Kind { HARD, PAIR };

    Kind     kind     = Kind::HARD;
    int      total    = 0;  // total dur, ou valeur d'une carte de la paire
    int      upcard   = 0;  // 1 (as) .. 10
    double   index    = 0.0;
    Decision at_or_above = Decision::STAND;
    Decision below       = Decision::HIT;
};

using DeviationTable = std::vector<Deviation>;

// Écarts "Illustrious 18" (Hi-Lo, S17) ; l'assurance est gérée à part.
DeviationTable illustrious_18(double index_scale = 1.0);

// Tables de basic strategy multi-jeux, croupier reste sur soft 17, double après split.
class BasicStrategy {
public:
    BasicStrategy();

    // Décision selon les tables, écarts éventuels appliqués d'abord.
    // Un DOUBLE impossible est converti en HIT (ou STAND pour soft 18/19),
    // un SURRENDER impossible en décision de la table dure.
    Decision decide(const Hand& hand, Card dealer_upcard, double true_count,
                    const TableRules& rules, const DeviationTable& deviations) const;

    Decision decide(const Hand& hand, Card dealer_upcard, const TableRules& rules) const;

private:
    // Codes internes des cases de table
    enum class Cell : uint8_t {
        H,   // hit
        S,   // stand
        Dh,  // double sinon hit
        Ds,  // double sinon stand
        P,   // split
        N,   // pas de split -> tables dures/souples
        Rh   // abandon sinon hit
    };

    static constexpr int MAX_TOTAL = 21;
    static constexpr int UPCARDS   = 11; // indices 1..10

    using Row = std::array<Cell, UPCARDS>;

    static Row row_from(const char* codes);
    static Decision resolve(Cell cell, const Hand& hand, const TableRules& rules);
    static const Deviation* find_deviation(const DeviationTable& deviations, Deviation::Kind kind,
                                           int total, int upcard);

    std::array<Row, MAX_TOTAL + 1> hard_{};
    std::array<Row, MAX_TOTAL + 1> soft_{};
    std::array<Row, UPCARDS>       pairs_{};
    std::array<Row, MAX_TOTAL + 1> surrender_{};
};

} // namespace bj_sim

#endif // BJSIM_BASIC_STRATEGY_H
