#include "bjsim/basic_strategy.h"
#include <algorithm> // Pour std::min
#include <cstring>
#include <stdexcept>

namespace bj_sim {

namespace {

// Colonne de la table pour une carte visible du croupier (2..10 puis as)
constexpr int upcard_column(int upcard_value) {
    return upcard_value == 1 ? 9 : upcard_value - 2;
}

} // namespace

DeviationTable illustrious_18(double index_scale) {
    using K = Deviation::Kind;
    const Decision H  = Decision::HIT;
    const Decision S  = Decision::STAND;
    const Decision D  = Decision::DOUBLE;
    const Decision P  = Decision::SPLIT;

    DeviationTable table = {
        {K::HARD, 16, 10,  0.0, S, H},
        {K::HARD, 15, 10,  4.0, S, H},
        {K::PAIR, 10,  5,  5.0, P, S},
        {K::PAIR, 10,  6,  4.0, P, S},
        {K::HARD, 10, 10,  4.0, D, H},
        {K::HARD, 12,  3,  2.0, S, H},
        {K::HARD, 12,  2,  3.0, S, H},
        {K::HARD, 11,  1,  1.0, D, H},
        {K::HARD,  9,  2,  1.0, D, H},
        {K::HARD, 10,  1,  4.0, D, H},
        {K::HARD,  9,  7,  3.0, D, H},
        {K::HARD, 16,  9,  5.0, S, H},
        {K::HARD, 13,  2, -1.0, S, H},
        {K::HARD, 12,  4,  0.0, S, H},
        {K::HARD, 12,  5, -2.0, S, H},
        {K::HARD, 12,  6, -1.0, S, H},
        {K::HARD, 13,  3, -2.0, S, H},
    };
    for (Deviation& d : table) d.index *= index_scale;
    return table;
}

// Une lettre par colonne : 2 3 4 5 6 7 8 9 T A
// H=hit S=stand D=double/hit d=double/stand P=split N=pas de split R=abandon/hit
BasicStrategy::Row BasicStrategy::row_from(const char* codes) {
    if (std::strlen(codes) != 10) {
        throw std::logic_error("Basic strategy row must have 10 columns.");
    }
    Row row{};
    row.fill(Cell::H);
    for (int up = 1; up <= 10; ++up) {
        Cell cell = Cell::H;
        switch (codes[upcard_column(up)]) {
            case 'H': cell = Cell::H;  break;
            case 'S': cell = Cell::S;  break;
            case 'D': cell = Cell::Dh; break;
            case 'd': cell = Cell::Ds; break;
            case 'P': cell = Cell::P;  break;
            case 'N': cell = Cell::N;  break;
            case 'R': cell = Cell::Rh; break;
            default: throw std::logic_error(std::string("Unknown basic strategy code: ") + codes);
        }
        row[up] = cell;
    }
    return row;
}

BasicStrategy::BasicStrategy() {
    const Row all_hit   = row_from("HHHHHHHHHH");
    const Row all_stand = row_from("SSSSSSSSSS");
    const Row no_split  = row_from("NNNNNNNNNN");

    // --- Totaux durs ---
    hard_.fill(all_hit);
    hard_[9]  = row_from("HDDDDHHHHH");
    hard_[10] = row_from("DDDDDDDDHH");
    hard_[11] = row_from("DDDDDDDDDD");
    hard_[12] = row_from("HHSSSHHHHH");
    for (int t = 13; t <= 16; ++t) hard_[t] = row_from("SSSSSHHHHH");
    for (int t = 17; t <= MAX_TOTAL; ++t) hard_[t] = all_stand;

    // --- Totaux souples (as compté 11) ---
    soft_.fill(all_hit);
    soft_[13] = row_from("HHHDDHHHHH");
    soft_[14] = row_from("HHHDDHHHHH");
    soft_[15] = row_from("HHDDDHHHHH");
    soft_[16] = row_from("HHDDDHHHHH");
    soft_[17] = row_from("HDDDDHHHHH");
    soft_[18] = row_from("SddddSSHHH");
    for (int t = 19; t <= MAX_TOTAL; ++t) soft_[t] = all_stand;

    // --- Paires (indexées par la valeur d'une carte, as = 1) ---
    pairs_.fill(no_split);
    pairs_[1]  = row_from("PPPPPPPPPP");
    pairs_[2]  = row_from("PPPPPPNNNN");
    pairs_[3]  = row_from("PPPPPPNNNN");
    pairs_[4]  = row_from("NNNPPNNNNN");
    pairs_[6]  = row_from("PPPPPNNNNN");
    pairs_[7]  = row_from("PPPPPPNNNN");
    pairs_[8]  = row_from("PPPPPPPPPP");
    pairs_[9]  = row_from("PPPPPNPPNN");

    // --- Abandon tardif ---
    surrender_.fill(no_split);
    surrender_[15] = row_from("NNNNNNNNRN");
    surrender_[16] = row_from("NNNNNNNRRR");
}

const Deviation* BasicStrategy::find_deviation(const DeviationTable& deviations, Deviation::Kind kind,
                                               int total, int upcard) {
    for (const Deviation& d : deviations) {
        if (d.kind == kind && d.total == total && d.upcard == upcard) return &d;
    }
    return nullptr;
}

Decision BasicStrategy::resolve(Cell cell, const Hand& hand, const TableRules& rules) {
    switch (cell) {
        case Cell::H:  return Decision::HIT;
        case Cell::S:  return Decision::STAND;
        case Cell::Dh: return hand.can_double(rules) ? Decision::DOUBLE : Decision::HIT;
        case Cell::Ds: return hand.can_double(rules) ? Decision::DOUBLE : Decision::STAND;
        case Cell::P:  return Decision::SPLIT;
        case Cell::Rh:
            return (rules.allow_surrender && hand.size() == 2 && !hand.is_split_hand())
                       ? Decision::SURRENDER : Decision::HIT;
        case Cell::N:  return Decision::HIT;
    }
    return Decision::STAND;
}

Decision BasicStrategy::decide(const Hand& hand, Card dealer_upcard, const TableRules& rules) const {
    static const DeviationTable no_deviations;
    return decide(hand, dealer_upcard, 0.0, rules, no_deviations);
}

Decision BasicStrategy::decide(const Hand& hand, Card dealer_upcard, double true_count,
                               const TableRules& rules, const DeviationTable& deviations) const {
    const int up = blackjack_value(dealer_upcard);
    const HandValue v = hand.value();
    const int total = std::min(v.total, MAX_TOTAL);

    // 1. Abandon (deux cartes, main non splittée, hors paires)
    if (rules.allow_surrender && hand.size() == 2 && !hand.is_split_hand()
        && !v.is_soft && !hand.can_split()) {
        if (surrender_[total][up] == Cell::Rh) return Decision::SURRENDER;
    }

    // 2. Paires
    if (hand.can_split()) {
        const int pair_value = blackjack_value(hand.cards().front());
        if (const Deviation* d = find_deviation(deviations, Deviation::Kind::PAIR, pair_value, up)) {
            if (true_count >= d->index && d->at_or_above == Decision::SPLIT) return Decision::SPLIT;
        } else if (pairs_[pair_value][up] == Cell::P) {
            return Decision::SPLIT;
        }
    }

    // 3. Totaux souples
    if (v.is_soft) {
        return resolve(soft_[total][up], hand, rules);
    }

    // 4. Totaux durs, écarts d'abord
    if (const Deviation* d = find_deviation(deviations, Deviation::Kind::HARD, total, up)) {
        const Decision dec = true_count >= d->index ? d->at_or_above : d->below;
        if (dec == Decision::DOUBLE && !hand.can_double(rules)) return Decision::HIT;
        return dec;
    }
    return resolve(hard_[total][up], hand, rules);
}

} // namespace bj_sim
