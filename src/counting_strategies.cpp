#include "bjsim/counting_strategies.h"
#include "spdlog/spdlog.h"
#include <algorithm> // Pour std::max, std::min
#include <cmath>     // Pour std::floor
#include <utility>

namespace bj_sim {

CountingSystem make_counting_system(const std::string& name, const std::array<int, 10>& weights,
                                    double index_scale, double bet_threshold) {
    CountingSystem sys;
    sys.name = name;
    for (int r = 0; r < NUM_RANKS; ++r) {
        const int w = weights[static_cast<size_t>(std::min(r, 9))];
        sys.red_weights[static_cast<size_t>(r)]   = w;
        sys.black_weights[static_cast<size_t>(r)] = w;
    }
    sys.index_scale   = index_scale;
    sys.bet_threshold = bet_threshold;
    return sys;
}

// -----------------------------------------------------------------------------
//  CountingStrategy
// -----------------------------------------------------------------------------
CountingStrategy::CountingStrategy(CountingSystem system)
    : system_(std::move(system)),
      deviations_(illustrious_18(system_.index_scale)) {}

double CountingStrategy::bet_amount(double true_count, const TableRules& rules, double bankroll) const {
    const double real_tc = true_count / system_.weight_scale;
    const double units   = std::max(0.0, std::floor(real_tc) - system_.bet_threshold);
    double amount = std::floor(rules.min_bet + rules.min_bet * rules.bet_margin * units);
    amount = std::max(amount, rules.min_bet);
    return std::min(amount, bankroll);
}

Decision CountingStrategy::play_decision(const Hand& hand, Card dealer_upcard,
                                         double true_count, const TableRules& rules) const {
    return basic_.decide(hand, dealer_upcard, true_count, rules, deviations_);
}

bool CountingStrategy::insurance_decision(double true_count) const {
    return true_count >= system_.insurance_index * system_.index_scale;
}

int CountingStrategy::card_weight(Card card) const {
    const auto r = static_cast<size_t>(card.rank);
    return is_red(card) ? system_.red_weights[r] : system_.black_weights[r];
}

int CountingStrategy::weight_per_deck() const {
    int sum = 0;
    for (int r = 0; r < NUM_RANKS; ++r) {
        // 2 couleurs rouges + 2 noires par rang
        sum += 2 * system_.red_weights[static_cast<size_t>(r)]
             + 2 * system_.black_weights[static_cast<size_t>(r)];
    }
    return sum;
}

// -----------------------------------------------------------------------------
//  Systèmes fournis                                A   2  3  4  5  6  7  8  9  T
// -----------------------------------------------------------------------------
CountingSystem hi_lo()            { return make_counting_system("Hi-Lo",       {-1, 1, 1, 1, 1, 1, 0, 0, 0, -1}); }
CountingSystem knock_out()        { return make_counting_system("KO",          {-1, 1, 1, 1, 1, 1, 1, 0, 0, -1}, 1.0, 1.0); }
CountingSystem hi_opt_i()         { return make_counting_system("Hi-Opt I",    { 0, 0, 1, 1, 1, 1, 0, 0, 0, -1}); }
CountingSystem hi_opt_ii()        { return make_counting_system("Hi-Opt II",   { 0, 1, 1, 2, 2, 1, 1, 0, 0, -2}, 2.0); }
CountingSystem omega_ii()         { return make_counting_system("Omega II",    { 0, 1, 1, 2, 2, 2, 1, 0, -1, -2}, 2.0); }
CountingSystem zen_count()        { return make_counting_system("Zen Count",   {-1, 1, 1, 2, 2, 2, 1, 0, 0, -2}, 2.0); }
CountingSystem unbalanced_zen_2() { return make_counting_system("Unbalanced Zen 2", {-1, 1, 2, 2, 2, 2, 1, 0, 0, -2}, 2.0, 1.0); }
// Poids Halves doublés pour rester entiers (+0.5 -> +1), indices doublés en conséquence
CountingSystem wong_halves() {
    CountingSystem sys = make_counting_system("Wong Halves", {-2, 1, 2, 2, 3, 2, 1, 0, -1, -2}, 2.0);
    sys.weight_scale = 2.0;
    return sys;
}
CountingSystem ace_five()         { return make_counting_system("Ace-Five",    {-1, 0, 0, 0, 1, 0, 0, 0, 0, 0}); }
CountingSystem silver_fox()       { return make_counting_system("Silver Fox",  {-1, 1, 1, 1, 1, 1, 1, 0, -1, -1}); }

CountingSystem red_seven() {
    CountingSystem sys = make_counting_system("Red Seven", {-1, 1, 1, 1, 1, 1, 0, 0, 0, -1}, 1.0, 1.0);
    sys.red_weights[static_cast<size_t>(Rank::SEVEN)] = 1;
    return sys;
}

CountingSystem kiss_ii() {
    CountingSystem sys = make_counting_system("KISS II", {0, 0, 1, 1, 1, 1, 0, 0, 0, -1}, 1.0, 1.0);
    sys.black_weights[static_cast<size_t>(Rank::TWO)] = 1;
    return sys;
}

CountingSystem kiss_iii() {
    CountingSystem sys = make_counting_system("KISS III", {-1, 0, 1, 1, 1, 1, 1, 0, 0, -1}, 1.0, 1.0);
    sys.black_weights[static_cast<size_t>(Rank::TWO)] = 1;
    return sys;
}

std::vector<StrategyPtr> builtin_strategies() {
    const std::vector<CountingSystem> systems = {
        hi_lo(), wong_halves(), knock_out(), red_seven(), hi_opt_i(), hi_opt_ii(),
        ace_five(), omega_ii(), zen_count(), silver_fox(), kiss_ii(), kiss_iii(),
        unbalanced_zen_2()
    };
    std::vector<StrategyPtr> strategies;
    strategies.reserve(systems.size());
    for (const CountingSystem& sys : systems) {
        strategies.push_back(std::make_shared<const CountingStrategy>(sys));
    }
    spdlog::debug("{} stratégies de comptage fournies.", strategies.size());
    return strategies;
}

StrategyPtr find_builtin_strategy(const std::string& name) {
    for (StrategyPtr& s : builtin_strategies()) {
        if (s->name() == name) return s;
    }
    return nullptr;
}

} // namespace bj_sim
