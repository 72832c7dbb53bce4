#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <set>
#include "bjsim/basic_strategy.h"
#include "bjsim/count_tracker.h"
#include "bjsim/counting_strategies.h"
#include "bjsim/hand.h"
#include "core/shoe.hpp"

using namespace bj_sim;
using Catch::Approx;

namespace {

Hand hand_of(const std::string& cards, bool split = false) {
    Hand h(0, split);
    for (const Card& c : cards_from_string(cards)) h.add_card(c);
    return h;
}

Card up(const std::string& s) { return card_from_string(s); }

} // namespace

TEST_CASE("Basic strategy tables", "[strategy][basic]") {
    const BasicStrategy basic;
    TableRules rules;

    SECTION("Hard totals") {
        REQUIRE(basic.decide(hand_of("Tc 6d"), up("Ts"), rules) == Decision::HIT);
        REQUIRE(basic.decide(hand_of("Tc 6d"), up("6s"), rules) == Decision::STAND);
        REQUIRE(basic.decide(hand_of("Tc 2d"), up("2s"), rules) == Decision::HIT);
        REQUIRE(basic.decide(hand_of("Tc 2d"), up("4s"), rules) == Decision::STAND);
        REQUIRE(basic.decide(hand_of("Tc 7d"), up("As"), rules) == Decision::STAND);
        REQUIRE(basic.decide(hand_of("5c 6d"), up("As"), rules) == Decision::DOUBLE);
        REQUIRE(basic.decide(hand_of("5c 3d"), up("6s"), rules) == Decision::HIT);
    }

    SECTION("Double falls back when not allowed") {
        REQUIRE(basic.decide(hand_of("3c 4d 4h"), up("6s"), rules) == Decision::HIT);
        REQUIRE(basic.decide(hand_of("Ac 7d"), up("4s"), rules) == Decision::DOUBLE);
        REQUIRE(basic.decide(hand_of("Ac 2d 5h"), up("4s"), rules) == Decision::STAND);
    }

    SECTION("Soft totals") {
        REQUIRE(basic.decide(hand_of("Ac 7d"), up("9s"), rules) == Decision::HIT);
        REQUIRE(basic.decide(hand_of("Ac 7d"), up("7s"), rules) == Decision::STAND);
        REQUIRE(basic.decide(hand_of("Ac 8d"), up("6s"), rules) == Decision::STAND);
    }

    SECTION("Pairs") {
        REQUIRE(basic.decide(hand_of("8c 8d"), up("Ts"), rules) == Decision::SPLIT);
        REQUIRE(basic.decide(hand_of("Ac Ad"), up("6s"), rules) == Decision::SPLIT);
        REQUIRE(basic.decide(hand_of("Tc Kd"), up("6s"), rules) == Decision::STAND);
        REQUIRE(basic.decide(hand_of("5c 5d"), up("6s"), rules) == Decision::DOUBLE);
        REQUIRE(basic.decide(hand_of("9c 9d"), up("7s"), rules) == Decision::STAND);
    }

    SECTION("Late surrender only when allowed") {
        REQUIRE(basic.decide(hand_of("Tc 6d"), up("Ts"), rules) == Decision::HIT);
        rules.allow_surrender = true;
        REQUIRE(basic.decide(hand_of("Tc 6d"), up("Ts"), rules) == Decision::SURRENDER);
        REQUIRE(basic.decide(hand_of("Tc 5d"), up("Ts"), rules) == Decision::SURRENDER);
        REQUIRE(basic.decide(hand_of("Tc 6d", true), up("Ts"), rules) == Decision::HIT);
        REQUIRE(basic.decide(hand_of("8c 8d"), up("Ts"), rules) == Decision::SPLIT);
    }
}

TEST_CASE("Count deviations", "[strategy][deviation]") {
    const BasicStrategy basic;
    const DeviationTable devs = illustrious_18();
    TableRules rules;

    REQUIRE(devs.size() == 17);
    REQUIRE(basic.decide(hand_of("Tc 6d"), up("Ts"), -1.0, rules, devs) == Decision::HIT);
    REQUIRE(basic.decide(hand_of("Tc 6d"), up("Ts"), 0.0, rules, devs) == Decision::STAND);
    REQUIRE(basic.decide(hand_of("Tc 2d"), up("3s"), 1.0, rules, devs) == Decision::HIT);
    REQUIRE(basic.decide(hand_of("Tc 2d"), up("3s"), 2.0, rules, devs) == Decision::STAND);
    REQUIRE(basic.decide(hand_of("Tc Kd"), up("5s"), 4.0, rules, devs) == Decision::STAND);
    REQUIRE(basic.decide(hand_of("Tc Kd"), up("5s"), 5.0, rules, devs) == Decision::SPLIT);
    REQUIRE(basic.decide(hand_of("6c 4d"), up("Ts"), 4.0, rules, devs) == Decision::DOUBLE);
    REQUIRE(basic.decide(hand_of("6c 2d 2h"), up("Ts"), 4.0, rules, devs) == Decision::HIT);

    SECTION("Indices scale with the count level") {
        const DeviationTable scaled = illustrious_18(2.0);
        REQUIRE(basic.decide(hand_of("Tc 5d"), up("Ts"), 7.0, rules, scaled) == Decision::HIT);
        REQUIRE(basic.decide(hand_of("Tc 5d"), up("Ts"), 8.0, rules, scaled) == Decision::STAND);
    }
}

TEST_CASE("Margin betting", "[strategy][bet]") {
    const CountingStrategy hilo(hi_lo());
    TableRules rules;
    rules.min_bet    = 5.0;
    rules.bet_margin = 2.0;

    REQUIRE(hilo.bet_amount(-3.0, rules, 1000.0) == Approx(5.0));
    REQUIRE(hilo.bet_amount(0.9, rules, 1000.0) == Approx(5.0));
    REQUIRE(hilo.bet_amount(1.0, rules, 1000.0) == Approx(15.0));
    REQUIRE(hilo.bet_amount(3.5, rules, 1000.0) == Approx(35.0));
    REQUIRE(hilo.bet_amount(3.5, rules, 20.0) == Approx(20.0));

    const CountingStrategy ko(knock_out());
    REQUIRE(ko.bet_amount(1.0, rules, 1000.0) == Approx(5.0));
    REQUIRE(ko.bet_amount(2.0, rules, 1000.0) == Approx(15.0));
}

TEST_CASE("Wong Halves bets on the real halves count", "[strategy][bet]") {
    const CountingStrategy halves(wong_halves());
    const CountingStrategy hilo(hi_lo());
    TableRules rules;
    rules.min_bet    = 5.0;
    rules.bet_margin = 2.0;

    // Deux 5 sur un jeu : compte Halves réel +3, soit +6 en poids doublés
    Shoe shoe(1, 0.8, 3);
    CountTracker tracker(halves, shoe);
    for (const Card& c : cards_from_string("5c 5d")) tracker.observe(c);
    REQUIRE(tracker.running_count() == 6);
    REQUIRE(tracker.true_count() == Approx(6.0));

    REQUIRE(halves.bet_amount(tracker.true_count(), rules, 1000.0) == Approx(35.0));
    REQUIRE(halves.bet_amount(tracker.true_count(), rules, 1000.0)
            == Approx(hilo.bet_amount(3.0, rules, 1000.0)));
    // +1.5 réel : un seul palier
    REQUIRE(halves.bet_amount(3.0, rules, 1000.0) == Approx(15.0));
    REQUIRE(halves.bet_amount(1.0, rules, 1000.0) == Approx(5.0));
}

TEST_CASE("Insurance decision", "[strategy]") {
    const CountingStrategy hilo(hi_lo());
    REQUIRE_FALSE(hilo.insurance_decision(2.9));
    REQUIRE(hilo.insurance_decision(3.0));

    const CountingStrategy zen(zen_count());
    REQUIRE_FALSE(zen.insurance_decision(5.0));
    REQUIRE(zen.insurance_decision(6.0));
}

TEST_CASE("Card weights of the built-in systems", "[strategy][weights]") {
    const CountingStrategy hilo(hi_lo());
    REQUIRE(hilo.card_weight(up("2c")) == 1);
    REQUIRE(hilo.card_weight(up("7c")) == 0);
    REQUIRE(hilo.card_weight(up("Qd")) == -1);
    REQUIRE(hilo.card_weight(up("Ah")) == -1);
    REQUIRE(hilo.is_balanced());

    const CountingStrategy red7(red_seven());
    REQUIRE(red7.card_weight(up("7h")) == 1);
    REQUIRE(red7.card_weight(up("7s")) == 0);
    REQUIRE(red7.weight_per_deck() == 2);

    const CountingStrategy ko(knock_out());
    REQUIRE(ko.weight_per_deck() == 4);
    REQUIRE_FALSE(ko.is_balanced());

    const CountingStrategy kiss2(kiss_ii());
    REQUIRE(kiss2.card_weight(up("2s")) == 1);
    REQUIRE(kiss2.card_weight(up("2h")) == 0);

    const CountingStrategy halves(wong_halves());
    REQUIRE(halves.card_weight(up("5c")) == 3);
    REQUIRE(halves.is_balanced());

    for (const char* name : {"Hi-Opt I", "Hi-Opt II", "Omega II", "Zen Count", "Silver Fox", "Ace-Five"}) {
        const StrategyPtr s = find_builtin_strategy(name);
        REQUIRE(s != nullptr);
        INFO(name);
        REQUIRE(dynamic_cast<const CountingStrategy&>(*s).is_balanced());
    }
}

TEST_CASE("Built-in strategy registry", "[strategy]") {
    const std::vector<StrategyPtr> all = builtin_strategies();
    REQUIRE(all.size() == 13);

    std::set<std::string> names;
    for (const StrategyPtr& s : all) names.insert(s->name());
    REQUIRE(names.size() == all.size());

    REQUIRE(find_builtin_strategy("Hi-Lo") != nullptr);
    REQUIRE(find_builtin_strategy("Hi-Lo")->name() == "Hi-Lo");
    REQUIRE(find_builtin_strategy("No Such Count") == nullptr);
}
