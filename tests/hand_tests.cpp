#include <catch2/catch_test_macros.hpp>
#include <stdexcept>
#include "bjsim/hand.h"
#include "core/cards.hpp"

using namespace bj_sim;

namespace {

Hand hand_of(const std::string& cards, bool split = false) {
    Hand h(0, split);
    for (const Card& c : cards_from_string(cards)) h.add_card(c);
    return h;
}

} // namespace

TEST_CASE("Hand values", "[hand]") {
    SECTION("Hard totals") {
        Hand h = hand_of("Tc 7d");
        REQUIRE(h.value() == HandValue{17, false});
        REQUIRE_FALSE(h.is_bust());
    }
    SECTION("Soft totals") {
        REQUIRE(hand_of("Ac 6d").value() == HandValue{17, true});
        REQUIRE(hand_of("Ac Ad").value() == HandValue{12, true});
        REQUIRE(hand_of("Ac Ad 9h").value() == HandValue{21, true});
    }
    SECTION("Soft falls back to hard") {
        Hand h = hand_of("Ac 6d");
        h.add_card(make_card(Rank::NINE, Suit::SPADES)); // invalide le cache
        REQUIRE(h.value() == HandValue{16, false});
    }
    SECTION("Bust") {
        Hand h = hand_of("Kc Qd 2h");
        REQUIRE(h.is_bust());
        REQUIRE(h.hard_total() == 22);
        REQUIRE(h.is_finished());
    }
}

TEST_CASE("Soft total never exceeds 21", "[hand]") {
    // Toutes les mains de 2 à 4 cartes construites sur les valeurs 1..10
    const Rank ranks[] = {Rank::ACE, Rank::TWO, Rank::THREE, Rank::FOUR, Rank::FIVE,
                          Rank::SIX, Rank::SEVEN, Rank::EIGHT, Rank::NINE, Rank::TEN};
    for (Rank a : ranks)
        for (Rank b : ranks)
            for (Rank c : ranks) {
                Hand h;
                h.add_card(make_card(a, Suit::CLUBS));
                h.add_card(make_card(b, Suit::HEARTS));
                h.add_card(make_card(c, Suit::SPADES));
                const HandValue v = h.value();
                if (v.is_soft) {
                    REQUIRE(v.total <= 21);
                    REQUIRE(v.total == h.hard_total() + 10);
                } else {
                    REQUIRE(v.total == h.hard_total());
                }
            }
}

TEST_CASE("Blackjack detection", "[hand]") {
    REQUIRE(hand_of("As Kd").is_blackjack());
    REQUIRE(hand_of("Td Ah").is_blackjack());
    REQUIRE_FALSE(hand_of("7s 7d 7h").is_blackjack());
    REQUIRE_FALSE(hand_of("As Kd", true).is_blackjack()); // 21 après split
}

TEST_CASE("Split and double rules", "[hand]") {
    TableRules rules;

    SECTION("Pairs by blackjack value") {
        REQUIRE(hand_of("8s 8d").can_split());
        REQUIRE(hand_of("Ks Td").can_split());
        REQUIRE_FALSE(hand_of("8s 9d").can_split());
        REQUIRE_FALSE(hand_of("8s 8d 8h").can_split());
    }

    SECTION("split_off") {
        Hand h = hand_of("8s 8d");
        const Card moved = h.split_off();
        REQUIRE(moved == make_card(Rank::EIGHT, Suit::DIAMONDS));
        REQUIRE(h.size() == 1);
        REQUIRE(h.is_split_hand());
        REQUIRE_THROWS_AS(hand_of("8s 9d").split_off(), std::logic_error);
    }

    SECTION("Split aces") {
        Hand h = hand_of("As Ad");
        h.split_off();
        REQUIRE(h.is_split_aces());
        REQUIRE_FALSE(hand_of("As Ad").is_split_aces());
    }

    SECTION("Double") {
        REQUIRE(hand_of("5s 6d").can_double(rules));
        REQUIRE_FALSE(hand_of("5s 3d 3h").can_double(rules));
        REQUIRE(hand_of("5s 6d", true).can_double(rules));
        rules.double_after_split = false;
        REQUIRE_FALSE(hand_of("5s 6d", true).can_double(rules));
    }
}

TEST_CASE("Hand flags", "[hand]") {
    Hand h = hand_of("Ts 6d");
    REQUIRE_FALSE(h.is_finished());
    h.mark_surrendered();
    REQUIRE(h.is_surrendered());
    REQUIRE(h.is_finished());

    Hand d = hand_of("5s 6d");
    d.mark_doubled();
    REQUIRE(d.has_doubled());
    REQUIRE(d.is_finished());

    Hand dealer(Hand::DEALER_INDEX);
    REQUIRE(dealer.is_dealer());
    REQUIRE(hand_of("Ac 6d").toString() == "H0 [Ac 6d] = soft 17");
}
