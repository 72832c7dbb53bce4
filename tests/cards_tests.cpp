#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <stdexcept>
#include "core/cards.hpp"
#include <string>

using namespace bj_sim;

TEST_CASE("Card Creation and Properties", "[cards]") {
    Card ac = make_card(Rank::ACE, Suit::CLUBS);
    Card kd = make_card(Rank::KING, Suit::DIAMONDS);
    Card _7h = make_card(Rank::SEVEN, Suit::HEARTS);
    Card _2s = make_card(Rank::TWO, Suit::SPADES);

    SECTION("Blackjack values") {
        REQUIRE(blackjack_value(ac) == 1);
        REQUIRE(blackjack_value(kd) == 10);
        REQUIRE(blackjack_value(Rank::TEN) == 10);
        REQUIRE(blackjack_value(Rank::JACK) == 10);
        REQUIRE(blackjack_value(Rank::QUEEN) == 10);
        REQUIRE(blackjack_value(_7h) == 7);
        REQUIRE(blackjack_value(_2s) == 2);
    }

    SECTION("Predicates") {
        REQUIRE(is_ace(ac));
        REQUIRE_FALSE(is_ace(kd));
        REQUIRE(is_ten_value(kd));
        REQUIRE_FALSE(is_ten_value(_7h));
        REQUIRE(is_red(kd));
        REQUIRE(is_red(_7h));
        REQUIRE_FALSE(is_red(ac));
        REQUIRE_FALSE(is_red(_2s));
    }

    SECTION("to_string conversion is correct") {
        REQUIRE(to_string(ac) == "Ac");
        REQUIRE(to_string(kd) == "Kd");
        REQUIRE(to_string(_7h) == "7h");
        REQUIRE(to_string(_2s) == "2s");
    }
}

TEST_CASE("Card String Conversions", "[cards][string]") {
    SECTION("card_from_string conversions") {
        REQUIRE(card_from_string("As") == make_card(Rank::ACE, Suit::SPADES));
        REQUIRE(card_from_string("Td") == make_card(Rank::TEN, Suit::DIAMONDS));
        REQUIRE(card_from_string("10d") == make_card(Rank::TEN, Suit::DIAMONDS));
        REQUIRE(card_from_string("qh") == make_card(Rank::QUEEN, Suit::HEARTS));
    }

    SECTION("Invalid strings throw") {
        REQUIRE_THROWS_AS(card_from_string("XX"), std::invalid_argument);
        REQUIRE_THROWS_AS(card_from_string("A"), std::invalid_argument);
        REQUIRE_THROWS_AS(card_from_string("1c"), std::invalid_argument);
        REQUIRE_THROWS_AS(card_from_string("Ahx"), std::invalid_argument);
        REQUIRE_THROWS_WITH(card_from_string("Zz"), Catch::Matchers::ContainsSubstring("Invalid card string"));
    }

    SECTION("Vectors of cards") {
        const std::vector<Card> cards = cards_from_string("As Kd 7h");
        REQUIRE(cards.size() == 3);
        REQUIRE(cards[1] == make_card(Rank::KING, Suit::DIAMONDS));
        REQUIRE(to_string(cards) == "[As Kd 7h]");
        REQUIRE(to_string(std::vector<Card>{}) == "[]");
    }
}

TEST_CASE("Card ordering", "[cards]") {
    REQUIRE(make_card(Rank::ACE, Suit::SPADES) < make_card(Rank::TWO, Suit::CLUBS));
    REQUIRE(make_card(Rank::TWO, Suit::CLUBS) < make_card(Rank::TWO, Suit::DIAMONDS));
    REQUIRE(make_card(Rank::KING, Suit::HEARTS) != make_card(Rank::KING, Suit::SPADES));
}
