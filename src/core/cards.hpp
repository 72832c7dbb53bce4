#ifndef BJSIM_CARDS_HPP
#define BJSIM_CARDS_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <stdexcept> // Pour std::invalid_argument

namespace bj_sim {

constexpr int CARDS_PER_DECK = 52;
constexpr int NUM_RANKS      = 13;
constexpr int NUM_SUITS      = 4;

// La couleur est purement cosmétique, sauf pour Red Seven (7 rouges).
enum class Suit : uint8_t { CLUBS = 0, DIAMONDS = 1, HEARTS = 2, SPADES = 3 };

// L'ordre suit la valeur blackjack : ACE=0 vaut 1, TWO..TEN = 2..10, figures = 10.
enum class Rank : uint8_t {
    ACE = 0, TWO = 1, THREE = 2, FOUR = 3, FIVE = 4, SIX = 5, SEVEN = 6,
    EIGHT = 7, NINE = 8, TEN = 9, JACK = 10, QUEEN = 11, KING = 12
};

struct Card {
    Rank rank = Rank::ACE;
    Suit suit = Suit::CLUBS;

    bool operator==(const Card& other) const {
        return rank == other.rank && suit == other.suit;
    }
    bool operator!=(const Card& other) const { return !(*this == other); }

    // Ordre total (rang puis couleur), utile pour comparer des multisets de cartes
    bool operator<(const Card& other) const {
        if (rank != other.rank) return static_cast<int>(rank) < static_cast<int>(other.rank);
        return static_cast<int>(suit) < static_cast<int>(other.suit);
    }
};

constexpr Card make_card(Rank r, Suit s) {
    return Card{r, s};
}

// Valeur blackjack "dure" : l'as vaut 1 ici, la main décide s'il compte 11.
constexpr int blackjack_value(Rank r) {
    const int idx = static_cast<int>(r);
    return idx >= static_cast<int>(Rank::TEN) ? 10 : idx + 1;
}

constexpr int blackjack_value(Card c) { return blackjack_value(c.rank); }

constexpr bool is_ace(Card c) { return c.rank == Rank::ACE; }

constexpr bool is_ten_value(Card c) { return blackjack_value(c) == 10; }

constexpr bool is_red(Card c) {
    return c.suit == Suit::DIAMONDS || c.suit == Suit::HEARTS;
}

// Fonctions de conversion string <-> Card/Rank/Suit
std::string to_string(Suit s);
std::string to_string(Rank r);
std::string to_string(Card c);
std::string to_string(const std::vector<Card>& cards);

// Accepte "As", "Td", "10d" (insensible à la casse)
Card card_from_string(const std::string& s);
std::vector<Card> cards_from_string(const std::string& s); // "As Kd 7h"
Rank rank_from_char(char r);
Suit suit_from_char(char s);

} // namespace bj_sim

#endif // BJSIM_CARDS_HPP
