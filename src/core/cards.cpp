#include "core/cards.hpp"
#include <stdexcept>
#include <cctype>
#include <map> // Pour la conversion char -> Rank/Suit
#include <sstream>

namespace bj_sim {

namespace {

const std::map<char, Rank> CHAR_TO_RANK = {
    {'A', Rank::ACE},   {'2', Rank::TWO},   {'3', Rank::THREE}, {'4', Rank::FOUR},
    {'5', Rank::FIVE},  {'6', Rank::SIX},   {'7', Rank::SEVEN}, {'8', Rank::EIGHT},
    {'9', Rank::NINE},  {'T', Rank::TEN},   {'J', Rank::JACK},  {'Q', Rank::QUEEN},
    {'K', Rank::KING}
};
const std::map<char, Suit> CHAR_TO_SUIT = {
    {'c', Suit::CLUBS}, {'d', Suit::DIAMONDS}, {'h', Suit::HEARTS}, {'s', Suit::SPADES}
};
constexpr const char RANK_CHARS[NUM_RANKS + 1] = "A23456789TJQK";
constexpr const char SUIT_CHARS[NUM_SUITS + 1] = "cdhs";

} // namespace

Rank rank_from_char(char r) {
    auto it = CHAR_TO_RANK.find(static_cast<char>(std::toupper(static_cast<unsigned char>(r))));
    if (it == CHAR_TO_RANK.end()) {
        throw std::invalid_argument("Invalid rank character: " + std::string(1, r));
    }
    return it->second;
}

Suit suit_from_char(char s) {
    auto it = CHAR_TO_SUIT.find(static_cast<char>(std::tolower(static_cast<unsigned char>(s))));
    if (it == CHAR_TO_SUIT.end()) {
        throw std::invalid_argument("Invalid suit character: " + std::string(1, s));
    }
    return it->second;
}

std::string to_string(Rank r) {
    const auto idx = static_cast<size_t>(r);
    if (idx >= NUM_RANKS) return "?";
    return std::string(1, RANK_CHARS[idx]);
}

std::string to_string(Suit s) {
    const auto idx = static_cast<size_t>(s);
    if (idx >= NUM_SUITS) return "?";
    return std::string(1, SUIT_CHARS[idx]);
}

std::string to_string(Card c) {
    return to_string(c.rank) + to_string(c.suit);
}

std::string to_string(const std::vector<Card>& cards) {
    std::stringstream ss;
    ss << "[";
    for (size_t i = 0; i < cards.size(); ++i) {
        ss << to_string(cards[i]);
        if (i + 1 < cards.size()) ss << " ";
    }
    ss << "]";
    return ss.str();
}

Card card_from_string(const std::string& s) {
    // "10h" est toléré en plus de "Th"
    if (s.length() == 3 && s[0] == '1' && s[1] == '0') {
        return card_from_string("T" + s.substr(2));
    }
    if (s.length() != 2) {
        throw std::invalid_argument("Invalid card string format: '" + s + "'. Expected 'Rs'.");
    }
    try {
        return make_card(rank_from_char(s[0]), suit_from_char(s[1]));
    } catch (const std::invalid_argument& e) {
        throw std::invalid_argument("Invalid card string '" + s + "': " + e.what());
    }
}

std::vector<Card> cards_from_string(const std::string& s) {
    std::vector<Card> cards;
    std::stringstream ss(s);
    std::string token;
    while (ss >> token) {
        cards.push_back(card_from_string(token));
    }
    return cards;
}

} // namespace bj_sim
