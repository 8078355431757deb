#ifndef BLACKJACK_CARDS_HPP
#define BLACKJACK_CARDS_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <stdexcept> // Pour std::invalid_argument

namespace blackjack {

// Une carte est un index 0-51 (suit * 13 + rank)
using Card = uint8_t;

// Constante pour une carte invalide/inconnue (ex: carte cachée du croupier)
constexpr Card INVALID_CARD = 52;
constexpr int  CARDS_PER_DECK = 52;

// Une main = suite ordonnée de cartes
using Hand = std::vector<Card>;

enum class Suit : uint8_t { CLUBS = 0, DIAMONDS = 1, HEARTS = 2, SPADES = 3 };
enum class Rank : uint8_t {
    TWO = 0, THREE = 1, FOUR = 2, FIVE = 3, SIX = 4, SEVEN = 5, EIGHT = 6,
    NINE = 7, TEN = 8, JACK = 9, QUEEN = 10, KING = 11, ACE = 12
};

constexpr Card make_card(Rank r, Suit s) {
    return static_cast<uint8_t>(s) * 13 + static_cast<uint8_t>(r);
}

constexpr Rank get_rank(Card c) {
    if (c >= INVALID_CARD) return static_cast<Rank>(13);
    return static_cast<Rank>(c % 13);
}

constexpr Suit get_suit(Card c) {
    if (c >= INVALID_CARD) return static_cast<Suit>(4);
    return static_cast<Suit>(c / 13);
}

// Conversions string <-> Card/Rank/Suit
// Format "Rs" ("Ah", "Td"); "10d" est aussi accepté en entrée.
std::string to_string(Suit s);
std::string to_string(Rank r);
std::string to_string(Card c);
std::string hand_to_string(const Hand& hand);

Card card_from_string(const std::string& s);
Hand hand_from_string(const std::string& s); // ex: "Ah Kd 9c"
Rank rank_from_char(char r);
Suit suit_from_char(char s);

} // namespace blackjack

#endif // BLACKJACK_CARDS_HPP
