#include "core/cards.hpp"
#include <stdexcept>
#include <cctype>
#include <cstring> // Pour std::strchr
#include <sstream>

namespace blackjack {

namespace {

// Index = valeur de l'enum
constexpr char RANK_CHARS[] = "23456789TJQKA";
constexpr char SUIT_CHARS[] = "cdhs";

} // namespace

Rank rank_from_char(char r) {
    const char up = static_cast<char>(std::toupper(static_cast<unsigned char>(r)));
    const char* pos = std::strchr(RANK_CHARS, up);
    if (up == '\0' || pos == nullptr) {
        throw std::invalid_argument("Invalid rank character: " + std::string(1, r));
    }
    return static_cast<Rank>(pos - RANK_CHARS);
}

Suit suit_from_char(char s) {
    const char low = static_cast<char>(std::tolower(static_cast<unsigned char>(s)));
    const char* pos = std::strchr(SUIT_CHARS, low);
    if (low == '\0' || pos == nullptr) {
        throw std::invalid_argument("Invalid suit character: " + std::string(1, s));
    }
    return static_cast<Suit>(pos - SUIT_CHARS);
}

std::string to_string(Rank r) {
    const auto idx = static_cast<size_t>(r);
    return idx < sizeof(RANK_CHARS) - 1 ? std::string(1, RANK_CHARS[idx]) : "?";
}

std::string to_string(Suit s) {
    const auto idx = static_cast<size_t>(s);
    return idx < sizeof(SUIT_CHARS) - 1 ? std::string(1, SUIT_CHARS[idx]) : "?";
}

std::string to_string(Card c) {
    if (c >= INVALID_CARD) return "??";
    return to_string(get_rank(c)) + to_string(get_suit(c));
}

std::string hand_to_string(const Hand& hand) {
    std::stringstream ss;
    ss << "[";
    for (size_t i = 0; i < hand.size(); ++i) {
        ss << (hand[i] == INVALID_CARD ? "--" : to_string(hand[i]));
        if (i < hand.size() - 1) {
            ss << " ";
        }
    }
    ss << "]";
    return ss.str();
}

Card card_from_string(const std::string& s) {
    // "10d" -> "Td"
    if (s.length() == 3 && s[0] == '1' && s[1] == '0') {
        return card_from_string("T" + s.substr(2));
    }
    if (s.length() != 2) {
        throw std::invalid_argument("Invalid card string format: '" + s + "'. Expected 'Rs'.");
    }
    try {
        Rank r = rank_from_char(s[0]);
        Suit su = suit_from_char(s[1]);
        return make_card(r, su);
    } catch (const std::invalid_argument& e) {
        // Propage l'erreur avec plus de contexte
        throw std::invalid_argument("Invalid card string '" + s + "': " + e.what());
    }
}

Hand hand_from_string(const std::string& s) {
    Hand hand;
    std::istringstream iss(s);
    std::string token;
    while (iss >> token) {
        hand.push_back(card_from_string(token));
    }
    return hand;
}

} // namespace blackjack
