// ─────────────────────────────────────────────────────────────────────────────
//  src/eval/hand_value.cpp
//  Valeur d'une main de blackjack (As = 1 ou 11).
// ─────────────────────────────────────────────────────────────────────────────
#include "eval/hand_value.hpp"
#include <stdexcept>

namespace blackjack {

namespace {

struct HandTotals {
    int total = 0;
    int soft_aces = 0; // As encore comptés 11
};

HandTotals compute_totals(const Hand& hand) {
    HandTotals t;
    for (Card c : hand) {
        t.total += card_points(c);
        if (get_rank(c) == Rank::ACE) t.soft_aces++;
    }
    // Passer un As de 11 à 1 tant que la main dépasse 21
    while (t.total > BLACKJACK_VALUE && t.soft_aces > 0) {
        t.total -= 10;
        t.soft_aces--;
    }
    return t;
}

} // namespace

int card_points(Card c) {
    if (c >= INVALID_CARD) {
        throw std::invalid_argument("Cannot evaluate INVALID_CARD.");
    }
    const Rank r = get_rank(c);
    if (r == Rank::ACE) return 11;
    if (r >= Rank::TEN) return 10; // T, J, Q, K
    return static_cast<int>(r) + 2;
}

int hand_value(const Hand& hand) {
    return compute_totals(hand).total;
}

bool is_soft(const Hand& hand) {
    return compute_totals(hand).soft_aces > 0;
}

bool is_blackjack(const Hand& hand) {
    return hand.size() == 2 && hand_value(hand) == BLACKJACK_VALUE;
}

bool is_bust(const Hand& hand) {
    return hand_value(hand) > BLACKJACK_VALUE;
}

} // namespace blackjack
