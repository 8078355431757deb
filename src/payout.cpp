#include "blackjack/payout.h"
#include "eval/hand_value.hpp" // Pour BLACKJACK_VALUE
#include <stdexcept>

namespace blackjack {

int settle(Outcome outcome, int bet) {
    if (bet < 0) throw std::invalid_argument("Bet must be >= 0");
    if (bet > MAX_BALANCE) throw std::invalid_argument("Bet must be <= MAX_BALANCE");
    switch (outcome) {
        case Outcome::BLACKJACK: return bet * 3 / 2; // == int(bet * 1.5) pour bet >= 0
        case Outcome::WIN:       return bet;
        case Outcome::PUSH:      return 0;
        case Outcome::LOSS:
        case Outcome::BUST:      return -bet;
        default: throw std::logic_error("Outcome inconnu");
    }
}

int credit_for(Outcome outcome, int bet) {
    return bet + settle(outcome, bet);
}

int settle_insurance(int stake, bool dealer_blackjack) {
    if (stake < 0) throw std::invalid_argument("Insurance stake must be >= 0");
    if (stake > MAX_BALANCE) throw std::invalid_argument("Insurance stake must be <= MAX_BALANCE");
    return dealer_blackjack ? stake : -stake;
}

int insurance_credit(int stake, bool dealer_blackjack) {
    return stake + settle_insurance(stake, dealer_blackjack);
}

Outcome determine_outcome(int player_value, int dealer_value) {
    if (player_value > BLACKJACK_VALUE) return Outcome::BUST;
    if (dealer_value > BLACKJACK_VALUE) return Outcome::WIN;
    if (player_value > dealer_value)    return Outcome::WIN;
    if (player_value < dealer_value)    return Outcome::LOSS;
    return Outcome::PUSH;
}

} // namespace blackjack
