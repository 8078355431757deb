#ifndef BLACKJACK_PAYOUT_H
#define BLACKJACK_PAYOUT_H

#include "blackjack/common_types.h"

namespace blackjack {

// Tous les deltas sont exprimés par rapport au solde AVANT la mise.
// Blackjack: int(bet * 1.5), tronqué (bet = 11 -> 16).
// Lance std::invalid_argument si bet < 0 ou bet > MAX_BALANCE.
int settle(Outcome outcome, int bet);

// Montant à recréditer pour une mise déjà déduite du solde.
int credit_for(Outcome outcome, int bet);

// Assurance: +stake si le croupier a blackjack (2x la mise recréditée), sinon -stake.
int settle_insurance(int stake, bool dealer_blackjack);
int insurance_credit(int stake, bool dealer_blackjack);

// Comparaison finale (main non naturelle) contre la valeur du croupier.
Outcome determine_outcome(int player_value, int dealer_value);

} // namespace blackjack

#endif // BLACKJACK_PAYOUT_H
