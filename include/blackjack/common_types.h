#ifndef BLACKJACK_COMMON_TYPES_H
#define BLACKJACK_COMMON_TYPES_H

#include "core/cards.hpp"

namespace blackjack {

// Phases d'une manche
enum class Phase {
    BETTING,
    INITIAL_DEAL,
    INSURANCE_OFFER,
    IMMEDIATE_SETTLEMENT,
    SPLIT_OFFER,
    PLAYER_TURN,
    DEALER_TURN,
    SETTLEMENT,
    COMPLETE
};

// Actions du joueur pendant son tour
enum class PlayerAction {
    HIT,
    STAND,
    DOUBLE
};

// Résultat d'une main face au croupier
enum class Outcome {
    BLACKJACK, // 3:2
    WIN,       // 1:1
    PUSH,
    LOSS,
    BUST
};

// Index utilisé pour désigner la main du croupier dans les événements
constexpr int DEALER_INDEX = -1;

// Plafond de la table: un solde <= MAX_BALANCE garde toute manche dans un int
// (au pire le solde final vaut 2.5x le solde de départ).
constexpr int MAX_BALANCE = 100000000;

// Une main du joueur avec sa mise
struct PlayerHand {
    Hand cards;
    int  bet = 0;
    bool doubled = false;
    bool from_split = false;
    bool finished = false;
};

// Entrée du journal des résultats
struct HandResult {
    int     hand_index = 0;
    Outcome outcome = Outcome::PUSH;
    int     bet = 0;
    int     delta = 0;        // Gain/perte net(te) par rapport au solde avant la mise
    int     player_value = 0;
    int     dealer_value = 0;
};

// Notifications envoyées à l'OutputSink
enum class EventType {
    SHOE_RESHUFFLED,
    BALANCE_REFILLED,
    BET_PLACED,
    CARD_DEALT,        // carte visible (joueur ou croupier)
    HOLE_CARD_DEALT,   // carte cachée du croupier (card == INVALID_CARD)
    INSURANCE_TAKEN,
    INSURANCE_SETTLED,
    HAND_SPLIT,
    DOUBLED_DOWN,
    HAND_BUST,
    HAND_STAND,
    DEALER_REVEAL,
    DEALER_HIT,
    HAND_SETTLED,
    ROUND_COMPLETE,
    ROUND_CANCELLED
};

struct RoundEvent {
    EventType type = EventType::ROUND_COMPLETE;
    int       hand_index = DEALER_INDEX;
    Card      card = INVALID_CARD;
    int       hand_value = 0;
    int       amount = 0;   // mise, mise d'assurance ou delta selon le type
    Outcome   outcome = Outcome::PUSH;
    int       balance = 0;  // solde après l'événement
};

} // namespace blackjack

#endif // BLACKJACK_COMMON_TYPES_H
