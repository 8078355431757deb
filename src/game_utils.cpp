#include "blackjack/game_utils.hpp"
#include <sstream>

namespace blackjack {

std::string phase_to_string(Phase p) {
    switch (p) {
        case Phase::BETTING:              return "Betting";
        case Phase::INITIAL_DEAL:         return "InitialDeal";
        case Phase::INSURANCE_OFFER:      return "InsuranceOffer";
        case Phase::IMMEDIATE_SETTLEMENT: return "ImmediateSettlement";
        case Phase::SPLIT_OFFER:          return "SplitOffer";
        case Phase::PLAYER_TURN:          return "PlayerTurn";
        case Phase::DEALER_TURN:          return "DealerTurn";
        case Phase::SETTLEMENT:           return "Settlement";
        case Phase::COMPLETE:             return "Complete";
        default:                          return "UnknownPhase";
    }
}

std::string outcome_to_string(Outcome o) {
    switch (o) {
        case Outcome::BLACKJACK: return "BLACKJACK";
        case Outcome::WIN:       return "WIN";
        case Outcome::PUSH:      return "PUSH";
        case Outcome::LOSS:      return "LOSS";
        case Outcome::BUST:      return "BUST";
        default:                 return "UNKNOWN_OUTCOME";
    }
}

std::string action_to_string(PlayerAction a) {
    switch (a) {
        case PlayerAction::HIT:    return "HIT";
        case PlayerAction::STAND:  return "STAND";
        case PlayerAction::DOUBLE: return "DOUBLE";
        default:                   return "UNKNOWN_ACTION";
    }
}

std::string event_type_to_string(EventType t) {
    switch (t) {
        case EventType::SHOE_RESHUFFLED:   return "ShoeReshuffled";
        case EventType::BALANCE_REFILLED:  return "BalanceRefilled";
        case EventType::BET_PLACED:        return "BetPlaced";
        case EventType::CARD_DEALT:        return "CardDealt";
        case EventType::HOLE_CARD_DEALT:   return "HoleCardDealt";
        case EventType::INSURANCE_TAKEN:   return "InsuranceTaken";
        case EventType::INSURANCE_SETTLED: return "InsuranceSettled";
        case EventType::HAND_SPLIT:        return "HandSplit";
        case EventType::DOUBLED_DOWN:      return "DoubledDown";
        case EventType::HAND_BUST:         return "HandBust";
        case EventType::HAND_STAND:        return "HandStand";
        case EventType::DEALER_REVEAL:     return "DealerReveal";
        case EventType::DEALER_HIT:        return "DealerHit";
        case EventType::HAND_SETTLED:      return "HandSettled";
        case EventType::ROUND_COMPLETE:    return "RoundComplete";
        case EventType::ROUND_CANCELLED:   return "RoundCancelled";
        default:                           return "UnknownEvent";
    }
}

std::string actions_to_string(const std::vector<PlayerAction>& actions) {
    std::stringstream ss;
    for (size_t i = 0; i < actions.size(); ++i) {
        ss << action_to_string(actions[i]);
        if (i < actions.size() - 1) {
            ss << ",";
        }
    }
    return ss.str();
}

} // namespace blackjack
