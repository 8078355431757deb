#ifndef BLACKJACK_PLAYER_IO_H
#define BLACKJACK_PLAYER_IO_H

#include "blackjack/common_types.h"
#include <vector>

namespace blackjack {

// Types de décision remontés par l'InputProvider
enum class DecisionType {
    BET_AMOUNT,
    INSURANCE_CHOICE,
    SPLIT_CHOICE,
    PLAYER_ACTION,
    PLAY_AGAIN,
    CANCEL
};

// Décision déjà validée (numérique, dans les bornes) par l'InputProvider
struct Decision {
    DecisionType type = DecisionType::CANCEL;
    int amount = 0;                          // BET_AMOUNT
    bool accepted = false;                   // INSURANCE_CHOICE / SPLIT_CHOICE / PLAY_AGAIN
    PlayerAction action = PlayerAction::STAND; // PLAYER_ACTION

    static Decision bet(int amount)         { Decision d; d.type = DecisionType::BET_AMOUNT; d.amount = amount; return d; }
    static Decision insurance(bool take)    { Decision d; d.type = DecisionType::INSURANCE_CHOICE; d.accepted = take; return d; }
    static Decision split(bool accept)      { Decision d; d.type = DecisionType::SPLIT_CHOICE; d.accepted = accept; return d; }
    static Decision play(PlayerAction a)    { Decision d; d.type = DecisionType::PLAYER_ACTION; d.action = a; return d; }
    static Decision play_again(bool again)  { Decision d; d.type = DecisionType::PLAY_AGAIN; d.accepted = again; return d; }
    static Decision cancel()                { return Decision{}; }

    bool is_cancel() const { return type == DecisionType::CANCEL; }
};

// Source des décisions du joueur. Chaque appel est bloquant.
class InputProvider {
public:
    virtual ~InputProvider() = default;

    virtual Decision request_bet(int balance) = 0;
    virtual Decision request_insurance(int stake) = 0;
    virtual Decision request_split(int bet) = 0;
    virtual Decision request_action(int hand_index, const std::vector<PlayerAction>& legal_actions) = 0;
    virtual Decision request_play_again() = 0;

    // Confirmation avant d'abandonner la partie
    virtual bool confirm_cancel() = 0;
};

// Reçoit une notification par changement d'état significatif.
class OutputSink {
public:
    virtual ~OutputSink() = default;
    virtual void on_event(const RoundEvent& event) = 0;
};

} // namespace blackjack

#endif // BLACKJACK_PLAYER_IO_H
