#ifndef BLACKJACK_GAME_SESSION_H
#define BLACKJACK_GAME_SESSION_H

#include <vector>
#include "core/shoe.hpp"
#include "blackjack/common_types.h"
#include "blackjack/game_config.h"
#include "blackjack/player_io.h"

namespace blackjack {

class RoundEngine;

struct SessionSummary {
    int  rounds_played = 0;
    int  final_balance = 0;
    int  refills = 0;
    bool cancelled = false;
};

// Enchaîne les manches sur un même sabot et un même solde.
// Chaque manche est pilotée par un RoundEngine neuf, alimenté par l'InputProvider.
class GameSession {
public:
    GameSession(const GameConfig& config, InputProvider& input, OutputSink* output = nullptr);
    ~GameSession() = default;

    // Joue une manche complète. Renvoie false si le joueur a confirmé l'abandon.
    // Le solde conservé entre deux manches est plafonné à MAX_BALANCE.
    bool play_round();

    // Manches + "rejouer ?" jusqu'au refus ou à l'abandon.
    SessionSummary run();

    // Getters
    int get_balance() const { return balance_; }
    int get_rounds_played() const { return rounds_played_; }
    int get_refills() const { return refills_; }
    const Shoe& get_shoe() const { return shoe_; }
    Shoe& get_shoe() { return shoe_; }
    const std::vector<HandResult>& get_last_outcome_log() const { return last_outcome_log_; }

private:
    GameConfig     config_;
    InputProvider& input_;
    OutputSink*    output_;
    Shoe           shoe_;
    int            balance_;
    int            rounds_played_ = 0;
    int            refills_ = 0;
    std::vector<HandResult> last_outcome_log_;

    void refill_if_broke();
    // Annule la manche si l'abandon est confirmé
    void handle_cancel(RoundEngine& engine);
    void step(RoundEngine& engine);
};

} // namespace blackjack

#endif // BLACKJACK_GAME_SESSION_H
