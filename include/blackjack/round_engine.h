#ifndef BLACKJACK_ROUND_ENGINE_H
#define BLACKJACK_ROUND_ENGINE_H

#include <vector>
#include <string>
#include "core/cards.hpp"
#include "core/shoe.hpp"
#include "blackjack/common_types.h"
#include "blackjack/player_io.h"

namespace blackjack {

constexpr int DEFAULT_DEALER_STAND_VALUE = 17;

// Machine à états d'une manche:
// BETTING -> INITIAL_DEAL -> [INSURANCE_OFFER] -> IMMEDIATE_SETTLEMENT
//         -> [SPLIT_OFFER] -> PLAYER_TURN -> [DEALER_TURN] -> SETTLEMENT -> COMPLETE
//
// Les phases sans décision du joueur (INITIAL_DEAL, IMMEDIATE_SETTLEMENT,
// DEALER_TURN, SETTLEMENT) sont enchaînées automatiquement. Les mises sont
// déduites du solde au moment où elles sont posées; les gains et mises rendues
// sont recrédités au règlement.
//
// Appeler une transition hors de sa phase lance std::logic_error.
// Un manque de fonds n'est pas une erreur: la transition renvoie false.
class RoundEngine {
public:
    // balance doit être dans [0, MAX_BALANCE].
    // Remélange le sabot avant la manche si needs_reshuffle().
    // sink peut être nullptr.
    RoundEngine(Shoe& shoe, int balance, OutputSink* sink = nullptr,
                int dealer_stand_value = DEFAULT_DEALER_STAND_VALUE);
    ~RoundEngine() = default;

    RoundEngine(const RoundEngine&) = delete;
    RoundEngine& operator=(const RoundEngine&) = delete;

    // Transitions
    bool place_bet(int amount);           // BETTING
    void resolve_insurance(bool take);    // INSURANCE_OFFER
    void resolve_split(bool accept);      // SPLIT_OFFER
    bool apply_action(PlayerAction action); // PLAYER_TURN
    void cancel();                        // toute phase sauf COMPLETE

    // Getters
    Phase get_phase() const { return phase_; }
    bool is_complete() const { return phase_ == Phase::COMPLETE; }
    bool was_cancelled() const { return cancelled_; }
    int get_balance() const { return balance_; }
    int get_starting_balance() const { return starting_balance_; }
    int get_net_result() const { return balance_ - starting_balance_; }
    int get_bet() const { return initial_bet_; }
    int get_insurance_stake() const { return insurance_stake_; }
    int get_insurance_delta() const { return insurance_delta_; }
    int get_dealer_stand_value() const { return dealer_stand_value_; }
    const Hand& get_dealer_hand() const { return dealer_hand_; }
    Card get_dealer_up_card() const;
    const std::vector<PlayerHand>& get_player_hands() const { return player_hands_; }
    const PlayerHand& get_player_hand(int hand_index) const;
    int get_active_hand_index() const { return active_hand_; }
    const std::vector<HandResult>& get_outcome_log() const { return outcome_log_; }

    std::vector<PlayerAction> get_legal_actions() const;
    bool can_double() const;
    bool can_split() const;

    // Utilitaires
    std::string toString() const;

private:
    Shoe&        shoe_;
    OutputSink*  sink_;
    int          dealer_stand_value_;
    Phase        phase_ = Phase::BETTING;
    int          starting_balance_;
    int          balance_;
    int          initial_bet_ = 0;
    int          insurance_stake_ = 0;
    int          insurance_delta_ = 0;
    bool         cancelled_ = false;
    bool         dealer_revealed_ = false;
    Hand         dealer_hand_;
    std::vector<PlayerHand> player_hands_;
    std::vector<bool>       settled_; // [hand_idx] résultat déjà enregistré
    int          active_hand_ = -1;
    std::vector<HandResult> outcome_log_;

    // Étapes internes
    void deal_initial_cards();
    void check_naturals();
    void start_player_turn();
    void advance_to_next_hand();
    void play_dealer();
    void settle_hands();
    void complete_round();

    // Helpers
    Card draw_card();
    void deal_to_player(int hand_index);
    void reveal_dealer();
    void record_result(int hand_index, Outcome outcome, int player_value, int dealer_value);
    void require_phase(Phase expected, const char* operation) const;
    void emit(RoundEvent event) const;
};

} // namespace blackjack

#endif // BLACKJACK_ROUND_ENGINE_H
