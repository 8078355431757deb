#include "blackjack/round_engine.h"
#include "blackjack/payout.h"
#include "blackjack/game_utils.hpp"    // Pour phase_to_string
#include "eval/hand_value.hpp"
#include "spdlog/spdlog.h"
#include <stdexcept>
#include <algorithm>
#include <sstream>
#include <string>

namespace blackjack {

// -----------------------------------------------------------------------------
//  Constructeur
// -----------------------------------------------------------------------------
RoundEngine::RoundEngine(Shoe& shoe, int balance, OutputSink* sink, int dealer_stand_value)
    : shoe_              (shoe),
      sink_              (sink),
      dealer_stand_value_(dealer_stand_value),
      starting_balance_  (balance),
      balance_           (balance)
{
    if (balance < 0 || balance > MAX_BALANCE) {
        throw std::invalid_argument("Balance must be in [0, " + std::to_string(MAX_BALANCE) + "]");
    }
    if (dealer_stand_value < 2 || dealer_stand_value > BLACKJACK_VALUE) {
        throw std::invalid_argument("Dealer stand value must be in [2, 21]");
    }
    // Politique de remélange: uniquement entre deux manches
    if (shoe_.needs_reshuffle()) {
        spdlog::info("Sabot bas ({} / {} cartes). Remélange…", shoe_.remaining(), shoe_.capacity());
        shoe_.reshuffle();
        RoundEvent ev;
        ev.type = EventType::SHOE_RESHUFFLED;
        ev.amount = static_cast<int>(shoe_.capacity());
        emit(ev);
    }
    spdlog::debug("RoundEngine initialisé: solde {}, croupier reste à {}", balance_, dealer_stand_value_);
}

// -----------------------------------------------------------------------------
//  Accesseurs
// -----------------------------------------------------------------------------
Card RoundEngine::get_dealer_up_card() const {
    return dealer_hand_.empty() ? INVALID_CARD : dealer_hand_.front();
}

const PlayerHand& RoundEngine::get_player_hand(int hand_index) const {
    if (hand_index < 0 || hand_index >= static_cast<int>(player_hands_.size())) {
        throw std::out_of_range("Idx main");
    }
    return player_hands_[hand_index];
}

bool RoundEngine::can_double() const {
    if (phase_ != Phase::PLAYER_TURN || active_hand_ < 0) return false;
    const PlayerHand& hand = player_hands_[active_hand_];
    return !hand.finished && hand.cards.size() == 2 && balance_ >= hand.bet;
}

bool RoundEngine::can_split() const {
    if (player_hands_.size() != 1) return false;
    const PlayerHand& hand = player_hands_.front();
    if (hand.cards.size() != 2 || hand.from_split) return false;
    return get_rank(hand.cards[0]) == get_rank(hand.cards[1]) && balance_ >= hand.bet;
}

std::vector<PlayerAction> RoundEngine::get_legal_actions() const {
    if (phase_ != Phase::PLAYER_TURN) return {};
    std::vector<PlayerAction> actions = {PlayerAction::HIT, PlayerAction::STAND};
    if (can_double()) actions.push_back(PlayerAction::DOUBLE);
    return actions;
}

// -----------------------------------------------------------------------------
//  BETTING
// -----------------------------------------------------------------------------
bool RoundEngine::place_bet(int amount)
{
    require_phase(Phase::BETTING, "place_bet");
    if (amount <= 0) {
        spdlog::warn("Mise refusée: {} (doit être > 0)", amount);
        return false;
    }
    if (amount > balance_) {
        spdlog::warn("Mise refusée: {} > solde {}", amount, balance_);
        return false;
    }

    initial_bet_ = amount;
    balance_ -= amount;
    player_hands_.assign(1, PlayerHand{});
    player_hands_[0].bet = amount;
    settled_.assign(1, false);
    spdlog::debug("Mise acceptée: {} (solde {})", amount, balance_);

    RoundEvent ev;
    ev.type = EventType::BET_PLACED;
    ev.hand_index = 0;
    ev.amount = amount;
    emit(ev);

    phase_ = Phase::INITIAL_DEAL;
    deal_initial_cards();
    return true;
}

// -----------------------------------------------------------------------------
//  INITIAL_DEAL : joueur, croupier, joueur, croupier
// -----------------------------------------------------------------------------
void RoundEngine::deal_initial_cards()
{
    deal_to_player(0);

    dealer_hand_.push_back(draw_card());
    RoundEvent up;
    up.type = EventType::CARD_DEALT;
    up.hand_index = DEALER_INDEX;
    up.card = dealer_hand_.back();
    up.hand_value = card_points(dealer_hand_.back());
    emit(up);

    deal_to_player(0);

    dealer_hand_.push_back(draw_card());
    RoundEvent hole;
    hole.type = EventType::HOLE_CARD_DEALT;
    hole.hand_index = DEALER_INDEX;
    emit(hole);

    spdlog::debug("Donne initiale: joueur {} ({}), croupier montre {}",
                  hand_to_string(player_hands_[0].cards), hand_value(player_hands_[0].cards),
                  to_string(dealer_hand_.front()));

    // Assurance proposée si le croupier montre un As
    const int stake = initial_bet_ / 2;
    if (get_rank(dealer_hand_.front()) == Rank::ACE && stake > 0 && balance_ >= stake) {
        phase_ = Phase::INSURANCE_OFFER;
        spdlog::debug("Croupier montre un As: assurance proposée ({})", stake);
        return;
    }
    check_naturals();
}

// -----------------------------------------------------------------------------
//  INSURANCE_OFFER
// -----------------------------------------------------------------------------
void RoundEngine::resolve_insurance(bool take)
{
    require_phase(Phase::INSURANCE_OFFER, "resolve_insurance");
    if (take) {
        insurance_stake_ = initial_bet_ / 2;
        balance_ -= insurance_stake_;
        RoundEvent taken;
        taken.type = EventType::INSURANCE_TAKEN;
        taken.amount = insurance_stake_;
        emit(taken);

        const bool dealer_blackjack = is_blackjack(dealer_hand_);
        insurance_delta_ = settle_insurance(insurance_stake_, dealer_blackjack);
        balance_ += insurance_credit(insurance_stake_, dealer_blackjack);
        spdlog::debug("Assurance {} : delta {} (solde {})",
                      dealer_blackjack ? "payée" : "perdue", insurance_delta_, balance_);

        RoundEvent settled;
        settled.type = EventType::INSURANCE_SETTLED;
        settled.amount = insurance_delta_;
        settled.outcome = dealer_blackjack ? Outcome::WIN : Outcome::LOSS;
        emit(settled);
    } else {
        spdlog::debug("Assurance refusée.");
    }
    // Le flux de la mise principale est inchangé
    check_naturals();
}

// -----------------------------------------------------------------------------
//  IMMEDIATE_SETTLEMENT : blackjacks naturels
// -----------------------------------------------------------------------------
void RoundEngine::check_naturals()
{
    phase_ = Phase::IMMEDIATE_SETTLEMENT;
    const Hand& player = player_hands_[0].cards;
    const bool player_blackjack = is_blackjack(player);
    const bool dealer_blackjack = is_blackjack(dealer_hand_);

    if (player_blackjack || dealer_blackjack) {
        reveal_dealer();
        Outcome outcome;
        if (player_blackjack && dealer_blackjack) outcome = Outcome::PUSH;
        else if (player_blackjack)                outcome = Outcome::BLACKJACK;
        else                                      outcome = Outcome::LOSS;
        spdlog::debug("Règlement immédiat: {}", outcome_to_string(outcome));
        record_result(0, outcome, hand_value(player), hand_value(dealer_hand_));
        complete_round();
        return;
    }

    if (can_split()) {
        phase_ = Phase::SPLIT_OFFER;
        spdlog::debug("Paire {}: split proposé", hand_to_string(player));
        return;
    }
    start_player_turn();
}

// -----------------------------------------------------------------------------
//  SPLIT_OFFER
// -----------------------------------------------------------------------------
void RoundEngine::resolve_split(bool accept)
{
    require_phase(Phase::SPLIT_OFFER, "resolve_split");
    if (!accept) {
        spdlog::debug("Split refusé.");
        start_player_turn();
        return;
    }

    const int bet = player_hands_[0].bet;
    balance_ -= bet;

    PlayerHand second;
    second.cards.push_back(player_hands_[0].cards.back());
    second.bet = bet;
    second.from_split = true;
    player_hands_[0].cards.pop_back();
    player_hands_[0].from_split = true;
    player_hands_.push_back(second);
    settled_.assign(player_hands_.size(), false);

    RoundEvent ev;
    ev.type = EventType::HAND_SPLIT;
    ev.hand_index = 1;
    ev.amount = bet;
    emit(ev);
    spdlog::debug("Split: mise supplémentaire {} (solde {})", bet, balance_);

    // Chaque tête de main reçoit une carte
    for (int i = 0; i < static_cast<int>(player_hands_.size()); ++i) {
        deal_to_player(i);
    }
    start_player_turn();
}

// -----------------------------------------------------------------------------
//  PLAYER_TURN
// -----------------------------------------------------------------------------
void RoundEngine::start_player_turn()
{
    phase_ = Phase::PLAYER_TURN;
    active_hand_ = 0;
    spdlog::debug("Tour du joueur: main {} {}", active_hand_, hand_to_string(player_hands_[0].cards));
}

bool RoundEngine::apply_action(PlayerAction action)
{
    require_phase(Phase::PLAYER_TURN, "apply_action");
    PlayerHand& hand = player_hands_[active_hand_];
    const int idx = active_hand_;

    switch (action) {
        case PlayerAction::HIT: {
            deal_to_player(idx);
            if (is_bust(hand.cards)) {
                hand.finished = true;
                spdlog::debug("Main {} BUST ({})", idx, hand_value(hand.cards));
                RoundEvent bust;
                bust.type = EventType::HAND_BUST;
                bust.hand_index = idx;
                bust.hand_value = hand_value(hand.cards);
                emit(bust);
                record_result(idx, Outcome::BUST, hand_value(hand.cards), 0);
            }
            break;
        }
        case PlayerAction::STAND: {
            hand.finished = true;
            spdlog::debug("Main {} STAND à {}", idx, hand_value(hand.cards));
            RoundEvent stand;
            stand.type = EventType::HAND_STAND;
            stand.hand_index = idx;
            stand.hand_value = hand_value(hand.cards);
            emit(stand);
            break;
        }
        case PlayerAction::DOUBLE: {
            if (!can_double()) {
                spdlog::warn("Double refusé sur la main {} ({} cartes, mise {}, solde {})",
                             idx, hand.cards.size(), hand.bet, balance_);
                return false;
            }
            balance_ -= hand.bet;
            hand.bet *= 2;
            hand.doubled = true;
            RoundEvent dbl;
            dbl.type = EventType::DOUBLED_DOWN;
            dbl.hand_index = idx;
            dbl.amount = hand.bet;
            emit(dbl);
            spdlog::debug("Main {} DOUBLE: mise {} (solde {})", idx, hand.bet, balance_);

            // Une seule carte, puis la main reste quoi qu'il arrive
            deal_to_player(idx);
            hand.finished = true;
            const int value = hand_value(hand.cards);
            RoundEvent end;
            end.type = is_bust(hand.cards) ? EventType::HAND_BUST : EventType::HAND_STAND;
            end.hand_index = idx;
            end.hand_value = value;
            emit(end);
            if (is_bust(hand.cards)) {
                record_result(idx, Outcome::BUST, value, 0);
            }
            break;
        }
        default: throw std::logic_error("Action joueur inconnue");
    }

    if (hand.finished) advance_to_next_hand();
    return true;
}

void RoundEngine::advance_to_next_hand()
{
    ++active_hand_;
    if (active_hand_ < static_cast<int>(player_hands_.size())) {
        spdlog::debug("Main suivante: {} {}", active_hand_, hand_to_string(player_hands_[active_hand_].cards));
        return;
    }
    active_hand_ = -1;

    const bool any_standing = std::any_of(player_hands_.begin(), player_hands_.end(),
                                          [](const PlayerHand& h) { return !is_bust(h.cards); });
    if (any_standing) {
        play_dealer();
    } else {
        spdlog::debug("Toutes les mains ont sauté: pas de tour du croupier.");
    }
    settle_hands();
}

// -----------------------------------------------------------------------------
//  DEALER_TURN
// -----------------------------------------------------------------------------
void RoundEngine::play_dealer()
{
    phase_ = Phase::DEALER_TURN;
    reveal_dealer();
    while (hand_value(dealer_hand_) < dealer_stand_value_) {
        dealer_hand_.push_back(draw_card());
        RoundEvent hit;
        hit.type = EventType::DEALER_HIT;
        hit.hand_index = DEALER_INDEX;
        hit.card = dealer_hand_.back();
        hit.hand_value = hand_value(dealer_hand_);
        emit(hit);
        spdlog::debug("Croupier tire {}: {}", to_string(dealer_hand_.back()), hand_value(dealer_hand_));
    }
}

// -----------------------------------------------------------------------------
//  SETTLEMENT
// -----------------------------------------------------------------------------
void RoundEngine::settle_hands()
{
    phase_ = Phase::SETTLEMENT;
    const int dealer_value = hand_value(dealer_hand_);
    for (int i = 0; i < static_cast<int>(player_hands_.size()); ++i) {
        if (settled_[i]) continue; // Bust déjà enregistré pendant le tour
        const int player_value = hand_value(player_hands_[i].cards);
        record_result(i, determine_outcome(player_value, dealer_value), player_value, dealer_value);
    }
    complete_round();
}

void RoundEngine::complete_round()
{
    phase_ = Phase::COMPLETE;
    active_hand_ = -1;
    spdlog::debug("Manche terminée: net {}, solde {}", get_net_result(), balance_);
    RoundEvent ev;
    ev.type = EventType::ROUND_COMPLETE;
    ev.amount = get_net_result();
    emit(ev);
}

void RoundEngine::cancel()
{
    if (phase_ == Phase::COMPLETE) {
        throw std::logic_error("cancel() sur une manche terminée");
    }
    spdlog::info("Manche annulée en phase {} (mises engagées: {})",
                 phase_to_string(phase_), starting_balance_ - balance_);
    cancelled_ = true;
    phase_ = Phase::COMPLETE;
    active_hand_ = -1;
    RoundEvent ev;
    ev.type = EventType::ROUND_CANCELLED;
    ev.amount = get_net_result();
    emit(ev);
}

// -----------------------------------------------------------------------------
//  Fonctions Helper Privées
// -----------------------------------------------------------------------------
Card RoundEngine::draw_card()
{
    const int reshuffles_before = shoe_.reshuffle_count();
    Card c = shoe_.draw();
    if (shoe_.reshuffle_count() != reshuffles_before) {
        RoundEvent ev;
        ev.type = EventType::SHOE_RESHUFFLED;
        ev.amount = static_cast<int>(shoe_.capacity());
        emit(ev);
    }
    return c;
}

void RoundEngine::deal_to_player(int hand_index)
{
    PlayerHand& hand = player_hands_[hand_index];
    hand.cards.push_back(draw_card());
    RoundEvent ev;
    ev.type = EventType::CARD_DEALT;
    ev.hand_index = hand_index;
    ev.card = hand.cards.back();
    ev.hand_value = hand_value(hand.cards);
    emit(ev);
}

void RoundEngine::reveal_dealer()
{
    if (dealer_revealed_) return;
    dealer_revealed_ = true;
    RoundEvent ev;
    ev.type = EventType::DEALER_REVEAL;
    ev.hand_index = DEALER_INDEX;
    ev.card = dealer_hand_.size() > 1 ? dealer_hand_[1] : INVALID_CARD;
    ev.hand_value = hand_value(dealer_hand_);
    emit(ev);
}

void RoundEngine::record_result(int hand_index, Outcome outcome, int player_value, int dealer_value)
{
    const int bet = player_hands_[hand_index].bet;
    balance_ += credit_for(outcome, bet);
    settled_[hand_index] = true;

    HandResult result;
    result.hand_index = hand_index;
    result.outcome = outcome;
    result.bet = bet;
    result.delta = settle(outcome, bet);
    result.player_value = player_value;
    result.dealer_value = dealer_value;
    outcome_log_.push_back(result);
    spdlog::debug("Main {}: {} (mise {}, delta {}, solde {})",
                  hand_index, outcome_to_string(outcome), bet, result.delta, balance_);

    RoundEvent ev;
    ev.type = EventType::HAND_SETTLED;
    ev.hand_index = hand_index;
    ev.hand_value = player_value;
    ev.amount = result.delta;
    ev.outcome = outcome;
    emit(ev);
}

void RoundEngine::require_phase(Phase expected, const char* operation) const
{
    if (phase_ != expected) {
        throw std::logic_error(std::string(operation) + " appelé en phase " + phase_to_string(phase_) +
                               " (attendu: " + phase_to_string(expected) + ")");
    }
}

void RoundEngine::emit(RoundEvent event) const
{
    if (sink_ == nullptr) return;
    event.balance = balance_;
    sink_->on_event(event);
}

// -----------------------------------------------------------------------------
//  Utilitaires d'affichage
// -----------------------------------------------------------------------------
std::string RoundEngine::toString() const {
    std::stringstream ss;
    ss << "Phase: " << phase_to_string(phase_) << " | Solde: " << balance_
       << " | Mise: " << initial_bet_ << " | Assurance: " << insurance_stake_ << "\n";
    ss << "  Croupier: ";
    if (dealer_revealed_ || dealer_hand_.size() < 2) {
        ss << hand_to_string(dealer_hand_) << " (" << hand_value(dealer_hand_) << ")";
    } else {
        ss << "[" << to_string(dealer_hand_.front()) << " --]";
    }
    ss << "\n";
    for (size_t i = 0; i < player_hands_.size(); ++i) {
        const PlayerHand& h = player_hands_[i];
        ss << "  Main " << i << (static_cast<int>(i) == active_hand_ ? " (active)" : "")
           << ": " << hand_to_string(h.cards) << " (" << hand_value(h.cards) << ")"
           << ", Mise=" << h.bet << (h.doubled ? " (doublée)" : "")
           << (h.finished ? " (terminée)" : "") << "\n";
    }
    return ss.str();
}

} // namespace blackjack
