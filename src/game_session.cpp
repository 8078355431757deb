#include "blackjack/game_session.h"
#include "blackjack/round_engine.h"
#include "blackjack/game_utils.hpp"
#include "spdlog/spdlog.h"
#include <stdexcept>
#include <string>
#include <vector>

namespace blackjack {

namespace {

const GameConfig& validated(const GameConfig& config) {
    config.validate();
    return config;
}

void expect_decision(const Decision& d, DecisionType expected, const char* where) {
    if (d.type != expected) {
        throw std::logic_error(std::string("Décision inattendue pour ") + where);
    }
}

} // namespace

GameSession::GameSession(const GameConfig& config, InputProvider& input, OutputSink* output)
    : config_ (validated(config)),
      input_  (input),
      output_ (output),
      shoe_   (config.num_decks, config.seed, config.reshuffle_threshold),
      balance_(config.starting_balance)
{
    spdlog::debug("GameSession initialisée: {} paquets, solde {}, seed {}",
                  config_.num_decks, balance_, config_.seed);
}

void GameSession::refill_if_broke()
{
    if (balance_ > 0) return;
    balance_ = config_.refill_amount;
    ++refills_;
    spdlog::info("Plus de Rocks: {} offerts pour continuer.", config_.refill_amount);
    if (output_ != nullptr) {
        RoundEvent ev;
        ev.type = EventType::BALANCE_REFILLED;
        ev.amount = config_.refill_amount;
        ev.balance = balance_;
        output_->on_event(ev);
    }
}

void GameSession::handle_cancel(RoundEngine& engine)
{
    if (!input_.confirm_cancel()) {
        spdlog::debug("Abandon non confirmé, la manche continue.");
        return;
    }
    engine.cancel();
}

// Une décision du joueur pour la phase courante
void GameSession::step(RoundEngine& engine)
{
    switch (engine.get_phase()) {
        case Phase::BETTING: {
            Decision d = input_.request_bet(engine.get_balance());
            if (d.is_cancel()) { handle_cancel(engine); return; }
            expect_decision(d, DecisionType::BET_AMOUNT, "la mise");
            engine.place_bet(d.amount); // false -> nouvelle demande
            return;
        }
        case Phase::INSURANCE_OFFER: {
            Decision d = input_.request_insurance(engine.get_bet() / 2);
            if (d.is_cancel()) { handle_cancel(engine); return; }
            expect_decision(d, DecisionType::INSURANCE_CHOICE, "l'assurance");
            engine.resolve_insurance(d.accepted);
            return;
        }
        case Phase::SPLIT_OFFER: {
            Decision d = input_.request_split(engine.get_bet());
            if (d.is_cancel()) { handle_cancel(engine); return; }
            expect_decision(d, DecisionType::SPLIT_CHOICE, "le split");
            engine.resolve_split(d.accepted);
            return;
        }
        case Phase::PLAYER_TURN: {
            const std::vector<PlayerAction> legal = engine.get_legal_actions();
            spdlog::debug("Etat:\n{}Actions légales: {}", engine.toString(), actions_to_string(legal));
            Decision d = input_.request_action(engine.get_active_hand_index(), legal);
            if (d.is_cancel()) { handle_cancel(engine); return; }
            expect_decision(d, DecisionType::PLAYER_ACTION, "l'action du joueur");
            spdlog::debug("Main {}: {}", engine.get_active_hand_index(), action_to_string(d.action));
            engine.apply_action(d.action); // false -> nouvelle demande
            return;
        }
        default:
            throw std::logic_error("Phase sans décision observée: " + phase_to_string(engine.get_phase()));
    }
}

bool GameSession::play_round()
{
    refill_if_broke();

    RoundEngine engine(shoe_, balance_, output_, config_.dealer_stand_value);
    while (!engine.is_complete()) {
        step(engine);
    }

    balance_ = engine.get_balance();
    if (balance_ > MAX_BALANCE) {
        spdlog::warn("Solde {} au-dessus du plafond de la table: ramené à {} Rocks.", balance_, MAX_BALANCE);
        balance_ = MAX_BALANCE;
    }
    last_outcome_log_ = engine.get_outcome_log();
    if (engine.was_cancelled()) {
        spdlog::info("Partie abandonnée. Solde: {} Rocks.", balance_);
        return false;
    }
    ++rounds_played_;
    spdlog::info("Manche {} terminée: net {:+}, solde {} Rocks.",
                 rounds_played_, engine.get_net_result(), balance_);
    return true;
}

SessionSummary GameSession::run()
{
    SessionSummary summary;
    while (true) {
        if (!play_round()) {
            summary.cancelled = true;
            break;
        }

        Decision again = input_.request_play_again();
        while (again.is_cancel()) {
            if (input_.confirm_cancel()) break;
            again = input_.request_play_again();
        }
        if (again.is_cancel()) {
            summary.cancelled = true;
            break;
        }
        expect_decision(again, DecisionType::PLAY_AGAIN, "rejouer");
        if (!again.accepted) break;
    }

    summary.rounds_played = rounds_played_;
    summary.final_balance = balance_;
    summary.refills = refills_;
    spdlog::info("Fin de session: {} manches, solde final {} Rocks.", rounds_played_, balance_);
    return summary;
}

} // namespace blackjack
