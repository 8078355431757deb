#include "console/console_io.hpp"
#include "blackjack/game_utils.hpp"
#include "core/cards.hpp"
#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>
#include <string>

namespace blackjack {

namespace {

std::string normalize(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r");
    std::string out = s.substr(first, last - first + 1);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string dealer_or_hand(int hand_index) {
    return hand_index == DEALER_INDEX ? "Croupier" : "Main " + std::to_string(hand_index + 1);
}

} // namespace

bool is_quit_command(const std::string& input) {
    const std::string s = normalize(input);
    return s == "quit" || s == "q" || s == "exit";
}

// -----------------------------------------------------------------------------
//  ConsoleInput
// -----------------------------------------------------------------------------
ConsoleInput::ConsoleInput(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {}

bool ConsoleInput::read_line(const std::string& prompt, std::string& line) {
    if (eof_) return false;
    out_ << prompt << std::flush;
    if (!std::getline(in_, line)) {
        eof_ = true;
        return false;
    }
    return true;
}

Decision ConsoleInput::ask_yes_no(const std::string& prompt, Decision (*make)(bool)) {
    std::string line;
    while (read_line(prompt, line)) {
        if (is_quit_command(line)) return Decision::cancel();
        const std::string s = normalize(line);
        if (s == "y" || s == "o") return make(true);
        if (s == "n") return make(false);
        out_ << "Choix invalide. Entrez 'y' ou 'n'.\n";
    }
    return Decision::cancel();
}

Decision ConsoleInput::request_bet(int balance) {
    std::string line;
    while (true) {
        out_ << "Vous avez " << balance << " Rocks.\n";
        if (!read_line("Combien voulez-vous miser ? ", line)) return Decision::cancel();
        if (is_quit_command(line)) return Decision::cancel();

        const std::string s = normalize(line);
        size_t pos = 0;
        int amount = 0;
        try {
            amount = std::stoi(s, &pos);
        } catch (const std::exception&) {
            out_ << "Entrez un nombre valide.\n";
            continue;
        }
        if (pos != s.size()) {
            out_ << "Entrez un nombre valide.\n";
        } else if (amount <= 0) {
            out_ << "La mise doit être positive.\n";
        } else if (amount > balance) {
            out_ << "Pas assez de Rocks. Vous avez " << balance << " Rocks.\n";
        } else {
            return Decision::bet(amount);
        }
    }
}

Decision ConsoleInput::request_insurance(int stake) {
    out_ << "Le croupier montre un As. L'assurance coûte " << stake << " Rocks.\n";
    return ask_yes_no("Prendre l'assurance ? (y/n) : ", &Decision::insurance);
}

Decision ConsoleInput::request_split(int bet) {
    out_ << "Vous avez une paire. Le split coûte " << bet << " Rocks de plus.\n";
    return ask_yes_no("Splitter ? (y/n) : ", &Decision::split);
}

Decision ConsoleInput::request_action(int hand_index, const std::vector<PlayerAction>& legal_actions) {
    const bool double_allowed = std::find(legal_actions.begin(), legal_actions.end(),
                                          PlayerAction::DOUBLE) != legal_actions.end();
    const std::string prompt = dealer_or_hand(hand_index) +
        (double_allowed ? " : Tirer, Rester ou Doubler ? (h/s/d) : " : " : Tirer ou Rester ? (h/s) : ");
    std::string line;
    while (read_line(prompt, line)) {
        if (is_quit_command(line)) return Decision::cancel();
        const std::string s = normalize(line);
        if (s == "h") return Decision::play(PlayerAction::HIT);
        if (s == "s") return Decision::play(PlayerAction::STAND);
        if (s == "d" && double_allowed) return Decision::play(PlayerAction::DOUBLE);
        out_ << (double_allowed ? "Choix invalide. Entrez 'h', 's' ou 'd'.\n"
                                : "Choix invalide. Entrez 'h' ou 's'.\n");
    }
    return Decision::cancel();
}

Decision ConsoleInput::request_play_again() {
    return ask_yes_no("Rejouer ? (y/n) : ", &Decision::play_again);
}

bool ConsoleInput::confirm_cancel() {
    std::string line;
    while (read_line("Confirmer l'abandon ? (y/n) : ", line)) {
        const std::string s = normalize(line);
        if (s == "y" || s == "yes" || s == "o") return true;
        if (s == "n" || s == "no") return false;
        out_ << "Entrez 'y' ou 'n'.\n";
    }
    return true; // Flux terminé
}

// -----------------------------------------------------------------------------
//  ConsoleOutput
// -----------------------------------------------------------------------------
ConsoleOutput::ConsoleOutput(std::ostream& out) : out_(out) {}

void ConsoleOutput::on_event(const RoundEvent& ev) {
    switch (ev.type) {
        case EventType::SHOE_RESHUFFLED:
            out_ << "\n--- Nouveau sabot mélangé (" << ev.amount << " cartes) ---\n"; break;
        case EventType::BALANCE_REFILLED:
            out_ << "Plus de Rocks ! En voici " << ev.amount << " pour continuer.\n"; break;
        case EventType::BET_PLACED:
            out_ << "\n--- Nouvelle manche --- Mise: " << ev.amount << " Rocks\n"; break;
        case EventType::CARD_DEALT:
            out_ << dealer_or_hand(ev.hand_index) << " reçoit " << to_string(ev.card)
                 << " (valeur " << ev.hand_value << ")\n"; break;
        case EventType::HOLE_CARD_DEALT:
            out_ << "Croupier reçoit une carte cachée\n"; break;
        case EventType::INSURANCE_TAKEN:
            out_ << "Assurance placée: " << ev.amount << " Rocks\n"; break;
        case EventType::INSURANCE_SETTLED:
            out_ << (ev.outcome == Outcome::WIN ? "Le croupier a Blackjack ! L'assurance paie.\n"
                                                : "Pas de Blackjack chez le croupier. Assurance perdue.\n");
            break;
        case EventType::HAND_SPLIT:
            out_ << "Split ! " << ev.amount << " Rocks de plus pour la seconde main.\n"; break;
        case EventType::DOUBLED_DOWN:
            out_ << dealer_or_hand(ev.hand_index) << " double: mise " << ev.amount << " Rocks\n"; break;
        case EventType::HAND_BUST:
            out_ << dealer_or_hand(ev.hand_index) << " saute avec " << ev.hand_value << " !\n"; break;
        case EventType::HAND_STAND:
            out_ << dealer_or_hand(ev.hand_index) << " reste à " << ev.hand_value << "\n"; break;
        case EventType::DEALER_REVEAL:
            out_ << "Le croupier retourne " << to_string(ev.card) << " (valeur " << ev.hand_value << ")\n"; break;
        case EventType::DEALER_HIT:
            out_ << "Le croupier tire " << to_string(ev.card) << " (valeur " << ev.hand_value << ")\n"; break;
        case EventType::HAND_SETTLED:
            out_ << dealer_or_hand(ev.hand_index) << ": " << outcome_to_string(ev.outcome)
                 << " (" << (ev.amount >= 0 ? "+" : "") << ev.amount << " Rocks)\n"; break;
        case EventType::ROUND_COMPLETE:
            out_ << "Manche terminée: " << (ev.amount >= 0 ? "+" : "") << ev.amount
                 << " Rocks. Solde: " << ev.balance << " Rocks.\n"; break;
        case EventType::ROUND_CANCELLED:
            out_ << "Manche abandonnée. Solde: " << ev.balance << " Rocks.\n"; break;
        default:
            out_ << event_type_to_string(ev.type) << "\n"; break;
    }
}

} // namespace blackjack
