#ifndef BLACKJACK_CONSOLE_IO_HPP
#define BLACKJACK_CONSOLE_IO_HPP

#include <iosfwd>
#include <string>
#include <vector>
#include "blackjack/player_io.h"

namespace blackjack {

// InputProvider texte: valide la saisie et redemande tant qu'elle est invalide.
// "quit", "q" et "exit" demandent l'abandon. La fin du flux vaut abandon confirmé.
class ConsoleInput : public InputProvider {
public:
    ConsoleInput(std::istream& in, std::ostream& out);

    Decision request_bet(int balance) override;
    Decision request_insurance(int stake) override;
    Decision request_split(int bet) override;
    Decision request_action(int hand_index, const std::vector<PlayerAction>& legal_actions) override;
    Decision request_play_again() override;
    bool confirm_cancel() override;

private:
    std::istream& in_;
    std::ostream& out_;
    bool eof_ = false;

    // false si le flux est terminé
    bool read_line(const std::string& prompt, std::string& line);
    // Question oui/non; renvoie CANCEL ou une décision construite par make
    Decision ask_yes_no(const std::string& prompt, Decision (*make)(bool));
};

// OutputSink texte: une ligne par événement.
class ConsoleOutput : public OutputSink {
public:
    explicit ConsoleOutput(std::ostream& out);
    void on_event(const RoundEvent& event) override;

private:
    std::ostream& out_;
};

bool is_quit_command(const std::string& input);

} // namespace blackjack

#endif // BLACKJACK_CONSOLE_IO_HPP
