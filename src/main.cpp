#include "blackjack/game_config.h"
#include "blackjack/game_session.h"
#include "console/console_io.hpp"
#include "spdlog/spdlog.h"

#include <iostream>   // std::cin, std::cout, std::cerr
#include <string>     // std::string
#include <vector>     // std::vector
#include <exception>  // std::exception
#include <random>     // std::random_device

int main(int argc, char* argv[])
{
    // ─────────────────────────────────────────────────────────────
    // Paramètres généraux
    // ─────────────────────────────────────────────────────────────
    blackjack::GameConfig defaults;
    defaults.num_decks           = 6;
    defaults.reshuffle_threshold = 0.2;
    defaults.dealer_stand_value  = 17;
    defaults.starting_balance    = 100;
    defaults.refill_amount       = 50;
    defaults.seed                = std::random_device{}();

    try
    {
        const std::vector<std::string> args(argv + 1, argv + argc);
        const blackjack::GameConfig config = blackjack::parse_config(args, defaults);

        // ─────────────────────────────────────────────────────────────
        // Logging
        // ─────────────────────────────────────────────────────────────
        spdlog::set_level(config.verbose ? spdlog::level::debug : spdlog::level::warn);
        spdlog::info("Démarrage du Blackjack (seed {}, {} paquets)…", config.seed, config.num_decks);

        std::cout << "Bienvenue au Blackjack !\n"
                  << "Vous commencez avec " << config.starting_balance << " Rocks.\n"
                  << "Tapez 'quit' à tout moment pour abandonner.\n";

        blackjack::ConsoleInput  input(std::cin, std::cout);
        blackjack::ConsoleOutput output(std::cout);
        blackjack::GameSession   session(config, input, &output);

        const blackjack::SessionSummary summary = session.run();
        std::cout << "\nMerci d'avoir joué ! Solde final: " << summary.final_balance
                  << " Rocks (" << summary.rounds_played << " manches).\n";
    }
    catch (const std::exception& e)
    {
        spdlog::critical("Erreur critique : {}", e.what());
        std::cerr << "Erreur critique : " << e.what() << '\n';
        return 1;
    }

    spdlog::info("Exécution terminée.");
    return 0;
}
