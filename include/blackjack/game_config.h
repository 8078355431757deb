#ifndef BLACKJACK_GAME_CONFIG_H
#define BLACKJACK_GAME_CONFIG_H

#include <cstdint>
#include <string>
#include <vector>

namespace blackjack {

// Paramètres généraux d'une session
struct GameConfig {
    int      num_decks           = 6;    // Sabot standard de casino
    double   reshuffle_threshold = 0.2;  // Remélange sous 20% de la capacité
    int      dealer_stand_value  = 17;   // Le croupier tire tant qu'il est sous cette valeur
    int      starting_balance    = 100;  // Rocks de départ, au plus MAX_BALANCE
    int      refill_amount       = 50;   // Rocks offerts quand le solde est épuisé
    uint32_t seed                = 0;
    bool     verbose             = false;

    // Lance std::invalid_argument si une valeur est hors bornes
    void validate() const;
};

// Parse "--seed N --decks N --balance N --verbose".
// Les options inconnues ou mal formées lancent std::invalid_argument.
GameConfig parse_config(const std::vector<std::string>& args, GameConfig defaults = {});

} // namespace blackjack

#endif // BLACKJACK_GAME_CONFIG_H
