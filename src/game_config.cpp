#include "blackjack/game_config.h"
#include "blackjack/common_types.h" // Pour MAX_BALANCE
#include <stdexcept>
#include <string>

namespace blackjack {

void GameConfig::validate() const {
    if (num_decks <= 0) throw std::invalid_argument("Num decks must be > 0");
    if (reshuffle_threshold < 0.0 || reshuffle_threshold > 1.0) {
        throw std::invalid_argument("Reshuffle threshold must be in [0, 1]");
    }
    if (dealer_stand_value < 2 || dealer_stand_value > 21) {
        throw std::invalid_argument("Dealer stand value must be in [2, 21]");
    }
    if (starting_balance <= 0 || starting_balance > MAX_BALANCE) {
        throw std::invalid_argument("Starting balance must be in [1, " + std::to_string(MAX_BALANCE) + "]");
    }
    if (refill_amount <= 0 || refill_amount > MAX_BALANCE) {
        throw std::invalid_argument("Refill amount must be in [1, " + std::to_string(MAX_BALANCE) + "]");
    }
}

namespace {

int parse_int_option(const std::string& name, const std::string& value) {
    size_t pos = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + name + ": '" + value + "'");
    }
    if (pos != value.size()) {
        throw std::invalid_argument("Invalid value for " + name + ": '" + value + "'");
    }
    return parsed;
}

} // namespace

GameConfig parse_config(const std::vector<std::string>& args, GameConfig defaults) {
    GameConfig cfg = defaults;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--verbose" || arg == "-v") {
            cfg.verbose = true;
            continue;
        }
        if (i + 1 >= args.size()) {
            throw std::invalid_argument("Missing value for option " + arg);
        }
        const std::string& value = args[++i];
        if (arg == "--seed") {
            int seed = parse_int_option(arg, value);
            if (seed < 0) throw std::invalid_argument("Seed must be >= 0");
            cfg.seed = static_cast<uint32_t>(seed);
        } else if (arg == "--decks") {
            cfg.num_decks = parse_int_option(arg, value);
        } else if (arg == "--balance") {
            cfg.starting_balance = parse_int_option(arg, value);
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }
    cfg.validate();
    return cfg;
}

} // namespace blackjack
