#ifndef BLACKJACK_GAME_UTILS_HPP
#define BLACKJACK_GAME_UTILS_HPP

#include "blackjack/common_types.h"
#include <string>
#include <vector>

namespace blackjack {

std::string phase_to_string(Phase p);
std::string outcome_to_string(Outcome o);
std::string action_to_string(PlayerAction a);
std::string event_type_to_string(EventType t);

// ex: "HIT,STAND,DOUBLE"
std::string actions_to_string(const std::vector<PlayerAction>& actions);

} // namespace blackjack

#endif // BLACKJACK_GAME_UTILS_HPP
