#ifndef BJSIM_GAME_UTILS_HPP
#define BJSIM_GAME_UTILS_HPP

#include "bjsim/common_types.h"
#include <string>

namespace bj_sim {

// Conversion des enums en texte (logs et rapport)
std::string decision_to_string(Decision d);
std::string round_state_to_string(RoundState s);
std::string terminal_reason_to_string(TerminalReason r);

} // namespace bj_sim

#endif // BJSIM_GAME_UTILS_HPP
