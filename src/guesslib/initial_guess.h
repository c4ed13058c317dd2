#pragma once

#include "hand.h"
#include "game_state.h"

// distinct suits roughly 13 / (n + 1) ranks apart; throws invalid_hand_size outside 2-4
hand_t get_initial_guess(int n);

// opening guess and every other hand of size n
game_state initial_guess(int n);
