#pragma once

#include "hand.h"
#include "candidate_space.h"

// the guess about to be played and the hands that may still be the answer
struct game_state
{
    hand_t guess;
    candidate_space_t candidates;
};
