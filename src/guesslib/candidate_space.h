#pragma once

#include <vector>
#include "hand.h"

typedef std::vector<hand_t> candidate_space_t;

// all 52 cards in deck order
std::vector<int> get_deck();

// every n-card subset of deck once, in lexicographic order of deck position
candidate_space_t generate_hands(int n, const std::vector<int>& deck);

// copy of space without hand
candidate_space_t remove_hand(const candidate_space_t& space, const hand_t& hand);
