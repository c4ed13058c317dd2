#pragma once

#include <string>
#include <vector>

static const int MIN_HAND_SIZE = 2;
static const int MAX_HAND_SIZE = 4;

// cards sorted by deck index; see make_hand
typedef std::vector<int> hand_t;

hand_t make_hand(std::vector<int> cards);
bool is_valid_selection(const hand_t& hand);
bool is_valid_hand_size(int size);
hand_t string_to_hand(const std::string& s);
std::string get_hand_string(const hand_t& hand);
