#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include "hand.h"

struct feedback_t
{
    int correct_cards;
    int lower_ranks;
    int correct_ranks;
    int higher_ranks;
    int correct_suits;

    std::string to_string() const;
};

bool operator==(const feedback_t& a, const feedback_t& b);
bool operator!=(const feedback_t& a, const feedback_t& b);
std::ostream& operator<<(std::ostream& os, const feedback_t& f);
std::size_t hash_value(const feedback_t& f);

// lower and higher ranks are relative to guess; the other counts are symmetric
feedback_t get_feedback(const hand_t& reference, const hand_t& guess);

// feedback for a guess equal to an answer of the given size
feedback_t get_winning_feedback(int hand_size);

bool is_correct(const feedback_t& f, int hand_size);
