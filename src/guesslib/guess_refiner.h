#pragma once

#include <cstddef>
#include <cstdint>
#include "feedback.h"
#include "candidate_space.h"
#include "game_state.h"

// candidates that would have produced feedback f against guess, without guess itself
candidate_space_t filter_candidates(const candidate_space_t& candidates, const hand_t& guess, const feedback_t& f);

// sum of squared sizes of the candidate groups sharing a feedback against guess
std::uint64_t get_group_size_square_sum(const hand_t& guess, const candidate_space_t& candidates);

// E(g) = sum(group size^2) / sum(group size)
double get_expected_remaining(const hand_t& guess, const candidate_space_t& candidates);

// index of the next guess: lowest E(g) for two cards (earliest wins ties), otherwise the middle candidate
std::size_t select_guess(const candidate_space_t& candidates);

game_state next_guess(const game_state& state, const feedback_t& f);
