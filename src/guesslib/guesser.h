#pragma once

#include <cstddef>
#include <boost/noncopyable.hpp>
#include "game_state.h"
#include "feedback.h"

class guesser : private boost::noncopyable
{
public:
    explicit guesser(int hand_size);
    const hand_t& get_guess() const { return state_.guess; }
    std::size_t get_candidate_count() const { return state_.candidates.size(); }
    const game_state& get_state() const { return state_; }
    int get_hand_size() const { return hand_size_; }
    void update(const feedback_t& f);

private:
    int hand_size_;
    game_state state_;
};
