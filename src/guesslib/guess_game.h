#pragma once

#include <ostream>
#include <boost/noncopyable.hpp>
#include "hand.h"

// plays the guesser against a known answer, writing each round to the transcript if set
class guess_game : private boost::noncopyable
{
public:
    guess_game();
    void set_transcript(std::ostream* os) { transcript_ = os; }
    void set_max_guesses(int max_guesses) { max_guesses_ = max_guesses; }
    int get_max_guesses() const { return max_guesses_; }

    // returns the number of guesses needed to find answer
    int play(const hand_t& answer);

private:
    std::ostream* transcript_;
    int max_guesses_;
};
