#include "guesser.h"
#include <boost/log/trivial.hpp>
#include "initial_guess.h"
#include "guess_refiner.h"

guesser::guesser(const int hand_size)
    : hand_size_(hand_size)
    , state_(initial_guess(hand_size))
{
}

void guesser::update(const feedback_t& f)
{
    state_ = next_guess(state_, f);

    BOOST_LOG_TRIVIAL(debug) << "Next guess " << get_hand_string(state_.guess) << ", "
        << state_.candidates.size() << " candidates left";
}
