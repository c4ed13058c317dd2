#include "guess_game.h"
#include <boost/log/trivial.hpp>
#include "errors.h"
#include "feedback.h"
#include "guesser.h"

guess_game::guess_game()
    : transcript_(nullptr)
    , max_guesses_(0)
{
}

int guess_game::play(const hand_t& answer)
{
    if (!is_valid_selection(answer))
        throw invalid_selection("invalid answer: " + get_hand_string(answer));

    const int size = static_cast<int>(answer.size());

    if (!is_valid_hand_size(size))
        throw invalid_hand_size(size);

    BOOST_LOG_TRIVIAL(info) << "Playing answer " << get_hand_string(answer);

    guesser g(size);

    for (int guesses = 1; ; ++guesses)
    {
        const auto& guess = g.get_guess();

        if (transcript_)
            *transcript_ << "Guess " << guesses << ":  " << get_hand_string(guess) << "\n";

        if (!is_valid_selection(guess))
            throw invalid_selection("invalid guess: " + get_hand_string(guess));

        if (guess.size() != answer.size())
            throw hand_size_mismatch(answer.size(), guess.size());

        const auto f = get_feedback(answer, guess);

        if (transcript_)
            *transcript_ << "Feedback: " << f << "\n";

        if (is_correct(f, size))
        {
            BOOST_LOG_TRIVIAL(info) << "Found " << get_hand_string(guess) << " in " << guesses << " guesses";
            return guesses;
        }

        if (max_guesses_ > 0 && guesses >= max_guesses_)
            throw guess_limit_exceeded(max_guesses_);

        g.update(f);
    }
}
