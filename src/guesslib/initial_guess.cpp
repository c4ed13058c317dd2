#include "initial_guess.h"
#include <boost/log/trivial.hpp>
#include "util/card.h"
#include "errors.h"

namespace
{
    enum { R2, R3, R4, R5, R6, R7, R8, R9, RT, RJ, RQ, RK, RA };
}

hand_t get_initial_guess(const int n)
{
    std::vector<int> cards;

    switch (n)
    {
    case 2:
        cards.push_back(get_card(R2, DIAMOND));
        cards.push_back(get_card(R6, SPADE));
        break;
    case 3:
        cards.push_back(get_card(RT, CLUB));
        cards.push_back(get_card(R2, DIAMOND));
        cards.push_back(get_card(R6, SPADE));
        break;
    case 4:
        cards.push_back(get_card(R2, CLUB));
        cards.push_back(get_card(R5, DIAMOND));
        cards.push_back(get_card(R7, HEART));
        cards.push_back(get_card(RT, SPADE));
        break;
    default:
        throw invalid_hand_size(n);
    }

    return make_hand(cards);
}

game_state initial_guess(const int n)
{
    game_state state;
    state.guess = get_initial_guess(n);
    state.candidates = remove_hand(generate_hands(n, get_deck()), state.guess);

    BOOST_LOG_TRIVIAL(debug) << "Initial guess " << get_hand_string(state.guess) << " with "
        << state.candidates.size() << " candidates";

    return state;
}
