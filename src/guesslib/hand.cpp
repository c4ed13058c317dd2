#include "hand.h"
#include <algorithm>
#include <iterator>
#include <sstream>
#include "util/card.h"
#include "errors.h"

namespace
{
    bool deck_order(const int a, const int b)
    {
        return get_deck_index(a) < get_deck_index(b);
    }
}

hand_t make_hand(std::vector<int> cards)
{
    std::sort(cards.begin(), cards.end(), deck_order);
    return cards;
}

bool is_valid_selection(const hand_t& hand)
{
    if (hand.empty())
        return false;

    for (auto i = hand.begin(); i != hand.end(); ++i)
    {
        if (*i < 0 || *i >= CARDS)
            return false;

        if (std::find(std::next(i), hand.end(), *i) != hand.end())
            return false;
    }

    return true;
}

bool is_valid_hand_size(const int size)
{
    return size >= MIN_HAND_SIZE && size <= MAX_HAND_SIZE;
}

hand_t string_to_hand(const std::string& s)
{
    std::istringstream is(s);
    std::vector<int> cards;
    std::string token;

    while (is >> token)
    {
        const int card = string_to_card(token);

        if (card == -1)
            throw invalid_selection("invalid card: " + token);

        cards.push_back(card);
    }

    return make_hand(cards);
}

std::string get_hand_string(const hand_t& hand)
{
    std::string s = "[";

    for (std::size_t i = 0; i < hand.size(); ++i)
        s += (i == 0 ? "" : ",") + get_card_string(hand[i]);

    return s + "]";
}
