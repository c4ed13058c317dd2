#include "candidate_space.h"
#include <algorithm>
#include <iterator>
#include "util/card.h"
#include "util/choose.h"

namespace
{
    // choose deck[index] and recurse, then skip it and recurse
    void add_hands(const std::vector<int>& deck, const std::size_t index, const int remaining, hand_t& prefix,
        candidate_space_t& out)
    {
        if (remaining == 0)
        {
            out.push_back(prefix);
            return;
        }

        if (deck.size() - index < static_cast<std::size_t>(remaining))
            return;

        prefix.push_back(deck[index]);
        add_hands(deck, index + 1, remaining - 1, prefix, out);
        prefix.pop_back();

        add_hands(deck, index + 1, remaining, prefix, out);
    }
}

std::vector<int> get_deck()
{
    std::vector<int> deck;
    deck.reserve(CARDS);

    for (int suit = CLUB; suit < SUITS; ++suit)
    {
        for (int rank = 0; rank < RANKS; ++rank)
            deck.push_back(get_card(rank, suit));
    }

    return deck;
}

candidate_space_t generate_hands(const int n, const std::vector<int>& deck)
{
    candidate_space_t hands;

    if (n < 0)
        return hands;

    hands.reserve(choose(deck.size(), static_cast<std::size_t>(n)));

    hand_t prefix;
    prefix.reserve(n);
    add_hands(deck, 0, n, prefix, hands);

    return hands;
}

candidate_space_t remove_hand(const candidate_space_t& space, const hand_t& hand)
{
    candidate_space_t out;
    out.reserve(space.size());
    std::remove_copy(space.begin(), space.end(), std::back_inserter(out), hand);
    return out;
}
