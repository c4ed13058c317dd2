#include "feedback.h"
#include <algorithm>
#include <array>
#include <cassert>
#include <boost/format.hpp>
#include <boost/functional/hash.hpp>
#include "util/card.h"

namespace
{
    // size of the multiset intersection, each value counted min(count in a, count in b) times
    template<std::size_t N>
    int get_bag_intersection(const std::array<int, N>& a, const std::array<int, N>& b)
    {
        int count = 0;

        for (std::size_t i = 0; i < N; ++i)
            count += std::min(a[i], b[i]);

        return count;
    }
}

std::string feedback_t::to_string() const
{
    return (boost::format("(%d,%d,%d,%d,%d)") % correct_cards % lower_ranks % correct_ranks % higher_ranks
        % correct_suits).str();
}

bool operator==(const feedback_t& a, const feedback_t& b)
{
    return a.correct_cards == b.correct_cards
        && a.lower_ranks == b.lower_ranks
        && a.correct_ranks == b.correct_ranks
        && a.higher_ranks == b.higher_ranks
        && a.correct_suits == b.correct_suits;
}

bool operator!=(const feedback_t& a, const feedback_t& b)
{
    return !(a == b);
}

std::ostream& operator<<(std::ostream& os, const feedback_t& f)
{
    return os << f.to_string();
}

std::size_t hash_value(const feedback_t& f)
{
    std::size_t seed = 0;
    boost::hash_combine(seed, f.correct_cards);
    boost::hash_combine(seed, f.lower_ranks);
    boost::hash_combine(seed, f.correct_ranks);
    boost::hash_combine(seed, f.higher_ranks);
    boost::hash_combine(seed, f.correct_suits);
    return seed;
}

feedback_t get_feedback(const hand_t& reference, const hand_t& guess)
{
    assert(!guess.empty());

    std::array<int, RANKS> reference_ranks = {{}};
    std::array<int, RANKS> guess_ranks = {{}};
    std::array<int, SUITS> reference_suits = {{}};
    std::array<int, SUITS> guess_suits = {{}};
    int min_rank = RANKS;
    int max_rank = -1;

    for (const int card : guess)
    {
        const int rank = get_rank(card);
        ++guess_ranks[rank];
        ++guess_suits[get_suit(card)];
        min_rank = std::min(min_rank, rank);
        max_rank = std::max(max_rank, rank);
    }

    feedback_t f = {};

    for (const int card : reference)
    {
        const int rank = get_rank(card);
        ++reference_ranks[rank];
        ++reference_suits[get_suit(card)];

        if (std::find(guess.begin(), guess.end(), card) != guess.end())
            ++f.correct_cards;

        if (rank < min_rank)
            ++f.lower_ranks;
        else if (rank > max_rank)
            ++f.higher_ranks;
    }

    f.correct_ranks = get_bag_intersection(reference_ranks, guess_ranks);
    f.correct_suits = get_bag_intersection(reference_suits, guess_suits);

    return f;
}

feedback_t get_winning_feedback(const int hand_size)
{
    const feedback_t f = {hand_size, 0, hand_size, 0, hand_size};
    return f;
}

bool is_correct(const feedback_t& f, const int hand_size)
{
    return f.correct_cards == hand_size;
}
