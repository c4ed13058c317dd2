#include "guess_refiner.h"
#include <unordered_map>
#include <utility>
#include <vector>
#include <boost/functional/hash.hpp>
#include <boost/log/trivial.hpp>
#include "errors.h"

candidate_space_t filter_candidates(const candidate_space_t& candidates, const hand_t& guess, const feedback_t& f)
{
    candidate_space_t out;

    for (const auto& c : candidates)
    {
        if (c != guess && get_feedback(c, guess) == f)
            out.push_back(c);
    }

    return out;
}

std::uint64_t get_group_size_square_sum(const hand_t& guess, const candidate_space_t& candidates)
{
    std::unordered_map<feedback_t, std::uint64_t, boost::hash<feedback_t>> groups;

    for (const auto& c : candidates)
        ++groups[get_feedback(c, guess)];

    std::uint64_t sum = 0;

    for (const auto& group : groups)
        sum += group.second * group.second;

    return sum;
}

double get_expected_remaining(const hand_t& guess, const candidate_space_t& candidates)
{
    if (candidates.empty())
        return 0;

    return double(get_group_size_square_sum(guess, candidates)) / candidates.size();
}

std::size_t select_guess(const candidate_space_t& candidates)
{
    if (candidates.empty())
        throw empty_candidate_space();

    const auto hand_size = candidates.front().size();

    if (hand_size != 2)
        return candidates.size() / 2;

    // all costs share the denominator so comparing the square sums is enough
    std::vector<std::uint64_t> costs(candidates.size());

#pragma omp parallel for
    for (std::int64_t i = 0; i < std::int64_t(candidates.size()); ++i)
        costs[i] = get_group_size_square_sum(candidates[i], candidates);

    std::size_t best = 0;

    for (std::size_t i = 1; i < costs.size(); ++i)
    {
        if (costs[i] < costs[best])
            best = i;
    }

    BOOST_LOG_TRIVIAL(debug) << "Best guess " << get_hand_string(candidates[best]) << " expects "
        << double(costs[best]) / candidates.size() << " remaining candidates";

    return best;
}

game_state next_guess(const game_state& state, const feedback_t& f)
{
    for (const auto& c : state.candidates)
    {
        if (c.size() != state.guess.size())
            throw hand_size_mismatch(state.guess.size(), c.size());
    }

    auto filtered = filter_candidates(state.candidates, state.guess, f);

    BOOST_LOG_TRIVIAL(debug) << "Feedback " << f << " for " << get_hand_string(state.guess) << " leaves "
        << filtered.size() << "/" << state.candidates.size() << " candidates";

    const auto index = select_guess(filtered);

    game_state next;
    next.guess = filtered[index];
    filtered.erase(filtered.begin() + index);
    next.candidates = std::move(filtered);

    return next;
}
