#include <algorithm>
#include "gtest/gtest.h"
#include "guesslib/guess_refiner.h"
#include "guesslib/initial_guess.h"
#include "guesslib/errors.h"

namespace
{
    candidate_space_t make_space(const std::vector<std::string>& hands)
    {
        candidate_space_t space;

        for (const auto& s : hands)
            space.push_back(string_to_hand(s));

        return space;
    }

    bool contains(const candidate_space_t& space, const hand_t& hand)
    {
        return std::find(space.begin(), space.end(), hand) != space.end();
    }
}

TEST(guess_refiner, filter)
{
    const auto space = make_space({"2C 3C", "2C 4C", "3C 4C", "2D 3D", "KS AS", "QH AH"});
    const auto guess = string_to_hand("2C 3C");
    const auto f = get_feedback(string_to_hand("3C 4C"), guess);

    EXPECT_EQ(make_space({"2C 4C", "3C 4C"}), filter_candidates(space, guess, f));

    // the guess itself never survives, even when the feedback says it was right
    EXPECT_TRUE(filter_candidates(space, guess, get_winning_feedback(2)).empty());
}

TEST(guess_refiner, expected_remaining)
{
    const auto space = make_space({"2C 3C", "2C 4C", "3C 4C", "2D 3D", "KS AS", "QH AH"});

    EXPECT_EQ(10u, get_group_size_square_sum(string_to_hand("2C 3C"), space));
    EXPECT_EQ(18u, get_group_size_square_sum(string_to_hand("KS AS"), space));
    EXPECT_DOUBLE_EQ(10.0 / 6, get_expected_remaining(string_to_hand("2D 3D"), space));
    EXPECT_DOUBLE_EQ(3.0, get_expected_remaining(string_to_hand("QH AH"), space));
    EXPECT_DOUBLE_EQ(0.0, get_expected_remaining(string_to_hand("QH AH"), candidate_space_t()));
}

TEST(guess_refiner, select_minimum_cost)
{
    // costs 18, 18, 10, 10, 10, 10: first of the cheapest wins
    const auto space = make_space({"KS AS", "QH AH", "2C 3C", "2C 4C", "3C 4C", "2D 3D"});
    EXPECT_EQ(2u, select_guess(space));

    // all costs equal
    EXPECT_EQ(0u, select_guess(make_space({"2C 3C", "2C 4C", "3C 4C", "2D 3D"})));
    EXPECT_EQ(0u, select_guess(make_space({"7H 9S"})));
}

TEST(guess_refiner, select_middle)
{
    const auto space = make_space({"2C 3C 4C", "2C 3C 5C", "2C 3C 6C", "2C 3C 7C", "2C 3C 8C"});

    EXPECT_EQ(2u, select_guess(space));
    EXPECT_EQ(1u, select_guess(make_space({"2C 3C 4C 5C", "2C 3C 4C 6C"})));
    EXPECT_EQ(0u, select_guess(make_space({"2C 3C 4C 5C"})));
}

TEST(guess_refiner, empty_space)
{
    EXPECT_THROW(select_guess(candidate_space_t()), empty_candidate_space);

    game_state state;
    state.guess = string_to_hand("2C 3C");
    state.candidates = make_space({"2C 4C", "KS AS"});

    // no candidate scores (0,0,0,0,0) against 2C 3C
    const feedback_t f = {0, 0, 0, 0, 0};
    EXPECT_THROW(next_guess(state, f), empty_candidate_space);
}

TEST(guess_refiner, size_mismatch)
{
    game_state state;
    state.guess = string_to_hand("2C 3C");
    state.candidates = make_space({"2C 4C", "KS AS QS"});

    EXPECT_THROW(next_guess(state, get_winning_feedback(2)), hand_size_mismatch);
}

TEST(guess_refiner, next_guess)
{
    const auto answer = string_to_hand("3C 4H");
    const auto state = initial_guess(2);
    const auto next = next_guess(state, get_feedback(answer, state.guess));

    // 15 candidates score (0,0,0,0,0) against 2D 6S
    EXPECT_EQ(string_to_hand("3C 4C"), next.guess);
    EXPECT_EQ(14u, next.candidates.size());
    EXPECT_TRUE(contains(next.candidates, answer));
    EXPECT_FALSE(contains(next.candidates, next.guess));
    EXPECT_EQ(1325u, state.candidates.size());

    const auto last = next_guess(next, get_feedback(answer, next.guess));

    EXPECT_EQ(answer, last.guess);
    EXPECT_EQ(1u, last.candidates.size());
}

TEST(guess_refiner, invariants)
{
    const auto answers = make_space({"4C 3H 2D", "AS KS QS", "7C 7D 7H", "2C TD AH"});

    for (const auto& answer : answers)
    {
        auto state = initial_guess(3);

        for (int round = 0; round < 20; ++round)
        {
            const auto f = get_feedback(answer, state.guess);

            if (is_correct(f, 3))
                break;

            const auto filtered = filter_candidates(state.candidates, state.guess, f);

            ASSERT_TRUE(contains(filtered, answer));

            const auto next = next_guess(state, f);

            EXPECT_LT(next.candidates.size(), state.candidates.size());
            EXPECT_EQ(filtered.size(), next.candidates.size() + 1);
            EXPECT_FALSE(contains(next.candidates, state.guess));
            EXPECT_FALSE(contains(next.candidates, next.guess));

            state = next;
        }

        EXPECT_EQ(answer, state.guess);
    }
}
