#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

class invalid_hand_size : public std::invalid_argument
{
public:
    explicit invalid_hand_size(int size)
        : std::invalid_argument("invalid hand size: " + std::to_string(size) + " (expected 2-4 cards)")
        , size_(size)
    {
    }

    int get_size() const { return size_; }

private:
    int size_;
};

class invalid_selection : public std::invalid_argument
{
public:
    explicit invalid_selection(const std::string& what)
        : std::invalid_argument(what)
    {
    }
};

class hand_size_mismatch : public std::runtime_error
{
public:
    hand_size_mismatch(std::size_t expected, std::size_t actual)
        : std::runtime_error("hand size mismatch: expected " + std::to_string(expected) + " cards, got "
            + std::to_string(actual))
    {
    }
};

// the consistency filter removed every candidate; feedback must have been dishonest
class empty_candidate_space : public std::logic_error
{
public:
    empty_candidate_space()
        : std::logic_error("no candidate hand is consistent with the feedback received")
    {
    }
};

class guess_limit_exceeded : public std::runtime_error
{
public:
    explicit guess_limit_exceeded(int limit)
        : std::runtime_error("answer not found within " + std::to_string(limit) + " guesses")
    {
    }
};
