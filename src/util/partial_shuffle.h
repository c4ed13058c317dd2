#pragma once

#include <cstddef>
#include <random>
#include <utility>

// shuffles the last shuffle_count elements of container into uniformly random picks from the whole container
template<class T, class F>
void partial_shuffle(T& container, int shuffle_count, F& rand)
{
    typedef typename std::uniform_int_distribution<std::size_t> distr_t;
    typedef typename distr_t::param_type param_t;

    distr_t d;
    const std::size_t first = container.size() - static_cast<std::size_t>(shuffle_count);

    for (auto i = container.size(); i-- > first; )
        std::swap(container[i], container[d(rand, param_t(0, i))]);
}
