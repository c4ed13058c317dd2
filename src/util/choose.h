#pragma once

#include <cstddef>
#include <boost/math/special_functions/binomial.hpp>

// number of k-element subsets of an n-element set
inline std::size_t choose(const std::size_t n, const std::size_t k)
{
    if (n < k)
        return 0;

    const double x = boost::math::binomial_coefficient<double>(static_cast<unsigned>(n), static_cast<unsigned>(k));
    return static_cast<std::size_t>(x + 0.5);
}
