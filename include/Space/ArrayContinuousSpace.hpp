#pragma once

#ifndef SIMPLERL_SPACE_ARRAYCONTINUOUSSPACE_HPP
#define SIMPLERL_SPACE_ARRAYCONTINUOUSSPACE_HPP

#include<limits>
#include<vector>

#include"Space.hpp"

namespace SimpleRL
{
    /**
     * @class ArrayContinuousSpace
     * @brief Fixed-size vector of floats, each with its own (possibly infinite) bounds.
     */
    class ArrayContinuousSpace : public Space
    {
    public:
        explicit ArrayContinuousSpace(int64_t size,
                                      double low = -std::numeric_limits<double>::infinity(),
                                      double high = std::numeric_limits<double>::infinity(),
                                      int64_t divisionNum = 5);

        ArrayContinuousSpace(int64_t size,
                             const std::vector<double> &low,
                             const std::vector<double> &high,
                             int64_t divisionNum = 5);
    };
}

#endif //SIMPLERL_SPACE_ARRAYCONTINUOUSSPACE_HPP
