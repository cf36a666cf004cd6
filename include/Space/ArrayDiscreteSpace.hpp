#pragma once

#ifndef SIMPLERL_SPACE_ARRAYDISCRETESPACE_HPP
#define SIMPLERL_SPACE_ARRAYDISCRETESPACE_HPP

#include<vector>

#include"Space.hpp"

namespace SimpleRL
{
    /**
     * @class ArrayDiscreteSpace
     * @brief Fixed-size vector of integers, each with its own [low, high].
     */
    class ArrayDiscreteSpace : public Space
    {
    public:
        ArrayDiscreteSpace(int64_t size, int64_t low, int64_t high);

        ArrayDiscreteSpace(int64_t size, const std::vector<int64_t> &low, const std::vector<int64_t> &high);
    };
}

#endif //SIMPLERL_SPACE_ARRAYDISCRETESPACE_HPP
