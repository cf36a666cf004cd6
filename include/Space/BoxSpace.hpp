#pragma once

#ifndef SIMPLERL_SPACE_BOXSPACE_HPP
#define SIMPLERL_SPACE_BOXSPACE_HPP

#include<vector>

#include"Space.hpp"

namespace SimpleRL
{
    /**
     * @class BoxSpace
     * @brief N-dimensional bounded region, e.g. an image or a board.
     *
     * A Box is continuous unless `discrete` is set, in which case it holds integers
     * (Othello's board is a discrete Box in [-1, 1]).
     */
    class BoxSpace : public Space
    {
    public:
        BoxSpace(const std::vector<int64_t> &shape,
                 double low,
                 double high,
                 bool discrete = false,
                 int64_t divisionNum = 5);

        /** @param low,high `shape`-shaped bound tensors */
        BoxSpace(const std::vector<int64_t> &shape,
                 const torch::Tensor &low,
                 const torch::Tensor &high,
                 bool discrete = false,
                 int64_t divisionNum = 5);
    };
}

#endif //SIMPLERL_SPACE_BOXSPACE_HPP
