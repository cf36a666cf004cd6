#pragma once

#ifndef SIMPLERL_SPACE_DISCRETESPACE_HPP
#define SIMPLERL_SPACE_DISCRETESPACE_HPP

#include"Space.hpp"

namespace SimpleRL
{
    /**
     * @class DiscreteSpace
     * @brief Scalar integer in [start, start + n - 1]. Native values are 0-dim kLong tensors.
     */
    class DiscreteSpace : public Space
    {
    public:
        explicit DiscreteSpace(int64_t n, int64_t start = 0);

        /** @return number of values */
        int64_t getN() const;

        /** @return native value for `value` */
        static torch::Tensor value(int64_t value);
    };
}

#endif //SIMPLERL_SPACE_DISCRETESPACE_HPP
