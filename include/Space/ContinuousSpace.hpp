#pragma once

#ifndef SIMPLERL_SPACE_CONTINUOUSSPACE_HPP
#define SIMPLERL_SPACE_CONTINUOUSSPACE_HPP

#include<limits>

#include"Space.hpp"

namespace SimpleRL
{
    /**
     * @class ContinuousSpace
     * @brief Scalar float, unbounded by default. Native values are 0-dim kFloat tensors.
     */
    class ContinuousSpace : public Space
    {
    public:
        explicit ContinuousSpace(double low = -std::numeric_limits<double>::infinity(),
                                 double high = std::numeric_limits<double>::infinity(),
                                 int64_t divisionNum = 5);

        /** @return native value for `value` */
        static torch::Tensor value(float value);
    };
}

#endif //SIMPLERL_SPACE_CONTINUOUSSPACE_HPP
