#pragma once

#ifndef SIMPLERL_WORKER_PROCESSOR_HPP
#define SIMPLERL_WORKER_PROCESSOR_HPP

#include<memory>
#include<string>
#include<utility>

#include<torch/torch.h>

#include"../Define.hpp"
#include"../Space/Space.hpp"

namespace SimpleRL
{
    class EnvRun;

    /**
     * @class Processor
     * @brief Observation pre-processing step applied before Space conversion.
     *
     * Processors are stateless and chained in the order an RLConfig lists them.
     * Each one declares the space its output lives in, so the adapter can
     * validate the whole chain before the first episode.
     */
    class Processor
    {
    public:
        virtual ~Processor() = default;

        virtual std::string getName() const = 0;

        /** @return space and type of observations after processing */
        virtual std::pair<std::shared_ptr<const Space>, EnvObservationType>
        changeObservationInfo(const std::shared_ptr<const Space> &space, EnvObservationType type) const = 0;

        virtual torch::Tensor processObservation(const torch::Tensor &observation, const EnvRun &env) const = 0;
    };
}

#endif //SIMPLERL_WORKER_PROCESSOR_HPP
