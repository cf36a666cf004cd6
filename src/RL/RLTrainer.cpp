#include"../../include/RL/RLTrainer.hpp"

namespace SimpleRL
{
    RLTrainer::RLTrainer(RLConfig config, std::shared_ptr<RLParameter> parameter, std::shared_ptr<RLRemoteMemory> memory) :
    config(std::move(config)),
    parameter(std::move(parameter)),
    memory(std::move(memory))
    {
        if (!this->parameter || !this->memory)
        {
            throw std::invalid_argument(this->config.getName() + " trainer needs a parameter and a memory");
        }
    }

    std::vector<UpdateDatum> RLTrainer::train()
    {
        auto data = update();
        ++trainCount;
        return data;
    }
}
