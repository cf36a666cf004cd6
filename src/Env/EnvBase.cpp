#include<stdexcept>

#include"../../include/Env/EnvBase.hpp"

namespace SimpleRL
{
    std::shared_ptr<WorkerBase> EnvBase::makeWorker(const std::string &name) const
    {
        throw std::invalid_argument(getName() + " provides no worker named '" + name + "'");
    }

    std::shared_ptr<const Processor> EnvBase::makeProcessor(const std::string &name) const
    {
        throw std::invalid_argument(getName() + " provides no processor named '" + name + "'");
    }
}
