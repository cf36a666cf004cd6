#include<spdlog/spdlog.h>

#include"../../include/Errors.hpp"
#include"../../include/RL/RLParameter.hpp"

namespace SimpleRL
{
    void RLParameter::save(const std::string &path) const
    {
        writeBlobFile(path, backup());
        spdlog::info("Saved {} parameter to {}", config.getName(), path);
    }

    void RLParameter::load(const std::string &path)
    {
        restore(readBlobFile(path));
        spdlog::info("Loaded {} parameter from {}", config.getName(), path);
    }

    void checkSnapshotSpaces(const RLSpaces &expected, const RLSpacesDescriptor &snapshot, const std::string &typeTag)
    {
        try
        {
            expected.checkCompatible(RLSpaces::fromDescriptor(snapshot));
        }
        catch (const std::exception &e)
        {
            throw IncompatibleRestoreError(typeTag + " snapshot was taken for other spaces: " + e.what());
        }
    }
}
