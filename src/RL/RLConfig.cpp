#include<cmath>

#include<fmt/format.h>
#include<fmt/ranges.h>
#include<doctest/doctest.h>

#include"../../include/RL/RLConfig.hpp"

namespace SimpleRL
{
    RLConfig::RLConfig(std::string name,
                       RLActionType actionType,
                       RLObservationType observationType,
                       std::map<std::string, double> hyperParameters,
                       std::vector<std::string> processors) :
    name(std::move(name)),
    actionType(actionType),
    observationType(observationType),
    hyperParameters(std::move(hyperParameters)),
    processors(std::move(processors))
    {
    }

    double RLConfig::get(const std::string &key) const
    {
        auto found = hyperParameters.find(key);
        if (found == hyperParameters.end())
        {
            throw std::invalid_argument(name + " has no hyperparameter '" + key + "'");
        }
        return found->second;
    }

    int64_t RLConfig::getInt(const std::string &key) const
    {
        return static_cast<int64_t>(std::llround(get(key)));
    }

    RLConfig RLConfig::withHyperParameter(const std::string &key, double value) const
    {
        RLConfig copy = *this;
        copy.hyperParameters[key] = value;
        return copy;
    }

    RLConfig RLConfig::withProcessors(std::vector<std::string> processors) const
    {
        RLConfig copy = *this;
        copy.processors = std::move(processors);
        return copy;
    }

    std::string RLConfig::toString() const
    {
        std::vector<std::string> entries;
        for (const auto &entry : hyperParameters)
        {
            entries.push_back(fmt::format("{}={}", entry.first, entry.second));
        }
        return fmt::format("{}(action={}, observation={}, {}{})",
                           name,
                           SimpleRL::toString(actionType),
                           SimpleRL::toString(observationType),
                           fmt::join(entries, ", "),
                           processors.empty() ? "" : fmt::format(", processors=[{}]", fmt::join(processors, ", ")));
    }

    bool RLConfig::operator==(const RLConfig &other) const
    {
        return name == other.name &&
               actionType == other.actionType &&
               observationType == other.observationType &&
               hyperParameters == other.hyperParameters &&
               processors == other.processors;
    }

    TEST_CASE("RLConfig")
    {
        RLConfig config("QL", RLActionType::DISCRETE, RLObservationType::DISCRETE, {{"gamma", 0.9}, {"batchSize", 4}});

        SUBCASE("Copies instead of mutating")
        {
            auto tuned = config.withHyperParameter("gamma", 0.5);
            CHECK(config.get("gamma") == doctest::Approx(0.9));
            CHECK(tuned.get("gamma") == doctest::Approx(0.5));
            CHECK_FALSE(tuned == config);
            CHECK(config.getInt("batchSize") == 4);
        }

        SUBCASE("Unknown keys are errors")
        {
            CHECK_THROWS_AS(config.get("epsilon"), std::invalid_argument);
        }

        SUBCASE("Survives msgpack")
        {
            msgpack::sbuffer buffer;
            msgpack::pack(buffer, config.withProcessors({"layer"}));
            RLConfig decoded;
            msgpack::unpack(buffer.data(), buffer.size()).get().convert(decoded);
            CHECK(decoded == config.withProcessors({"layer"}));
            CHECK(decoded.getActionType() == RLActionType::DISCRETE);
        }
    }
}
