#pragma once

#ifndef SIMPLERL_ENVS_GRID_HPP
#define SIMPLERL_ENVS_GRID_HPP

#include<random>

#include"../Env/EnvBase.hpp"

namespace SimpleRL
{
    /**
     * @class Grid
     * @brief 4x3 single-player grid world with slippery moves.
     *
     * ```
     * y=0  .  .  .  G     G: +1, episode ends
     * y=1  .  #  .  X     X: -1, episode ends
     * y=2  S  .  .  .     #: wall, S: start
     * ```
     *
     * Every other step costs 0.04. A move goes where it was told with
     * `moveProbability`, otherwise it slips to one of the two perpendicular
     * directions. Moving into a wall or the border stays in place.
     *
     * Actions: 0 left, 1 down, 2 right, 3 up. Observation: (x, y).
     */
    class Grid : public EnvBase
    {
    private:
        static constexpr int64_t width = 4;
        static constexpr int64_t height = 3;

        float moveProbability;
        int64_t x = 0;
        int64_t y = 2;
        std::mt19937 engine;

        bool isWall(int64_t cellX, int64_t cellY) const;

        torch::Tensor observation() const;

    public:
        static constexpr uint32_t blobVersion = 1;

        explicit Grid(float moveProbability = 0.8f);

        std::string getName() const override;

        std::shared_ptr<const Space> actionSpace() const override;

        std::shared_ptr<const Space> observationSpace() const override;

        EnvObservationType observationType() const override;

        int64_t maxEpisodeSteps() const override;

        torch::Tensor reset() override;

        EnvStep step(const torch::Tensor &action, int playerIndex) override;

        Blob backup() const override;

        void restore(const Blob &blob) override;

        void renderTerminal(std::ostream &os) const override;

        torch::Tensor renderRgbArray() const override;

        void setSeed(int64_t seed) override;
    };
}

#endif //SIMPLERL_ENVS_GRID_HPP
