#pragma once

#ifndef SIMPLERL_ENVS_OTHELLO_HPP
#define SIMPLERL_ENVS_OTHELLO_HPP

#include<vector>

#include"../Env/EnvBase.hpp"

namespace SimpleRL
{
    /**
     * @class Othello
     * @brief Two-player Othello (Reversi) on a `width` x `height` board.
     *
     * Player 0 plays the stones marked 1 ("o"), player 1 the stones marked -1 ("x").
     * The board is the observation, flattened row-major. An action is the flat
     * cell index. A player without a legal move passes, and the game ends when
     * neither player can move; the winner gets +1, the loser -1, a draw 0.
     *
     * Shipped extras: worker "cpu" (shallow negamax) and processor "layer"
     * (two binary planes, own stones and enemy stones, for convolutional models).
     */
    class Othello : public EnvBase
    {
    private:
        int64_t width;
        int64_t height;
        std::vector<int> board;
        int playerIndex = 0;
        int64_t lastAction = -1;

        int64_t flipCount(int64_t x, int64_t y, int color, int64_t dx, int64_t dy) const;

        torch::Tensor observation() const;

    public:
        static constexpr uint32_t blobVersion = 1;

        /** @throws std::invalid_argument unless both sides are even and at least 4 */
        Othello(int64_t width = 8, int64_t height = 8);

        inline int64_t getWidth() const
        {
            return width;
        }

        inline int64_t getHeight() const
        {
            return height;
        }

        inline const std::vector<int> &getBoard() const
        {
            return board;
        }

        /** @return 1 for player 0, -1 for player 1 */
        static int playerColor(int playerIndex);

        /** @return cells where `playerIndex` flips at least one stone, ascending */
        std::vector<int64_t> legalMoves(int playerIndex) const;

        int64_t countStones(int color) const;

        std::string getName() const override;

        std::shared_ptr<const Space> actionSpace() const override;

        std::shared_ptr<const Space> observationSpace() const override;

        EnvObservationType observationType() const override;

        int64_t maxEpisodeSteps() const override;

        int playerNum() const override;

        TurnOrder turnOrder() const override;

        int currentPlayerIndex() const override;

        torch::Tensor reset() override;

        EnvStep step(const torch::Tensor &action, int playerIndex) override;

        std::vector<int64_t> getInvalidActions(int playerIndex) const override;

        Blob backup() const override;

        void restore(const Blob &blob) override;

        void renderTerminal(std::ostream &os) const override;

        torch::Tensor renderRgbArray() const override;

        std::shared_ptr<WorkerBase> makeWorker(const std::string &name) const override;

        std::shared_ptr<const Processor> makeProcessor(const std::string &name) const override;
    };
}

#endif //SIMPLERL_ENVS_OTHELLO_HPP
