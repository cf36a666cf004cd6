#include<sstream>

#include<doctest/doctest.h>

#include"../../include/Envs/Grid.hpp"
#include"../../include/Env/EnvRun.hpp"
#include"../../include/Errors.hpp"
#include"../../include/Space/ArrayDiscreteSpace.hpp"
#include"../../include/Space/DiscreteSpace.hpp"

namespace SimpleRL
{
    namespace
    {
        struct GridSnapshot
        {
            int64_t x = 0;
            int64_t y = 0;
            float moveProbability = 0;
            std::string engine;
            MSGPACK_DEFINE_MAP(x, y, moveProbability, engine);
        };

        const int64_t moveX[] = {-1, 0, 1, 0};
        const int64_t moveY[] = {0, 1, 0, -1};

        const int64_t goalX = 3, goalY = 0;
        const int64_t holeX = 3, holeY = 1;
        const int64_t cellPixels = 16;
    }

    Grid::Grid(float moveProbability) : moveProbability(moveProbability)
    {
        if (moveProbability < 0.0f || moveProbability > 1.0f)
        {
            throw std::invalid_argument("Grid moveProbability must be within [0, 1]");
        }
    }

    std::string Grid::getName() const
    {
        return "Grid";
    }

    std::shared_ptr<const Space> Grid::actionSpace() const
    {
        return std::make_shared<DiscreteSpace>(4);
    }

    std::shared_ptr<const Space> Grid::observationSpace() const
    {
        return std::make_shared<ArrayDiscreteSpace>(2,
                                                    std::vector<int64_t>{0, 0},
                                                    std::vector<int64_t>{width - 1, height - 1});
    }

    EnvObservationType Grid::observationType() const
    {
        return EnvObservationType::DISCRETE;
    }

    int64_t Grid::maxEpisodeSteps() const
    {
        return 50;
    }

    bool Grid::isWall(int64_t cellX, int64_t cellY) const
    {
        return cellX == 1 && cellY == 1;
    }

    torch::Tensor Grid::observation() const
    {
        return torch::tensor(std::vector<int64_t>{x, y}, torch::TensorOptions().dtype(torch::kLong));
    }

    torch::Tensor Grid::reset()
    {
        x = 0;
        y = 2;
        return observation();
    }

    EnvStep Grid::step(const torch::Tensor &action, int playerIndex)
    {
        auto direction = action.item<int64_t>();

        const double roll = std::uniform_real_distribution<double>(0.0, 1.0)(engine);
        if (roll >= moveProbability)
        {
            // slip sideways, half of the remaining probability each way
            const double slip = (roll - moveProbability) / (1.0 - moveProbability);
            direction = (direction + (slip < 0.5 ? 1 : 3)) % 4;
        }

        const auto nextX = x + moveX[direction];
        const auto nextY = y + moveY[direction];
        if (nextX >= 0 && nextX < width && nextY >= 0 && nextY < height && !isWall(nextX, nextY))
        {
            x = nextX;
            y = nextY;
        }

        EnvStep result;
        result.observation = observation();
        if (x == goalX && y == goalY)
        {
            result.rewards = {1.0f};
            result.done = true;
        }
        else if (x == holeX && y == holeY)
        {
            result.rewards = {-1.0f};
            result.done = true;
        }
        else
        {
            result.rewards = {-0.04f};
        }
        return result;
    }

    Blob Grid::backup() const
    {
        std::ostringstream engineState;
        engineState << engine;

        GridSnapshot snapshot;
        snapshot.x = x;
        snapshot.y = y;
        snapshot.moveProbability = moveProbability;
        snapshot.engine = engineState.str();
        return packBlob("Grid", blobVersion, snapshot);
    }

    void Grid::restore(const Blob &blob)
    {
        auto snapshot = unpackBlob<GridSnapshot>(blob, "Grid", blobVersion);
        if (snapshot.x < 0 || snapshot.x >= width || snapshot.y < 0 || snapshot.y >= height)
        {
            throw IncompatibleRestoreError("Grid snapshot position is off the board");
        }

        std::mt19937 restoredEngine;
        std::istringstream engineState(snapshot.engine);
        engineState >> restoredEngine;
        if (!engineState)
        {
            throw IncompatibleRestoreError("Grid snapshot has a corrupted random state");
        }

        x = snapshot.x;
        y = snapshot.y;
        moveProbability = snapshot.moveProbability;
        engine = restoredEngine;
    }

    void Grid::renderTerminal(std::ostream &os) const
    {
        for (int64_t row = 0; row < height; ++row)
        {
            for (int64_t column = 0; column < width; ++column)
            {
                char cell = '.';
                if (column == x && row == y)
                {
                    cell = 'P';
                }
                else if (column == goalX && row == goalY)
                {
                    cell = 'G';
                }
                else if (column == holeX && row == holeY)
                {
                    cell = 'X';
                }
                else if (isWall(column, row))
                {
                    cell = '#';
                }
                os << cell;
            }
            os << '\n';
        }
    }

    torch::Tensor Grid::renderRgbArray() const
    {
        auto image = torch::full({height * cellPixels, width * cellPixels, 3}, 255, torch::kByte);
        auto paint = [&](int64_t column, int64_t row, std::vector<int64_t> color) {
            using torch::indexing::Slice;
            image.index_put_({Slice(row * cellPixels, (row + 1) * cellPixels),
                              Slice(column * cellPixels, (column + 1) * cellPixels)},
                             torch::tensor(color, torch::kByte));
        };
        paint(goalX, goalY, {0, 200, 0});
        paint(holeX, holeY, {200, 0, 0});
        paint(1, 1, {64, 64, 64});
        paint(x, y, {0, 0, 200});
        return image;
    }

    void Grid::setSeed(int64_t seed)
    {
        engine.seed(static_cast<std::mt19937::result_type>(seed));
    }

    TEST_CASE("Grid")
    {
        SUBCASE("Deterministic moves reach the goal")
        {
            EnvRun run(std::make_unique<Grid>(1.0f));
            run.reset();
            for (int64_t action : {3, 3, 2, 2, 2})
            {
                run.step(DiscreteSpace::value(action), 0);
            }
            CHECK(run.isDone());
            CHECK(run.getEpisodeRewards()[0] == doctest::Approx(1.0 - 4 * 0.04));
        }

        SUBCASE("Walls block movement")
        {
            EnvRun run(std::make_unique<Grid>(1.0f));
            run.reset();
            run.step(DiscreteSpace::value(2), 0);
            run.step(DiscreteSpace::value(3), 0);
            CHECK(torch::equal(run.getState(), torch::tensor(std::vector<int64_t>{1, 2})));
        }

        SUBCASE("Restored runs replay the same slips")
        {
            auto grid = std::make_unique<Grid>(0.5f);
            grid->setSeed(7);
            EnvRun run(std::move(grid));
            run.reset();
            run.step(DiscreteSpace::value(3), 0);

            auto blob = run.backup();
            EnvRun copy(std::make_unique<Grid>());
            copy.restore(blob);

            for (int i = 0; i < 20 && !run.isDone(); ++i)
            {
                auto action = DiscreteSpace::value(i % 4);
                auto original = run.step(action, 0);
                auto restored = copy.step(action, 0);
                CHECK(torch::equal(original.observation, restored.observation));
                CHECK(original.rewards == restored.rewards);
                CHECK(original.done == restored.done);
            }
        }

        SUBCASE("Timeout after fifty steps")
        {
            EnvRun run(std::make_unique<Grid>(1.0f));
            run.reset();
            for (int i = 0; i < 50; ++i)
            {
                run.step(DiscreteSpace::value(0), 0);
            }
            CHECK(run.isDone());
            CHECK(run.getDoneReason() == "timeout");
        }

        SUBCASE("Rendering does not move the player")
        {
            EnvRun run(std::make_unique<Grid>());
            run.reset();
            std::ostringstream os;
            run.renderTerminal(os);
            CHECK(os.str() == "...G\n.#.X\nP...\n");
            CHECK(run.renderRgbArray().sizes().vec() == std::vector<int64_t>{48, 64, 3});
            CHECK(torch::equal(run.getState(), torch::tensor(std::vector<int64_t>{0, 2})));
        }
    }
}
