#include<algorithm>
#include<chrono>
#include<map>
#include<sstream>

#include<doctest/doctest.h>
#include<fmt/format.h>
#include<fmt/ranges.h>
#include<spdlog/spdlog.h>

#include"../../include/Envs/Othello.hpp"
#include"../../include/Env/EnvRun.hpp"
#include"../../include/Errors.hpp"
#include"../../include/Runner/Episode.hpp"
#include"../../include/Space/BoxSpace.hpp"
#include"../../include/Space/DiscreteSpace.hpp"
#include"../../include/Worker/Processor.hpp"
#include"../../include/Worker/RuleBaseWorker.hpp"
#include"../../include/Worker/WorkerRun.hpp"

namespace SimpleRL
{
    namespace
    {
        struct OthelloSnapshot
        {
            int64_t width = 0;
            int64_t height = 0;
            std::vector<int> board;
            int playerIndex = 0;
            int64_t lastAction = -1;
            MSGPACK_DEFINE_MAP(width, height, board, playerIndex, lastAction);
        };

        const int64_t directionX[] = {-1, 0, 1, 1, 1, 0, -1, -1};
        const int64_t directionY[] = {1, 1, 1, 0, -1, -1, -1, 0};

        const int64_t cellPixels = 24;

        const std::vector<int> evals8x8 = {
            30, -12, 0, -1, -1, 0, -12, 30,
            -12, -15, -3, -3, -3, -3, -15, -12,
            0, -3, 0, -1, -1, 0, -3, 0,
            -1, -3, -1, -1, -1, -1, -3, -1,
            -1, -3, -1, -1, -1, -1, -3, -1,
            0, -3, 0, -1, -1, 0, -3, 0,
            -12, -15, -3, -3, -3, -3, -15, -12,
            30, -12, 0, -1, -1, 0, -12, 30,
        };

        const std::vector<int> evals6x6 = {
            30, -12, 0, 0, -12, 30,
            -12, -15, -3, -3, -15, -12,
            0, -3, 0, 0, -3, 0,
            0, -3, 0, 0, -3, 0,
            -12, -15, -3, -3, -15, -12,
            30, -12, 0, 0, -12, 30,
        };

        const float unreachableScore = -999.0f;

        /**
         * @class OthelloCpu
         * @brief Negamax opponent with a positional evaluation table.
         *
         * Searches `maxDepth + 2` plies. Terminal positions score the game result
         * times 500, leaf positions the weighted stone difference. Ties between
         * equally scored moves are broken at random.
         */
        class OthelloCpu : public WorkerBase
        {
        private:
            int maxDepth;
            std::map<std::string, std::vector<float>> cache;
            std::vector<float> lastScores;
            int64_t lastSearchCount = 0;
            double lastSearchSeconds = 0;

            static float evaluate(const Othello &othello)
            {
                const std::vector<int> *table = nullptr;
                if (othello.getWidth() == 8 && othello.getHeight() == 8)
                {
                    table = &evals8x8;
                }
                else if (othello.getWidth() == 6 && othello.getHeight() == 6)
                {
                    table = &evals6x6;
                }
                if (table == nullptr)
                {
                    return 0.0f;
                }

                float score = 0;
                const auto &board = othello.getBoard();
                for (size_t i = 0; i < board.size(); ++i)
                {
                    score += static_cast<float>((*table)[i] * board[i]);
                }
                return score;
            }

            std::vector<float> negamax(const Othello &othello, int depth)
            {
                const int player = othello.currentPlayerIndex();
                const std::string key = fmt::format("{}:{}:{}", player, depth, fmt::join(othello.getBoard(), ","));
                auto found = cache.find(key);
                if (found != cache.end())
                {
                    return found->second;
                }
                ++lastSearchCount;

                std::vector<float> scores(othello.getBoard().size(), unreachableScore);
                for (int64_t action : othello.legalMoves(player))
                {
                    Othello next = othello;
                    auto result = next.step(DiscreteSpace::value(action), player);
                    if (result.done)
                    {
                        scores[action] = result.rewards[player] * 500.0f;
                    }
                    else if (depth > maxDepth)
                    {
                        const float score = evaluate(next);
                        scores[action] = player == 0 ? score : -score;
                    }
                    else
                    {
                        auto nextScores = negamax(next, depth + 1);
                        const float best = *std::max_element(nextScores.begin(), nextScores.end());
                        scores[action] = next.currentPlayerIndex() != player ? -best : best;
                    }
                }

                cache.emplace(key, scores);
                return scores;
            }

            static const Othello &othelloOf(const EnvRun &env)
            {
                const auto *othello = dynamic_cast<const Othello *>(&env.getEnv());
                if (othello == nullptr)
                {
                    throw std::invalid_argument("The Othello cpu worker cannot play " + env.getName());
                }
                return *othello;
            }

        public:
            explicit OthelloCpu(int maxDepth = 2) : maxDepth(maxDepth)
            {
            }

            void onReset(const EnvRun &env, const WorkerRun &run) override
            {
                othelloOf(env);
                lastScores.clear();
            }

            torch::Tensor policy(const EnvRun &env, const WorkerRun &run) override
            {
                const auto &othello = othelloOf(env);
                const auto start = std::chrono::steady_clock::now();
                cache.clear();
                lastSearchCount = 0;
                lastScores = negamax(othello, 0);
                lastSearchSeconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

                const float best = *std::max_element(lastScores.begin(), lastScores.end());
                std::vector<int64_t> candidates;
                for (size_t i = 0; i < lastScores.size(); ++i)
                {
                    if (lastScores[i] == best)
                    {
                        candidates.push_back(static_cast<int64_t>(i));
                    }
                }
                const auto pick = torch::randint(static_cast<int64_t>(candidates.size()), {1}).item<int64_t>();
                spdlog::debug("Othello cpu searched {} positions in {:.3f}s", lastSearchCount, lastSearchSeconds);
                return DiscreteSpace::value(candidates[pick]);
            }

            InfoMap onStep(const EnvRun &env, const WorkerRun &run) override
            {
                return {{"search_count", static_cast<float>(lastSearchCount)}};
            }

            void renderTerminal(const EnvRun &env, const WorkerRun &run, std::ostream &os) const override
            {
                if (lastScores.empty())
                {
                    return;
                }
                const auto &othello = othelloOf(env);
                os << fmt::format("- MinMax count: {}, {:.3f}s -\n", lastSearchCount, lastSearchSeconds);
                for (int64_t y = 0; y < othello.getHeight(); ++y)
                {
                    std::string line = "|";
                    for (int64_t x = 0; x < othello.getWidth(); ++x)
                    {
                        const float score = lastScores[y * othello.getWidth() + x];
                        line += score == unreachableScore ? std::string(6, ' ') + "|" : fmt::format("{:6.1f}|", score);
                    }
                    os << line << "\n";
                }
            }
        };

        /**
         * @class LayerProcessor
         * @brief Splits the flat board into an own-stones plane and an enemy-stones plane.
         *
         * "Own" is relative to the player about to move, so one model can play both sides.
         */
        class LayerProcessor : public Processor
        {
        private:
            int64_t width;
            int64_t height;

        public:
            LayerProcessor(int64_t width, int64_t height) : width(width), height(height)
            {
            }

            std::string getName() const override
            {
                return "layer";
            }

            std::pair<std::shared_ptr<const Space>, EnvObservationType>
            changeObservationInfo(const std::shared_ptr<const Space> &space, EnvObservationType type) const override
            {
                if (space->numel() != width * height)
                {
                    throw ShapeMismatchError(fmt::format("Layer processor expects a board of {} cells, got {}",
                                                         width * height, space->toString()));
                }
                return {std::make_shared<BoxSpace>(std::vector<int64_t>{2, height, width}, 0.0, 1.0),
                        EnvObservationType::SHAPE3};
            }

            torch::Tensor processObservation(const torch::Tensor &observation, const EnvRun &env) const override
            {
                const int color = Othello::playerColor(env.getPlayerIndex());
                auto board = observation.reshape({height, width});
                return torch::stack({(board == color).to(torch::kFloat), (board == -color).to(torch::kFloat)});
            }
        };
    }

    Othello::Othello(int64_t width, int64_t height) :
    width(width),
    height(height),
    board(static_cast<size_t>(width * height), 0)
    {
        if (width < 4 || height < 4 || width % 2 != 0 || height % 2 != 0)
        {
            throw std::invalid_argument(fmt::format("Othello board must have even sides of at least 4, got {}x{}",
                                                    width, height));
        }
    }

    int Othello::playerColor(int playerIndex)
    {
        return playerIndex == 0 ? 1 : -1;
    }

    int64_t Othello::flipCount(int64_t x, int64_t y, int color, int64_t dx, int64_t dy) const
    {
        int64_t count = 0;
        x += dx;
        y += dy;
        while (x >= 0 && x < width && y >= 0 && y < height)
        {
            const int cell = board[y * width + x];
            if (cell == color)
            {
                return count;
            }
            if (cell == 0)
            {
                return 0;
            }
            ++count;
            x += dx;
            y += dy;
        }
        return 0;
    }

    std::vector<int64_t> Othello::legalMoves(int playerIndex) const
    {
        const int color = playerColor(playerIndex);
        std::vector<int64_t> moves;
        for (int64_t y = 0; y < height; ++y)
        {
            for (int64_t x = 0; x < width; ++x)
            {
                if (board[y * width + x] != 0)
                {
                    continue;
                }
                for (int direction = 0; direction < 8; ++direction)
                {
                    if (flipCount(x, y, color, directionX[direction], directionY[direction]) > 0)
                    {
                        moves.push_back(y * width + x);
                        break;
                    }
                }
            }
        }
        return moves;
    }

    int64_t Othello::countStones(int color) const
    {
        return std::count(board.begin(), board.end(), color);
    }

    torch::Tensor Othello::observation() const
    {
        return torch::tensor(std::vector<int64_t>(board.begin(), board.end()));
    }

    std::string Othello::getName() const
    {
        if (width == 6 && height == 6)
        {
            return "Othello6x6";
        }
        if (width == 8 && height == 8)
        {
            return "Othello";
        }
        return fmt::format("Othello{}x{}", width, height);
    }

    std::shared_ptr<const Space> Othello::actionSpace() const
    {
        return std::make_shared<DiscreteSpace>(width * height);
    }

    std::shared_ptr<const Space> Othello::observationSpace() const
    {
        return std::make_shared<BoxSpace>(std::vector<int64_t>{width * height}, -1.0, 1.0, true);
    }

    EnvObservationType Othello::observationType() const
    {
        return EnvObservationType::DISCRETE;
    }

    int64_t Othello::maxEpisodeSteps() const
    {
        return width * height;
    }

    int Othello::playerNum() const
    {
        return 2;
    }

    TurnOrder Othello::turnOrder() const
    {
        return TurnOrder::ENVIRONMENT_DECLARED;
    }

    int Othello::currentPlayerIndex() const
    {
        return playerIndex;
    }

    torch::Tensor Othello::reset()
    {
        std::fill(board.begin(), board.end(), 0);
        const int64_t centerX = width / 2 - 1;
        const int64_t centerY = height / 2 - 1;
        board[centerY * width + centerX] = 1;
        board[(centerY + 1) * width + centerX + 1] = 1;
        board[centerY * width + centerX + 1] = -1;
        board[(centerY + 1) * width + centerX] = -1;
        playerIndex = 0;
        lastAction = -1;
        return observation();
    }

    EnvStep Othello::step(const torch::Tensor &action, int player)
    {
        const int64_t cell = action.item<int64_t>();
        const int64_t x = cell % width;
        const int64_t y = cell / width;
        const int color = playerColor(player);

        for (int direction = 0; direction < 8; ++direction)
        {
            const int64_t flips = flipCount(x, y, color, directionX[direction], directionY[direction]);
            for (int64_t i = 1; i <= flips; ++i)
            {
                board[(y + i * directionY[direction]) * width + x + i * directionX[direction]] = color;
            }
        }
        board[cell] = color;
        lastAction = cell;

        EnvStep result;
        result.rewards = {0.0f, 0.0f};

        const int enemy = 1 - player;
        const bool enemyCanMove = !legalMoves(enemy).empty();
        if (!enemyCanMove && legalMoves(player).empty())
        {
            const auto p1 = countStones(1);
            const auto p2 = countStones(-1);
            if (p1 > p2)
            {
                result.rewards = {1.0f, -1.0f};
            }
            else if (p1 < p2)
            {
                result.rewards = {-1.0f, 1.0f};
            }
            result.done = true;
            result.info = {{"P1", static_cast<float>(p1)}, {"P2", static_cast<float>(p2)}};
        }
        else if (enemyCanMove)
        {
            playerIndex = enemy;
        }

        result.observation = observation();
        return result;
    }

    std::vector<int64_t> Othello::getInvalidActions(int playerIndex) const
    {
        const auto legal = legalMoves(playerIndex);
        std::vector<int64_t> invalid;
        size_t next = 0;
        for (int64_t cell = 0; cell < width * height; ++cell)
        {
            if (next < legal.size() && legal[next] == cell)
            {
                ++next;
                continue;
            }
            invalid.push_back(cell);
        }
        return invalid;
    }

    Blob Othello::backup() const
    {
        return packBlob("Othello", blobVersion, OthelloSnapshot{width, height, board, playerIndex, lastAction});
    }

    void Othello::restore(const Blob &blob)
    {
        auto snapshot = unpackBlob<OthelloSnapshot>(blob, "Othello", blobVersion);
        if (snapshot.width != width || snapshot.height != height)
        {
            throw IncompatibleRestoreError(fmt::format("Othello snapshot of a {}x{} board cannot restore {}x{}",
                                                       snapshot.width, snapshot.height, width, height));
        }
        if (snapshot.board.size() != board.size() ||
            std::any_of(snapshot.board.begin(), snapshot.board.end(), [](int cell) {
                return cell < -1 || cell > 1;
            }))
        {
            throw IncompatibleRestoreError("Othello snapshot holds a malformed board");
        }
        if (snapshot.playerIndex < 0 || snapshot.playerIndex > 1 ||
            snapshot.lastAction < -1 || snapshot.lastAction >= width * height)
        {
            throw IncompatibleRestoreError("Othello snapshot holds an invalid player or last action");
        }

        board = std::move(snapshot.board);
        playerIndex = snapshot.playerIndex;
        lastAction = snapshot.lastAction;
    }

    void Othello::renderTerminal(std::ostream &os) const
    {
        const auto legal = legalMoves(playerIndex);
        const std::string border(static_cast<size_t>(1 + width * 3), '-');

        os << border << "\n";
        for (int64_t y = 0; y < height; ++y)
        {
            std::string line = "|";
            for (int64_t x = 0; x < width; ++x)
            {
                const int64_t cell = y * width + x;
                const char *marker = cell == lastAction ? "*" : " ";
                if (board[cell] == 1)
                {
                    line += fmt::format("{}o|", marker);
                }
                else if (board[cell] == -1)
                {
                    line += fmt::format("{}x|", marker);
                }
                else if (std::binary_search(legal.begin(), legal.end(), cell))
                {
                    line += fmt::format("{:2d}|", cell);
                }
                else
                {
                    line += "  |";
                }
            }
            os << line << "\n";
        }
        os << border << "\n";
        os << fmt::format("O: {}, X: {}\n", countStones(1), countStones(-1));
        os << "next player: " << (playerIndex == 0 ? "O" : "X") << "\n";
    }

    torch::Tensor Othello::renderRgbArray() const
    {
        using torch::indexing::Slice;

        auto image = torch::empty({height * cellPixels, width * cellPixels, 3}, torch::kByte);
        image.index_put_({Slice(), Slice()}, torch::tensor(std::vector<uint8_t>{0, 200, 0}));

        auto coordinate = torch::arange(cellPixels, torch::kFloat) - (cellPixels - 1) / 2.0;
        auto distance = (coordinate.unsqueeze(0).pow(2) + coordinate.unsqueeze(1).pow(2)).sqrt();
        auto stoneMask = distance <= cellPixels * 0.3;
        auto hintMask = distance <= cellPixels * 0.1;
        auto lastMask = (distance <= cellPixels * 0.3).logical_and(distance > cellPixels * 0.2);
        auto borderMask = torch::zeros({cellPixels, cellPixels}, torch::kBool);
        borderMask.index_put_({0, Slice()}, true);
        borderMask.index_put_({Slice(), 0}, true);

        const auto black = torch::tensor(std::vector<uint8_t>{0, 0, 0});
        const auto white = torch::tensor(std::vector<uint8_t>{255, 255, 255});
        const auto red = torch::tensor(std::vector<uint8_t>{200, 0, 0});
        const auto legal = legalMoves(playerIndex);

        for (int64_t y = 0; y < height; ++y)
        {
            for (int64_t x = 0; x < width; ++x)
            {
                const int64_t cell = y * width + x;
                auto block = image.index({Slice(y * cellPixels, (y + 1) * cellPixels),
                                          Slice(x * cellPixels, (x + 1) * cellPixels)});
                block.index_put_({borderMask}, black);
                if (board[cell] != 0)
                {
                    block.index_put_({stoneMask}, board[cell] == 1 ? black : white);
                    if (cell == lastAction)
                    {
                        block.index_put_({lastMask}, red);
                    }
                }
                else if (std::binary_search(legal.begin(), legal.end(), cell))
                {
                    block.index_put_({hintMask}, playerIndex == 0 ? black : white);
                }
            }
        }
        return image;
    }

    std::shared_ptr<WorkerBase> Othello::makeWorker(const std::string &name) const
    {
        if (name == "cpu")
        {
            return std::make_shared<OthelloCpu>();
        }
        return EnvBase::makeWorker(name);
    }

    std::shared_ptr<const Processor> Othello::makeProcessor(const std::string &name) const
    {
        if (name == "layer")
        {
            return std::make_shared<LayerProcessor>(width, height);
        }
        return EnvBase::makeProcessor(name);
    }

    TEST_CASE("Othello")
    {
        SUBCASE("Opening position")
        {
            EnvRun run(std::make_unique<Othello>());
            run.reset();
            CHECK(run.getName() == "Othello");
            CHECK(run.getPlayerIndex() == 0);
            CHECK(run.getValidActions(0) == std::vector<int64_t>{20, 29, 34, 43});
            CHECK(run.getInvalidActions(0).size() == 60);
            CHECK(run.getState().sum().item<int64_t>() == 0);
        }

        SUBCASE("A move flips the flanked stone and passes the turn")
        {
            EnvRun run(std::make_unique<Othello>());
            run.reset();
            run.step(DiscreteSpace::value(20), 0);
            CHECK(run.getPlayerIndex() == 1);
            CHECK(run.getState()[20].item<int64_t>() == 1);
            CHECK(run.getState()[28].item<int64_t>() == 1);
            CHECK(run.getState().eq(1).sum().item<int64_t>() == 4);
            CHECK(run.getState().eq(-1).sum().item<int64_t>() == 1);
        }

        SUBCASE("Illegal cells are refused")
        {
            EnvRun run(std::make_unique<Othello>());
            run.reset();
            CHECK_THROWS_AS(run.step(DiscreteSpace::value(0), 0), InvalidActionError);
            CHECK_THROWS(run.step(DiscreteSpace::value(20), 1));
        }

        SUBCASE("A player without moves passes, the game ends when nobody can move")
        {
            Othello othello(6, 6);
            OthelloSnapshot snapshot{6, 6, std::vector<int>(36, 0), 0, -1};
            snapshot.board[0] = 1;
            snapshot.board[1] = -1;
            snapshot.board[12] = 1;
            snapshot.board[13] = -1;
            othello.restore(packBlob("Othello", Othello::blobVersion, snapshot));

            auto first = othello.step(DiscreteSpace::value(2), 0);
            CHECK_FALSE(first.done);
            CHECK(othello.currentPlayerIndex() == 0);
            CHECK(othello.legalMoves(1).empty());

            auto last = othello.step(DiscreteSpace::value(14), 0);
            CHECK(last.done);
            CHECK(last.rewards == std::vector<float>{1.0f, -1.0f});
            CHECK(last.info.at("P1") == 6.0f);
            CHECK(last.info.at("P2") == 0.0f);
        }

        SUBCASE("Restored games continue identically")
        {
            torch::manual_seed(5);
            EnvRun run(std::make_unique<Othello>(6, 6));
            run.reset();
            for (int i = 0; i < 6 && !run.isDone(); ++i)
            {
                run.step(run.sampleAction(), run.getPlayerIndex());
            }

            EnvRun copy(std::make_unique<Othello>(6, 6));
            copy.restore(run.backup());
            while (!run.isDone())
            {
                auto action = run.sampleAction();
                run.step(action, run.getPlayerIndex());
                copy.step(action, copy.getPlayerIndex());
                CHECK(torch::equal(run.getState(), copy.getState()));
            }
            CHECK(copy.isDone());
            CHECK(copy.getEpisodeRewards() == run.getEpisodeRewards());
        }

        SUBCASE("Snapshots of another board size are refused")
        {
            Othello small(6, 6);
            small.reset();
            Othello large;
            CHECK_THROWS_AS(large.restore(small.backup()), IncompatibleRestoreError);
        }

        SUBCASE("Random games end with opposite rewards")
        {
            torch::manual_seed(11);
            EnvRun run(std::make_unique<Othello>(6, 6));
            std::vector<WorkerRun> workers;
            workers.emplace_back(RuleBaseWorker::random(), 0);
            workers.emplace_back(RuleBaseWorker::random(), 1);
            auto result = playEpisode(run, workers);
            CHECK(result.doneReason == "env");
            CHECK(result.rewards[0] == -result.rewards[1]);
        }

        SUBCASE("Rendering")
        {
            EnvRun run(std::make_unique<Othello>());
            run.reset();
            std::ostringstream os;
            run.renderTerminal(os);
            CHECK(os.str().find("|20|") != std::string::npos);
            CHECK(os.str().find("next player: O") != std::string::npos);

            auto image = run.renderRgbArray();
            CHECK(image.sizes().vec() == std::vector<int64_t>{8 * cellPixels, 8 * cellPixels, 3});
            CHECK(image.scalar_type() == torch::kByte);
        }
    }

    TEST_CASE("Othello cpu worker")
    {
        torch::manual_seed(3);
        EnvRun run(std::make_unique<Othello>(6, 6));
        std::vector<WorkerRun> workers;
        workers.emplace_back(run.getEnv().makeWorker("cpu"), 0);
        workers.emplace_back(RuleBaseWorker::random(), 1);

        EpisodeResult result;
        CHECK_NOTHROW(result = playEpisode(run, workers));
        CHECK(result.doneReason == "env");
        CHECK_THROWS_AS(run.getEnv().makeWorker("human"), std::invalid_argument);
    }

    TEST_CASE("Othello layer processor")
    {
        EnvRun run(std::make_unique<Othello>());
        run.reset();
        auto processor = run.getEnv().makeProcessor("layer");

        auto info = processor->changeObservationInfo(run.observationSpace(), run.observationType());
        CHECK(info.first->getShape() == std::vector<int64_t>{2, 8, 8});
        CHECK(info.second == EnvObservationType::SHAPE3);

        auto layers = processor->processObservation(run.getState(), run);
        CHECK(layers.sizes().vec() == std::vector<int64_t>{2, 8, 8});
        CHECK(layers[0][3][3].item<float>() == 1.0f);
        CHECK(layers[1][3][4].item<float>() == 1.0f);
        CHECK(info.first->contains(layers));

        run.step(DiscreteSpace::value(20), 0);
        layers = processor->processObservation(run.getState(), run);
        CHECK(layers[0].sum().item<float>() == 1.0f);
        CHECK(layers[1].sum().item<float>() == 4.0f);

        CHECK_THROWS_AS(processor->changeObservationInfo(std::make_shared<DiscreteSpace>(5), EnvObservationType::DISCRETE),
                        ShapeMismatchError);
    }
}
