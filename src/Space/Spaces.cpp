#include<algorithm>

#include<doctest/doctest.h>

#include"../../include/Errors.hpp"
#include"../../include/Space/DiscreteSpace.hpp"
#include"../../include/Space/ArrayDiscreteSpace.hpp"
#include"../../include/Space/ContinuousSpace.hpp"
#include"../../include/Space/ArrayContinuousSpace.hpp"
#include"../../include/Space/BoxSpace.hpp"

namespace SimpleRL
{
    namespace
    {
        torch::Tensor longBounds(const std::vector<int64_t> &values)
        {
            return torch::tensor(values, torch::TensorOptions().dtype(torch::kLong)).to(torch::kDouble);
        }

        torch::Tensor doubleBounds(const std::vector<double> &values)
        {
            return torch::tensor(values, torch::TensorOptions().dtype(torch::kDouble));
        }

        void checkSize(int64_t size, size_t lowSize, size_t highSize)
        {
            if (size <= 0 || static_cast<int64_t>(lowSize) != size || static_cast<int64_t>(highSize) != size)
            {
                throw std::invalid_argument("Array space of size " + std::to_string(size) + " got " +
                                            std::to_string(lowSize) + " low and " + std::to_string(highSize) +
                                            " high bounds");
            }
        }
    }

    DiscreteSpace::DiscreteSpace(int64_t n, int64_t start) :
    Space(SpaceType::DISCRETE,
          {},
          torch::tensor(static_cast<double>(start)),
          torch::tensor(static_cast<double>(start + n - 1)),
          true,
          std::max<int64_t>(n, 1))
    {
        if (n < 1)
        {
            throw std::invalid_argument("DiscreteSpace needs at least one value, got n=" + std::to_string(n));
        }
    }

    int64_t DiscreteSpace::getN() const
    {
        return getBinCounts()[0];
    }

    torch::Tensor DiscreteSpace::value(int64_t value)
    {
        return torch::tensor(value, torch::TensorOptions().dtype(torch::kLong));
    }

    ArrayDiscreteSpace::ArrayDiscreteSpace(int64_t size, int64_t low, int64_t high) :
    ArrayDiscreteSpace(size,
                       std::vector<int64_t>(static_cast<size_t>(std::max<int64_t>(size, 0)), low),
                       std::vector<int64_t>(static_cast<size_t>(std::max<int64_t>(size, 0)), high))
    {
    }

    ArrayDiscreteSpace::ArrayDiscreteSpace(int64_t size,
                                           const std::vector<int64_t> &low,
                                           const std::vector<int64_t> &high) :
    Space(SpaceType::ARRAY_DISCRETE,
          {size},
          (checkSize(size, low.size(), high.size()), longBounds(low)),
          longBounds(high),
          true,
          5)
    {
    }

    ContinuousSpace::ContinuousSpace(double low, double high, int64_t divisionNum) :
    Space(SpaceType::CONTINUOUS,
          {},
          torch::tensor(low, torch::TensorOptions().dtype(torch::kDouble)),
          torch::tensor(high, torch::TensorOptions().dtype(torch::kDouble)),
          false,
          divisionNum)
    {
    }

    torch::Tensor ContinuousSpace::value(float value)
    {
        return torch::tensor(value, torch::TensorOptions().dtype(torch::kFloat));
    }

    ArrayContinuousSpace::ArrayContinuousSpace(int64_t size, double low, double high, int64_t divisionNum) :
    ArrayContinuousSpace(size,
                         std::vector<double>(static_cast<size_t>(std::max<int64_t>(size, 0)), low),
                         std::vector<double>(static_cast<size_t>(std::max<int64_t>(size, 0)), high),
                         divisionNum)
    {
    }

    ArrayContinuousSpace::ArrayContinuousSpace(int64_t size,
                                               const std::vector<double> &low,
                                               const std::vector<double> &high,
                                               int64_t divisionNum) :
    Space(SpaceType::ARRAY_CONTINUOUS,
          {size},
          (checkSize(size, low.size(), high.size()), doubleBounds(low)),
          doubleBounds(high),
          false,
          divisionNum)
    {
    }

    BoxSpace::BoxSpace(const std::vector<int64_t> &shape, double low, double high, bool discrete, int64_t divisionNum) :
    Space(SpaceType::BOX,
          shape,
          torch::full(shape, low, torch::TensorOptions().dtype(torch::kDouble)),
          torch::full(shape, high, torch::TensorOptions().dtype(torch::kDouble)),
          discrete,
          divisionNum)
    {
    }

    BoxSpace::BoxSpace(const std::vector<int64_t> &shape,
                       const torch::Tensor &low,
                       const torch::Tensor &high,
                       bool discrete,
                       int64_t divisionNum) :
    Space(SpaceType::BOX, shape, low, high, discrete, divisionNum)
    {
        if (low.sizes().vec() != shape || high.sizes().vec() != shape)
        {
            throw ShapeMismatchError("BoxSpace bounds must have shape " + shapeToString(shape));
        }
    }

    TEST_CASE("Space variants")
    {
        SUBCASE("Discrete")
        {
            DiscreteSpace space(5, 2);
            CHECK(space.getN() == 5);
            CHECK(space.getShape().empty());
            CHECK(space.contains(DiscreteSpace::value(6)));
            CHECK_FALSE(space.contains(DiscreteSpace::value(7)));
            CHECK_FALSE(space.contains(DiscreteSpace::value(1)));
            CHECK_THROWS_AS(DiscreteSpace(0), std::invalid_argument);
        }

        SUBCASE("ArrayDiscrete")
        {
            ArrayDiscreteSpace space(3, 0, 2);
            CHECK(space.getDiscreteNum() == 27);
            CHECK(space.sample().scalar_type() == torch::kLong);
            CHECK_THROWS_AS(ArrayDiscreteSpace(2, std::vector<int64_t>{0}, std::vector<int64_t>{1, 1}),
                            std::invalid_argument);
        }

        SUBCASE("Continuous")
        {
            ContinuousSpace space(0.0, 1.0, 10);
            CHECK(space.isBounded());
            CHECK(space.contains(ContinuousSpace::value(0.5f)));
            CHECK_FALSE(space.contains(ContinuousSpace::value(1.5f)));
            CHECK_FALSE(ContinuousSpace().isBounded());
            CHECK(space.sample().scalar_type() == torch::kFloat);
        }

        SUBCASE("Box")
        {
            BoxSpace board({6, 6}, -1.0, 1.0, true);
            CHECK(board.isDiscrete());
            CHECK(board.getBinCounts() == std::vector<int64_t>(36, 3));
            CHECK_THROWS_AS(BoxSpace({2}, torch::zeros({3}), torch::ones({3})), std::invalid_argument);
            CHECK_THROWS_AS(BoxSpace({2}, 0.5, 0.5, true), std::invalid_argument);
        }

        SUBCASE("Views")
        {
            ContinuousSpace scalar(-1.0, 1.0, 8);
            auto discrete = scalar.discreteView();
            CHECK(discrete->getType() == SpaceType::DISCRETE);
            CHECK(discrete->getDiscreteNum() == 8);

            ArrayDiscreteSpace array(2, -1, 1);
            auto continuous = array.continuousView();
            CHECK(continuous->getType() == SpaceType::ARRAY_CONTINUOUS);
            CHECK(continuous->contains(torch::tensor({-0.5f, 0.75f})));
        }
    }
}
