#include<algorithm>
#include<functional>
#include<limits>
#include<numeric>
#include<unordered_set>

#include<fmt/format.h>
#include<fmt/ranges.h>
#include<doctest/doctest.h>

#include"../../include/Errors.hpp"
#include"../../include/Space/Space.hpp"
#include"../../include/Space/DiscreteSpace.hpp"
#include"../../include/Space/ArrayDiscreteSpace.hpp"
#include"../../include/Space/ContinuousSpace.hpp"
#include"../../include/Space/ArrayContinuousSpace.hpp"
#include"../../include/Space/BoxSpace.hpp"

namespace SimpleRL
{
    namespace
    {
        std::vector<int64_t> toLongVector(const torch::Tensor &tensor)
        {
            auto flat = tensor.to(torch::kLong).contiguous().flatten();
            const int64_t *begin = flat.data_ptr<int64_t>();
            return std::vector<int64_t>(begin, begin + flat.numel());
        }

        std::vector<double> toDoubleVector(const torch::Tensor &tensor)
        {
            auto flat = tensor.to(torch::kDouble).contiguous().flatten();
            const double *begin = flat.data_ptr<double>();
            return std::vector<double>(begin, begin + flat.numel());
        }

        std::string boundToString(const torch::Tensor &bound)
        {
            auto values = toDoubleVector(bound);
            if (std::adjacent_find(values.begin(), values.end(), std::not_equal_to<double>()) == values.end())
            {
                return fmt::format("{}", values.front());
            }
            return fmt::format("[{}]", fmt::join(values, ", "));
        }
    }

    std::string shapeToString(const std::vector<int64_t> &shape)
    {
        return fmt::format("[{}]", fmt::join(shape, ", "));
    }

    std::string valueToString(const torch::Tensor &value)
    {
        if (!value.defined())
        {
            return "undefined";
        }
        auto values = toDoubleVector(value);
        if (value.dim() == 0)
        {
            return fmt::format("{}", values.front());
        }
        return fmt::format("[{}]", fmt::join(values, ", "));
    }

    Space::Space(SpaceType type,
                 std::vector<int64_t> shape,
                 torch::Tensor low,
                 torch::Tensor high,
                 bool discrete,
                 int64_t divisionNum) :
    type(type),
    shape(std::move(shape)),
    discrete(discrete),
    divisionNum(divisionNum)
    {
        int64_t expected = 1;
        for (auto dimension : this->shape)
        {
            if (dimension <= 0)
            {
                throw std::invalid_argument("Space dimensions must be positive, got " + shapeToString(this->shape));
            }
            expected *= dimension;
        }
        if (low.numel() != expected || high.numel() != expected)
        {
            throw std::invalid_argument("Space bounds do not match shape " + shapeToString(this->shape));
        }
        if (divisionNum < 1)
        {
            throw std::invalid_argument("divisionNum must be at least 1");
        }

        this->low = low.to(torch::kDouble).reshape(this->shape).clone();
        this->high = high.to(torch::kDouble).reshape(this->shape).clone();

        if (torch::isnan(this->low).any().item<bool>() || torch::isnan(this->high).any().item<bool>())
        {
            throw std::invalid_argument("Space bounds must not be NaN");
        }
        if ((this->low > this->high).any().item<bool>())
        {
            throw std::invalid_argument("Space bounds must satisfy low <= high");
        }
        if (discrete)
        {
            if (!torch::isfinite(this->low).all().item<bool>() || !torch::isfinite(this->high).all().item<bool>())
            {
                throw std::invalid_argument("Discrete spaces need finite bounds");
            }
            if ((this->low != torch::round(this->low)).any().item<bool>() ||
                (this->high != torch::round(this->high)).any().item<bool>())
            {
                throw std::invalid_argument("Discrete spaces need integer bounds");
            }
        }
    }

    int64_t Space::numel() const
    {
        return std::accumulate(shape.begin(), shape.end(), int64_t{1}, std::multiplies<int64_t>());
    }

    bool Space::isBounded() const
    {
        return torch::isfinite(low).all().item<bool>() && torch::isfinite(high).all().item<bool>();
    }

    torch::Dtype Space::nativeDtype() const
    {
        return discrete ? torch::kLong : torch::kFloat;
    }

    void Space::checkShape(const torch::Tensor &value, const char *operation) const
    {
        if (!value.defined())
        {
            throw ShapeMismatchError(fmt::format("{}: undefined value for {}", operation, toString()));
        }
        if (value.sizes().vec() != shape)
        {
            throw ShapeMismatchError(fmt::format("{}: value shape {} does not match {}",
                                                 operation,
                                                 shapeToString(value.sizes().vec()),
                                                 toString()));
        }
    }

    void Space::checkDiscretizable() const
    {
        if (discrete)
        {
            return;
        }
        auto finite = torch::isfinite(low) & torch::isfinite(high);
        if (!finite.all().item<bool>())
        {
            auto element = finite.flatten().logical_not().nonzero()[0][0].item<int64_t>();
            throw UnboundedConversionError(fmt::format("{} element {} has no finite bounds and cannot be discretized",
                                                       toString(),
                                                       element));
        }
    }

    torch::Tensor Space::binCountTensor() const
    {
        if (discrete)
        {
            return high - low + 1;
        }
        return torch::full_like(low, static_cast<double>(divisionNum));
    }

    torch::Tensor Space::sample(const std::vector<int64_t> &invalidActions) const
    {
        if (discrete && invalidActions.empty())
        {
            auto r = torch::rand(shape, torch::TensorOptions().dtype(torch::kDouble));
            auto value = torch::floor(low + r * (high - low + 1));
            return torch::minimum(value, high).to(torch::kLong);
        }
        if (!invalidActions.empty() && (discrete || isBounded()))
        {
            // Continuous values land on the midpoint of a valid bin.
            std::unordered_set<int64_t> invalid(invalidActions.begin(), invalidActions.end());
            std::vector<int64_t> valid;
            const auto discreteNum = getDiscreteNum();
            for (int64_t index = 0; index < discreteNum; ++index)
            {
                if (invalid.count(index) == 0)
                {
                    valid.push_back(index);
                }
            }
            if (valid.empty())
            {
                throw InvalidActionError("Every action of " + toString() + " is invalid, nothing to sample");
            }
            auto pick = torch::randint(static_cast<int64_t>(valid.size()), {1}).item<int64_t>();
            return fromDiscrete(decodeDiscreteIndex(valid[static_cast<size_t>(pick)]));
        }

        auto finiteLow = torch::isfinite(low);
        auto finiteHigh = torch::isfinite(high);
        auto uniform = low + torch::rand(shape, torch::TensorOptions().dtype(torch::kDouble)) * (high - low);
        auto normal = torch::randn(shape, torch::TensorOptions().dtype(torch::kDouble));
        auto value = torch::where(finiteLow & finiteHigh, uniform, normal);
        value = torch::where(finiteLow & finiteHigh.logical_not(), low + normal.abs(), value);
        value = torch::where(finiteLow.logical_not() & finiteHigh, high - normal.abs(), value);
        return value.to(torch::kFloat);
    }

    bool Space::contains(const torch::Tensor &value) const
    {
        if (!value.defined() || value.sizes().vec() != shape)
        {
            return false;
        }
        auto v = value.to(torch::kDouble);
        if (torch::isnan(v).any().item<bool>())
        {
            return false;
        }
        if ((v < low).any().item<bool>() || (v > high).any().item<bool>())
        {
            return false;
        }
        if (discrete && (v != torch::round(v)).any().item<bool>())
        {
            return false;
        }
        return true;
    }

    torch::Tensor Space::toDiscrete(const torch::Tensor &value) const
    {
        checkShape(value, "toDiscrete");
        auto v = value.to(torch::kDouble);
        if (discrete)
        {
            return torch::round(v).to(torch::kLong);
        }
        checkDiscretizable();

        const auto n = static_cast<double>(divisionNum);
        auto width = high - low;
        auto scaled = torch::where(width > 0, (v - low) / width * n, torch::zeros_like(v));
        return torch::floor(scaled).clamp(0, n - 1).to(torch::kLong);
    }

    torch::Tensor Space::fromDiscrete(const torch::Tensor &discreteValue) const
    {
        checkShape(discreteValue, "fromDiscrete");
        auto d = discreteValue.to(torch::kDouble);
        if (discrete)
        {
            return torch::maximum(torch::minimum(torch::round(d), high), low).to(torch::kLong);
        }
        checkDiscretizable();

        const auto n = static_cast<double>(divisionNum);
        auto bins = d.clamp(0, n - 1);
        return (low + (bins + 0.5) * (high - low) / n).to(torch::kFloat);
    }

    torch::Tensor Space::toContinuous(const torch::Tensor &value) const
    {
        checkShape(value, "toContinuous");
        return value.to(torch::kFloat);
    }

    torch::Tensor Space::fromContinuous(const torch::Tensor &continuousValue) const
    {
        checkShape(continuousValue, "fromContinuous");
        auto c = continuousValue.to(torch::kDouble);
        if (discrete)
        {
            c = torch::round(c);
        }
        auto clamped = torch::maximum(torch::minimum(c, high), low);
        return clamped.to(nativeDtype());
    }

    std::vector<int64_t> Space::getBinCounts() const
    {
        checkDiscretizable();
        return toLongVector(binCountTensor());
    }

    int64_t Space::getDiscreteNum() const
    {
        int64_t total = 1;
        for (auto count : getBinCounts())
        {
            if (total > std::numeric_limits<int64_t>::max() / count)
            {
                throw TypeIncompatibilityError(toString() + " has too many discrete values to enumerate");
            }
            total *= count;
        }
        return total;
    }

    torch::Tensor Space::discreteOffset() const
    {
        if (discrete)
        {
            return low.to(torch::kLong);
        }
        return torch::zeros(shape, torch::TensorOptions().dtype(torch::kLong));
    }

    int64_t Space::encodeDiscreteIndex(const torch::Tensor &discreteValue) const
    {
        checkShape(discreteValue, "encodeDiscreteIndex");
        auto counts = getBinCounts();
        auto values = toLongVector(discreteValue);
        auto offsets = toLongVector(discreteOffset());

        int64_t index = 0;
        for (size_t i = 0; i < counts.size(); ++i)
        {
            auto ordinal = values[i] - offsets[i];
            if (ordinal < 0 || ordinal >= counts[i])
            {
                throw std::out_of_range(fmt::format("Element {} = {} is outside {}", i, values[i], toString()));
            }
            index = index * counts[i] + ordinal;
        }
        return index;
    }

    torch::Tensor Space::decodeDiscreteIndex(int64_t index) const
    {
        auto counts = getBinCounts();
        if (index < 0 || index >= getDiscreteNum())
        {
            throw std::out_of_range(fmt::format("Index {} is outside {}", index, toString()));
        }
        auto offsets = toLongVector(discreteOffset());

        std::vector<int64_t> values(counts.size());
        for (size_t i = counts.size(); i-- > 0;)
        {
            values[i] = index % counts[i] + offsets[i];
            index /= counts[i];
        }
        return torch::tensor(values, torch::TensorOptions().dtype(torch::kLong)).reshape(shape);
    }

    torch::Tensor Space::quantizationTolerance() const
    {
        if (discrete)
        {
            return torch::zeros_like(low);
        }
        checkDiscretizable();
        return (high - low) / (2.0 * static_cast<double>(divisionNum));
    }

    std::shared_ptr<const Space> Space::discreteView() const
    {
        checkDiscretizable();
        if (discrete)
        {
            return makeSpace(describe());
        }

        auto counts = getBinCounts();
        if (shape.empty())
        {
            return std::make_shared<DiscreteSpace>(counts[0]);
        }
        std::vector<int64_t> highs(counts.size());
        std::transform(counts.begin(), counts.end(), highs.begin(), [](int64_t count) { return count - 1; });
        if (shape.size() == 1)
        {
            return std::make_shared<ArrayDiscreteSpace>(shape[0], std::vector<int64_t>(counts.size(), 0), highs);
        }
        return std::make_shared<BoxSpace>(shape,
                                          torch::zeros(shape),
                                          torch::tensor(highs).reshape(shape),
                                          true);
    }

    std::shared_ptr<const Space> Space::continuousView() const
    {
        if (shape.empty())
        {
            return std::make_shared<ContinuousSpace>(low.item<double>(), high.item<double>(), divisionNum);
        }
        if (shape.size() == 1)
        {
            return std::make_shared<ArrayContinuousSpace>(shape[0], toDoubleVector(low), toDoubleVector(high), divisionNum);
        }
        return std::make_shared<BoxSpace>(shape, low, high, false, divisionNum);
    }

    SpaceDescriptor Space::describe() const
    {
        SpaceDescriptor descriptor;
        descriptor.type = type;
        descriptor.shape = shape;
        descriptor.low = toDoubleVector(low);
        descriptor.high = toDoubleVector(high);
        descriptor.discrete = discrete;
        descriptor.divisionNum = divisionNum;
        return descriptor;
    }

    std::string Space::toString() const
    {
        return fmt::format("{}(shape={}, low={}, high={}, {})",
                           SimpleRL::toString(type),
                           shapeToString(shape),
                           boundToString(low),
                           boundToString(high),
                           discrete ? "discrete" : "continuous");
    }

    bool Space::operator==(const Space &other) const
    {
        return type == other.type &&
               shape == other.shape &&
               discrete == other.discrete &&
               divisionNum == other.divisionNum &&
               torch::equal(low, other.low) &&
               torch::equal(high, other.high);
    }

    std::shared_ptr<const Space> makeSpace(const SpaceDescriptor &descriptor)
    {
        const auto expected = std::accumulate(descriptor.shape.begin(), descriptor.shape.end(), int64_t{1},
                                              std::multiplies<int64_t>());
        if (static_cast<int64_t>(descriptor.low.size()) != expected ||
            static_cast<int64_t>(descriptor.high.size()) != expected)
        {
            throw std::invalid_argument("Space descriptor bounds do not match shape " + shapeToString(descriptor.shape));
        }

        auto toLongs = [](const std::vector<double> &values) {
            return std::vector<int64_t>(values.begin(), values.end());
        };

        switch (descriptor.type)
        {
            case SpaceType::DISCRETE:
                if (!descriptor.shape.empty())
                {
                    break;
                }
                return std::make_shared<DiscreteSpace>(static_cast<int64_t>(descriptor.high[0] - descriptor.low[0]) + 1,
                                                       static_cast<int64_t>(descriptor.low[0]));
            case SpaceType::ARRAY_DISCRETE:
                if (descriptor.shape.size() != 1)
                {
                    break;
                }
                return std::make_shared<ArrayDiscreteSpace>(descriptor.shape[0],
                                                            toLongs(descriptor.low),
                                                            toLongs(descriptor.high));
            case SpaceType::CONTINUOUS:
                if (!descriptor.shape.empty())
                {
                    break;
                }
                return std::make_shared<ContinuousSpace>(descriptor.low[0], descriptor.high[0], descriptor.divisionNum);
            case SpaceType::ARRAY_CONTINUOUS:
                if (descriptor.shape.size() != 1)
                {
                    break;
                }
                return std::make_shared<ArrayContinuousSpace>(descriptor.shape[0],
                                                              descriptor.low,
                                                              descriptor.high,
                                                              descriptor.divisionNum);
            case SpaceType::BOX:
                return std::make_shared<BoxSpace>(descriptor.shape,
                                                  torch::tensor(descriptor.low, torch::kDouble).reshape(descriptor.shape),
                                                  torch::tensor(descriptor.high, torch::kDouble).reshape(descriptor.shape),
                                                  descriptor.discrete,
                                                  descriptor.divisionNum);
        }
        throw std::invalid_argument(fmt::format("{} cannot have shape {}",
                                                toString(descriptor.type),
                                                shapeToString(descriptor.shape)));
    }

    void checkConvertible(const Space &from, const Space &to)
    {
        const bool sameShape = from.getShape() == to.getShape();
        const bool bothSingle = from.numel() == 1 && to.numel() == 1;
        if (!sameShape && !bothSingle)
        {
            throw ShapeMismatchError(fmt::format("Cannot convert {} into {}: shapes differ",
                                                 from.toString(),
                                                 to.toString()));
        }
        if (to.isDiscrete() || from.isDiscrete())
        {
            from.checkDiscretizable();
            to.checkDiscretizable();
            if (from.getBinCounts() != to.getBinCounts())
            {
                throw TypeIncompatibilityError(fmt::format("Cannot convert {} into {}: discrete ranges differ",
                                                           from.toString(),
                                                           to.toString()));
            }
        }
    }

    torch::Tensor convertValue(const Space &from, const Space &to, const torch::Tensor &value)
    {
        checkConvertible(from, to);
        if (to.isDiscrete())
        {
            auto ordinal = from.toDiscrete(value) - from.discreteOffset();
            return to.fromDiscrete(ordinal.reshape(to.getShape()) + to.discreteOffset());
        }
        if (from.isDiscrete())
        {
            // Discrete ordinals of a bounded continuous target are its bin indices.
            auto ordinal = from.toDiscrete(value) - from.discreteOffset();
            return to.fromDiscrete(ordinal.reshape(to.getShape()));
        }
        return to.fromContinuous(from.toContinuous(value).reshape(to.getShape()));
    }

    TEST_CASE("Space")
    {
        torch::manual_seed(0);

        SUBCASE("Rejects inverted bounds")
        {
            CHECK_THROWS_AS(ContinuousSpace(1.0, -1.0), std::invalid_argument);
            CHECK_THROWS_AS(ArrayDiscreteSpace(2, std::vector<int64_t>{0, 3}, std::vector<int64_t>{1, 2}),
                            std::invalid_argument);
        }

        SUBCASE("Discrete round trip is exact")
        {
            ArrayDiscreteSpace space(3, -1, 1);
            for (int i = 0; i < 50; ++i)
            {
                auto value = space.sample();
                CHECK(space.contains(value));
                CHECK(torch::equal(space.fromDiscrete(space.toDiscrete(value)), value));
            }
        }

        SUBCASE("Continuous round trip stays within the quantization tolerance")
        {
            ArrayContinuousSpace space(3, std::vector<double>{-2, 0, 5}, std::vector<double>{2, 1, 6}, 7);
            auto tolerance = space.quantizationTolerance();
            for (int i = 0; i < 200; ++i)
            {
                auto value = space.sample();
                auto recovered = space.fromDiscrete(space.toDiscrete(value));
                auto error = (recovered.to(torch::kDouble) - value.to(torch::kDouble)).abs();
                CHECK((error <= tolerance + 1e-6).all().item<bool>());
            }
        }

        SUBCASE("Unbounded elements refuse discretization")
        {
            ArrayContinuousSpace space(2, std::vector<double>{-1, 0},
                                       std::vector<double>{1, std::numeric_limits<double>::infinity()});
            CHECK_THROWS_AS(space.checkDiscretizable(), UnboundedConversionError);
            CHECK_THROWS_AS(space.toDiscrete(torch::zeros({2})), UnboundedConversionError);
            CHECK_THROWS_AS(space.getDiscreteNum(), UnboundedConversionError);
            CHECK(space.contains(space.sample()));
        }

        SUBCASE("Shape mismatch is never reshaped")
        {
            BoxSpace space({2, 2}, -1.0, 1.0);
            CHECK_THROWS_AS(space.toDiscrete(torch::zeros({4})), ShapeMismatchError);
            CHECK_THROWS_AS(space.toContinuous(torch::zeros({2, 3})), ShapeMismatchError);
            CHECK_FALSE(space.contains(torch::zeros({4})));
        }

        SUBCASE("Flat index enumerates every value once")
        {
            ArrayDiscreteSpace space(2, std::vector<int64_t>{0, -1}, std::vector<int64_t>{2, 1});
            CHECK(space.getDiscreteNum() == 9);
            for (int64_t index = 0; index < 9; ++index)
            {
                auto value = space.decodeDiscreteIndex(index);
                CHECK(space.contains(value));
                CHECK(space.encodeDiscreteIndex(value) == index);
            }
            CHECK_THROWS_AS(space.decodeDiscreteIndex(9), std::out_of_range);
        }

        SUBCASE("Sampling honours invalid actions")
        {
            DiscreteSpace space(4);
            for (int i = 0; i < 50; ++i)
            {
                auto action = space.sample({0, 1, 3}).item<int64_t>();
                CHECK(action == 2);
            }
            CHECK_THROWS_AS(space.sample({0, 1, 2, 3}), InvalidActionError);
        }

        SUBCASE("Descriptors rebuild an equal space")
        {
            BoxSpace box({2, 3}, -1.0, 1.0, true);
            CHECK(*makeSpace(box.describe()) == box);
            ContinuousSpace scalar(0.0, 2.0, 3);
            CHECK(*makeSpace(scalar.describe()) == scalar);
            CHECK(*makeSpace(scalar.describe()) != ContinuousSpace(0.0, 2.0, 4));
        }
    }

    TEST_CASE("Space conversion")
    {
        torch::manual_seed(1);

        SUBCASE("Box quantization into ArrayDiscrete is stable")
        {
            BoxSpace box({4}, -1.0, 1.0, false, 4);
            auto bins = box.discreteView();
            CHECK(bins->getType() == SpaceType::ARRAY_DISCRETE);
            CHECK(bins->getBinCounts() == std::vector<int64_t>{4, 4, 4, 4});

            for (int i = 0; i < 1000; ++i)
            {
                auto value = box.sample();
                auto discrete = convertValue(box, *bins, value);
                auto continuous = convertValue(*bins, box, discrete);
                CHECK(torch::equal(convertValue(box, *bins, continuous), discrete));
            }
        }

        SUBCASE("Bins map to their midpoints")
        {
            BoxSpace box({4}, -1.0, 1.0, false, 4);
            auto bins = box.discreteView();
            auto value = torch::tensor({0, 1, 2, 3}, torch::kLong);
            auto continuous = convertValue(*bins, box, value);
            CHECK(continuous.scalar_type() == torch::kFloat);
            CHECK(torch::allclose(continuous, torch::tensor({-0.75f, -0.25f, 0.25f, 0.75f})));
            CHECK(torch::equal(convertValue(box, *bins, continuous), value));

            DiscreteSpace actions(5, 2);
            ContinuousSpace scalar(0.0, 1.0, 5);
            CHECK(convertValue(actions, scalar, DiscreteSpace::value(2)).item<float>() == doctest::Approx(0.1));
            CHECK_THROWS_AS(convertValue(DiscreteSpace(4), scalar, DiscreteSpace::value(1)),
                            TypeIncompatibilityError);
        }

        SUBCASE("Discrete ranges with different offsets keep ordinals")
        {
            DiscreteSpace from(3, 1);
            DiscreteSpace to(3);
            auto converted = convertValue(from, to, DiscreteSpace::value(3));
            CHECK(converted.item<int64_t>() == 2);
        }

        SUBCASE("Different element counts are rejected")
        {
            ArrayContinuousSpace three(3, -1.0, 1.0);
            ArrayContinuousSpace four(4, -1.0, 1.0);
            CHECK_THROWS_AS(checkConvertible(three, four), ShapeMismatchError);
        }

        SUBCASE("Discrete targets need a bounded source")
        {
            ContinuousSpace unbounded;
            DiscreteSpace target(5);
            CHECK_THROWS_AS(checkConvertible(unbounded, target), UnboundedConversionError);
        }
    }
}
