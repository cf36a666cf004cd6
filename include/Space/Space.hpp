#pragma once

#ifndef SIMPLERL_SPACE_SPACE_HPP
#define SIMPLERL_SPACE_SPACE_HPP

#include<cstdint>
#include<memory>
#include<string>
#include<vector>

#include<msgpack.hpp>
#include<torch/torch.h>

#include"../Define.hpp"

namespace SimpleRL
{
    /**
     * @struct SpaceDescriptor
     * @brief Serializable description of a Space, see makeSpace().
     */
    struct SpaceDescriptor
    {
        SpaceType type = SpaceType::BOX;
        std::vector<int64_t> shape;
        std::vector<double> low;
        std::vector<double> high;
        bool discrete = false;
        int64_t divisionNum = 5;
        MSGPACK_DEFINE_MAP(type, shape, low, high, discrete, divisionNum);
    };

    /**
     * @class Space
     * @brief Typed domain of legal action or observation values.
     *
     * A Space is a shape, a per-element [low, high] range and an element type tag.
     * Discrete elements hold integers (native dtype torch::kLong) and must be
     * finitely bounded. Continuous elements hold floats (torch::kFloat) and may be
     * unbounded on either side.
     *
     * Two canonical representations exist besides the native one:
     * - discrete: one integer per element. Discrete elements keep their value;
     *   continuous elements are quantized into `divisionNum` equal bins over
     *   [low, high] and the bin index is stored.
     * - continuous: one float per element.
     *
     * Spaces are immutable once built and are shared as std::shared_ptr<const Space>.
     * Only the five variants (DiscreteSpace, ArrayDiscreteSpace, ContinuousSpace,
     * ArrayContinuousSpace, BoxSpace) construct one.
     */
    class Space
    {
    private:
        SpaceType type;
        std::vector<int64_t> shape;
        torch::Tensor low;   /**< kDouble, `shape`-shaped, may contain +-inf for continuous elements */
        torch::Tensor high;  /**< kDouble, `shape`-shaped */
        bool discrete;
        int64_t divisionNum;

        /** @brief Per-element bin counts as a kDouble tensor of `shape` (requires finite bounds). */
        torch::Tensor binCountTensor() const;

        void checkShape(const torch::Tensor &value, const char *operation) const;

    protected:
        /**
         * @throws std::invalid_argument if a bound is NaN, low > high, bounds do not
         *         match `shape`, or a discrete element has infinite/non-integer bounds
         */
        Space(SpaceType type,
              std::vector<int64_t> shape,
              torch::Tensor low,
              torch::Tensor high,
              bool discrete,
              int64_t divisionNum);

    public:
        virtual ~Space() = default;

        inline SpaceType getType() const
        {
            return type;
        }

        inline const std::vector<int64_t> &getShape() const
        {
            return shape;
        }

        /** @return number of elements (1 for scalar spaces) */
        int64_t numel() const;

        /** @return true when elements are integers */
        inline bool isDiscrete() const
        {
            return discrete;
        }

        inline int64_t getDivisionNum() const
        {
            return divisionNum;
        }

        inline torch::Tensor getLow() const
        {
            return low.clone();
        }

        inline torch::Tensor getHigh() const
        {
            return high.clone();
        }

        /** @return true when every element has finite bounds */
        bool isBounded() const;

        /** @return dtype of native values: kLong for discrete spaces, kFloat otherwise */
        torch::Dtype nativeDtype() const;

        /**
         * @brief Draws a uniformly random valid value.
         *
         * Uses the torch generator, so torch::manual_seed() makes draws reproducible.
         * Unbounded continuous elements are drawn from a standard normal and clamped
         * into the half-open bound if one exists.
         *
         * @param invalidActions Flat discrete indices to exclude. Ignored by unbounded
         *                       spaces; bounded continuous spaces then return the
         *                       midpoint of a valid bin.
         * @throws InvalidActionError when every value is excluded
         */
        torch::Tensor sample(const std::vector<int64_t> &invalidActions = {}) const;

        /** @return true when `value` has this shape, lies within bounds and is integral for discrete spaces */
        bool contains(const torch::Tensor &value) const;

        /**
         * @brief Native value to per-element discrete representation.
         * @throws ShapeMismatchError if value.sizes() != getShape()
         * @throws UnboundedConversionError if a continuous element has no finite bounds
         */
        torch::Tensor toDiscrete(const torch::Tensor &value) const;

        /**
         * @brief Per-element discrete representation back to a native value.
         *
         * Continuous elements map to the midpoint of their bin.
         */
        torch::Tensor fromDiscrete(const torch::Tensor &discreteValue) const;

        /** @brief Native value to float representation. */
        torch::Tensor toContinuous(const torch::Tensor &value) const;

        /** @brief Float representation back to a native value (rounded and clamped for discrete spaces). */
        torch::Tensor fromContinuous(const torch::Tensor &continuousValue) const;

        /**
         * @brief Verifies this space can be enumerated.
         * @throws UnboundedConversionError naming the first unbounded element
         */
        void checkDiscretizable() const;

        /** @return number of distinct values per element in the discrete representation */
        std::vector<int64_t> getBinCounts() const;

        /** @return product of getBinCounts(), the size of the flat discrete index range */
        int64_t getDiscreteNum() const;

        /**
         * @return value of ordinal 0 in the discrete representation, per element (kLong):
         *         `low` for discrete elements, 0 for bin indices
         */
        torch::Tensor discreteOffset() const;

        /** @brief Per-element discrete representation to a row-major flat index. */
        int64_t encodeDiscreteIndex(const torch::Tensor &discreteValue) const;

        /** @brief Inverse of encodeDiscreteIndex(). */
        torch::Tensor decodeDiscreteIndex(int64_t index) const;

        /**
         * @brief Largest distance between a native value and the value recovered by
         *        fromDiscrete(toDiscrete(value)), per element.
         */
        torch::Tensor quantizationTolerance() const;

        /** @return space describing the discrete representation of this space */
        std::shared_ptr<const Space> discreteView() const;

        /** @return space describing the continuous representation of this space */
        std::shared_ptr<const Space> continuousView() const;

        SpaceDescriptor describe() const;

        std::string toString() const;

        bool operator==(const Space &other) const;

        inline bool operator!=(const Space &other) const
        {
            return !(*this == other);
        }
    };

    /** @brief Rebuilds the concrete variant a descriptor came from. */
    std::shared_ptr<const Space> makeSpace(const SpaceDescriptor &descriptor);

    /**
     * @brief Moves a value from one space into another with the same element count.
     *
     * Discrete targets receive fromDiscrete(from.toDiscrete(value)) reinterpreted
     * element-wise. A discrete source reaching a continuous target picks the
     * midpoint of the bin with the same ordinal. Continuous to continuous goes
     * through the continuous representation.
     *
     * @throws ShapeMismatchError if the spaces hold a different number of elements
     * @throws UnboundedConversionError if either side is discrete and the other unbounded
     * @throws TypeIncompatibilityError if the discrete ranges hold different bin counts
     */
    torch::Tensor convertValue(const Space &from, const Space &to, const torch::Tensor &value);

    /** @brief The checks of convertValue() without a value, for construction-time validation. */
    void checkConvertible(const Space &from, const Space &to);

    std::string shapeToString(const std::vector<int64_t> &shape);

    /** @brief Compact one-line form of a value for messages, e.g. "3" or "[0.5, -1]". */
    std::string valueToString(const torch::Tensor &value);
}

#endif //SIMPLERL_SPACE_SPACE_HPP
