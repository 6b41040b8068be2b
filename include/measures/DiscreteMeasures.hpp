/**
 * @file DiscreteMeasures.hpp
 * @brief Concrete discrete weights.
 *
 * - GenericDiscreteWeight: explicit points, weights and support domain, all fixed at
 *   construction. The support may be larger than the convex hull of the points.
 * - UniformDiscreteWeight: points only; every weight is 1/n and computed on access.
 *
 * Usage Example:
 * @code
 * auto mu = measures::make_discrete_weight(std::vector<double>{0.0, 1.0, 2.0},
 *                                          {0.2, 0.3, 0.5});
 * double w = mu.weight_at(1);      // 0.3
 * bool n = mu.is_normalized();     // true
 * mu.weight_at(3);                 // throws std::out_of_range
 * @endcode
 */
#ifndef OPM_DISCRETE_MEASURES_HPP
#define OPM_DISCRETE_MEASURES_HPP

#include <algorithm>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "Measure.hpp"

namespace measures {

/**
 * @brief A discrete weight that stores its points, weights and support.
 *
 * @tparam T Domain type (type of each point).
 * @tparam D Support domain type.
 */
template <typename T = traits::DataType::MeasureField, typename D = domains::FullSpace<T>>
class GenericDiscreteWeight : public DiscreteWeight<GenericDiscreteWeight<T, D>, T> {
public:
    using Base = DiscreteWeight<GenericDiscreteWeight<T, D>, T>;
    using typename Base::CodomainType;
    using typename Base::PointStorage;
    using typename Base::WeightStorage;

    /**
     * @brief Constructs the discrete weight.
     *
     * @param points The points, in order.
     * @param weights The weight of each point, in the same order.
     * @param domain The support (the full space by default).
     * @throws std::invalid_argument if points and weights differ in length.
     */
    GenericDiscreteWeight(PointStorage points, const std::vector<CodomainType>& weights, D domain = D{})
        : points_(std::move(points))
        , weights_(Eigen::Map<const WeightStorage>(weights.data(), static_cast<Eigen::Index>(weights.size())))
        , domain_(std::move(domain))
    {
        validate();
    }

    /**
     * @brief The same points, weights and support over domain type U.
     */
    template <typename U>
    auto similar() const {
        using DU = decltype(domain_.template similar<U>());
        using RU = traits::prectype_t<U>;

        std::vector<U> converted;
        converted.reserve(points_.size());
        std::transform(points_.begin(), points_.end(), std::back_inserter(converted),
                       [](const T& p) { return traits::convert_point<U>(p); });

        return GenericDiscreteWeight<U, DU>(std::move(converted),
                                            weights_.template cast<RU>(),
                                            domain_.template similar<U>(),
                                            typename GenericDiscreteWeight<U, DU>::StorageTag{});
    }

    const PointStorage& points() const noexcept { return points_; }

    const WeightStorage& weights() const noexcept { return weights_; }

    const D& support() const noexcept { return domain_; }

private:
    template <typename, typename> friend class GenericDiscreteWeight;

    struct StorageTag {};

    GenericDiscreteWeight(PointStorage points, WeightStorage weights, D domain, StorageTag)
        : points_(std::move(points))
        , weights_(std::move(weights))
        , domain_(std::move(domain))
    {
        validate();
    }

    void validate() const {
        if (points_.size() != static_cast<std::size_t>(weights_.size())) {
            throw std::invalid_argument("Discrete weight has " + std::to_string(points_.size())
                                        + " points but " + std::to_string(weights_.size()) + " weights.");
        }
        if (points_.empty()) {
            std::cerr << "Warning: discrete weight constructed without points." << std::endl;
        }

        const auto outside = std::count_if(points_.begin(), points_.end(),
                                           [this](const T& p) { return !domain_.contains(p); });
        if (outside > 0) {
            std::cerr << "Warning: " << outside << " point(s) of the discrete weight lie outside its support."
                      << std::endl;
        }
    }

    PointStorage points_;
    WeightStorage weights_;
    D domain_;
};

/**
 * @brief Builds a GenericDiscreteWeight, deducing the point and domain types.
 */
template <typename T, typename D = domains::FullSpace<T>>
GenericDiscreteWeight<T, D> make_discrete_weight(std::vector<T> points,
                                                 const std::vector<traits::prectype_t<T>>& weights,
                                                 D domain = D{})
{
    return GenericDiscreteWeight<T, D>(std::move(points), weights, std::move(domain));
}

/**
 * @brief Discrete weight giving every one of its n points the weight 1/n.
 *
 * Only the points are stored: weights are computed in unsafe_weight_at.
 */
template <typename T = traits::DataType::MeasureField>
class UniformDiscreteWeight : public DiscreteWeight<UniformDiscreteWeight<T>, T> {
public:
    using Base = DiscreteWeight<UniformDiscreteWeight<T>, T>;
    using typename Base::CodomainType;
    using typename Base::Index;
    using typename Base::PointStorage;
    using typename Base::WeightStorage;

    explicit UniformDiscreteWeight(PointStorage points) : points_(std::move(points)) {
        if (points_.empty()) {
            std::cerr << "Warning: uniform discrete weight constructed without points." << std::endl;
        }
    }

    template <typename U>
    UniformDiscreteWeight<U> similar() const {
        std::vector<U> converted;
        converted.reserve(points_.size());
        std::transform(points_.begin(), points_.end(), std::back_inserter(converted),
                       [](const T& p) { return traits::convert_point<U>(p); });
        return UniformDiscreteWeight<U>(std::move(converted));
    }

    const PointStorage& points() const noexcept { return points_; }

    WeightStorage weights() const {
        return WeightStorage::Constant(static_cast<Eigen::Index>(points_.size()), uniform_weight());
    }

    CodomainType unsafe_weight_at(Index) const { return uniform_weight(); }

    bool is_normalized() const { return !points_.empty(); }

private:
    CodomainType uniform_weight() const {
        return CodomainType(1) / static_cast<CodomainType>(points_.size());
    }

    PointStorage points_;
};

template <typename T>
UniformDiscreteWeight(std::vector<T>) -> UniformDiscreteWeight<T>;

} // namespace measures

#endif // OPM_DISCRETE_MEASURES_HPP
