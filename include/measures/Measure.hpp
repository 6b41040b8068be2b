/**
 * @file Measure.hpp
 * @brief CRTP framework shared by all measures: continuous weight functions and discrete weights.
 *
 * A measure is parametrized by its domain type T, the type of the points it accepts. Its
 * codomain type, the scalar in which weights are returned, is always traits::prectype_t<T>.
 *
 * ## Main Components
 *
 * - **Measure**: CRTP root. Declares the domain and codomain types and the default
 *   capabilities: full-space support and "not normalized".
 *
 * - **Weight**: continuous measures, dμ = w(x) dx. Evaluation with `weight(x)` follows a
 *   two-phase protocol:
 *     1. If the type of x is not T, the measure is rebuilt over U = promote_t<S, T>
 *        with `similar<U>()`, x is converted to U, and evaluation restarts.
 *     2. Once the types match, x is tested against the support. Members are passed to
 *        the variant's `unsafe_weight`, everything else weighs zero.
 *   Variants therefore only implement `unsafe_weight` for points of their exact domain
 *   type that lie in their support.
 *
 * - **DiscreteWeight**: measures made of points and weights. `weight_at(i)` checks the
 *   index and dispatches to `unsafe_weight_at(i)`, which reads the stored weights unless a
 *   variant computes them on the fly.
 *
 * Each variant implements `template <typename U> similar() const`, returning the same
 * variant over domain type U.
 *
 * ## Usage Example
 * @code
 * measures::JacobiMeasure jacobi(1.0, 2.0);
 * double w = jacobi.weight(0.5);     // (1.5)^1 (0.5)^2
 * double z = jacobi.weight(2.0);     // 0, outside [-1, 1]
 * double p = jacobi.weight(0);       // int argument, promoted to double
 * auto f = jacobi.weight_function(); // f(0.5f), f(0) and f(0.5) all promote like weight()
 * @endcode
 */
#ifndef OPM_MEASURE_HPP
#define OPM_MEASURE_HPP

#include <concepts>
#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>
#include "../domains/Domains.hpp"
#include "../traits/OPM_traits.hpp"
#include "../traits/Promotion.hpp"
#include "../utils/Utils.hpp"
#include "MeasureValidator.hpp"

namespace measures {

/**
 * @brief Root of the measure hierarchy (CRTP).
 *
 * @tparam Derived The concrete measure.
 * @tparam T Domain type.
 */
template <typename Derived, typename T>
class Measure {
public:
    using DomainType = T;
    using CodomainType = traits::prectype_t<T>;

    /**
     * @brief Support of the measure. Variants that restrict their domain hide this.
     */
    domains::FullSpace<T> support() const { return {}; }

    /**
     * @brief Does the measure have total mass one? Unknown measures report false.
     */
    bool is_normalized() const { return false; }

protected:
    const Derived& derived() const { return static_cast<const Derived&>(*this); }
};

/**
 * @brief Continuous measure defined by a weight function.
 *
 * @tparam Derived The concrete weight.
 * @tparam T Domain type.
 */
template <typename Derived, typename T>
class Weight : public Measure<Derived, T> {
    using Base = Measure<Derived, T>;

public:
    using typename Base::DomainType;
    using typename Base::CodomainType;

    static constexpr traits::MeasureKind kind() noexcept { return traits::MeasureKind::Continuous; }
    static constexpr bool is_discrete() noexcept { return false; }
    static constexpr bool is_continuous() noexcept { return true; }

    /**
     * @brief Evaluates the weight function at x.
     *
     * @tparam S Argument type; must have a common type with T.
     * @param x Evaluation point.
     * @return The weight, or zero if x lies outside the support. The result has the
     *         codomain type of the promoted measure.
     * @throws traits::TypePromotionError if a vector argument has the wrong dimension.
     */
    template <typename S>
    requires traits::Promotable<S, T>
    auto weight(const S& x) const
    {
        if constexpr (std::is_same_v<S, T>) {
            return in_support(x) ? this->derived().unsafe_weight(x) : CodomainType(0);
        } else {
            using U = traits::promote_t<S, T>;
            if constexpr (std::is_same_v<U, T>) {
                return weight(traits::convert_point<U>(x));
            } else {
                return this->derived().template similar<U>().weight(traits::convert_point<U>(x));
            }
        }
    }

    /// @brief Same as weight(x).
    template <typename S>
    requires traits::Promotable<S, T>
    auto operator()(const S& x) const { return weight(x); }

    /**
     * @brief Membership test used by the gate in weight().
     *
     * Arguments of another type are promoted as in weight(), so that in_support(x) is the
     * decision weight(x) takes.
     */
    template <typename S>
    requires traits::Promotable<S, T>
    bool in_support(const S& x) const
    {
        if constexpr (std::is_same_v<S, T>) {
            return this->derived().support().contains(x);
        } else {
            using U = traits::promote_t<S, T>;
            if constexpr (std::is_same_v<U, T>) {
                return in_support(traits::convert_point<U>(x));
            } else {
                return this->derived().template similar<U>().in_support(traits::convert_point<U>(x));
            }
        }
    }

    /**
     * @brief The raw weight formula, valid for points in the support only.
     * @throws UnsupportedOperationError unless the variant defines its own formula.
     */
    CodomainType unsafe_weight(const T&) const {
        throw UnsupportedOperationError("Measure does not define a weight function.");
    }

    /**
     * @brief Returns the weight function as a callable.
     *
     * The callable holds a copy of the measure and stays valid after the measure is gone.
     * It accepts every argument weight() accepts and promotes it the same way, so
     * `weight_function()(x) == weight(x)` for x of any promotable type.
     */
    auto weight_function() const {
        return [measure = this->derived()]<typename S>(const S& x) requires traits::Promotable<S, T> {
            return measure.weight(x);
        };
    }

    /**
     * @brief The weight function as a std::function over T.
     *
     * Only arguments of exactly type T are evaluated as such: the std::function converts
     * anything else to T before the measure sees it.
     */
    std::function<CodomainType(const T&)> typed_weight_function() const {
        return [measure = this->derived()](const T& x) -> CodomainType { return measure.weight(x); };
    }

    /**
     * @brief Returns the unguarded weight formula as a std::function.
     */
    std::function<CodomainType(const T&)> unsafe_weight_function() const {
        return [measure = this->derived()](const T& x) -> CodomainType { return measure.unsafe_weight(x); };
    }
};

/**
 * @brief Discrete measure made of an ordered sequence of points and matching weights.
 *
 * Variants implement `points()` and `weights()`, and may replace `unsafe_weight_at` with a
 * formula.
 *
 * @tparam Derived The concrete discrete weight.
 * @tparam T Domain type (the type of each point).
 */
template <typename Derived, typename T>
class DiscreteWeight : public Measure<Derived, T> {
    using Base = Measure<Derived, T>;

public:
    using typename Base::DomainType;
    using typename Base::CodomainType;
    using Index = std::size_t;
    using PointStorage = std::vector<T>;
    using WeightStorage = traits::DataType::WeightVector<CodomainType>;

    static constexpr traits::MeasureKind kind() noexcept { return traits::MeasureKind::Discrete; }
    static constexpr bool is_discrete() noexcept { return true; }
    static constexpr bool is_continuous() noexcept { return false; }

    /// @brief Number of points.
    Index size() const { return this->derived().points().size(); }

    /**
     * @throws std::out_of_range if i is not a valid point index.
     */
    void check_bounds(Index i) const {
        if (i >= size()) {
            throw std::out_of_range("Index " + std::to_string(i)
                                    + " is out of range for a discrete weight with "
                                    + std::to_string(size()) + " points.");
        }
    }

    /**
     * @brief Weight of the i-th point, bounds checked.
     * @throws std::out_of_range if i >= size().
     */
    CodomainType weight_at(Index i) const {
        check_bounds(i);
        return this->derived().unsafe_weight_at(i);
    }

    /**
     * @brief Weight of the i-th point without bounds checking.
     */
    CodomainType unsafe_weight_at(Index i) const {
        return this->derived().weights()[static_cast<Eigen::Index>(i)];
    }

    /**
     * @brief True if the weights sum to one within the default tolerance.
     */
    bool is_normalized() const {
        const CodomainType total = this->derived().weights().sum();
        return Utils::isapprox(total, CodomainType(1));
    }
};

/// @name Capability concepts
/// @{
template <typename M>
concept ContinuousMeasure = std::derived_from<M, Weight<M, typename M::DomainType>>;

template <typename M>
concept DiscreteMeasure = std::derived_from<M, DiscreteWeight<M, typename M::DomainType>>;

template <typename M>
concept AnyMeasure = ContinuousMeasure<M> || DiscreteMeasure<M>;
/// @}

template <typename M>
using domain_type_t = typename M::DomainType;

template <typename M>
using codomain_type_t = typename M::CodomainType;

/// @name Comparison of discrete weights
/// @{

namespace detail {

/// @brief The measure itself if its domain type is U, otherwise its similar<U>().
template <typename U, typename M>
decltype(auto) retyped(const M& m)
{
    if constexpr (std::is_same_v<typename M::DomainType, U>) {
        return (m);
    } else {
        return m.template similar<U>();
    }
}

} // namespace detail

/**
 * @brief Discrete weights are equal if their points and weights are equal element-wise.
 *
 * Weights over different domain types are compared after promotion to their common type,
 * so integer points [0, 1] equal double points [0.0, 1.0].
 */
template <typename D1, typename T1, typename D2, typename T2>
requires traits::Promotable<T1, T2>
bool operator==(const DiscreteWeight<D1, T1>& a, const DiscreteWeight<D2, T2>& b)
{
    using U = traits::promote_t<T1, T2>;
    using R = traits::prectype_t<U>;
    const auto& lhs = detail::retyped<U>(static_cast<const D1&>(a));
    const auto& rhs = detail::retyped<U>(static_cast<const D2&>(b));
    return Utils::points_equal(lhs.points(), rhs.points())
        && Utils::weights_equal<R>(lhs.weights(), rhs.weights());
}

/**
 * @brief Discrete weights are approximately equal if their points and weights are,
 *        element-wise and within a relative tolerance, after promotion to a common type.
 */
template <typename D1, typename T1, typename D2, typename T2>
requires traits::Promotable<T1, T2>
bool isapprox(const DiscreteWeight<D1, T1>& a, const DiscreteWeight<D2, T2>& b,
              traits::prectype_t<traits::promote_t<T1, T2>> rtol
                  = traits::Tolerance<traits::prectype_t<traits::promote_t<T1, T2>>>::relative())
{
    using U = traits::promote_t<T1, T2>;
    using R = traits::prectype_t<U>;
    const auto& lhs = detail::retyped<U>(static_cast<const D1&>(a));
    const auto& rhs = detail::retyped<U>(static_cast<const D2&>(b));
    return Utils::points_isapprox(lhs.points(), rhs.points(), rtol)
        && Utils::weights_isapprox<R>(lhs.weights(), rhs.weights(), rtol);
}
/// @}

/// @name Free-function interface
/// @{
template <AnyMeasure M>
decltype(auto) support(const M& m) { return m.support(); }

template <AnyMeasure M>
constexpr bool is_discrete(const M&) noexcept { return M::is_discrete(); }

template <AnyMeasure M>
constexpr bool is_continuous(const M&) noexcept { return M::is_continuous(); }

template <AnyMeasure M>
bool is_normalized(const M& m) { return m.is_normalized(); }

template <ContinuousMeasure M, typename S>
auto weight(const M& m, const S& x) { return m.weight(x); }

template <ContinuousMeasure M>
auto unsafe_weight(const M& m, const typename M::DomainType& x) { return m.unsafe_weight(x); }

template <ContinuousMeasure M>
auto weight_function(const M& m) { return m.weight_function(); }

template <ContinuousMeasure M>
auto typed_weight_function(const M& m) { return m.typed_weight_function(); }

template <ContinuousMeasure M>
auto unsafe_weight_function(const M& m) { return m.unsafe_weight_function(); }

template <DiscreteMeasure M>
decltype(auto) points(const M& m) { return m.points(); }

template <DiscreteMeasure M>
decltype(auto) weights(const M& m) { return m.weights(); }

template <DiscreteMeasure M>
auto weight_at(const M& m, std::size_t i) { return m.weight_at(i); }

template <DiscreteMeasure M>
std::size_t length(const M& m) { return m.size(); }

/// @brief The same measure over domain type U.
template <typename U, AnyMeasure M>
auto similar(const M& m) { return m.template similar<U>(); }
/// @}

} // namespace measures

#endif // OPM_MEASURE_HPP
