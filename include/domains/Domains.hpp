/**
 * @file Domains.hpp
 * @brief Support domains of measures: membership testing and shape identity.
 *
 * The measures only ever ask a domain whether a point is a member, and the Lebesgue
 * factory asks which well-known shape it is. This header provides:
 *   - FullSpace<T>: every point of type T.
 *   - ClosedInterval<T>: [lower, upper].
 *   - UnitInterval<T>, ChebyshevInterval<T>: the intervals [0, 1] and [-1, 1].
 *   - HalfLine<T>: [0, inf).
 *   - Point<T>: a single point (scalar or Eigen vector).
 *   - AnyDomain<T>: a runtime variant of the scalar shapes above.
 *
 * Every domain exposes `ValueType`, `contains(x)`, `shape()` and `similar<U>()`, which
 * rebuilds the same domain over another point type.
 */
#ifndef OPM_DOMAINS_HPP
#define OPM_DOMAINS_HPP

#include <concepts>
#include <type_traits>
#include <variant>
#include "../traits/OPM_traits.hpp"

namespace domains {

/**
 * @brief Requirements on a support domain over points of type D::ValueType.
 */
template <typename D>
concept DomainLike = requires(const D& d, const typename D::ValueType& x) {
    { d.contains(x) } -> std::convertible_to<bool>;
};

/**
 * @brief The whole space of points of type T.
 */
template <typename T = traits::DataType::MeasureField>
struct FullSpace {
    using ValueType = T;

    constexpr bool contains(const T&) const noexcept { return true; }

    static constexpr traits::DomainShape shape() noexcept { return traits::DomainShape::FullSpace; }

    template <typename U>
    FullSpace<U> similar() const { return {}; }
};

/**
 * @brief Represents a closed numeric interval [lower, upper].
 *
 * @tparam T Type of the interval endpoints.
 */
template <typename T = traits::DataType::MeasureField>
struct ClosedInterval {
    using ValueType = T;

    T lower; ///< Lower bound of the interval
    T upper; ///< Upper bound of the interval

    /**
     * @brief Checks if a value lies within the interval. NaN is never a member.
     */
    constexpr bool contains(const T& x) const noexcept {
        return x >= lower && x <= upper;
    }

    static constexpr traits::DomainShape shape() noexcept { return traits::DomainShape::Interval; }

    template <typename U>
    ClosedInterval<U> similar() const { return {static_cast<U>(lower), static_cast<U>(upper)}; }
};

/**
 * @brief The interval [0, 1].
 */
template <typename T = traits::DataType::MeasureField>
struct UnitInterval {
    using ValueType = T;

    constexpr bool contains(const T& x) const noexcept { return x >= T(0) && x <= T(1); }

    static constexpr traits::DomainShape shape() noexcept { return traits::DomainShape::UnitInterval; }

    template <typename U>
    UnitInterval<U> similar() const { return {}; }
};

/**
 * @brief The interval [-1, 1] on which the Chebyshev, Legendre and Jacobi families live.
 */
template <typename T = traits::DataType::MeasureField>
struct ChebyshevInterval {
    using ValueType = T;

    constexpr bool contains(const T& x) const noexcept { return x >= T(-1) && x <= T(1); }

    static constexpr traits::DomainShape shape() noexcept { return traits::DomainShape::ChebyshevInterval; }

    template <typename U>
    ChebyshevInterval<U> similar() const { return {}; }
};

/**
 * @brief The half line [0, inf).
 */
template <typename T = traits::DataType::MeasureField>
struct HalfLine {
    using ValueType = T;

    constexpr bool contains(const T& x) const noexcept { return x >= T(0); }

    static constexpr traits::DomainShape shape() noexcept { return traits::DomainShape::HalfLine; }

    template <typename U>
    HalfLine<U> similar() const { return {}; }
};

/**
 * @brief A domain consisting of a single point.
 *
 * Membership is exact equality. For vector points the dimensions must agree as well.
 */
template <typename T = traits::DataType::MeasureField>
struct Point {
    using ValueType = T;

    T point;

    bool contains(const T& x) const {
        if constexpr (traits::is_eigen_vector_v<T>) {
            return x.size() == point.size() && x == point;
        } else {
            return x == point;
        }
    }

    static constexpr traits::DomainShape shape() noexcept { return traits::DomainShape::Point; }

    template <typename U>
    Point<U> similar() const {
        if constexpr (traits::is_eigen_vector_v<U>) {
            return {U(point.template cast<typename U::Scalar>())};
        } else {
            return {static_cast<U>(point)};
        }
    }
};

/**
 * @brief Runtime variant over the scalar domain shapes.
 */
template <typename T = traits::DataType::MeasureField>
using AnyDomain = std::variant<FullSpace<T>, UnitInterval<T>, ChebyshevInterval<T>,
                               HalfLine<T>, ClosedInterval<T>, Point<T>>;

/// @brief Membership test on a domain held in an AnyDomain.
template <typename T>
bool contains(const AnyDomain<T>& domain, const T& x)
{
    return std::visit([&x](const auto& d) { return d.contains(x); }, domain);
}

/// @brief Shape of the domain held in an AnyDomain.
template <typename T>
traits::DomainShape shape_of(const AnyDomain<T>& domain)
{
    return std::visit([](const auto& d) { return d.shape(); }, domain);
}

} // namespace domains

#endif // OPM_DOMAINS_HPP
