/*!
 * @file OPM_traits.hpp
 * @brief Defines core type traits, enumerations, and data structures for the OPMeasures library.
 *
 * This header provides the type definitions and enumerations used throughout the library,
 * including the Eigen-based storage types for discrete weights and vector-valued points,
 * the "precision type" extractor used to derive the codomain of a measure from its domain
 * type, and the default numerical tolerances.
 */

#ifndef OPM_TRAITS_HPP
#define OPM_TRAITS_HPP

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <type_traits>

namespace traits
/*!
 * @namespace traits
 * @brief Contains all type traits, type aliases, and enumerations used across the OPMeasures library.
 */
{

/*!
 * @struct DataType
 * @brief Central container of type aliases for commonly used storage types in OPMeasures.
 */
struct DataType
{
public:
    using MeasureField = double;  ///< Scalar field used by default for domains and weights.

    using StoringVector = Eigen::Matrix<MeasureField, Eigen::Dynamic, 1>; ///< Grid of scalar points, or a point in R^d.

    template <typename R>
    using WeightVector = Eigen::Matrix<R, Eigen::Dynamic, 1>; ///< Storage of discrete weights with scalar R.
};

/*!
 * @enum ScalarKind
 * @brief The numeric tower on which promotion operates.
 */
enum class ScalarKind
{
    Int32,   ///< 32-bit signed integer.
    Int64,   ///< 64-bit signed integer.
    UInt32,  ///< 32-bit unsigned integer.
    UInt64,  ///< 64-bit unsigned integer.
    Float32, ///< Single precision.
    Float64, ///< Double precision.
    Float80, ///< Extended precision (long double).
    None     ///< Not on the tower, or no common supertype.
};

/*!
 * @enum MeasureKind
 * @brief Whether a measure is a weight function or a set of points and weights.
 */
enum class MeasureKind
{
    Continuous, ///< Defined by a weight function dmu = w(x) dx.
    Discrete    ///< Defined by points and associated weights.
};

/*!
 * @enum DomainShape
 * @brief The well-known domain shapes recognised by the Lebesgue factory.
 */
enum class DomainShape
{
    FullSpace,         ///< The whole space of the point type.
    UnitInterval,      ///< [0, 1]
    ChebyshevInterval, ///< [-1, 1]
    HalfLine,          ///< [0, inf)
    Interval,          ///< A general closed interval [a, b].
    Point              ///< A single point.
};

// -----------------------------------------------------------------------------
// Eigen vector detection
// -----------------------------------------------------------------------------

template <typename T>
struct is_eigen_vector : std::false_type {};

template <typename S, int Rows, int Options, int MaxRows, int MaxCols>
struct is_eigen_vector<Eigen::Matrix<S, Rows, 1, Options, MaxRows, MaxCols>> : std::true_type {};

template <typename T>
inline constexpr bool is_eigen_vector_v = is_eigen_vector<T>::value;

// -----------------------------------------------------------------------------
// Precision type
// -----------------------------------------------------------------------------

/*!
 * @brief The scalar floating type underlying T.
 *
 * Floating types map to themselves, integers to double and Eigen vectors to the
 * precision type of their scalar. Other types have no precision type.
 */
template <typename T, typename = void>
struct prectype {};

template <typename T>
struct prectype<T, std::enable_if_t<std::is_floating_point_v<T>>>
{
    using type = T;
};

template <typename T>
struct prectype<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>>
{
    using type = double;
};

template <typename T>
struct prectype<T, std::enable_if_t<is_eigen_vector_v<T>>>
{
    using type = typename prectype<typename T::Scalar>::type;
};

template <typename T>
using prectype_t = typename prectype<T>::type;

/*!
 * @brief Default relative tolerances used by approximate comparisons.
 * @tparam R Floating point type.
 */
template <typename R>
struct Tolerance
{
    static R relative() noexcept
    {
        return std::max(static_cast<R>(1e-6), std::sqrt(std::numeric_limits<R>::epsilon()));
    }
};

} // namespace traits

#endif // OPM_TRAITS_HPP
