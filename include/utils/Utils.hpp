/*!
 * @file Utils.hpp
 * @brief Utility functions for comparing points and weights, and for evaluating measures on grids.
 *
 * This header provides:
 * - `isapprox` for scalars and Eigen vectors, with a relative tolerance.
 * - `points_equal` / `points_isapprox`: element-wise comparison of point and weight sequences.
 * - `evaluate_weights`: evaluation of a continuous measure on a grid of scalar points, in parallel
 *   with OpenMP. Measures are immutable and their evaluation is pure, so the loop needs no
 *   synchronisation beyond collecting a possible exception.
 *
 * Dependencies:
 * - Eigen for vector operations.
 * - OPM_traits.hpp for type definitions and tolerances.
 */

#ifndef OPM_UTILS_HPP
#define OPM_UTILS_HPP

#include <algorithm>
#include <cmath>
#include <exception>
#include <type_traits>
#include <vector>
#include "../traits/OPM_traits.hpp"

namespace Utils
{

/**
 * @section Comparison Utilities
 */

/**
 * @brief Relative comparison of two floating point numbers.
 *
 * Equal values (including equal infinities) always compare approximately equal.
 * Otherwise |a - b| <= rtol * max(|a|, |b|).
 */
template <typename R>
requires std::is_floating_point_v<R>
inline bool isapprox(R a, R b, R rtol = traits::Tolerance<R>::relative()) noexcept
{
    if (a == b) {
        return true;
    }
    if (!std::isfinite(a) || !std::isfinite(b)) {
        return false;
    }
    return std::abs(a - b) <= rtol * std::max(std::abs(a), std::abs(b));
}

/**
 * @brief Relative comparison of two Eigen vectors in the Euclidean norm.
 */
template <typename V>
requires traits::is_eigen_vector_v<V>
inline bool isapprox(const V& a, const V& b,
                     traits::prectype_t<V> rtol = traits::Tolerance<traits::prectype_t<V>>::relative())
{
    if (a.size() != b.size()) {
        return false;
    }
    return (a - b).norm() <= rtol * std::max(a.norm(), b.norm());
}

/**
 * @brief Exact equality of two points; vectors must also agree in size.
 */
template <typename T>
inline bool point_equal(const T& a, const T& b)
{
    if constexpr (traits::is_eigen_vector_v<T>) {
        return a.size() == b.size() && a == b;
    } else {
        return a == b;
    }
}

/**
 * @brief Approximate equality of two points. Integer points compare exactly.
 */
template <typename T>
inline bool point_isapprox(const T& a, const T& b, traits::prectype_t<T> rtol)
{
    if constexpr (traits::is_eigen_vector_v<T>) {
        return isapprox(a, b, rtol);
    } else if constexpr (std::is_floating_point_v<T>) {
        return isapprox(a, b, rtol);
    } else {
        return a == b;
    }
}

/**
 * @brief Element-wise exact equality of two point sequences, paired in order.
 */
template <typename T>
bool points_equal(const std::vector<T>& a, const std::vector<T>& b)
{
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(),
                      [](const T& x, const T& y) { return point_equal(x, y); });
}

/**
 * @brief Element-wise approximate equality of two point sequences, paired in order.
 */
template <typename T>
bool points_isapprox(const std::vector<T>& a, const std::vector<T>& b, traits::prectype_t<T> rtol)
{
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(),
                      [rtol](const T& x, const T& y) { return point_isapprox(x, y, rtol); });
}

/**
 * @brief Element-wise exact equality of two weight vectors.
 */
template <typename R>
bool weights_equal(const traits::DataType::WeightVector<R>& a, const traits::DataType::WeightVector<R>& b)
{
    return a.size() == b.size() && (a.array() == b.array()).all();
}

/**
 * @brief Element-wise approximate equality of two weight vectors.
 */
template <typename R>
bool weights_isapprox(const traits::DataType::WeightVector<R>& a, const traits::DataType::WeightVector<R>& b, R rtol)
{
    if (a.size() != b.size()) {
        return false;
    }
    for (Eigen::Index i = 0; i < a.size(); ++i) {
        if (!isapprox(a[i], b[i], rtol)) {
            return false;
        }
    }
    return true;
}

/**
 * @section Grid Evaluation
 */

/**
 * @brief Evaluates a continuous measure at every point of a grid.
 *
 * @tparam M A continuous measure over scalar points.
 * @param measure The measure.
 * @param grid The evaluation points.
 * @return The weights, one per grid point; zero outside the support.
 */
template <typename M>
traits::DataType::WeightVector<typename M::CodomainType>
evaluate_weights(const M& measure, const traits::DataType::WeightVector<typename M::DomainType>& grid)
{
    static_assert(!traits::is_eigen_vector_v<typename M::DomainType>,
                  "evaluate_weights expects a measure over scalar points.");

    traits::DataType::WeightVector<typename M::CodomainType> values(grid.size());
    std::exception_ptr error = nullptr;

    #pragma omp parallel for
    for (Eigen::Index i = 0; i < grid.size(); ++i) {
        try {
            values[i] = measure.weight(grid[i]);
        } catch (...) {
            #pragma omp critical
            {
                if (!error) {
                    error = std::current_exception();
                }
            }
        }
    }

    if (error) {
        std::rethrow_exception(error);
    }
    return values;
}

} // namespace Utils

#endif // OPM_UTILS_HPP
