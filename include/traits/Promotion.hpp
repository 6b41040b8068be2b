/*!
 * @file Promotion.hpp
 * @brief Numeric promotion between the argument type and the domain type of a measure.
 *
 * Promotion is modelled explicitly rather than left to the implicit conversions of the
 * language. It comes in two forms:
 * - `promote_kind`, a total constexpr function on the scalar tower `traits::ScalarKind`,
 *   with `common_kind` as its throwing runtime counterpart;
 * - `promote_t<S, T>`, the compile-time form used by measure evaluation. It is defined
 *   for scalar pairs whose kinds promote and, element-wise, for Eigen column vectors.
 *
 * Eigen expressions (blocks, maps, `2 * v`, `Vector3d::Zero()`) promote as the plain vector
 * they evaluate to. `convert_point<U>` performs the conversion of an argument to the promoted
 * type, evaluating expressions on the way.
 *
 * Usage Example:
 * @code
 * using U = traits::promote_t<int, float>;                // float
 * using V = traits::promote_t<Eigen::VectorXf,
 *                             Eigen::Vector3d>;           // Eigen::Vector3d
 * auto k = traits::common_kind(traits::ScalarKind::Int64,
 *                              traits::ScalarKind::UInt64); // throws TypePromotionError
 * @endcode
 */

#ifndef OPM_PROMOTION_HPP
#define OPM_PROMOTION_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include "OPM_traits.hpp"

namespace traits {

/**
 * @brief Raised when two numeric types have no common supertype.
 */
class TypePromotionError : public std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

/// @name Scalar tower
/// @{

/**
 * @brief Position of a C++ type on the scalar tower, or ScalarKind::None.
 */
template <typename S>
constexpr ScalarKind scalar_kind_of() noexcept
{
    if constexpr (std::is_same_v<S, float>) {
        return ScalarKind::Float32;
    } else if constexpr (std::is_same_v<S, double>) {
        return ScalarKind::Float64;
    } else if constexpr (std::is_same_v<S, long double>) {
        return ScalarKind::Float80;
    } else if constexpr (std::is_integral_v<S> && !std::is_same_v<S, bool>) {
        if constexpr (std::is_signed_v<S>) {
            return sizeof(S) <= 4 ? ScalarKind::Int32
                 : sizeof(S) == 8 ? ScalarKind::Int64 : ScalarKind::None;
        } else {
            return sizeof(S) <= 4 ? ScalarKind::UInt32
                 : sizeof(S) == 8 ? ScalarKind::UInt64 : ScalarKind::None;
        }
    } else {
        return ScalarKind::None;
    }
}

template <typename S>
inline constexpr ScalarKind scalar_kind_v = scalar_kind_of<S>();

constexpr bool is_floating_kind(ScalarKind k) noexcept
{
    return k == ScalarKind::Float32 || k == ScalarKind::Float64 || k == ScalarKind::Float80;
}

constexpr bool is_signed_kind(ScalarKind k) noexcept
{
    return k == ScalarKind::Int32 || k == ScalarKind::Int64 || is_floating_kind(k);
}

constexpr int bit_width(ScalarKind k) noexcept
{
    switch (k) {
        case ScalarKind::Int32:
        case ScalarKind::UInt32:
        case ScalarKind::Float32:
            return 32;
        case ScalarKind::Int64:
        case ScalarKind::UInt64:
        case ScalarKind::Float64:
            return 64;
        case ScalarKind::Float80:
            return 80;
        default:
            return 0;
    }
}

/**
 * @brief Common supertype of two kinds on the tower.
 *
 * Floating kinds absorb integers; among floating kinds the wider one wins. Integers of
 * the same signedness promote to the wider one. A signed and an unsigned integer promote
 * to the signed kind only if it is strictly wider, otherwise there is no lossless
 * integer supertype and the result is ScalarKind::None.
 */
constexpr ScalarKind promote_kind(ScalarKind a, ScalarKind b) noexcept
{
    if (a == ScalarKind::None || b == ScalarKind::None) {
        return ScalarKind::None;
    }
    if (a == b) {
        return a;
    }

    const bool fa = is_floating_kind(a);
    const bool fb = is_floating_kind(b);
    if (fa && fb) {
        return bit_width(a) >= bit_width(b) ? a : b;
    }
    if (fa) {
        return a;
    }
    if (fb) {
        return b;
    }

    if (is_signed_kind(a) == is_signed_kind(b)) {
        return bit_width(a) >= bit_width(b) ? a : b;
    }
    const ScalarKind s = is_signed_kind(a) ? a : b;
    const ScalarKind u = is_signed_kind(a) ? b : a;
    return bit_width(s) > bit_width(u) ? s : ScalarKind::None;
}

inline std::string to_string(ScalarKind k)
{
    switch (k) {
        case ScalarKind::Int32:   return "Int32";
        case ScalarKind::Int64:   return "Int64";
        case ScalarKind::UInt32:  return "UInt32";
        case ScalarKind::UInt64:  return "UInt64";
        case ScalarKind::Float32: return "Float32";
        case ScalarKind::Float64: return "Float64";
        case ScalarKind::Float80: return "Float80";
        default:                  return "None";
    }
}

/**
 * @brief Runtime form of promote_kind.
 * @throws TypePromotionError if the kinds have no common supertype.
 */
inline ScalarKind common_kind(ScalarKind a, ScalarKind b)
{
    const ScalarKind k = promote_kind(a, b);
    if (k == ScalarKind::None) {
        throw TypePromotionError("No common numeric type for " + to_string(a) + " and " + to_string(b) + ".");
    }
    return k;
}

template <ScalarKind K> struct kind_type {};
template <> struct kind_type<ScalarKind::Int32>   { using type = std::int32_t; };
template <> struct kind_type<ScalarKind::Int64>   { using type = std::int64_t; };
template <> struct kind_type<ScalarKind::UInt32>  { using type = std::uint32_t; };
template <> struct kind_type<ScalarKind::UInt64>  { using type = std::uint64_t; };
template <> struct kind_type<ScalarKind::Float32> { using type = float; };
template <> struct kind_type<ScalarKind::Float64> { using type = double; };
template <> struct kind_type<ScalarKind::Float80> { using type = long double; };

/// @}

/// @name Compile-time promotion
/// @{

/**
 * @brief Common type of an argument type S and a domain type T.
 *
 * Has a nested `type` only if the promotion exists.
 */
template <typename S, typename T>
struct promote {};

template <typename S, typename T>
concept Promotable = requires { typename promote<S, T>::type; };

template <typename S, typename T>
using promote_t = typename promote<S, T>::type;

// Identical scalars promote to themselves
template <typename S, typename T>
requires (std::is_same_v<S, T> && scalar_kind_v<S> != ScalarKind::None)
struct promote<S, T>
{
    using type = T;
};

template <typename S, typename T>
requires (!std::is_same_v<S, T> && promote_kind(scalar_kind_v<S>, scalar_kind_v<T>) != ScalarKind::None)
struct promote<S, T>
{
    using type = typename kind_type<promote_kind(scalar_kind_v<S>, scalar_kind_v<T>)>::type;
};

/**
 * @brief Element-wise promotion of column vectors.
 *
 * The result keeps the row count of the domain vector T: a fixed-size domain converts
 * dynamic input to its fixed size, a dynamic domain accepts fixed-size input.
 */
template <typename S, int RS, int OS, int MRS, int MCS,
          typename T, int RT, int OT, int MRT, int MCT>
requires (Promotable<S, T> && (RS == Eigen::Dynamic || RT == Eigen::Dynamic || RS == RT))
struct promote<Eigen::Matrix<S, RS, 1, OS, MRS, MCS>, Eigen::Matrix<T, RT, 1, OT, MRT, MCT>>
{
    using type = std::conditional_t<
        std::is_same_v<Eigen::Matrix<S, RS, 1, OS, MRS, MCS>, Eigen::Matrix<T, RT, 1, OT, MRT, MCT>>,
        Eigen::Matrix<T, RT, 1, OT, MRT, MCT>,
        Eigen::Matrix<promote_t<S, T>, RT, 1>>;
};

namespace detail {

// Deduction through a base pointer also matches VectorBlock, whose MatrixBase is that of Block
template <typename D>
std::true_type derives_matrix_base(const Eigen::MatrixBase<D>*);
std::false_type derives_matrix_base(...);

} // namespace detail

/**
 * @brief An Eigen column-vector expression that is not itself a plain vector: a block,
 *        Map, Ref or arithmetic expression.
 */
template <typename S>
concept EigenColumnExpression = std::is_class_v<S>
    && requires { typename S::PlainObject; }
    && decltype(detail::derives_matrix_base(std::declval<const S*>()))::value
    && !is_eigen_vector_v<S>
    && (S::ColsAtCompileTime == 1);

/**
 * @brief Expressions promote as the plain vector they evaluate to.
 */
template <typename S, typename T>
requires (EigenColumnExpression<S> && Promotable<typename S::PlainObject, T>)
struct promote<S, T>
{
    using type = promote_t<typename S::PlainObject, T>;
};

/**
 * @brief S promotes to T itself, so a value of S can be handed to an operation fixed on T.
 */
template <typename S, typename T>
concept PromotesInto = Promotable<S, T> && std::is_same_v<promote_t<S, T>, T>;

/**
 * @brief Floating type obtained by promoting A and B and taking the precision type.
 *
 * Used to place the parameters of a measure on a common floating type.
 */
template <typename A, typename B>
using float_promote_t = prectype_t<promote_t<A, B>>;

/// @}

/**
 * @brief Converts a point to the type U produced by promotion.
 *
 * @tparam U Target type, as given by promote_t.
 * @param x The point; a scalar, a vector or a vector expression.
 * @throws TypePromotionError if a dynamic vector is converted to a fixed size it does not have.
 */
template <typename U, typename S>
U convert_point(const S& x)
{
    if constexpr (std::is_same_v<U, S>) {
        return x;
    } else if constexpr (is_eigen_vector_v<U>) {
        static_assert(is_eigen_vector_v<S> || EigenColumnExpression<S>,
                      "A scalar cannot be converted to a vector point.");
        if constexpr (U::RowsAtCompileTime != Eigen::Dynamic) {
            if (x.size() != U::RowsAtCompileTime) {
                throw TypePromotionError("Cannot convert a vector of length " + std::to_string(x.size())
                                         + " to a point of dimension "
                                         + std::to_string(U::RowsAtCompileTime) + ".");
            }
        }
        return U(x.template cast<typename U::Scalar>());
    } else {
        return static_cast<U>(x);
    }
}

} // namespace traits

#endif // OPM_PROMOTION_HPP
