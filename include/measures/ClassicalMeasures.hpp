/**
 * @file ClassicalMeasures.hpp
 * @brief Weight functions of the classical orthogonal polynomial families, and the Dirac measure.
 *
 * | Measure               | Support  | Weight                              |
 * |-----------------------|----------|-------------------------------------|
 * | JacobiMeasure(α, β)   | [-1, 1]  | (1+x)^α (1-x)^β                     |
 * | ChebyshevTMeasure     | [-1, 1]  | (1-x²)^(-1/2)                       |
 * | ChebyshevUMeasure     | [-1, 1]  | (1-x²)^(1/2)                        |
 * | UltrasphericalMeasure | [-1, 1]  | (1-x²)^(λ-1/2)                      |
 * | LaguerreMeasure(α)    | [0, inf) | exp(-x) x^α                         |
 * | HermiteMeasure        | R        | exp(-x²)                            |
 * | GaussianMeasure       | R^d      | (2π)^(-d/2) exp(-|x|²)              |
 * | DiracMeasure(p)       | {p}      | +inf at p                           |
 *
 * Parameters are stored in the codomain type of the measure and validated on construction.
 * Class template argument deduction places them on a common floating type:
 * @code
 * measures::JacobiMeasure jacobi(1, 2.0f);  // JacobiMeasure<float>
 * measures::LaguerreMeasure laguerre(0.5);  // LaguerreMeasure<double>
 * @endcode
 */
#ifndef OPM_CLASSICAL_MEASURES_HPP
#define OPM_CLASSICAL_MEASURES_HPP

#include <cmath>
#include <limits>
#include <utility>
#include <boost/math/constants/constants.hpp>
#include "Measure.hpp"

namespace measures {

/**
 * @brief Jacobi weight (1+x)^α (1-x)^β on [-1, 1].
 */
template <typename T = traits::DataType::MeasureField>
class JacobiMeasure : public Weight<JacobiMeasure<T>, T> {
public:
    using Base = Weight<JacobiMeasure<T>, T>;
    using typename Base::CodomainType;
    using ValidatorType = MeasureParameterValidator<CodomainType, JacobiAlpha<CodomainType>, JacobiBeta<CodomainType>>;

    /**
     * @throws ParameterDomainError unless α > -1 and β > -1.
     */
    JacobiMeasure(CodomainType alpha, CodomainType beta)
        : validator_(JacobiAlpha<CodomainType>(alpha), JacobiBeta<CodomainType>(beta))
    {}

    template <typename U>
    JacobiMeasure<U> similar() const { return JacobiMeasure<U>(alpha(), beta()); }

    domains::ChebyshevInterval<T> support() const { return {}; }

    CodomainType unsafe_weight(const T& x) const {
        const CodomainType y = static_cast<CodomainType>(x);
        return std::pow(1 + y, alpha()) * std::pow(1 - y, beta());
    }

    CodomainType alpha() const { return validator_.template getValue<JacobiAlpha<CodomainType>>(); }
    CodomainType beta() const { return validator_.template getValue<JacobiBeta<CodomainType>>(); }
    const ValidatorType& validator() const noexcept { return validator_; }

private:
    ValidatorType validator_;
};

template <typename A, typename B>
JacobiMeasure(A, B) -> JacobiMeasure<traits::float_promote_t<A, B>>;

/**
 * @brief Chebyshev weight of the first kind, 1/sqrt(1-x²) on [-1, 1].
 */
template <typename T = traits::DataType::MeasureField>
class ChebyshevTMeasure : public Weight<ChebyshevTMeasure<T>, T> {
public:
    using Base = Weight<ChebyshevTMeasure<T>, T>;
    using typename Base::CodomainType;

    template <typename U>
    ChebyshevTMeasure<U> similar() const { return {}; }

    domains::ChebyshevInterval<T> support() const { return {}; }

    // Infinite at both end points
    CodomainType unsafe_weight(const T& x) const {
        const CodomainType y = static_cast<CodomainType>(x);
        return 1 / std::sqrt(1 - y * y);
    }
};

/**
 * @brief Chebyshev weight of the second kind, sqrt(1-x²) on [-1, 1].
 */
template <typename T = traits::DataType::MeasureField>
class ChebyshevUMeasure : public Weight<ChebyshevUMeasure<T>, T> {
public:
    using Base = Weight<ChebyshevUMeasure<T>, T>;
    using typename Base::CodomainType;

    template <typename U>
    ChebyshevUMeasure<U> similar() const { return {}; }

    domains::ChebyshevInterval<T> support() const { return {}; }

    CodomainType unsafe_weight(const T& x) const {
        const CodomainType y = static_cast<CodomainType>(x);
        return std::sqrt(1 - y * y);
    }
};

/**
 * @brief Ultraspherical (Gegenbauer) weight (1-x²)^(λ-1/2) on [-1, 1].
 *
 * λ = 0 and λ = 1 give the Chebyshev weights of the first and second kind, λ = 1/2 the
 * Legendre weight.
 */
template <typename T = traits::DataType::MeasureField>
class UltrasphericalMeasure : public Weight<UltrasphericalMeasure<T>, T> {
public:
    using Base = Weight<UltrasphericalMeasure<T>, T>;
    using typename Base::CodomainType;
    using ValidatorType = MeasureParameterValidator<CodomainType, UltrasphericalLambda<CodomainType>>;

    /**
     * @throws ParameterDomainError unless λ > -1/2.
     */
    explicit UltrasphericalMeasure(CodomainType lambda)
        : validator_(UltrasphericalLambda<CodomainType>(lambda))
    {}

    template <typename U>
    UltrasphericalMeasure<U> similar() const { return UltrasphericalMeasure<U>(lambda()); }

    domains::ChebyshevInterval<T> support() const { return {}; }

    CodomainType unsafe_weight(const T& x) const {
        const CodomainType y = static_cast<CodomainType>(x);
        return std::pow(1 - y * y, lambda() - CodomainType(0.5));
    }

    CodomainType lambda() const { return validator_.template getValue<UltrasphericalLambda<CodomainType>>(); }
    const ValidatorType& validator() const noexcept { return validator_; }

private:
    ValidatorType validator_;
};

template <typename A>
UltrasphericalMeasure(A) -> UltrasphericalMeasure<traits::prectype_t<A>>;

/**
 * @brief Generalized Laguerre weight exp(-x) x^α on the half line.
 */
template <typename T = traits::DataType::MeasureField>
class LaguerreMeasure : public Weight<LaguerreMeasure<T>, T> {
public:
    using Base = Weight<LaguerreMeasure<T>, T>;
    using typename Base::CodomainType;
    using ValidatorType = MeasureParameterValidator<CodomainType, LaguerreAlpha<CodomainType>>;

    /**
     * @throws ParameterDomainError unless α > -1.
     */
    explicit LaguerreMeasure(CodomainType alpha = 0)
        : validator_(LaguerreAlpha<CodomainType>(alpha))
    {}

    template <typename U>
    LaguerreMeasure<U> similar() const { return LaguerreMeasure<U>(alpha()); }

    domains::HalfLine<T> support() const { return {}; }

    // The classical weight with α = 0 is the exponential density
    bool is_normalized() const { return alpha() == 0; }

    CodomainType unsafe_weight(const T& x) const {
        const CodomainType y = static_cast<CodomainType>(x);
        return std::exp(-y) * std::pow(y, alpha());
    }

    CodomainType alpha() const { return validator_.template getValue<LaguerreAlpha<CodomainType>>(); }
    const ValidatorType& validator() const noexcept { return validator_; }

private:
    ValidatorType validator_;
};

template <typename A>
LaguerreMeasure(A) -> LaguerreMeasure<traits::prectype_t<A>>;

/**
 * @brief Hermite weight exp(-x²) on the real line.
 */
template <typename T = traits::DataType::MeasureField>
class HermiteMeasure : public Weight<HermiteMeasure<T>, T> {
public:
    using Base = Weight<HermiteMeasure<T>, T>;
    using typename Base::CodomainType;

    template <typename U>
    HermiteMeasure<U> similar() const { return {}; }

    CodomainType unsafe_weight(const T& x) const {
        const CodomainType y = static_cast<CodomainType>(x);
        return std::exp(-y * y);
    }
};

/**
 * @brief Gaussian weight (2π)^(-d/2) exp(-|x|²) on R^d.
 *
 * T is a scalar (d = 1) or an Eigen column vector (d = number of entries).
 */
template <typename T = traits::DataType::MeasureField>
class GaussianMeasure : public Weight<GaussianMeasure<T>, T> {
public:
    using Base = Weight<GaussianMeasure<T>, T>;
    using typename Base::CodomainType;

    template <typename U>
    GaussianMeasure<U> similar() const { return {}; }

    bool is_normalized() const { return true; }

    CodomainType unsafe_weight(const T& x) const {
        using boost::math::constants::two_pi;
        using boost::math::constants::one_div_root_two_pi;

        if constexpr (traits::is_eigen_vector_v<T>) {
            const auto y = x.template cast<CodomainType>();
            const CodomainType d = static_cast<CodomainType>(y.size());
            return std::pow(two_pi<CodomainType>(), -d / 2) * std::exp(-y.squaredNorm());
        } else {
            const CodomainType y = static_cast<CodomainType>(x);
            return one_div_root_two_pi<CodomainType>() * std::exp(-y * y);
        }
    }
};

/**
 * @brief Dirac measure at a point p.
 *
 * The weight is a distribution rather than a function. Evaluation returns +inf at p and
 * zero everywhere else; the infinity is a sentinel and takes no part in further arithmetic.
 */
template <typename T = traits::DataType::MeasureField>
class DiracMeasure : public Weight<DiracMeasure<T>, T> {
public:
    using Base = Weight<DiracMeasure<T>, T>;
    using typename Base::CodomainType;

    explicit DiracMeasure(T point) : point_(std::move(point)) {}

    template <typename U>
    DiracMeasure<U> similar() const { return DiracMeasure<U>(traits::convert_point<U>(point_)); }

    domains::Point<T> support() const { return {point_}; }

    bool is_normalized() const { return true; }

    CodomainType unsafe_weight(const T&) const { return std::numeric_limits<CodomainType>::infinity(); }

    const T& point() const noexcept { return point_; }

private:
    T point_;
};

template <typename T>
DiracMeasure(T) -> DiracMeasure<T>;

} // namespace measures

#endif // OPM_CLASSICAL_MEASURES_HPP
