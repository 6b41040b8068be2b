/**
 * @file LebesgueMeasures.hpp
 * @brief The Lebesgue family: constant weight one on a support domain.
 *
 * - LebesgueMeasure: on the full space.
 * - UnitLebesgueMeasure: on [0, 1]; normalized.
 * - LegendreMeasure: on [-1, 1], the measure of the Legendre polynomials.
 * - DomainLebesgueMeasure: on a caller-supplied domain, which it owns.
 *
 * `lebesgue_measure_for(domain)` picks the variant matching the shape of a domain.
 */
#ifndef OPM_LEBESGUE_MEASURES_HPP
#define OPM_LEBESGUE_MEASURES_HPP

#include <type_traits>
#include <utility>
#include <variant>
#include "Measure.hpp"
#include "WeightHolder.hpp"

namespace measures {

/**
 * @brief Lebesgue measure on the full space of T.
 */
template <typename T = traits::DataType::MeasureField>
class LebesgueMeasure : public Weight<LebesgueMeasure<T>, T> {
public:
    using Base = Weight<LebesgueMeasure<T>, T>;
    using typename Base::CodomainType;

    template <typename U>
    LebesgueMeasure<U> similar() const { return {}; }

    CodomainType unsafe_weight(const T&) const { return CodomainType(1); }
};

/**
 * @brief Lebesgue measure on the unit interval [0, 1].
 */
template <typename T = traits::DataType::MeasureField>
class UnitLebesgueMeasure : public Weight<UnitLebesgueMeasure<T>, T> {
public:
    using Base = Weight<UnitLebesgueMeasure<T>, T>;
    using typename Base::CodomainType;

    template <typename U>
    UnitLebesgueMeasure<U> similar() const { return {}; }

    domains::UnitInterval<T> support() const { return {}; }

    bool is_normalized() const { return true; }

    CodomainType unsafe_weight(const T&) const { return CodomainType(1); }
};

/**
 * @brief Lebesgue measure on [-1, 1], the orthogonality measure of the Legendre polynomials.
 */
template <typename T = traits::DataType::MeasureField>
class LegendreMeasure : public Weight<LegendreMeasure<T>, T> {
public:
    using Base = Weight<LegendreMeasure<T>, T>;
    using typename Base::CodomainType;

    template <typename U>
    LegendreMeasure<U> similar() const { return {}; }

    domains::ChebyshevInterval<T> support() const { return {}; }

    CodomainType unsafe_weight(const T&) const { return CodomainType(1); }
};

/**
 * @brief Lebesgue measure restricted to an arbitrary domain.
 *
 * @tparam T Domain type.
 * @tparam D Type of the support domain; owned by the measure.
 */
template <typename T, typename D>
class DomainLebesgueMeasure : public Weight<DomainLebesgueMeasure<T, D>, T> {
public:
    using Base = Weight<DomainLebesgueMeasure<T, D>, T>;
    using typename Base::CodomainType;

    explicit DomainLebesgueMeasure(D domain) : domain_(std::move(domain)) {}

    /**
     * @brief Rebuilds the measure over U; the domain must support similar<U>() as well.
     */
    template <typename U>
    auto similar() const {
        using DU = decltype(domain_.template similar<U>());
        return DomainLebesgueMeasure<U, DU>(domain_.template similar<U>());
    }

    const D& support() const noexcept { return domain_; }

    CodomainType unsafe_weight(const T&) const { return CodomainType(1); }

private:
    D domain_;
};

template <domains::DomainLike D>
DomainLebesgueMeasure(D) -> DomainLebesgueMeasure<typename D::ValueType, D>;

/**
 * @brief The Lebesgue measure on a given domain, specialized by the type of the domain.
 *
 * UnitInterval gives UnitLebesgueMeasure, ChebyshevInterval gives LegendreMeasure,
 * FullSpace gives LebesgueMeasure, any other domain a DomainLebesgueMeasure on it.
 */
template <domains::DomainLike D>
auto lebesgue_measure_for(const D& domain)
{
    using T = typename D::ValueType;
    if constexpr (std::is_same_v<D, domains::UnitInterval<T>>) {
        return UnitLebesgueMeasure<T>();
    } else if constexpr (std::is_same_v<D, domains::ChebyshevInterval<T>>) {
        return LegendreMeasure<T>();
    } else if constexpr (std::is_same_v<D, domains::FullSpace<T>>) {
        return LebesgueMeasure<T>();
    } else {
        return DomainLebesgueMeasure<T, D>(domain);
    }
}

/**
 * @brief Runtime counterpart of lebesgue_measure_for, on the shape held by an AnyDomain.
 *
 * @return A WeightHolder holding the selected Lebesgue variant.
 */
template <typename T>
WeightHolder<T> lebesgue_measure_for(const domains::AnyDomain<T>& domain)
{
    return std::visit([](const auto& d) { return WeightHolder<T>(lebesgue_measure_for(d)); }, domain);
}

} // namespace measures

#endif // OPM_LEBESGUE_MEASURES_HPP
