/**
 * @file WeightHolder.hpp
 * @brief Runtime-polymorphic holder for continuous measures over a fixed domain type.
 *
 * The CRTP measures are distinct types; when the variant is only known at runtime (for
 * instance when it is chosen from the shape of a domain held in a domains::AnyDomain) the
 * measure is stored behind the IWeight interface. WeightHolder gives it value semantics:
 * copies are deep (through clone()), moves transfer ownership.
 */
#ifndef OPM_WEIGHT_HOLDER_HPP
#define OPM_WEIGHT_HOLDER_HPP

#include <memory>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include "Measure.hpp"

namespace measures {

/**
 * @brief Abstract interface of a continuous measure with domain type T.
 *
 * @tparam T Domain type.
 */
template <typename T>
class IWeight {
public:
    using DomainType = T;
    using CodomainType = traits::prectype_t<T>;

    virtual ~IWeight() = default;

    /// @brief Gated evaluation: zero outside the support.
    virtual CodomainType weight(const T& x) const = 0;

    /// @brief Raw formula, for points in the support only.
    virtual CodomainType unsafe_weight(const T& x) const = 0;

    virtual bool in_support(const T& x) const = 0;

    virtual bool is_normalized() const = 0;

    /**
     * @brief Creates a copy of the underlying measure.
     * @return A std::unique_ptr to the new IWeight object.
     */
    virtual std::unique_ptr<IWeight<T>> clone() const = 0;
};

/**
 * @brief Adapts a CRTP continuous measure to the IWeight interface.
 *
 * @tparam M The wrapped measure type.
 */
template <ContinuousMeasure M>
class WeightWrapper final : public IWeight<typename M::DomainType> {
public:
    using DomainType = typename M::DomainType;
    using CodomainType = typename M::CodomainType;

    explicit WeightWrapper(M measure) : measure_(std::move(measure)) {}

    CodomainType weight(const DomainType& x) const override { return measure_.weight(x); }

    CodomainType unsafe_weight(const DomainType& x) const override { return measure_.unsafe_weight(x); }

    bool in_support(const DomainType& x) const override { return measure_.in_support(x); }

    bool is_normalized() const override { return measure_.is_normalized(); }

    std::unique_ptr<IWeight<DomainType>> clone() const override {
        return std::make_unique<WeightWrapper<M>>(*this);
    }

    const M& measure() const noexcept { return measure_; }

private:
    M measure_;
};

/**
 * @brief A holder class for continuous measures selected at runtime.
 *
 * @tparam T Domain type.
 */
template <typename T>
class WeightHolder {
private:
    std::unique_ptr<IWeight<T>> p_weight_;

    const IWeight<T>& get() const {
        if (!p_weight_) {
            throw std::runtime_error("WeightHolder is not initialized with a measure.");
        }
        return *p_weight_;
    }

public:
    using DomainType = T;
    using CodomainType = traits::prectype_t<T>;

    /**
     * @brief Default constructor. Leaves the holder empty.
     */
    WeightHolder() = default;

    /**
     * @brief Takes a copy of a continuous measure over T.
     */
    template <ContinuousMeasure M>
    requires std::is_same_v<typename M::DomainType, T>
    explicit WeightHolder(M measure)
        : p_weight_(std::make_unique<WeightWrapper<M>>(std::move(measure))) {}

    /**
     * @brief Copy constructor. Performs a deep copy using the clone interface.
     */
    WeightHolder(const WeightHolder& other)
        : p_weight_(other.p_weight_ ? other.p_weight_->clone() : nullptr) {}

    WeightHolder& operator=(const WeightHolder& other) {
        if (this != &other) {
            p_weight_ = other.p_weight_ ? other.p_weight_->clone() : nullptr;
        }
        return *this;
    }

    WeightHolder(WeightHolder&& other) noexcept = default;
    WeightHolder& operator=(WeightHolder&& other) noexcept = default;

    /**
     * @brief Gated evaluation of the held measure.
     *
     * The held measure cannot be rebuilt over another domain type, so the argument must
     * promote to T itself (an int for a double holder, a fixed-size vector or a vector
     * expression for a dynamic-size holder). Arguments that would need a wider type are
     * rejected at compile time instead of being narrowed.
     *
     * @throws std::runtime_error if the holder is empty (as do all evaluation methods).
     */
    template <typename S>
    requires traits::PromotesInto<S, T>
    CodomainType weight(const S& x) const { return get().weight(traits::convert_point<T>(x)); }

    template <typename S>
    requires traits::PromotesInto<S, T>
    CodomainType operator()(const S& x) const { return weight(x); }

    CodomainType unsafe_weight(const T& x) const { return get().unsafe_weight(x); }

    template <typename S>
    requires traits::PromotesInto<S, T>
    bool in_support(const S& x) const { return get().in_support(traits::convert_point<T>(x)); }

    bool is_normalized() const { return get().is_normalized(); }

    /**
     * @brief Returns the gated weight function; it holds its own copy of the measure and
     *        accepts the same arguments as weight().
     */
    auto weight_function() const {
        return [holder = *this]<typename S>(const S& x) requires traits::PromotesInto<S, T> {
            return holder.weight(x);
        };
    }

    bool is_initialized() const noexcept { return p_weight_ != nullptr; }

    /**
     * @brief Access to the concrete measure, if it has type M.
     * @return Pointer to the measure, or nullptr if the holder is empty or holds another type.
     */
    template <ContinuousMeasure M>
    const M* target() const noexcept {
        const auto* wrapper = dynamic_cast<const WeightWrapper<M>*>(p_weight_.get());
        return wrapper ? &wrapper->measure() : nullptr;
    }
};

} // namespace measures

#endif // OPM_WEIGHT_HOLDER_HPP
