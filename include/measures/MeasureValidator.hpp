/**
 * @file MeasureValidator.hpp
 * @brief Error types of the measure library and validation of measure parameters.
 *
 * This header defines:
 *   - The exception hierarchy raised by measures (MeasureError and its subclasses).
 *   - Parameter, a named value with an admissible range.
 *   - Parameter types for the classical weight families (Jacobi, Laguerre, Ultraspherical).
 *   - MeasureParameterValidator, which checks a tuple of parameters on construction.
 */
#ifndef OPM_MEASURE_VALIDATOR_HPP
#define OPM_MEASURE_VALIDATOR_HPP

#include <iostream>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>

namespace measures {

/**
 * @brief Base class for all errors raised by measures.
 */
class MeasureError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

/**
 * @brief Exception for parameters outside the range in which a weight is integrable.
 */
class ParameterDomainError : public MeasureError {
    using MeasureError::MeasureError;
};

/**
 * @brief Exception for capabilities a measure variant does not provide.
 */
class UnsupportedOperationError : public MeasureError {
    using MeasureError::MeasureError;
};

/**
 * @brief A generic parameter with value range validation.
 *
 * @tparam R Scalar type.
 */
template <typename R>
struct Parameter {
    R value;                ///< The parameter's current value.
    std::pair<R, R> range;  ///< The valid domain for the parameter.
    const char* name;       ///< Human-readable name for error messages.

    Parameter(R val, std::pair<R, R> range, const char* name)
        : value(val), range(range), name(name) {}

    /**
     * @brief Validates if the value lies in (range.first, range.second].
     */
    bool isValid() const {
        return value > range.first && value <= range.second;
    }

    /**
     * @brief Returns the domain constraint as a human-readable string.
     */
    std::string getDomain() const {
        return std::to_string(range.first) + " < " + name + " <= " + std::to_string(range.second);
    }
};

/// @brief α, exponent of (1+x) in the Jacobi weight: α > -1
template <typename R>
struct JacobiAlpha : Parameter<R> {
    JacobiAlpha(R val) : Parameter<R>{val, {R(-1), std::numeric_limits<R>::infinity()}, "alpha"} {}
};

/// @brief β, exponent of (1-x) in the Jacobi weight: β > -1
template <typename R>
struct JacobiBeta : Parameter<R> {
    JacobiBeta(R val) : Parameter<R>{val, {R(-1), std::numeric_limits<R>::infinity()}, "beta"} {}
};

/// @brief α exponent of the Laguerre weight: α > -1
template <typename R>
struct LaguerreAlpha : Parameter<R> {
    LaguerreAlpha(R val) : Parameter<R>{val, {R(-1), std::numeric_limits<R>::infinity()}, "alpha"} {}
};

/// @brief λ parameter of the ultraspherical (Gegenbauer) weight: λ > -1/2
template <typename R>
struct UltrasphericalLambda : Parameter<R> {
    UltrasphericalLambda(R val) : Parameter<R>{val, {R(-0.5), std::numeric_limits<R>::infinity()}, "lambda"} {}
};

/**
 * @brief Validates the parameters of a weight family.
 *
 * @tparam R Scalar type
 * @tparam Params Parameter types (derived from Parameter<R>)
 */
template <typename R, typename... Params>
class MeasureParameterValidator {
private:
    std::tuple<Params...> parameters_;

public:
    /**
     * @brief Constructs the validator and performs initial validation.
     * @throws ParameterDomainError if a parameter is out of range.
     */
    explicit MeasureParameterValidator(Params... params)
        : parameters_(std::make_tuple(params...)) {
        validateParameters();
    }

    /**
     * @brief Throws if any parameter is out of domain.
     */
    void validateParameters() const {
        bool allValid = std::apply([](const auto&... params) {
            return (params.isValid() && ...);
        }, parameters_);

        if (!allValid) {
            throw ParameterDomainError(buildErrorMessage());
        }
    }

    template <typename P>
    auto getValue() const {
        return std::get<P>(parameters_).value;
    }

    /**
     * @brief Prints parameter names and values (for debugging).
     */
    void debugParameters(std::ostream& out = std::cout) const {
        std::apply([&out](const auto&... params) {
            ((out << "Parameter " << params.name << ": " << params.value << "\n"), ...);
        }, parameters_);
    }

private:
    std::string buildErrorMessage() const {
        std::string errorDetail = "Parameter validation failed:\n";

        std::apply([&errorDetail](const auto&... params) {
            (
                [&]() {
                    if (!params.isValid()) {
                        errorDetail += " - Parameter \"" + std::string(params.name) + "\" is invalid (value: "
                                       + std::to_string(params.value) + "). Expected: " + params.getDomain() + ".\n";
                    }
                }(),
                ...
            );
        }, parameters_);

        return errorDetail;
    }
};

} // namespace measures

#endif // OPM_MEASURE_VALIDATOR_HPP
