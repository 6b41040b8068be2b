#include <Eigen/Dense>
#include <iomanip>
#include <iostream>
#include <cmath>
#include <stdexcept>
#include <vector>
#include "../include/measures/ClassicalMeasures.hpp"
#include "../include/measures/DiscreteMeasures.hpp"
#include "../include/measures/LebesgueMeasures.hpp"
#include "../include/utils/Utils.hpp"

using namespace measures;
using StoringVector = traits::DataType::StoringVector;


int main() {
    using R = double;

    JacobiMeasure<R> jacobi(1.0, 2.0);
    LaguerreMeasure<R> laguerre(0.5);
    GaussianMeasure<R> gaussian;

    jacobi.validator().debugParameters();
    laguerre.validator().debugParameters();

    StoringVector grid = StoringVector::LinSpaced(9, -2.0, 2.0);

    StoringVector w_jacobi = Utils::evaluate_weights(jacobi, grid);
    StoringVector w_laguerre = Utils::evaluate_weights(laguerre, grid);
    StoringVector w_gaussian = Utils::evaluate_weights(gaussian, grid);

    std::cout << std::setw(8) << "x" << std::setw(14) << "Jacobi" << std::setw(14) << "Laguerre"
              << std::setw(14) << "Gaussian" << std::endl;
    for (Eigen::Index i = 0; i < grid.size(); ++i) {
        std::cout << std::setw(8) << grid[i] << std::setw(14) << w_jacobi[i] << std::setw(14) << w_laguerre[i]
                  << std::setw(14) << w_gaussian[i] << std::endl;
    }

    // Promotion: an integer argument is evaluated in double precision
    std::cout << "Jacobi weight at 0 (int): " << jacobi.weight(0) << std::endl;

    // Lebesgue measure picked at runtime from a domain
    domains::AnyDomain<R> domain = domains::ClosedInterval<R>{-0.5, 0.5};
    auto lebesgue = lebesgue_measure_for(domain);
    std::cout << "Lebesgue weight at 0.25 / 0.75: " << lebesgue(0.25) << " / " << lebesgue(0.75) << std::endl;

    auto mu = make_discrete_weight(std::vector<R>{0.0, 1.0, 2.0}, {0.2, 0.3, 0.5});
    std::cout << "Discrete weight normalized: " << std::boolalpha << mu.is_normalized() << std::endl;

    try {
        mu.weight_at(3);
    } catch (const std::out_of_range& e) {
        std::cerr << "Error: " << e.what() << std::endl;
    }

    try {
        LaguerreMeasure<R> invalid(-2.0);
    } catch (const ParameterDomainError& e) {
        std::cerr << e.what();
    }

    return 0;
}
