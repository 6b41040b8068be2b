#include <catch2/catch.hpp>
#include "../include/domains/Domains.hpp"
#include <Eigen/Dense>
#include <limits>
#include <type_traits>

TEST_CASE("Interval membership", "[domains]") {
    const domains::UnitInterval<double> unit;
    REQUIRE(unit.contains(0.0));
    REQUIRE(unit.contains(0.5));
    REQUIRE(unit.contains(1.0));
    REQUIRE_FALSE(unit.contains(-0.1));
    REQUIRE_FALSE(unit.contains(1.5));
    REQUIRE_FALSE(unit.contains(std::numeric_limits<double>::quiet_NaN()));

    const domains::ChebyshevInterval<double> cheb;
    REQUIRE(cheb.contains(-1.0));
    REQUIRE(cheb.contains(1.0));
    REQUIRE_FALSE(cheb.contains(1.0000001));

    const domains::HalfLine<double> half;
    REQUIRE(half.contains(0.0));
    REQUIRE(half.contains(1e9));
    REQUIRE_FALSE(half.contains(-1e-12));
}

TEST_CASE("Closed interval membership is exact at the endpoints", "[domains]") {
    const domains::ClosedInterval<double> interval{0.0, 1.0};
    REQUIRE(interval.contains(0.0));
    REQUIRE(interval.contains(1.0));
    REQUIRE_FALSE(interval.contains(1.05));
    REQUIRE_FALSE(interval.contains(-1e-300));
}

TEST_CASE("Point domains", "[domains]") {
    const domains::Point<double> p{3.0};
    REQUIRE(p.contains(3.0));
    REQUIRE_FALSE(p.contains(3.0000001));

    Eigen::VectorXd v(2);
    v << 1.0, 2.0;
    const domains::Point<Eigen::VectorXd> vp{v};
    REQUIRE(vp.contains(v));

    Eigen::VectorXd longer(3);
    longer << 1.0, 2.0, 0.0;
    REQUIRE_FALSE(vp.contains(longer));
}

TEST_CASE("Domains rebuilt over another point type", "[domains]") {
    const auto unit = domains::UnitInterval<int>{}.similar<double>();
    STATIC_REQUIRE(std::is_same_v<decltype(unit), const domains::UnitInterval<double>>);
    REQUIRE(unit.contains(0.5));

    const auto interval = domains::ClosedInterval<int>{1, 4}.similar<double>();
    REQUIRE(interval.lower == 1.0);
    REQUIRE(interval.upper == 4.0);
    REQUIRE(interval.contains(3.5));

    const auto p = domains::Point<int>{2}.similar<float>();
    REQUIRE(p.contains(2.0f));
}

TEST_CASE("Runtime domain variant", "[domains]") {
    domains::AnyDomain<double> d = domains::HalfLine<double>{};
    REQUIRE(domains::shape_of(d) == traits::DomainShape::HalfLine);
    REQUIRE(domains::contains(d, 2.0));
    REQUIRE_FALSE(domains::contains(d, -2.0));

    d = domains::ClosedInterval<double>{-2.0, -1.0};
    REQUIRE(domains::shape_of(d) == traits::DomainShape::Interval);
    REQUIRE(domains::contains(d, -1.5));
    REQUIRE_FALSE(domains::contains(d, 0.0));

    d = domains::Point<double>{0.25};
    REQUIRE(domains::shape_of(d) == traits::DomainShape::Point);
    REQUIRE(domains::contains(d, 0.25));
}
