#include <catch2/catch.hpp>
#include "../include/traits/Promotion.hpp"
#include <Eigen/Dense>
#include <cstdint>
#include <type_traits>

using traits::ScalarKind;

TEST_CASE("Floating kinds absorb integers and the wider float wins", "[promotion]") {
    STATIC_REQUIRE(traits::promote_kind(ScalarKind::Int32, ScalarKind::Float32) == ScalarKind::Float32);
    STATIC_REQUIRE(traits::promote_kind(ScalarKind::UInt64, ScalarKind::Float32) == ScalarKind::Float32);
    STATIC_REQUIRE(traits::promote_kind(ScalarKind::Float32, ScalarKind::Float64) == ScalarKind::Float64);
    STATIC_REQUIRE(traits::promote_kind(ScalarKind::Float80, ScalarKind::Float64) == ScalarKind::Float80);
}

TEST_CASE("Integer promotion keeps values representable", "[promotion]") {
    STATIC_REQUIRE(traits::promote_kind(ScalarKind::Int32, ScalarKind::Int64) == ScalarKind::Int64);
    STATIC_REQUIRE(traits::promote_kind(ScalarKind::UInt32, ScalarKind::UInt64) == ScalarKind::UInt64);
    STATIC_REQUIRE(traits::promote_kind(ScalarKind::Int64, ScalarKind::UInt32) == ScalarKind::Int64);

    STATIC_REQUIRE(traits::promote_kind(ScalarKind::Int32, ScalarKind::UInt32) == ScalarKind::None);
    STATIC_REQUIRE(traits::promote_kind(ScalarKind::Int64, ScalarKind::UInt64) == ScalarKind::None);
    STATIC_REQUIRE(traits::promote_kind(ScalarKind::Int32, ScalarKind::UInt64) == ScalarKind::None);
    STATIC_REQUIRE(traits::promote_kind(ScalarKind::None, ScalarKind::Int32) == ScalarKind::None);
}

TEST_CASE("promote_kind is symmetric and idempotent", "[promotion]") {
    const ScalarKind kinds[] = {ScalarKind::Int32, ScalarKind::Int64, ScalarKind::UInt32, ScalarKind::UInt64,
                                ScalarKind::Float32, ScalarKind::Float64, ScalarKind::Float80};
    for (ScalarKind a : kinds) {
        REQUIRE(traits::promote_kind(a, a) == a);
        for (ScalarKind b : kinds) {
            REQUIRE(traits::promote_kind(a, b) == traits::promote_kind(b, a));
        }
    }
}

TEST_CASE("common_kind throws when there is no supertype", "[promotion]") {
    REQUIRE(traits::common_kind(ScalarKind::Int32, ScalarKind::Float64) == ScalarKind::Float64);
    REQUIRE_THROWS_AS(traits::common_kind(ScalarKind::Int64, ScalarKind::UInt64), traits::TypePromotionError);
    REQUIRE_THROWS_WITH(traits::common_kind(ScalarKind::Int32, ScalarKind::UInt32),
                        Catch::Matchers::Contains("Int32") && Catch::Matchers::Contains("UInt32"));
}

TEST_CASE("Compile-time promotion of scalar types", "[promotion]") {
    STATIC_REQUIRE(std::is_same_v<traits::promote_t<int, double>, double>);
    STATIC_REQUIRE(std::is_same_v<traits::promote_t<int, float>, float>);
    STATIC_REQUIRE(std::is_same_v<traits::promote_t<double, float>, double>);
    STATIC_REQUIRE(std::is_same_v<traits::promote_t<double, double>, double>);
    STATIC_REQUIRE(std::is_same_v<traits::promote_t<std::int32_t, std::int64_t>, std::int64_t>);

    STATIC_REQUIRE_FALSE(traits::Promotable<unsigned int, int>);
    STATIC_REQUIRE_FALSE(traits::Promotable<bool, double>);
    STATIC_REQUIRE_FALSE(traits::Promotable<double, Eigen::VectorXd>);
}

TEST_CASE("Compile-time promotion of Eigen vectors keeps the domain size", "[promotion]") {
    STATIC_REQUIRE(std::is_same_v<traits::promote_t<Eigen::VectorXd, Eigen::VectorXd>, Eigen::VectorXd>);
    STATIC_REQUIRE(std::is_same_v<traits::promote_t<Eigen::VectorXf, Eigen::Vector3d>, Eigen::Vector3d>);
    STATIC_REQUIRE(std::is_same_v<traits::promote_t<Eigen::Vector3i, Eigen::VectorXd>, Eigen::VectorXd>);
    STATIC_REQUIRE(std::is_same_v<traits::promote_t<Eigen::Vector2d, Eigen::Vector2f>, Eigen::Vector2d>);

    STATIC_REQUIRE_FALSE(traits::Promotable<Eigen::Vector2d, Eigen::Vector3d>);
}

TEST_CASE("Precision type of a domain", "[promotion]") {
    STATIC_REQUIRE(std::is_same_v<traits::prectype_t<int>, double>);
    STATIC_REQUIRE(std::is_same_v<traits::prectype_t<float>, float>);
    STATIC_REQUIRE(std::is_same_v<traits::prectype_t<Eigen::Vector3f>, float>);
    STATIC_REQUIRE(std::is_same_v<traits::prectype_t<Eigen::VectorXi>, double>);

    STATIC_REQUIRE(std::is_same_v<traits::float_promote_t<int, float>, float>);
    STATIC_REQUIRE(std::is_same_v<traits::float_promote_t<int, int>, double>);
}

TEST_CASE("convert_point", "[promotion]") {
    REQUIRE(traits::convert_point<double>(3) == 3.0);

    Eigen::VectorXd three(3);
    three << 1.0, 2.0, 3.0;
    const Eigen::Vector3d fixed = traits::convert_point<Eigen::Vector3d>(three);
    REQUIRE(fixed(2) == 3.0);

    Eigen::VectorXd two(2);
    two << 1.0, 2.0;
    REQUIRE_THROWS_AS(traits::convert_point<Eigen::Vector3d>(two), traits::TypePromotionError);
}

TEST_CASE("Eigen expressions promote as the vector they evaluate to", "[promotion]") {
    Eigen::VectorXd x(3);
    x << 1.0, 2.0, 3.0;
    using Head = decltype(x.head(2));
    using Scaled = decltype(2.0 * x);
    using Mapped = Eigen::Map<const Eigen::VectorXd>;

    STATIC_REQUIRE(traits::EigenColumnExpression<Head>);
    STATIC_REQUIRE(traits::EigenColumnExpression<Scaled>);
    STATIC_REQUIRE(traits::EigenColumnExpression<Mapped>);
    STATIC_REQUIRE_FALSE(traits::EigenColumnExpression<Eigen::VectorXd>);
    STATIC_REQUIRE_FALSE(traits::EigenColumnExpression<decltype(x.transpose())>);

    STATIC_REQUIRE(std::is_same_v<traits::promote_t<Head, Eigen::VectorXd>, Eigen::VectorXd>);
    STATIC_REQUIRE(std::is_same_v<traits::promote_t<Scaled, Eigen::Vector3d>, Eigen::Vector3d>);
    STATIC_REQUIRE(std::is_same_v<traits::promote_t<Mapped, Eigen::VectorXf>, Eigen::VectorXd>);
    STATIC_REQUIRE(traits::Promotable<decltype(Eigen::Vector3d::Zero()), Eigen::Vector3d>);
    STATIC_REQUIRE_FALSE(traits::Promotable<decltype(Eigen::Vector2d::Zero()), Eigen::Vector3d>);

    const Eigen::VectorXd head = traits::convert_point<Eigen::VectorXd>(x.head(2));
    REQUIRE(head.size() == 2);
    REQUIRE(head(1) == 2.0);

    const Eigen::Vector3d scaled = traits::convert_point<Eigen::Vector3d>(2.0 * x);
    REQUIRE(scaled(2) == 6.0);
    REQUIRE_THROWS_AS(traits::convert_point<Eigen::Vector3d>(x.head(2)), traits::TypePromotionError);
}

TEST_CASE("Promotion into a fixed evaluation type", "[promotion]") {
    STATIC_REQUIRE(traits::PromotesInto<int, double>);
    STATIC_REQUIRE(traits::PromotesInto<float, double>);
    STATIC_REQUIRE(traits::PromotesInto<double, double>);
    STATIC_REQUIRE_FALSE(traits::PromotesInto<double, float>);
    STATIC_REQUIRE_FALSE(traits::PromotesInto<double, int>);
    STATIC_REQUIRE(traits::PromotesInto<Eigen::VectorXd, Eigen::Vector3d>);
    STATIC_REQUIRE_FALSE(traits::PromotesInto<Eigen::VectorXd, Eigen::VectorXf>);
}
