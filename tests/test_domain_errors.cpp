// tests/test_domain_errors.cpp
#include "test_framework.hpp"
#include <string>

#include "sg/core/errors.hpp"
#include "sg/ops/elementwise.hpp"

using sg::Scalar;
using sg::constant;
using sg::parameter;
using sg::DomainError;

TEST("domain/div_by_zero") {
    ASSERT_THROWS_AS(sg::div(constant(1.0), constant(0.0)), DomainError);
    ASSERT_THROWS_AS(sg::div(parameter(1.0), 0.0), DomainError);
    ASSERT_THROWS_AS(sg::div(constant(1.0), constant(-0.0)), DomainError);
    ASSERT_NO_THROW(sg::div(constant(1.0), constant(1e-300)));
}

TEST("domain/inv_of_zero") {
    ASSERT_THROWS_AS(sg::inv(constant(0.0)), DomainError);
    ASSERT_THROWS_AS(sg::inv(parameter(0.0)), DomainError);
}

TEST("domain/log_of_non_positive") {
    ASSERT_THROWS_AS(sg::logv(constant(-1.0)), DomainError);
    ASSERT_THROWS_AS(sg::logv(constant(0.0)), DomainError);
    ASSERT_NO_THROW(sg::logv(constant(1e-12)));
}

TEST("domain/pow_undefined_cases") {
    ASSERT_THROWS_AS(sg::pow(constant(-2.0), constant(0.5)), DomainError);
    ASSERT_THROWS_AS(sg::pow(constant(0.0), constant(-1.0)), DomainError);
    ASSERT_THROWS_AS(sg::pow(parameter(0.0), -2.0), DomainError);
    ASSERT_NO_THROW(sg::pow(constant(-2.0), constant(2.0)));
    ASSERT_NO_THROW(sg::pow(constant(0.0), constant(2.0)));
}

TEST("domain/error_is_a_domain_error_with_message") {
    bool caught = false;
    try {
        (void)sg::logv(constant(-3.0));
    } catch (const std::domain_error& e) {
        caught = true;
        ASSERT_TRUE(std::string(e.what()).find("log") != std::string::npos);
    }
    ASSERT_TRUE(caught);
}

TEST("domain/failed_op_creates_no_node") {
    Scalar a = parameter(1.0);
    Scalar b = parameter(0.0);
    ASSERT_THROWS_AS(sg::div(a, b), DomainError);
    ASSERT_THROWS_AS(sg::logv(b), DomainError);
    // ids are handed out sequentially; nothing was allocated in between
    Scalar c = parameter(2.0);
    ASSERT_TRUE(c.unique_id() == b.unique_id() + 1);
}
