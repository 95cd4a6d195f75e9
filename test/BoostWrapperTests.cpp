#include <modules/common.hpp>
#include <modules/prob/boost.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>

#include <boost/assert.hpp>

//-------------------------------------------------------------------------

using namespace testing;

namespace prob = disclib::modules::prob;

//-------------------------------------------------------------------------

TEST(BoostWrapperTest, BinomialOutsideSupport)
{
    const prob::binomial dist(5., 0.5);

    EXPECT_EQ(0., prob::pdf(dist, 7.));
    EXPECT_EQ(0., prob::pdf(dist, -1.));
    EXPECT_EQ(0., prob::cdf(dist, -1.));
    EXPECT_EQ(1., prob::cdf(dist, 9.));
    EXPECT_EQ(0., prob::pdf(dist, std::numeric_limits<double>::infinity()));
    EXPECT_EQ(1., prob::cdf(dist, std::numeric_limits<double>::infinity()));
}

TEST(BoostWrapperTest, RandomVariateIsFloored)
{
    const prob::binomial dist(5., 0.5);

    EXPECT_DOUBLE_EQ(prob::pdf(dist, 2.), prob::pdf(dist, 2.5));
    EXPECT_DOUBLE_EQ(prob::cdf(dist, 3.), prob::cdf(dist, 3.99));
    EXPECT_DOUBLE_EQ(10. / 32., prob::pdf(dist, 2.));
}

TEST(BoostWrapperTest, NaNPropagates)
{
    const double nan = std::numeric_limits<double>::quiet_NaN();

    EXPECT_TRUE(std::isnan(prob::pdf(prob::binomial(5., 0.5), nan)));
    EXPECT_TRUE(std::isnan(prob::cdf(prob::binomial(5., 0.5), nan)));
    EXPECT_TRUE(std::isnan(prob::pdf(prob::geometric(0.5), nan)));
    EXPECT_TRUE(std::isnan(prob::cdf(prob::geometric(0.5), nan)));
}

TEST(BoostWrapperTest, GeometricCertainSuccess)
{
    const prob::geometric dist(1.);

    EXPECT_EQ(1., prob::cdf(dist, 0.));
    EXPECT_EQ(1., prob::cdf(dist, 12.));
    EXPECT_EQ(0., prob::cdf(dist, -1.));
    EXPECT_EQ(1., prob::pdf(dist, 0.));
    EXPECT_EQ(0., prob::quantile(dist, 1.));
    EXPECT_EQ(0., prob::quantile(dist, 0.5));
}

TEST(BoostWrapperTest, GeometricNegativeVariate)
{
    const prob::geometric dist(0.5);

    EXPECT_EQ(0., prob::pdf(dist, -3.));
    EXPECT_EQ(0., prob::cdf(dist, -0.5));
}

TEST(BoostWrapperTest, GeometricQuantileAtLevelOneOverflows)
{
    EXPECT_EQ(std::numeric_limits<double>::infinity(),
        prob::quantile(prob::geometric(0.5), 1.));
}

TEST(BoostWrapperTest, BinomialSinglePointQuantiles)
{
    EXPECT_EQ(4., prob::quantile(prob::binomial(4., 1.), 0.3));
    EXPECT_EQ(0., prob::quantile(prob::binomial(4., 1.), 0.));
    EXPECT_EQ(0., prob::quantile(prob::binomial(4., 0.), 0.9));
}

TEST(BoostWrapperTest, DomainErrorsThrow)
{
    EXPECT_THROW(prob::binomial(5., 1.5), std::domain_error);
    EXPECT_THROW(prob::binomial(-1., 0.5), std::domain_error);
    EXPECT_THROW(prob::geometric(-0.5), std::domain_error);
    EXPECT_THROW(prob::quantile(prob::geometric(0.5), 1.5), std::domain_error);
    EXPECT_THROW(prob::quantile(prob::binomial(5., 0.5), -0.1),
        std::domain_error);
}

TEST(BoostWrapperTest, DomainErrorMessageIsTrimmed)
{
    try {
        prob::geometric dist(-0.5);
        FAIL() << "Expected std::domain_error";
    } catch (const std::domain_error& e) {
        const std::string msg = e.what();

        EXPECT_THAT(msg, HasSubstr("-0.5"));
        ASSERT_GE(msg.size(), 2u);
        EXPECT_NE(' ', msg[msg.size() - 2]);
    }
}

TEST(BoostWrapperTest, FailedAssertionThrows)
{
    EXPECT_THROW(BOOST_ASSERT(1 + 1 == 3), std::runtime_error);
    EXPECT_THROW(BOOST_ASSERT_MSG(false, "checked"), std::runtime_error);

    try {
        BOOST_ASSERT_MSG(2 < 1, "ordering is broken");
        FAIL() << "Expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_THAT(e.what(), StartsWith("ordering is broken\n"));
        EXPECT_THAT(e.what(), HasSubstr("Failed assertion: 2 < 1"));
        EXPECT_THAT(e.what(), HasSubstr("BoostWrapperTests.cpp"));
    }
}

//-------------------------------------------------------------------------
