#include <catch2/catch.hpp>
#include <cmath>
#include <vector>
#include "StatUtils.h"

using namespace alphaflow;

TEST_CASE("StatUtils descriptive statistics", "[StatUtils]")
{
  std::vector<double> data{1.0, 2.0, 3.0, 4.0};

  REQUIRE(StatUtils::computeMean(data) == Approx(2.5));
  REQUIRE(StatUtils::computeVariance(data, 2.5) == Approx(5.0 / 3.0));
  REQUIRE(StatUtils::computeStdDev(data) == Approx(std::sqrt(5.0 / 3.0)));
  REQUIRE(StatUtils::computePopulationVariance(data) == Approx(1.25));
}

TEST_CASE("StatUtils degenerate inputs return zero", "[StatUtils]")
{
  std::vector<double> empty;
  std::vector<double> single{7.0};

  REQUIRE(StatUtils::computeMean(empty) == 0.0);
  REQUIRE(StatUtils::computeVariance(single, 7.0) == 0.0);
  REQUIRE(StatUtils::computeStdDev(single) == 0.0);
  REQUIRE(StatUtils::computePopulationVariance(empty) == 0.0);
  REQUIRE(StatUtils::computeCovariance(single, single) == 0.0);
  REQUIRE(StatUtils::quantile(empty, 0.5) == 0.0);
}

TEST_CASE("StatUtils covariance", "[StatUtils]")
{
  std::vector<double> x{1.0, 2.0, 3.0};
  std::vector<double> y{2.0, 4.0, 6.0};
  std::vector<double> z{6.0, 4.0, 2.0};

  REQUIRE(StatUtils::computeCovariance(x, y) == Approx(2.0));
  REQUIRE(StatUtils::computeCovariance(x, z) == Approx(-2.0));
}

TEST_CASE("StatUtils quantile interpolates linearly", "[StatUtils]")
{
  std::vector<double> data{4.0, 1.0, 3.0, 2.0};

  REQUIRE(StatUtils::quantile(data, 0.0) == Approx(1.0));
  REQUIRE(StatUtils::quantile(data, 0.5) == Approx(2.5));
  REQUIRE(StatUtils::quantile(data, 1.0) == Approx(4.0));
  REQUIRE(StatUtils::quantile(data, 0.05) == Approx(1.15));
  REQUIRE(StatUtils::quantile(data, 2.0) == Approx(4.0));
}
