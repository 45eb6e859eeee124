// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STAT_UTILS_H
#define __STAT_UTILS_H 1

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <vector>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>

namespace alphaflow
{
  /**
   * @struct StatUtils
   * @brief Basic descriptive statistics over vectors of doubles.
   *
   * Every function returns 0.0 when the input is too short for the statistic
   * to be defined.
   */
  struct StatUtils
  {
    static double computeMean(const std::vector<double>& data)
    {
      if (data.empty())
	return 0.0;

      double sum = std::accumulate(data.begin(), data.end(), 0.0);
      return sum / static_cast<double>(data.size());
    }

    /**
     * @brief Computes the (unbiased) sample variance given a precomputed mean.
     *        Returns 0 when data.size() < 2.
     */
    static double computeVariance(const std::vector<double>& data, double mean)
    {
      const std::size_t n = data.size();
      if (n < 2)
	return 0.0;

      double sq_sum = std::accumulate(data.begin(), data.end(), 0.0,
				      [mean](double acc, double val) {
					const double diff = (val - mean);
					return acc + diff * diff;
				      });

      // Unbiased sample variance (N-1)
      return sq_sum / static_cast<double>(n - 1);
    }

    static double computeStdDev(const std::vector<double>& data)
    {
      const double v = computeVariance(data, computeMean(data));
      return (v > 0.0) ? std::sqrt(v) : 0.0;
    }

    /**
     * @brief Population (N denominator) variance in a single pass.
     */
    static double computePopulationVariance(const std::vector<double>& data)
    {
      using namespace boost::accumulators;

      if (data.empty())
	return 0.0;

      accumulator_set<double, stats<tag::mean, tag::variance>> acc;
      for (double x : data)
	acc(x);

      return variance(acc);
    }

    /**
     * @brief Unbiased sample covariance of two equally long vectors.
     *        Returns 0 when fewer than two pairs are available.
     */
    static double computeCovariance(const std::vector<double>& x, const std::vector<double>& y)
    {
      const std::size_t n = std::min(x.size(), y.size());
      if (n < 2)
	return 0.0;

      double meanX = 0.0;
      double meanY = 0.0;
      for (std::size_t i = 0; i < n; ++i)
	{
	  meanX += x[i];
	  meanY += y[i];
	}
      meanX /= static_cast<double>(n);
      meanY /= static_cast<double>(n);

      double sum = 0.0;
      for (std::size_t i = 0; i < n; ++i)
	sum += (x[i] - meanX) * (y[i] - meanY);

      return sum / static_cast<double>(n - 1);
    }

    /**
     * @brief Quantile with linear interpolation at the fractional index q * (N - 1).
     *
     * @param v the data, taken by value because it is sorted in place.
     * @param q the desired quantile, clamped to [0, 1].
     * @return the interpolated value, 0 for an empty vector.
     */
    static double quantile(std::vector<double> v, double q)
    {
      if (v.empty())
	return 0.0;

      q = std::min(std::max(q, 0.0), 1.0);

      const double idx = q * (static_cast<double>(v.size()) - 1.0);
      const auto lo = static_cast<std::size_t>(std::floor(idx));
      const auto hi = static_cast<std::size_t>(std::ceil(idx));

      std::sort(v.begin(), v.end());

      if (lo == hi)
	return v[lo];

      const double frac = idx - static_cast<double>(lo);
      return v[lo] + (v[hi] - v[lo]) * frac;
    }
  };
} // namespace alphaflow

#endif
