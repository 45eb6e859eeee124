#ifndef __ALPHAFLOW_TEST_UTILS_H
#define __ALPHAFLOW_TEST_UTILS_H 1

#include <string>
#include <vector>
#include <boost/date_time.hpp>
#include "PriceSeries.h"

alphaflow::PriceBar
createBar (const std::string& dateString,
	   double openPrice,
	   double highPrice,
	   double lowPrice,
	   double closePrice,
	   double vol);

// Daily series starting 2024-01-01 whose open, high, low and close all equal closes[i]
alphaflow::PriceSeries createCloseSeries (const std::vector<double>& closes);

// Daily series starting 2024-01-01 with distinct opens and closes
alphaflow::PriceSeries createOpenCloseSeries (const std::vector<double>& opens,
					      const std::vector<double>& closes);

boost::posix_time::ptime barTime (std::size_t barIndex);

// Writes contents to a uniquely named file in the temp directory and returns its path
std::string writeTempFile (const std::string& contents, const std::string& extension);

#endif
