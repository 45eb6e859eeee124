#include "TestUtils.h"
#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <boost/filesystem.hpp>

using namespace boost::gregorian;
using namespace boost::posix_time;
using namespace alphaflow;

namespace
{
  const date SeriesStartDate(2024, Jan, 1);
}

PriceBar
createBar (const std::string& dateString,
	   double openPrice,
	   double highPrice,
	   double lowPrice,
	   double closePrice,
	   double vol)
{
  ptime dateTime(from_simple_string(dateString), time_duration(0, 0, 0));
  return PriceBar(dateTime, openPrice, highPrice, lowPrice, closePrice, vol);
}

ptime barTime (std::size_t barIndex)
{
  return ptime(SeriesStartDate + days(static_cast<long>(barIndex)), time_duration(0, 0, 0));
}

PriceSeries createCloseSeries (const std::vector<double>& closes)
{
  return createOpenCloseSeries(closes, closes);
}

PriceSeries createOpenCloseSeries (const std::vector<double>& opens,
				   const std::vector<double>& closes)
{
  if (opens.size() != closes.size())
    throw std::invalid_argument("createOpenCloseSeries: opens and closes differ in length");

  PriceSeries series;
  for (std::size_t i = 0; i < closes.size(); ++i)
    {
      double high = std::max(opens[i], closes[i]);
      double low = std::min(opens[i], closes[i]);
      series.addBar(PriceBar(barTime(i), opens[i], high, low, closes[i], 1000.0));
    }

  return series;
}

std::string writeTempFile (const std::string& contents, const std::string& extension)
{
  boost::filesystem::path tempPath = boost::filesystem::temp_directory_path() /
    boost::filesystem::unique_path("alphaflow-test-%%%%-%%%%-%%%%" + extension);

  std::ofstream out(tempPath.string());
  if (!out)
    throw std::runtime_error("writeTempFile: cannot create " + tempPath.string());

  out << contents;
  return tempPath.string();
}
