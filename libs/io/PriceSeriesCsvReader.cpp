// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "PriceSeriesCsvReader.h"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include "csv.h"

namespace alphaflow
{
  namespace
  {
    const char *const RequiredColumns[] = {"timestamp", "open", "high", "low", "close", "volume"};

    std::string formatPrice (double price)
    {
      return boost::lexical_cast<std::string>(price);
    }
  }

  PriceSeriesCsvReader::PriceSeriesCsvReader (const std::string& fileName)
    : mFileName(fileName),
      mSeries(),
      mNumWarnings(0)
  {
    std::ifstream fin(mFileName);
    if (!fin.is_open())
      throw CsvReaderException("Cannot open file: " + mFileName);
  }

  ptime PriceSeriesCsvReader::parseTimestamp (const std::string& text)
  {
    std::string normalized = boost::algorithm::trim_copy(text);
    std::replace(normalized.begin(), normalized.end(), 'T', ' ');

    ptime dateTime;
    try
      {
	if (normalized.find(' ') == std::string::npos)
	  dateTime = ptime(boost::gregorian::from_simple_string(normalized));
	else
	  dateTime = boost::posix_time::time_from_string(normalized);
      }
    catch (const std::exception& e)
      {
	throw CsvReaderException("Invalid timestamp '" + text + "': " + e.what());
      }

    if (dateTime.is_special())
      throw CsvReaderException("Invalid timestamp '" + text + "'");

    return dateTime;
  }

  double PriceSeriesCsvReader::parsePrice (const std::string& text,
					   const char *columnName,
					   unsigned lineNumber) const
  {
    try
      {
	return boost::lexical_cast<double>(boost::algorithm::trim_copy(text));
      }
    catch (const boost::bad_lexical_cast&)
      {
	throw CsvReaderException(mFileName + ":" + std::to_string(lineNumber) + ": invalid " +
				 columnName + " value '" + text + "'");
      }
  }

  void PriceSeriesCsvReader::readFile()
  {
    mSeries = PriceSeries();
    mNumWarnings = 0;

    io::CSVReader<6, io::trim_chars<' ', '\t'>, io::double_quote_escape<',','\"'>> csvFile(mFileName);
    csvFile.set_header(RequiredColumns[0], RequiredColumns[1], RequiredColumns[2],
		       RequiredColumns[3], RequiredColumns[4], RequiredColumns[5]);

    std::string timestampString, openString, highString, lowString, closeString, volumeString;

    try
      {
	if (!csvFile.read_row(timestampString, openString, highString, lowString,
			      closeString, volumeString))
	  throw CsvReaderException("No header row found in file: " + mFileName);

	const std::string header[] = {timestampString, openString, highString,
				      lowString, closeString, volumeString};
	for (std::size_t i = 0; i < 6; ++i)
	  {
	    if (!boost::algorithm::iequals(boost::algorithm::trim_copy(header[i]), RequiredColumns[i]))
	      throw CsvReaderException("File " + mFileName + ": expected column '" +
				       RequiredColumns[i] + "' at position " + std::to_string(i + 1) +
				       " of the header but found '" + header[i] + "'");
	  }

	while (csvFile.read_row(timestampString, openString, highString, lowString,
				closeString, volumeString))
	  {
	    const unsigned lineNumber = csvFile.get_file_line();

	    ptime dateTime;
	    try
	      {
		dateTime = parseTimestamp(timestampString);
	      }
	    catch (const CsvReaderException& e)
	      {
		throw CsvReaderException(mFileName + ":" + std::to_string(lineNumber) + ": " + e.what());
	      }

	    const double openPrice = parsePrice(openString, "open", lineNumber);
	    const double highPrice = parsePrice(highString, "high", lineNumber);
	    const double lowPrice = parsePrice(lowString, "low", lineNumber);
	    const double closePrice = parsePrice(closeString, "close", lineNumber);
	    const double volume = parsePrice(volumeString, "volume", lineNumber);

	    if (!mSeries.empty() && !(mSeries.getBar(mSeries.getNumBars() - 1).getDateTime() < dateTime))
	      throw CsvReaderException(mFileName + ":" + std::to_string(lineNumber) + ": timestamp " +
				       boost::posix_time::to_simple_string(dateTime) +
				       " is not later than the previous row");

	    if (checkForErrors(dateTime, openPrice, highPrice, lowPrice, closePrice))
	      mNumWarnings++;

	    mSeries.addBar(PriceBar(dateTime, openPrice, highPrice, lowPrice, closePrice, volume));
	  }
      }
    catch (const io::error::base& e)
      {
	throw CsvReaderException("Error reading " + mFileName + ": " + e.what());
      }
  }

  bool PriceSeriesCsvReader::checkForErrors (const ptime& dateTime,
					     double openPrice, double highPrice,
					     double lowPrice, double closePrice)
  {
    bool errorFound = false;
    const std::string when(boost::posix_time::to_simple_string(dateTime));

    if (highPrice < openPrice)
      {
	errorFound = true;
	std::cout << "Warning: OHLC error on " << when << " high of " << formatPrice(highPrice)
		  << " is less than open of " << formatPrice(openPrice) << std::endl;
      }

    if (highPrice < lowPrice)
      {
	errorFound = true;
	std::cout << "Warning: OHLC error on " << when << " high of " << formatPrice(highPrice)
		  << " is less than low of " << formatPrice(lowPrice) << std::endl;
      }

    if (highPrice < closePrice)
      {
	errorFound = true;
	std::cout << "Warning: OHLC error on " << when << " high of " << formatPrice(highPrice)
		  << " is less than close of " << formatPrice(closePrice) << std::endl;
      }

    if (lowPrice > openPrice)
      {
	errorFound = true;
	std::cout << "Warning: OHLC error on " << when << " low of " << formatPrice(lowPrice)
		  << " is greater than open of " << formatPrice(openPrice) << std::endl;
      }

    if (lowPrice > closePrice)
      {
	errorFound = true;
	std::cout << "Warning: OHLC error on " << when << " low of " << formatPrice(lowPrice)
		  << " is greater than close of " << formatPrice(closePrice) << std::endl;
      }

    return errorFound;
  }

  std::vector<double> readReturnsFile (const std::string& fileName)
  {
    std::ifstream fin(fileName);
    if (!fin.is_open())
      throw CsvReaderException("Cannot open file: " + fileName);
    fin.close();

    std::vector<double> returns;
    bool firstValueLine = true;

    try
      {
	io::LineReader in(fileName);
	while (char *line = in.next_line())
	  {
	    std::string text = boost::algorithm::trim_copy(std::string(line));
	    if (text.empty())
	      continue;

	    try
	      {
		returns.push_back(boost::lexical_cast<double>(text));
	      }
	    catch (const boost::bad_lexical_cast&)
	      {
		if (!firstValueLine)
		  throw CsvReaderException(fileName + ":" + std::to_string(in.get_file_line()) +
					   ": invalid return value '" + text + "'");
	      }

	    firstValueLine = false;
	  }
      }
    catch (const io::error::base& e)
      {
	throw CsvReaderException("Error reading " + fileName + ": " + e.what());
      }

    return returns;
  }
} // namespace alphaflow
