// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "BacktestRequestReader.h"
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <boost/lexical_cast.hpp>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

using namespace rapidjson;

namespace alphaflow
{
  namespace
  {
    const Value& requireMember (const Value& object, const char *name, const std::string& context)
    {
      if (!object.HasMember(name))
	throw BacktestRequestException("Backtest request: missing required field '" + context + name + "'");

      return object[name];
    }

    std::string requireString (const Value& value, const std::string& field)
    {
      if (!value.IsString())
	throw BacktestRequestException("Backtest request: field '" + field + "' must be a string");

      return value.GetString();
    }

    double requireNumber (const Value& value, const std::string& field)
    {
      if (!value.IsNumber())
	throw BacktestRequestException("Backtest request: field '" + field + "' must be a number");

      return value.GetDouble();
    }

    std::string paramToString (const Value& value, const std::string& field)
    {
      if (value.IsString())
	return value.GetString();
      if (value.IsInt64())
	return std::to_string(value.GetInt64());
      if (value.IsUint64())
	return std::to_string(value.GetUint64());
      if (value.IsNumber())
	return boost::lexical_cast<std::string>(value.GetDouble());

      throw BacktestRequestException("Backtest request: parameter '" + field +
				     "' must be a number or a string");
    }

    std::vector<IndicatorSpec> parseIndicators (const Value& indicators)
    {
      if (!indicators.IsArray())
	throw BacktestRequestException("Backtest request: 'indicators' must be an array");

      std::vector<IndicatorSpec> specs;
      for (SizeType i = 0; i < indicators.Size(); ++i)
	{
	  const Value& indicator = indicators[i];
	  const std::string context("indicators[" + std::to_string(i) + "].");

	  if (!indicator.IsObject())
	    throw BacktestRequestException("Backtest request: 'indicators[" + std::to_string(i) +
					   "]' must be an object");

	  std::string name(requireString(requireMember(indicator, "name", context), context + "name"));
	  std::map<std::string, std::string> params;

	  if (indicator.HasMember("params"))
	    {
	      const Value& paramsValue = indicator["params"];
	      if (!paramsValue.IsObject())
		throw BacktestRequestException("Backtest request: '" + context + "params' must be an object");

	      for (auto it = paramsValue.MemberBegin(); it != paramsValue.MemberEnd(); ++it)
		{
		  std::string key(it->name.GetString());
		  params[key] = paramToString(it->value, context + "params." + key);
		}
	    }

	  specs.push_back(IndicatorSpec(name, params));
	}

      return specs;
    }

    ExecutionParameters parseExecution (const Value& execution)
    {
      if (!execution.IsObject())
	throw BacktestRequestException("Backtest request: 'execution' must be an object");

      OrderType orderType = OrderType::MARKET;
      if (execution.HasMember("order_type"))
	{
	  std::string name(requireString(execution["order_type"], "execution.order_type"));
	  try
	    {
	      orderType = orderTypeFromString(name);
	    }
	  catch (const std::invalid_argument& e)
	    {
	      throw BacktestRequestException(std::string("Backtest request: ") + e.what());
	    }
	}

      double initialBalance = ExecutionParameters::DefaultInitialBalance;
      if (execution.HasMember("initial_balance"))
	initialBalance = requireNumber(execution["initial_balance"], "execution.initial_balance");

      double positionSize = ExecutionParameters::DefaultPositionSize;
      if (execution.HasMember("position_size"))
	positionSize = requireNumber(execution["position_size"], "execution.position_size");

      double periodsPerYear = ExecutionParameters::DefaultPeriodsPerYear;
      if (execution.HasMember("periods_per_year"))
	periodsPerYear = requireNumber(execution["periods_per_year"], "execution.periods_per_year");

      double riskFreeRate = 0.0;
      if (execution.HasMember("risk_free_rate"))
	riskFreeRate = requireNumber(execution["risk_free_rate"], "execution.risk_free_rate");

      try
	{
	  ExecutionParameters params(orderType, initialBalance, positionSize, periodsPerYear, riskFreeRate);

	  if (execution.HasMember("stop_loss") && !execution["stop_loss"].IsNull())
	    params.setStopLoss(requireNumber(execution["stop_loss"], "execution.stop_loss"));

	  if (execution.HasMember("take_profit") && !execution["take_profit"].IsNull())
	    params.setTakeProfit(requireNumber(execution["take_profit"], "execution.take_profit"));

	  return params;
	}
      catch (const std::domain_error& e)
	{
	  throw BacktestRequestException(std::string("Backtest request: ") + e.what());
	}
    }
  }

  BacktestRequest BacktestRequestReader::parseJson (const std::string& jsonText)
  {
    Document doc;
    doc.Parse(jsonText.c_str());

    if (doc.HasParseError())
      throw BacktestRequestException(std::string("Backtest request: JSON parse error at offset ") +
				     std::to_string(doc.GetErrorOffset()) + ": " +
				     GetParseError_En(doc.GetParseError()));

    if (!doc.IsObject())
      throw BacktestRequestException("Backtest request: document must be a JSON object");

    std::vector<IndicatorSpec> indicators;
    if (doc.HasMember("indicators"))
      indicators = parseIndicators(doc["indicators"]);

    const Value& logic = requireMember(doc, "logic", "");
    if (!logic.IsObject())
      throw BacktestRequestException("Backtest request: 'logic' must be an object");

    const Value& conditionsValue = requireMember(logic, "conditions", "logic.");
    if (!conditionsValue.IsArray())
      throw BacktestRequestException("Backtest request: 'logic.conditions' must be an array");

    std::vector<std::string> conditions;
    for (SizeType i = 0; i < conditionsValue.Size(); ++i)
      conditions.push_back(requireString(conditionsValue[i],
					 "logic.conditions[" + std::to_string(i) + "]"));

    std::string entryLogic(requireString(requireMember(logic, "entry", "logic."), "logic.entry"));
    std::string exitLogic(requireString(requireMember(logic, "exit", "logic."), "logic.exit"));

    ExecutionParameters execution;
    if (doc.HasMember("execution"))
      execution = parseExecution(doc["execution"]);

    return BacktestRequest(indicators, conditions, entryLogic, exitLogic, execution);
  }

  BacktestRequest BacktestRequestReader::readFile (const std::string& fileName)
  {
    std::ifstream in(fileName);
    if (!in.is_open())
      throw BacktestRequestException("Cannot open file: " + fileName);

    std::stringstream buffer;
    buffer << in.rdbuf();

    return parseJson(buffer.str());
  }
} // namespace alphaflow
