// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "BacktestResultWriter.h"
#include <cmath>
#include <cstdint>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <boost/date_time/posix_time/posix_time.hpp>

using namespace rapidjson;

namespace alphaflow
{
  namespace
  {
    Value numberValue (double value)
    {
      Value v;
      if (std::isfinite(value))
	v.SetDouble(value);
      else
	v.SetNull();

      return v;
    }

    Value optionalValue (const std::optional<double>& value)
    {
      if (value)
	return numberValue(*value);

      return Value(kNullType);
    }

    Value serializeLedgerEntry (const LedgerEntry& entry, Document::AllocatorType& allocator)
    {
      Value obj(kObjectType);
      std::string type(tradeActionToString(entry.getAction()));
      std::string timestamp(boost::posix_time::to_iso_extended_string(entry.getDateTime()));

      obj.AddMember("type", Value(type.c_str(), allocator), allocator);
      obj.AddMember("price", numberValue(entry.getPrice()), allocator);
      obj.AddMember("timestamp", Value(timestamp.c_str(), allocator), allocator);
      obj.AddMember("bar_index", static_cast<uint64_t>(entry.getBarIndex()), allocator);

      if (entry.isExit())
	{
	  obj.AddMember("pnl", optionalValue(entry.getPnl()), allocator);
	  obj.AddMember("balance", optionalValue(entry.getBalance()), allocator);
	}

      return obj;
    }

    Value serializeSummary (const PerformanceSummary& summary, Document::AllocatorType& allocator)
    {
      Value metrics(kObjectType);

      metrics.AddMember("total_trades", static_cast<uint64_t>(summary.getTotalTrades()), allocator);
      metrics.AddMember("total_pnl", numberValue(summary.getTotalPnl()), allocator);
      metrics.AddMember("win_rate", numberValue(summary.getWinRate()), allocator);
      metrics.AddMember("max_drawdown", numberValue(summary.getMaxDrawdown()), allocator);
      metrics.AddMember("max_drawdown_pct", numberValue(summary.getMaxDrawdownPercent()), allocator);
      metrics.AddMember("cagr", numberValue(summary.getCagr()), allocator);
      metrics.AddMember("sharpe_ratio", numberValue(summary.getSharpeRatio()), allocator);
      metrics.AddMember("sortino_ratio", numberValue(summary.getSortinoRatio()), allocator);
      metrics.AddMember("calmar_ratio", numberValue(summary.getCalmarRatio()), allocator);
      metrics.AddMember("volatility", numberValue(summary.getVolatility()), allocator);
      metrics.AddMember("var_95", numberValue(summary.getValueAtRisk95()), allocator);
      metrics.AddMember("beta", optionalValue(summary.getBeta()), allocator);
      metrics.AddMember("final_balance", numberValue(summary.getFinalBalance()), allocator);

      return metrics;
    }

    Value serializeExecution (const ExecutionParameters& params, Document::AllocatorType& allocator)
    {
      Value execution(kObjectType);
      std::string orderType(orderTypeToString(params.getOrderType()));

      execution.AddMember("order_type", Value(orderType.c_str(), allocator), allocator);
      execution.AddMember("initial_balance", numberValue(params.getInitialBalance()), allocator);
      execution.AddMember("position_size", numberValue(params.getPositionSize()), allocator);
      execution.AddMember("stop_loss", optionalValue(params.getStopLoss()), allocator);
      execution.AddMember("take_profit", optionalValue(params.getTakeProfit()), allocator);

      return execution;
    }
  }

  std::string BacktestResultWriter::toJson (const BacktestResult& result, const ExecutionParameters& params)
  {
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    Value trades(kArrayType);
    const SimulationResult& simulation = result.getSimulationResult();
    for (auto it = simulation.beginLedger(); it != simulation.endLedger(); ++it)
      trades.PushBack(serializeLedgerEntry(*it, allocator), allocator);

    doc.AddMember("trades", trades, allocator);
    doc.AddMember("metrics", serializeSummary(result.getPerformanceSummary(), allocator), allocator);
    doc.AddMember("execution", serializeExecution(params, allocator), allocator);

    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);
    doc.Accept(writer);

    return buffer.GetString();
  }

  void BacktestResultWriter::writeFile (const BacktestResult& result,
					const ExecutionParameters& params,
					const std::string& fileName)
  {
    std::ofstream out(fileName);
    if (!out.is_open())
      throw std::runtime_error("Cannot open output file: " + fileName);

    out << toJson(result, params) << std::endl;
    if (!out)
      throw std::runtime_error("Error writing output file: " + fileName);
  }
} // namespace alphaflow
