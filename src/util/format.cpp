#include "util/format.h"
#include "core/analysis.h"
#include "ind/candle.h"
#include "sig/signal.h"
#include "util/asset_class.h"
#include "util/times.h"

#include <string>

template <>
std::string to_str(const Candle& candle) {
  auto& [_, open, high, low, close, volume] = candle;
  return std::format("{} {:.2f} {:.2f} {:.2f} {:.2f} {}",  //
                     candle.day(), open, high, low, close, volume);
}

template <>
std::string to_str(const Direction& dir) {
  switch (dir) {
    case Direction::Buy:
      return "BUY";
    case Direction::Sell:
      return "SELL";
    default:
      return "WATCH";
  }
}

template <>
std::string to_str(const AssetClass& cls) {
  return std::string{asset_class_name(cls)};
}

template <>
std::string to_str(const Stage& stage) {
  switch (stage) {
    case Stage::DataLoaded:
      return "data loaded";
    case Stage::IndicatorsComputed:
      return "indicators computed";
    case Stage::SignalsGenerated:
      return "signals generated";
    case Stage::Selected:
      return "selected";
    default:
      return "not run";
  }
}

template <>
std::string to_str(const AnalysisStatus& status) {
  switch (status) {
    case AnalysisStatus::Success:
      return "success";
    case AnalysisStatus::NoSignals:
      return "no signals";
    case AnalysisStatus::Error:
      return "error";
    default:
      return "not run";
  }
}

inline std::string exit_str(const std::optional<double>& px) {
  return px ? std::format("{:.2f}", *px) : "";
}

template <>
std::string to_str<FormatTarget::Console>(const Signal& sig) {
  return std::format("{:<8} {:<5} {:<24} {:>5.2f} {:>10.2f} {:>10} {:>10}  {}",
                     sig.symbol, to_str(sig.direction), sig.name(),
                     sig.confidence, sig.price, exit_str(sig.stop_loss),
                     exit_str(sig.target), sig.rationale);
}

template <>
std::string to_str<FormatTarget::Csv>(const Signal& sig) {
  return std::format("{},{},{},{:.4f},{:.4f},{},{},{}",                     //
                     csv_escape(sig.symbol), sig.name(), to_str(sig.direction),
                     sig.confidence, sig.price,
                     sig.stop_loss ? std::format("{:.4f}", *sig.stop_loss) : "",
                     sig.target ? std::format("{:.4f}", *sig.target) : "",
                     csv_escape(sig.rationale));
}

std::string csv_escape(const std::string& field) {
  if (field.find_first_of(",\"\n\r") == std::string::npos)
    return field;

  std::string out = "\"";
  for (char c : field) {
    if (c == '"')
      out += '"';
    out += c;
  }
  out += '"';
  return out;
}
