#pragma once

#include "sel/selection.h"
#include "util/asset_class.h"
#include "util/times.h"

#include <string>

class TechnicalManager;

std::string signal_report_path(const std::string& dir,
                               AssetClass cls,
                               SysTimePoint ts);
std::string comprehensive_report_path(const std::string& dir, SysTimePoint ts);

// Both writers create `dir` when missing and throw std::runtime_error when
// the file cannot be written. They return the written path.

std::string write_signal_report(AssetClass cls,
                                const SelectionResult& result,
                                const std::string& dir,
                                SysTimePoint ts);

std::string write_comprehensive_report(const TechnicalManager& manager,
                                       const std::string& dir,
                                       SysTimePoint ts);
