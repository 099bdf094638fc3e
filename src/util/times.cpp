#include "util/times.h"

#include <spdlog/spdlog.h>
#include <format>
#include <sstream>

using namespace std::chrono;

LocalTimePoint datetime_to_local(std::string_view datetime,
                                 std::string_view fmt) {
  if (datetime == "") {
    spdlog::error("[time] empty datetime string");
    return {};
  }

  std::istringstream in{std::string(datetime)};

  local_time<seconds> local;
  in >> parse(std::string(fmt), local);
  if (in.fail()) {
    spdlog::error("[time] unable to parse '{}' as '{}'", datetime, fmt);
    return {};
  }

  return local;
}

std::string timestamp_str(SysTimePoint tp) {
  return std::format("{:%Y%m%d_%H%M%S}", tp);
}
