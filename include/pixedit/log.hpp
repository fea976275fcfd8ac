#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace pe {

// 函式庫共用的 logger，名稱 "pixedit"，第一次呼叫時建立（stderr）
std::shared_ptr<spdlog::logger> logger();

void set_log_level(spdlog::level::level_enum level);

// "trace" / "debug" / "info" / "warn" / "error" / "critical" / "off"
// 不認得的名稱丟 std::invalid_argument
spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace pe
