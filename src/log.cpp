#include "pixedit/log.hpp"

#include <stdexcept>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace pe {

static constexpr const char* kLoggerName = "pixedit";

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        // 呼叫端可能已經自己註冊過同名 logger（例如測試或 CLI）
        if (auto existing = spdlog::get(kLoggerName)) {
            return existing;
        }
        // 等級不在這裡設定：預設 info，SPDLOG_LEVEL 設過的話以它為準
        auto created = spdlog::stderr_color_mt(kLoggerName);
        created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
        return created;
    }();
    return instance;
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    const auto level = spdlog::level::from_str(name);
    // from_str 對不認得的字串回傳 off
    if (level == spdlog::level::off && name != "off") {
        throw std::invalid_argument("unknown log level: " + name);
    }
    return level;
}

} // namespace pe
