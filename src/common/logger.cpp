/**
 * @file logger.cpp
 * @brief Logger implementation
 */

#include "common/logger.hpp"

namespace csvcols {

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;

void Logger::init(const std::string& name, spdlog::level::level_enum level) {
    if (logger_ == nullptr) {
        logger_ = spdlog::get(name);
        if (logger_ == nullptr) {
            logger_ = spdlog::stderr_color_mt(name);
        }
        logger_->set_level(level);
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
    }
}

std::shared_ptr<spdlog::logger>& Logger::get() {
    if (logger_ == nullptr) {
        init();
    }
    return logger_;
}

void Logger::set_level(spdlog::level::level_enum level) {
    get()->set_level(level);
}

Status Logger::parse_level(std::string_view name,
                           spdlog::level::level_enum* level) {
    // from_str maps unknown names to "off", so "off" is checked separately
    const std::string text(name);
    const auto parsed = spdlog::level::from_str(text);
    if (parsed == spdlog::level::off && text != "off") {
        return Status::InvalidArgument("unknown log level '" + text + "'");
    }
    *level = parsed;
    return Status::Ok();
}

void Logger::shutdown() {
    if (logger_ != nullptr) {
        spdlog::drop(logger_->name());
        logger_.reset();
    }
}

}  // namespace csvcols
