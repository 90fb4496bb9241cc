#pragma once
#include <iostream>
#include <string>
#include <memory>
#include <vector>
#include <time.h>
#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/rotating_file_sink.h"

#include <vecarrows/core/Global.hpp>

namespace VecArrows {

#ifdef _WIN32
#define LOCALTIME(time_ptr, result_ptr) localtime_s((result_ptr), (time_ptr))
#else
#define LOCALTIME(time_ptr, result_ptr) localtime_r((time_ptr), (result_ptr))
#endif

static inline int ToDateInt(const tm& p) {
  return (1900 + p.tm_year) * 10000 + (p.tm_mon + 1) * 100 + p.tm_mday;
}

static inline int ToTimeInt(const tm& p) {
  return p.tm_hour * 10000 + p.tm_min * 100 + p.tm_sec;
}

static inline void NowDateTimeToInt(int& out_date, int& out_time) {
  time_t now;
  time(&now);
  tm p;
  LOCALTIME(&now, &p);

  out_date = ToDateInt(p);
  out_time = ToTimeInt(p);
}

class Logger {
 public:
  static Logger* GetInstance() {
    static Logger xlogger;
    return &xlogger;
  }

  std::shared_ptr<spdlog::logger> GetLogger() { return logger_; }

  void SwitchLogLevel(int level) {
    auto log_level = static_cast<spdlog::level::level_enum>(level);
    logger_->set_level(log_level);
    logger_->flush_on(log_level);
  }

 private:
  // make constructor private to avoid outside instance
  Logger() {
    const std::string log_dir = Global::engine_config.log_path;
    const std::string logger_name_prefix = "VecArrows_";

    bool print_console = true;
    bool print_file = Global::engine_config.log_to_file;
    int level = Global::engine_config.log_level;

    int date, time;
    NowDateTimeToInt(date, time);
    const std::string logger_name =
        logger_name_prefix + std::to_string(date) + "_" + std::to_string(time);

    std::vector<spdlog::sink_ptr> sinks;
    if (print_console) {
      sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_st>());
    }

    try {
      if (print_file) {
        // multi part log files, with every part 64MB, max 16 files
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_dir + "/" + logger_name + ".log", 64 * 1024 * 1024, 16));
      }
    } catch (const spdlog::spdlog_ex& ex) {
      std::cout << "Log file initialization failed: " << ex.what() << std::endl;
    }

    logger_ = std::make_shared<spdlog::logger>(logger_name, begin(sinks), end(sinks));

    // with timestamp, filename and line number
    logger_->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] [%s::%#] %v");

    SwitchLogLevel(level);
  }

  ~Logger() { spdlog::drop_all(); }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

 private:
  std::shared_ptr<spdlog::logger> logger_;
};

// use embedded macro to support file and line number
#define LOG_TRACE(...)                                                                        \
  SPDLOG_LOGGER_CALL(::VecArrows::Logger::GetInstance()->GetLogger().get(),                   \
                     spdlog::level::trace, __VA_ARGS__)
#define LOG_DEBUG(...)                                                                        \
  SPDLOG_LOGGER_CALL(::VecArrows::Logger::GetInstance()->GetLogger().get(),                   \
                     spdlog::level::debug, __VA_ARGS__)
#define LOG_INFO(...)                                                                         \
  SPDLOG_LOGGER_CALL(::VecArrows::Logger::GetInstance()->GetLogger().get(),                   \
                     spdlog::level::info, __VA_ARGS__)
#define LOG_WARN(...)                                                                         \
  SPDLOG_LOGGER_CALL(::VecArrows::Logger::GetInstance()->GetLogger().get(),                   \
                     spdlog::level::warn, __VA_ARGS__)
#define LOG_ERROR(...)                                                                        \
  SPDLOG_LOGGER_CALL(::VecArrows::Logger::GetInstance()->GetLogger().get(),                   \
                     spdlog::level::err, __VA_ARGS__)
}  // namespace VecArrows
