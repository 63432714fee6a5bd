#include "utilities/logger.h"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <system_error>

Logger *Logger::s_instance = nullptr;
std::recursive_mutex Logger::s_mutex;
const std::string Logger::CONSOLE_ONLY_OUTPUT = "::CONSOLE::";

void Logger::init(const std::string &logFile, LogLevel level,
                  long long maxFileSize, int maxBackupFiles) {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  delete s_instance;
  s_instance = nullptr;
  s_instance = new Logger(logFile, level, maxFileSize, maxBackupFiles);
}

Logger &Logger::getInstance() {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  if (!s_instance) {
    // Fall back to console output so early callers never dereference null.
    std::cerr << "WARNING: Logger::getInstance() called before Logger::init(); "
                 "logging to console."
              << std::endl;
    s_instance = new Logger(CONSOLE_ONLY_OUTPUT, LogLevel::WARN, 0, 0);
  }
  return *s_instance;
}

Logger::Logger(const std::string &logFile, LogLevel level, long long maxFileSize,
               int maxBackupFiles)
    : currentLogLevel_(level), logFilePath_(logFile), maxFileSize_(maxFileSize),
      maxBackupFiles_(maxBackupFiles) {
  if (logFile != CONSOLE_ONLY_OUTPUT) {
    logFileStream_.open(logFilePath_, std::ios::app);
    if (!logFileStream_.is_open()) {
      std::cerr << "Error: Could not open log file: " << logFilePath_
                << std::endl;
    }
  }
}

Logger::~Logger() {
  if (logFileStream_.is_open())
    logFileStream_.close();
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  currentLogLevel_ = level;
}

LogLevel Logger::logLevel() const {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  return currentLogLevel_;
}

std::string Logger::levelToString(LogLevel level) {
  switch (level) {
  case TRACE:
    return "TRACE";
  case DEBUG:
    return "DEBUG";
  case INFO:
    return "INFO";
  case WARN:
    return "WARN";
  case ERROR:
    return "ERROR";
  case FATAL:
    return "FATAL";
  }
  return "UNKNOWN";
}

void Logger::log(LogLevel level, const std::string &message) {
  log(level, message, nlohmann::json());
}

void Logger::log(LogLevel level, const std::string &message,
                 const nlohmann::json &fields) {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  if (level < currentLogLevel_)
    return;

  nlohmann::json entry;
  entry["timestamp"] = getTimestamp();
  entry["level"] = levelToString(level);
  entry["message"] = message;
  if (fields.is_object() && !fields.empty())
    entry["fields"] = fields;
  // Replace invalid UTF-8 instead of throwing from a log call.
  write(entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

void Logger::write(const std::string &line) {
  if (logFilePath_ == CONSOLE_ONLY_OUTPUT) {
    std::cout << line << std::endl;
    return;
  }
  rotateIfNeeded();
  if (logFileStream_.is_open())
    logFileStream_ << line << std::endl;
}

void Logger::rotateIfNeeded() {
  if (!logFileStream_.is_open() || maxFileSize_ <= 0)
    return;
  logFileStream_.flush();
  if (logFileStream_.tellp() < maxFileSize_)
    return;

  namespace fs = std::filesystem;
  std::error_code ec;
  logFileStream_.close();
  if (maxBackupFiles_ == 0) {
    fs::remove(logFilePath_, ec);
  } else {
    fs::remove(logFilePath_ + "." + std::to_string(maxBackupFiles_), ec);
    for (int i = maxBackupFiles_ - 1; i >= 1; --i) {
      std::string from = logFilePath_ + "." + std::to_string(i);
      if (fs::exists(from, ec))
        fs::rename(from, logFilePath_ + "." + std::to_string(i + 1), ec);
    }
    fs::rename(logFilePath_, logFilePath_ + ".1", ec);
  }
  logFileStream_.open(logFilePath_, std::ios::app);
  if (!logFileStream_.is_open()) {
    std::cerr << "Error: Could not re-open log file after rotation: "
              << logFilePath_ << std::endl;
  }
}

std::string Logger::getTimestamp() {
  using namespace std::chrono;
  auto now = system_clock::now();
  std::time_t t = system_clock::to_time_t(now);
  auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm utc{};
  gmtime_r(&t, &utc);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc);
  char out[40];
  std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms));
  return out;
}
