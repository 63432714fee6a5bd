#pragma once
#ifndef LEDGERPROOF_LOGGER_H
#define LEDGERPROOF_LOGGER_H
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/**
 * @brief Process-wide structured logger.
 *
 * Each entry is written as one JSON object per line with "timestamp",
 * "level", "message" and, when supplied, a "fields" object. File output is
 * rotated by size into <file>.1 .. <file>.N.
 */
class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;
  ~Logger();

  /// Pass as the log file to write to stdout only.
  static const std::string CONSOLE_ONLY_OUTPUT;

  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);
  static Logger &getInstance();

  void setLogLevel(LogLevel level);
  LogLevel logLevel() const;

  void log(LogLevel level, const std::string &message);
  /// Log with structured context attached under "fields".
  void log(LogLevel level, const std::string &message,
           const nlohmann::json &fields);

  static std::string levelToString(LogLevel level);

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSize,
         int maxBackupFiles);

  void write(const std::string &line);
  void rotateIfNeeded();
  static std::string getTimestamp();

  std::ofstream logFileStream_;
  LogLevel currentLogLevel_;
  std::string logFilePath_;
  long long maxFileSize_;
  int maxBackupFiles_;

  static Logger *s_instance;
  static std::recursive_mutex s_mutex;
};

#endif // LEDGERPROOF_LOGGER_H
