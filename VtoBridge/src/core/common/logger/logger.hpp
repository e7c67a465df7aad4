#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace vtob::core::common::log {

enum class Level : std::uint8_t {
  Trace = 0,
  Debug = 1,
  Info  = 2,
  Warn  = 3,
  Error = 4,
  Fatal = 5
};

const char* ToString(Level level);

struct Event {
  Level level{};
  std::chrono::system_clock::time_point ts{};
  std::string message;
  std::string tag;
};

class Sink {
public:
  virtual ~Sink() = default;
  virtual void Write(const Event& e) = 0;
  virtual void Flush() {}
};

class Logger {
public:
  explicit Logger(std::shared_ptr<Sink> sink);

  void SetLevel(Level level);
  Level GetLevel() const;

  void Log(Level level, std::string_view msg);
  void Log(Level level, std::string_view tag, std::string_view msg);

  void Trace(std::string_view msg);
  void Debug(std::string_view msg);
  void Info(std::string_view msg);
  void Warn(std::string_view msg);
  void Error(std::string_view msg);
  void Fatal(std::string_view msg);

  void Flush();

private:
  bool ShouldLog(Level level) const;

private:
  mutable std::mutex mu_;
  std::shared_ptr<Sink> sink_;
  Level level_{Level::Info};
};

// Prefixes every line with a fixed tag; used per tenant connection.
class TaggedLogger {
public:
  TaggedLogger() = default;
  TaggedLogger(std::shared_ptr<Logger> logger, std::string tag)
      : logger_(std::move(logger)), tag_(std::move(tag)) {}

  void Debug(std::string_view msg) const { Emit(Level::Debug, msg); }
  void Info(std::string_view msg) const { Emit(Level::Info, msg); }
  void Warn(std::string_view msg) const { Emit(Level::Warn, msg); }
  void Error(std::string_view msg) const { Emit(Level::Error, msg); }

  const std::shared_ptr<Logger>& Base() const { return logger_; }

private:
  void Emit(Level level, std::string_view msg) const {
    if (logger_) logger_->Log(level, tag_, msg);
  }

  std::shared_ptr<Logger> logger_;
  std::string tag_;
};

class FileSink final : public Sink {
public:
  explicit FileSink(std::filesystem::path file_path);

  void Write(const Event& e) override;
  void Flush() override;

  std::filesystem::path Path() const;

private:
  mutable std::mutex mu_;
  std::filesystem::path file_path_;
};

class ConsoleSink final : public Sink {
public:
  void Write(const Event& e) override;
  void Flush() override;

private:
  std::mutex mu_;
};

std::string FormatLine(const Event& e);

}  // namespace vtob::core::common::log
