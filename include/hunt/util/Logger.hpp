#pragma once

#include <mutex>
#include <string>
#include <vector>

namespace hunt {
namespace util {

enum class LogLevel : int {
  Trace    = 0,
  Debug    = 1,
  Info     = 2,
  Warn     = 3,
  Error    = 4,
  Critical = 5
};

struct Field {
  std::string k;
  std::string v;
};

LogLevel parseLevel(const std::string& s);
const char* levelName(LogLevel l);

class Logger {
public:
  Logger();
  ~Logger();

  Logger(const Logger&)            = delete;
  Logger& operator=(const Logger&) = delete;

  void setLevel(LogLevel lvl);
  void setFormatJson(bool json);
  void setFile(const std::string& path); // empty -> stdout

  LogLevel level() const;
  bool enabled(LogLevel lvl) const { return static_cast<int>(lvl) >= static_cast<int>(level()); }

  void log(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields = {});

  // Thread-local context helper: fields are attached to every line logged
  // by this thread while the Scoped object lives.
  class Scoped {
  public:
    explicit Scoped(const std::vector<Field>& add);
    ~Scoped();

    Scoped(const Scoped&)            = delete;
    Scoped& operator=(const Scoped&) = delete;

  private:
    std::vector<Field> previous_;   // values shadowed by this scope
    std::vector<std::string> added_;
  };

private:
  void writeLine(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields);

private:
  mutable std::mutex mx_;
  void* file_ = nullptr;            // FILE* stored as void* to avoid <cstdio> in header
  LogLevel lvl_ = LogLevel::Info;
  bool json_ = false;
};

Logger& logger();

// Number formatting for log fields.
std::string fmt(double v, int precision = 6);

} // namespace util
} // namespace hunt
