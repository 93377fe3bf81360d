#ifndef CIVIC_LEDGER_LOGGER_H
#define CIVIC_LEDGER_LOGGER_H

#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace cl {
namespace logging {

enum class Level { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, CRITICAL = 4 };

std::string levelToString(Level level);

/**
 * Parse a level name (case-sensitive, e.g. "INFO")
 * @return true if the name is a known level
 */
bool levelFromString(const std::string &name, Level &level);

class Handler {
public:
  virtual ~Handler() = default;
  virtual void emit(Level level, const std::string &message) = 0;

  void setLevel(Level level) { level_ = level; }
  Level getLevel() const { return level_; }

protected:
  Level level_ = Level::DEBUG;
};

// Writes to stderr so that stdout stays free for command output
class ConsoleHandler : public Handler {
public:
  void emit(Level level, const std::string &message) override;
};

class FileHandler : public Handler {
public:
  explicit FileHandler(const std::string &filename);
  ~FileHandler() override;
  void emit(Level level, const std::string &message) override;

private:
  std::ofstream file_;
  std::string filename_;
};

// Collects emitted lines in memory, mainly for tests
class MemoryHandler : public Handler {
public:
  void emit(Level level, const std::string &message) override;
  std::vector<std::string> getLines() const;
  void clear();

private:
  mutable std::mutex mutex_;
  std::vector<std::string> lines_;
};

class Logger;
class LoggerNode;

class LogStream {
public:
  LogStream(LoggerNode *node, Level level);
  ~LogStream();

  LogStream(const LogStream &) = delete;
  LogStream &operator=(const LogStream &) = delete;
  LogStream(LogStream &&other) noexcept;

  template <typename T> LogStream &operator<<(const T &value) {
    stream_ << value;
    return *this;
  }

private:
  LoggerNode *node_;
  Level level_;
  std::ostringstream stream_;
  bool moved_;
};

class LogProxy {
public:
  LogProxy(LoggerNode *node, Level level) : node_(node), level_(level) {}

  template <typename T> LogStream operator<<(const T &value) {
    LogStream stream(node_, level_);
    stream << value;
    return stream;
  }

private:
  LoggerNode *node_;
  Level level_;
};

/**
 * Tree node behind a named logger. Messages are emitted to the node's own
 * handlers and then propagated to the parent, up to the root.
 */
class LoggerNode {
public:
  LoggerNode(const std::string &fullName, std::shared_ptr<LoggerNode> parent);

  void setLevel(Level level);
  // Own level if set, otherwise the nearest ancestor's
  Level getLevel() const;

  void addHandler(std::shared_ptr<Handler> spHandler);
  void removeHandler(const std::shared_ptr<Handler> &spHandler);
  void clearHandlers();

  void setPropagate(bool propagate);
  bool getPropagate() const;

  const std::string &getFullName() const { return fullName_; }

  void log(Level level, const std::string &message);

private:
  void dispatch(Level level, const std::string &formatted);

  std::string fullName_;
  std::shared_ptr<LoggerNode> spParent_;
  Level level_{ Level::DEBUG };
  bool levelSet_{ false };
  bool propagate_{ true };
  std::vector<std::shared_ptr<Handler>> spHandlers_;
  mutable std::mutex mutex_;
};

/**
 * Lightweight handle to a LoggerNode. Copies refer to the same node.
 *
 *   auto logger = logging::getLogger("civic.ledger");
 *   logger.info << "Appended block " << index;
 */
class Logger {
public:
  explicit Logger(std::shared_ptr<LoggerNode> node);
  Logger(const Logger &other);
  Logger &operator=(const Logger &other);

  LogProxy debug;
  LogProxy info;
  LogProxy warning;
  LogProxy error;
  LogProxy critical;

  void setLevel(Level level) { spNode_->setLevel(level); }
  Level getLevel() const { return spNode_->getLevel(); }

  void addHandler(std::shared_ptr<Handler> spHandler) { spNode_->addHandler(spHandler); }
  void removeHandler(const std::shared_ptr<Handler> &spHandler) {
    spNode_->removeHandler(spHandler);
  }
  void addFileHandler(const std::string &filename, Level level = Level::DEBUG);
  void clearHandlers() { spNode_->clearHandlers(); }

  void setPropagate(bool propagate) { spNode_->setPropagate(propagate); }
  bool getPropagate() const { return spNode_->getPropagate(); }

  const std::string &getFullName() const { return spNode_->getFullName(); }

  bool operator==(const Logger &other) const { return spNode_ == other.spNode_; }
  bool operator!=(const Logger &other) const { return spNode_ != other.spNode_; }

private:
  void bindProxies();

  std::shared_ptr<LoggerNode> spNode_;
};

// Global logger management. Names are dot-separated ("civic.ledger.chain");
// missing ancestors are created on demand.
Logger getLogger(const std::string &name);
Logger getRootLogger();

} // namespace logging
} // namespace cl

#endif // CIVIC_LEDGER_LOGGER_H
