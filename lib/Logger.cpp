#include "Logger.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

namespace cl {
namespace logging {

static std::mutex &getRegistryMutex() {
  static std::mutex mutex;
  return mutex;
}

static std::unordered_map<std::string, std::shared_ptr<LoggerNode>> &getLoggerRegistry() {
  static std::unordered_map<std::string, std::shared_ptr<LoggerNode>> registry;
  return registry;
}

static std::string getCurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm local{};
  localtime_r(&time, &local);

  std::stringstream ss;
  ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

std::string levelToString(Level level) {
  switch (level) {
  case Level::DEBUG:
    return "DEBUG";
  case Level::INFO:
    return "INFO";
  case Level::WARNING:
    return "WARNING";
  case Level::ERROR:
    return "ERROR";
  case Level::CRITICAL:
    return "CRITICAL";
  default:
    return "UNKNOWN";
  }
}

bool levelFromString(const std::string &name, Level &level) {
  static const Level levels[] = {Level::DEBUG, Level::INFO, Level::WARNING,
                                 Level::ERROR, Level::CRITICAL};
  for (Level candidate : levels) {
    if (levelToString(candidate) == name) {
      level = candidate;
      return true;
    }
  }
  return false;
}

// ConsoleHandler

void ConsoleHandler::emit(Level level, const std::string &message) {
  if (level < level_) {
    return;
  }
  std::cerr << message << std::endl;
}

// FileHandler

FileHandler::FileHandler(const std::string &filename) : filename_(filename) {
  file_.open(filename_, std::ios::app);
  if (!file_.is_open()) {
    throw std::runtime_error("Failed to open log file: " + filename_);
  }
}

FileHandler::~FileHandler() {
  if (file_.is_open()) {
    file_.close();
  }
}

void FileHandler::emit(Level level, const std::string &message) {
  if (level < level_) {
    return;
  }
  if (file_.is_open()) {
    file_ << message << std::endl;
    file_.flush();
  }
}

// MemoryHandler

void MemoryHandler::emit(Level level, const std::string &message) {
  if (level < level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  lines_.push_back(message);
}

std::vector<std::string> MemoryHandler::getLines() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return lines_;
}

void MemoryHandler::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  lines_.clear();
}

// LogStream

LogStream::LogStream(LoggerNode *node, Level level)
    : node_(node), level_(level), moved_(false) {}

LogStream::~LogStream() {
  if (!moved_ && node_) {
    node_->log(level_, stream_.str());
  }
}

LogStream::LogStream(LogStream &&other) noexcept
    : node_(other.node_), level_(other.level_),
      stream_(std::move(other.stream_)), moved_(false) {
  other.moved_ = true;
}

// LoggerNode

LoggerNode::LoggerNode(const std::string &fullName,
                       std::shared_ptr<LoggerNode> parent)
    : fullName_(fullName), spParent_(std::move(parent)) {}

void LoggerNode::setLevel(Level level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
  levelSet_ = true;
}

Level LoggerNode::getLevel() const {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (levelSet_ || !spParent_) {
      return level_;
    }
  }
  return spParent_->getLevel();
}

void LoggerNode::addHandler(std::shared_ptr<Handler> spHandler) {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.push_back(std::move(spHandler));
}

void LoggerNode::removeHandler(const std::shared_ptr<Handler> &spHandler) {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.erase(std::remove(spHandlers_.begin(), spHandlers_.end(), spHandler),
                    spHandlers_.end());
}

void LoggerNode::clearHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.clear();
}

void LoggerNode::setPropagate(bool propagate) {
  std::lock_guard<std::mutex> lock(mutex_);
  propagate_ = propagate;
}

bool LoggerNode::getPropagate() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return propagate_;
}

void LoggerNode::log(Level level, const std::string &message) {
  if (level < getLevel()) {
    return;
  }

  std::stringstream ss;
  ss << "[" << getCurrentTimestamp() << "] ";
  ss << "[" << levelToString(level) << "] ";
  if (!fullName_.empty()) {
    ss << "[" << fullName_ << "] ";
  }
  ss << message;
  std::string formatted = ss.str();

  // The originating node decides the level; ancestors only provide handlers
  for (LoggerNode *node = this; node != nullptr;) {
    node->dispatch(level, formatted);
    if (!node->getPropagate()) {
      break;
    }
    node = node->spParent_.get();
  }
}

void LoggerNode::dispatch(Level level, const std::string &formatted) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &spHandler : spHandlers_) {
    spHandler->emit(level, formatted);
  }
}

// Logger

Logger::Logger(std::shared_ptr<LoggerNode> node)
    : debug(node.get(), Level::DEBUG), info(node.get(), Level::INFO),
      warning(node.get(), Level::WARNING), error(node.get(), Level::ERROR),
      critical(node.get(), Level::CRITICAL), spNode_(std::move(node)) {}

Logger::Logger(const Logger &other) : Logger(other.spNode_) {}

Logger &Logger::operator=(const Logger &other) {
  if (this != &other) {
    spNode_ = other.spNode_;
    bindProxies();
  }
  return *this;
}

void Logger::bindProxies() {
  debug = LogProxy(spNode_.get(), Level::DEBUG);
  info = LogProxy(spNode_.get(), Level::INFO);
  warning = LogProxy(spNode_.get(), Level::WARNING);
  error = LogProxy(spNode_.get(), Level::ERROR);
  critical = LogProxy(spNode_.get(), Level::CRITICAL);
}

void Logger::addFileHandler(const std::string &filename, Level level) {
  auto spHandler = std::make_shared<FileHandler>(filename);
  spHandler->setLevel(level);
  spNode_->addHandler(spHandler);
}

// Global logger management

static std::shared_ptr<LoggerNode> getOrCreateNode(const std::string &name) {
  auto &registry = getLoggerRegistry();
  auto it = registry.find(name);
  if (it != registry.end()) {
    return it->second;
  }

  std::shared_ptr<LoggerNode> parent;
  if (name.empty()) {
    // Root owns the only console handler; children reach it by propagation
    auto root = std::make_shared<LoggerNode>("", nullptr);
    root->addHandler(std::make_shared<ConsoleHandler>());
    root->setLevel(Level::INFO);
    registry[name] = root;
    return root;
  }

  auto lastDot = name.rfind('.');
  parent = getOrCreateNode(lastDot == std::string::npos ? "" : name.substr(0, lastDot));

  auto node = std::make_shared<LoggerNode>(name, parent);
  registry[name] = node;
  return node;
}

Logger getLogger(const std::string &name) {
  std::string trimmed = name;
  if (!trimmed.empty() && trimmed[0] == '.') {
    trimmed = trimmed.substr(1);
  }
  std::lock_guard<std::mutex> lock(getRegistryMutex());
  return Logger(getOrCreateNode(trimmed));
}

Logger getRootLogger() { return getLogger(""); }

} // namespace logging
} // namespace cl
