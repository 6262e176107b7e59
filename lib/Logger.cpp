#include "Logger.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

namespace fv {
namespace logging {

namespace {

std::mutex &getRegistryMutex() {
  static std::mutex mutex;
  return mutex;
}

// Keyed by full dotted name, "" is the root
std::unordered_map<std::string, std::shared_ptr<LoggerNode>> &getRegistry() {
  static std::unordered_map<std::string, std::shared_ptr<LoggerNode>> registry;
  return registry;
}

std::string trimDots(const std::string &name) {
  size_t begin = name.find_first_not_of('.');
  if (begin == std::string::npos) {
    return "";
  }
  size_t end = name.find_last_not_of('.');
  return name.substr(begin, end - begin + 1);
}

std::string getCurrentTimestamp() {
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

// Caller holds the registry mutex
std::shared_ptr<LoggerNode> getOrCreateNode(const std::string &fullName) {
  auto &registry = getRegistry();
  auto it = registry.find(fullName);
  if (it != registry.end()) {
    return it->second;
  }

  std::string nodeName = fullName;
  std::shared_ptr<LoggerNode> spParent;
  if (!fullName.empty()) {
    auto lastDot = fullName.rfind('.');
    std::string parentName;
    if (lastDot != std::string::npos) {
      parentName = fullName.substr(0, lastDot);
      nodeName = fullName.substr(lastDot + 1);
    }
    spParent = getOrCreateNode(parentName);
  }

  auto spNode = std::make_shared<LoggerNode>(nodeName, fullName);
  if (spParent) {
    spNode->setParent(spParent);
  } else {
    // Root logger writes to the console, everything else propagates to it
    spNode->addHandler(std::make_shared<ConsoleHandler>());
  }
  registry[fullName] = spNode;
  return spNode;
}

} // namespace

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

// ConsoleHandler implementation
void ConsoleHandler::emit(Level level, const std::string &message) {
  if (level < level_) {
    return;
  }
  std::cout << message << std::endl;
}

// FileHandler implementation
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
  }
}

// LogProxy implementation
LogProxy::LogProxy(Logger *logger, Level level)
    : logger_(logger), level_(level) {}

// LogStream implementation
LogStream::LogStream(Logger *logger, Level level)
    : logger_(logger), level_(level), moved_(false) {}

LogStream::~LogStream() {
  if (!moved_ && logger_) {
    logger_->log(level_, stream_.str());
  }
}

LogStream::LogStream(LogStream &&other) noexcept
    : logger_(other.logger_), level_(other.level_),
      stream_(std::move(other.stream_)), moved_(false) {
  other.moved_ = true;
}

// ========== LoggerNode ==========

LoggerNode::LoggerNode(const std::string &name, const std::string &fullName)
    : name_(name), fullName_(fullName) {}

void LoggerNode::setLevel(Level level) {
  level_ = level;
  hasLevel_ = true;
}

Level LoggerNode::getLevel() const {
  if (hasLevel_) {
    return level_;
  }
  auto spParent = getParent();
  if (spParent) {
    return spParent->getLevel();
  }
  return level_;
}

bool LoggerNode::hasLevel() const { return hasLevel_; }

void LoggerNode::addHandler(std::shared_ptr<Handler> spHandler) {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.push_back(spHandler);
}

void LoggerNode::clearHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.clear();
}

size_t LoggerNode::getHandlerCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return spHandlers_.size();
}

void LoggerNode::log(Level level, const std::string &message) {
  if (level < getLevel()) {
    return;
  }

  std::string formatted = formatMessage(level, message, fullName_);
  emitToHandlers(level, formatted);

  auto spAncestor = propagate_ ? getParent() : nullptr;
  while (spAncestor) {
    spAncestor->emitToHandlers(level, formatted);
    spAncestor = spAncestor->getPropagate() ? spAncestor->getParent() : nullptr;
  }
}

void LoggerNode::emitToHandlers(Level level, const std::string &formatted) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &spHandler : spHandlers_) {
    spHandler->emit(level, formatted);
  }
}

std::string LoggerNode::formatMessage(Level level, const std::string &message,
                                      const std::string &originName) const {
  std::stringstream ss;
  ss << "[" << getCurrentTimestamp() << "] ";
  ss << "[" << levelToString(level) << "] ";
  if (!originName.empty()) {
    ss << "[" << originName << "] ";
  }
  ss << message;
  return ss.str();
}

// ========== Logger ==========

Logger::Logger(std::shared_ptr<LoggerNode> spNode)
    : debug(this, Level::DEBUG), info(this, Level::INFO),
      warning(this, Level::WARNING), error(this, Level::ERROR),
      critical(this, Level::CRITICAL), spNode_(spNode) {
  if (!spNode_) {
    throw std::invalid_argument("Logger requires a logger node");
  }
}

Logger::Logger(const Logger &other) : Logger(other.spNode_) {}

Logger &Logger::operator=(const Logger &other) {
  // Proxies keep pointing at this handle, only the node changes
  spNode_ = other.spNode_;
  return *this;
}

void Logger::addFileHandler(const std::string &filename, Level level) {
  auto spHandler = std::make_shared<FileHandler>(filename);
  spHandler->setLevel(level);
  spNode_->addHandler(spHandler);
}

Logger Logger::getParent() const {
  auto spParent = spNode_->getParent();
  if (!spParent) {
    return *this;
  }
  return Logger(spParent);
}

void Logger::log(Level level, const std::string &message) {
  spNode_->log(level, message);
}

// ========== Global logger management ==========

Logger getLogger(const std::string &name) {
  std::lock_guard<std::mutex> lock(getRegistryMutex());
  return Logger(getOrCreateNode(trimDots(name)));
}

Logger getRootLogger() { return getLogger(""); }

} // namespace logging
} // namespace fv
