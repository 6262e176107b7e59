#ifndef FORKVOTE_LOGGER_H
#define FORKVOTE_LOGGER_H

#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace fv {
namespace logging {

enum class Level { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, CRITICAL = 4 };

std::string levelToString(Level level);

class Handler {
public:
  virtual ~Handler() = default;
  virtual void emit(Level level, const std::string &message) = 0;

  void setLevel(Level level) { level_ = level; }
  Level getLevel() const { return level_; }

protected:
  Level level_ = Level::DEBUG;
};

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

class Logger;
class LogStream;

class LogProxy {
public:
  LogProxy(Logger *logger, Level level);

  template <typename T> LogStream operator<<(const T &value);

private:
  Logger *logger_;
  Level level_;
};

// Collects one message and hands it to the logger on destruction
class LogStream {
public:
  LogStream(Logger *logger, Level level);
  ~LogStream();

  LogStream(const LogStream &) = delete;
  LogStream &operator=(const LogStream &) = delete;
  LogStream(LogStream &&other) noexcept;

  template <typename T> LogStream &operator<<(const T &value) {
    stream_ << value;
    return *this;
  }

private:
  Logger *logger_;
  Level level_;
  std::ostringstream stream_;
  bool moved_;
};

// Node of the logger tree, shared by every Logger handle with the same name
class LoggerNode : public std::enable_shared_from_this<LoggerNode> {
public:
  LoggerNode(const std::string &name, const std::string &fullName);

  void setLevel(Level level);
  // Own level if set, otherwise the nearest ancestor's, INFO at the top
  Level getLevel() const;
  bool hasLevel() const;

  void setPropagate(bool propagate) { propagate_ = propagate; }
  bool getPropagate() const { return propagate_; }

  void addHandler(std::shared_ptr<Handler> spHandler);
  void clearHandlers();
  size_t getHandlerCount() const;

  void setParent(std::weak_ptr<LoggerNode> parent) { parent_ = parent; }
  std::shared_ptr<LoggerNode> getParent() const { return parent_.lock(); }

  const std::string &getName() const { return name_; }
  const std::string &getFullName() const { return fullName_; }

  /**
   * Drop the message if it is below the effective level, otherwise emit it
   * to the handlers of this node and, while propagation is enabled, of
   * every ancestor. Handler levels still filter individually.
   */
  void log(Level level, const std::string &message);

private:
  void emitToHandlers(Level level, const std::string &formatted);
  std::string formatMessage(Level level, const std::string &message,
                            const std::string &originName) const;

  std::string name_;
  std::string fullName_;
  std::weak_ptr<LoggerNode> parent_;
  Level level_{ Level::INFO };
  bool hasLevel_{ false };
  bool propagate_{ true };
  std::vector<std::shared_ptr<Handler>> spHandlers_;
  mutable std::mutex mutex_;
};

// Lightweight handle around a LoggerNode
class Logger {
public:
  explicit Logger(std::shared_ptr<LoggerNode> spNode);
  Logger(const Logger &other);
  Logger &operator=(const Logger &other);

  LogProxy debug;
  LogProxy info;
  LogProxy warning;
  LogProxy error;
  LogProxy critical;

  void setLevel(Level level) { spNode_->setLevel(level); }
  Level getLevel() const { return spNode_->getLevel(); }

  void addHandler(std::shared_ptr<Handler> spHandler) {
    spNode_->addHandler(spHandler);
  }
  void addFileHandler(const std::string &filename,
                      Level level = Level::DEBUG);
  void clearHandlers() { spNode_->clearHandlers(); }

  void setPropagate(bool propagate) { spNode_->setPropagate(propagate); }
  bool getPropagate() const { return spNode_->getPropagate(); }

  const std::string &getName() const { return spNode_->getName(); }
  const std::string &getFullName() const { return spNode_->getFullName(); }

  Logger getParent() const;

  bool operator==(const Logger &other) const {
    return spNode_ == other.spNode_;
  }
  bool operator!=(const Logger &other) const {
    return spNode_ != other.spNode_;
  }

private:
  friend class LogStream;

  void log(Level level, const std::string &message);

  std::shared_ptr<LoggerNode> spNode_;
};

template <typename T> LogStream LogProxy::operator<<(const T &value) {
  LogStream stream(logger_, level_);
  stream << value;
  return stream;
}

/**
 * Get (creating on first use) the logger with a dotted hierarchical name,
 * e.g. "simulation.engine". Missing ancestors are created as well.
 * The empty name is the root logger.
 */
Logger getLogger(const std::string &name);
Logger getRootLogger();

} // namespace logging
} // namespace fv

#endif // FORKVOTE_LOGGER_H
