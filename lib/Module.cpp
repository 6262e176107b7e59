#include "Module.h"

namespace fv {

Module::Module(const std::string &name) : logger_(logging::getLogger(name)) {}

logging::Logger &Module::log() const { return logger_; }

} // namespace fv
