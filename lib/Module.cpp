#include "Module.h"

namespace vnc {

Module::Module(const std::string &name) : spLogger_(logging::getLogger(name)) {}

logging::Logger &Module::log() const { return *spLogger_; }

} // namespace vnc
