#include "Module.h"

namespace cl {

Module::Module(const std::string &name)
    : loggerName_(name), logger_(logging::getLogger(name)) {}

} // namespace cl
