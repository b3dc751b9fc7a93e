#pragma once

#include "Logger/Logger.hpp"

namespace fuseki::core {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace fuseki::core
