#pragma once

#include "Logger/Logger.hpp"

namespace fuseki::engine {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace fuseki::engine
