#pragma once

#include "Logger/Logger.hpp"

namespace fuseki::app {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace fuseki::app
