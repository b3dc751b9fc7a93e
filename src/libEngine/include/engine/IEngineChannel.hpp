#pragma once

#include <optional>
#include <string>

namespace fuseki::engine {

//! Line based connection to an engine process.
class IEngineChannel {
public:
	virtual ~IEngineChannel() = default;

	//! Write a complete command line to the engine.
	virtual void send(const std::string& line) = 0;

	//! Block until one complete response (up to the terminating empty line) was read.
	//! Empty when the channel is closed.
	virtual std::optional<std::string> receive() = 0;
};

} // namespace fuseki::engine
