#pragma once

#include "engine/IEngineChannel.hpp"

#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace fuseki::gtest {

//! Scripted engine. Answers each command with the next queued response.
class MockChannel : public engine::IEngineChannel {
public:
	void pushResponse(const std::string& response);
	void pushSuccess(const std::string& payload = "");
	void pushFailure(const std::string& message);

	const std::vector<std::string>& sent() const; //!< Command lines in send order.
	std::size_t pending() const;                  //!< Responses not consumed yet.

public:
	void send(const std::string& line) override;
	std::optional<std::string> receive() override;

private:
	std::deque<std::string> m_responses;
	std::vector<std::string> m_sent;
};

} // namespace fuseki::gtest
