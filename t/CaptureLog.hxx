#pragma once

#include "report/LogSink.hxx"

#include <algorithm>
#include <string>
#include <vector>

/**
 * A #LogSink which collects all messages.
 */
class CaptureLog final : public LogSink {
public:
	struct Line {
		int priority;
		std::string message;
	};

	std::vector<Line> lines;

	void Log(int priority, std::string_view message) noexcept override {
		lines.push_back({priority, std::string{message}});
	}

	[[gnu::pure]]
	bool Contains(std::string_view needle) const noexcept {
		return std::any_of(lines.begin(), lines.end(), [needle](const auto &i){
			return i.message.find(needle) != i.message.npos;
		});
	}

	[[gnu::pure]]
	std::size_t Count(std::string_view prefix) const noexcept {
		return std::count_if(lines.begin(), lines.end(), [prefix](const auto &i){
			return i.message.starts_with(prefix);
		});
	}
};
