#include "logging.h"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

static std::atomic<int> g_logLevel{ static_cast<int>(LogLevel::Info) };
static std::mutex g_logMutex;

static const char* levelTag(LogLevel level) noexcept {
	switch (level) {
	case LogLevel::Debug: return "DEBUG";
	case LogLevel::Info: return "INFO";
	case LogLevel::Warn: return "WARN";
	case LogLevel::Error: return "ERROR";
	}
	return "INFO";
}

static std::string utcTimestamp() {
	auto now = std::chrono::system_clock::now();
	std::time_t tt = std::chrono::system_clock::to_time_t(now);
	std::tm tm{};
	gmtime_r(&tt, &tm);
	std::ostringstream oss;
	oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
	return oss.str();
}

void setLogLevel(LogLevel level) noexcept {
	g_logLevel.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel getLogLevel() noexcept {
	return static_cast<LogLevel>(g_logLevel.load(std::memory_order_relaxed));
}

bool parseLogLevel(const std::string& text, LogLevel& level) {
	if (text == "debug") {
		level = LogLevel::Debug;
	}
	else if (text == "info") {
		level = LogLevel::Info;
	}
	else if (text == "warn") {
		level = LogLevel::Warn;
	}
	else if (text == "error") {
		level = LogLevel::Error;
	}
	else {
		return false;
	}
	return true;
}

void logMessage(LogLevel level, const std::string& msg) noexcept {
	if (static_cast<int>(level) < g_logLevel.load(std::memory_order_relaxed)) {
		return;
	}
	try {
		std::lock_guard<std::mutex> lock(g_logMutex);
		std::ostream& out = (level >= LogLevel::Warn) ? std::cerr : std::cout;
		out << "[" << utcTimestamp() << "][" << levelTag(level) << "] " << msg << std::endl;
	}
	catch (const std::exception&) {
		// dropped, logging never throws
	}
}
