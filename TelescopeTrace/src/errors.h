#pragma once

#include <stdexcept>
#include <string>
#include <utility>

// Base error for the trace engine.
class TraceError : public std::runtime_error {
public:
	explicit TraceError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

// Bad stop flags, bad grid shapes, invalid surface parameters. Fatal to the whole run.
class ConfigurationError : public TraceError {
public:
	explicit ConfigurationError(std::string msg) : TraceError(std::move(msg)) {}
};

// Raised after a parallel map observed its cancellation flag.
class CancelledError : public TraceError {
public:
	explicit CancelledError(std::string msg) : TraceError(std::move(msg)) {}
};

class IoError : public TraceError {
public:
	explicit IoError(std::string msg) : TraceError(std::move(msg)) {}
};
