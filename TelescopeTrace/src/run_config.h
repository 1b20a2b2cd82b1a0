#pragma once

#include "logging.h"
#include "sensor_format.h"

#include <string>
#include <vector>

// Settings of one prime_focus run, from a flat JSON file and/or --key value arguments.
struct RunConfig {
	std::string preset = "prime_focus"; // or "newtonian"
	double apertureRadius = 100.0;
	double focalLength = 500.0;
	double obscurationRadius = 0.0;
	double mirrorDistance = 1000.0;
	double diagonalOffset = 100.0;
	double diagonalRadius = 40.0;
	SensorFormat sensor;
	std::string sensorMaterial = "transparent"; // or "ccd"
	long long exposurePhotons = 0;              // photons per ray for a simulated CCD exposure, 0 for none

	std::vector<double> wavelengths{ 550.0 };
	int fieldX = 5;
	int fieldY = 5;
	int pupilX = 5;
	int pupilY = 5;

	int threads = 0;
	int chunkSize = 64;

	bool bestFocus = false;
	double focusRange = 5.0;
	int focusGenerations = 30;

	std::string rayTablePath;
	std::string imagePath;
	std::string layoutPath;
	LogLevel logLevel = LogLevel::Info;
};

std::string readTextFile(const std::string& path);

// Keys missing from the JSON keep their current value. Throws ConfigurationError on malformed values.
void applyConfigJson(const std::string& json, RunConfig& config);
// --config FILE is applied first, then every other --key value in order.
// Throws ConfigurationError on unknown options or malformed values.
RunConfig parseArguments(const std::vector<std::string>& args);

std::string usage();
