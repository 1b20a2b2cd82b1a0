#include "run_config.h"

#include "errors.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace {

double toNumber(const std::string& key, const std::string& text) {
	std::size_t used = 0;
	double value = 0.0;
	try {
		value = std::stod(text, &used);
	}
	catch (const std::logic_error&) {
		throw ConfigurationError("value of '" + key + "' is not a number: " + text);
	}
	if (text.find_first_not_of(" \t\r\n", used) != std::string::npos) {
		throw ConfigurationError("value of '" + key + "' is not a number: " + text);
	}
	return value;
}

int toInt(const std::string& key, const std::string& text) {
	double value = toNumber(key, text);
	if (!(value >= std::numeric_limits<int>::min() && value <= std::numeric_limits<int>::max())) {
		throw ConfigurationError("value of '" + key + "' is out of range: " + text);
	}
	if (value != std::trunc(value)) {
		throw ConfigurationError("value of '" + key + "' is not an integer: " + text);
	}
	return static_cast<int>(value);
}

// integer of at least `minimum`, e.g. sample counts
int toCount(const std::string& key, const std::string& text, int minimum) {
	int value = toInt(key, text);
	if (value < minimum) {
		throw ConfigurationError("value of '" + key + "' must be at least " + std::to_string(minimum) + ": " + text);
	}
	return value;
}

bool toBool(const std::string& key, const std::string& text) {
	if (text == "true" || text == "1") {
		return true;
	}
	if (text == "false" || text == "0") {
		return false;
	}
	throw ConfigurationError("value of '" + key + "' is not a boolean: " + text);
}

std::vector<double> toList(const std::string& key, const std::string& text) {
	std::vector<double> values;
	std::istringstream ss(text);
	std::string token;
	while (std::getline(ss, token, ',')) {
		values.push_back(toNumber(key, token));
	}
	if (values.empty()) {
		throw ConfigurationError("value of '" + key + "' is an empty list");
	}
	return values;
}

std::size_t findKey(const std::string& json, const std::string& key) {
	std::size_t pos = json.find("\"" + key + "\"");
	if (pos == std::string::npos) {
		return pos;
	}
	return json.find(':', pos);
}

bool findString(const std::string& json, const std::string& key, std::string& out) {
	std::size_t pos = findKey(json, key);
	if (pos == std::string::npos) {
		return false;
	}
	pos = json.find('"', pos);
	if (pos == std::string::npos) {
		return false;
	}
	std::size_t end = json.find('"', pos + 1);
	if (end == std::string::npos) {
		throw ConfigurationError("unterminated string for '" + key + "'");
	}
	out = json.substr(pos + 1, end - pos - 1);
	return true;
}

// raw scalar text up to the next separator, e.g. a number or true/false
bool findScalar(const std::string& json, const std::string& key, std::string& out) {
	std::size_t pos = findKey(json, key);
	if (pos == std::string::npos) {
		return false;
	}
	std::size_t end = json.find_first_of(",}\n\r", pos + 1);
	out = json.substr(pos + 1, end == std::string::npos ? std::string::npos : end - pos - 1);
	out.erase(0, out.find_first_not_of(" \t"));
	out.erase(out.find_last_not_of(" \t") + 1);
	return true;
}

bool findArray(const std::string& json, const std::string& key, std::string& out) {
	std::size_t pos = findKey(json, key);
	if (pos == std::string::npos) {
		return false;
	}
	pos = json.find('[', pos);
	std::size_t end = json.find(']', pos);
	if (pos == std::string::npos || end == std::string::npos) {
		throw ConfigurationError("malformed array for '" + key + "'");
	}
	out = json.substr(pos + 1, end - pos - 1);
	return true;
}

void applyValue(RunConfig& config, const std::string& key, const std::string& value) {
	if (key == "preset") {
		if (value != "prime_focus" && value != "newtonian") {
			throw ConfigurationError("unknown preset '" + value + "'");
		}
		config.preset = value;
	}
	else if (key == "aperture_radius") config.apertureRadius = toNumber(key, value);
	else if (key == "focal_length") config.focalLength = toNumber(key, value);
	else if (key == "obscuration_radius") config.obscurationRadius = toNumber(key, value);
	else if (key == "mirror_distance") config.mirrorDistance = toNumber(key, value);
	else if (key == "diagonal_offset") config.diagonalOffset = toNumber(key, value);
	else if (key == "diagonal_radius") config.diagonalRadius = toNumber(key, value);
	else if (key == "pixel_pitch") config.sensor.pixelPitch = toNumber(key, value);
	else if (key == "pixels_x") config.sensor.pixelsX = toCount(key, value, 1);
	else if (key == "pixels_y") config.sensor.pixelsY = toCount(key, value, 1);
	else if (key == "sensor_material") {
		if (value != "transparent" && value != "ccd") {
			throw ConfigurationError("unknown sensor material '" + value + "'");
		}
		config.sensorMaterial = value;
	}
	else if (key == "exposure_photons") config.exposurePhotons = toCount(key, value, 0);
	else if (key == "wavelengths") config.wavelengths = toList(key, value);
	else if (key == "field_x") config.fieldX = toCount(key, value, 1);
	else if (key == "field_y") config.fieldY = toCount(key, value, 1);
	else if (key == "pupil_x") config.pupilX = toCount(key, value, 1);
	else if (key == "pupil_y") config.pupilY = toCount(key, value, 1);
	else if (key == "threads") config.threads = toCount(key, value, 0);
	else if (key == "chunk_size") config.chunkSize = toCount(key, value, 1);
	else if (key == "best_focus") config.bestFocus = toBool(key, value);
	else if (key == "focus_range") config.focusRange = toNumber(key, value);
	else if (key == "focus_generations") config.focusGenerations = toCount(key, value, 1);
	else if (key == "ray_table") config.rayTablePath = value;
	else if (key == "image") config.imagePath = value;
	else if (key == "layout") config.layoutPath = value;
	else if (key == "log_level") {
		if (!parseLogLevel(value, config.logLevel)) {
			throw ConfigurationError("unknown log level '" + value + "'");
		}
	}
	else {
		throw ConfigurationError("unknown option '" + key + "'");
	}
}

const char* const kStringKeys[] = { "preset", "sensor_material", "ray_table", "image", "layout", "log_level" };
const char* const kScalarKeys[] = { "aperture_radius", "focal_length", "obscuration_radius", "mirror_distance", "diagonal_offset",
	"diagonal_radius", "pixel_pitch", "pixels_x", "pixels_y", "exposure_photons", "field_x", "field_y", "pupil_x", "pupil_y", "threads", "chunk_size",
	"best_focus", "focus_range", "focus_generations" };

}

std::string readTextFile(const std::string& path) {
	std::ifstream in(path);
	if (!in) {
		throw IoError("could not open " + path);
	}
	std::ostringstream ss;
	ss << in.rdbuf();
	return ss.str();
}

void applyConfigJson(const std::string& json, RunConfig& config) {
	std::string value;
	for (const char* key : kStringKeys) {
		if (findString(json, key, value)) {
			applyValue(config, key, value);
		}
	}
	for (const char* key : kScalarKeys) {
		if (findScalar(json, key, value)) {
			applyValue(config, key, value);
		}
	}
	if (findArray(json, "wavelengths", value)) {
		applyValue(config, "wavelengths", value);
	}
}

RunConfig parseArguments(const std::vector<std::string>& args) {
	RunConfig config;
	std::vector<std::pair<std::string, std::string>> options;
	for (std::size_t i = 0; i < args.size(); i++) {
		const std::string& arg = args[i];
		if (arg.rfind("--", 0) != 0) {
			throw ConfigurationError("unexpected argument '" + arg + "'");
		}
		if (i + 1 >= args.size()) {
			throw ConfigurationError("option '" + arg + "' needs a value");
		}
		std::string key = arg.substr(2);
		std::replace(key.begin(), key.end(), '-', '_');
		options.emplace_back(key, args[++i]);
	}

	for (const auto& [key, value] : options) {
		if (key == "config") {
			applyConfigJson(readTextFile(value), config);
		}
	}
	for (const auto& [key, value] : options) {
		if (key != "config") {
			applyValue(config, key, value);
		}
	}
	return config;
}

std::string usage() {
	return "usage: prime_focus [--config FILE] [--preset prime_focus|newtonian]\n"
		"  [--aperture-radius R] [--focal-length F] [--obscuration-radius R] [--mirror-distance D]\n"
		"  [--diagonal-offset D] [--diagonal-radius R]\n"
		"  [--pixel-pitch P] [--pixels-x N] [--pixels-y N] [--sensor-material transparent|ccd] [--exposure-photons N]\n"
		"  [--wavelengths L1,L2,...] [--field-x N] [--field-y N] [--pupil-x N] [--pupil-y N]\n"
		"  [--threads N] [--chunk-size N]\n"
		"  [--best-focus true|false] [--focus-range R] [--focus-generations N]\n"
		"  [--ray-table FILE.csv] [--image FILE.png] [--layout FILE.csv] [--log-level debug|info|warn|error]\n";
}
