#include "utils.h"

#include <cmath>
#include <limits>

glm::dvec3 directionFromFieldAngles(const glm::dvec2& fieldAngles) {
	return glm::normalize(glm::dvec3(std::tan(fieldAngles.x), std::tan(fieldAngles.y), 1.0));
}

glm::dvec2 fieldAnglesFromDirection(const glm::dvec3& direction) {
	// angle of the projection onto the xz and yz planes
	double angleX = std::atan2(direction.x, direction.z);
	double angleY = std::atan2(direction.y, direction.z);
	return glm::dvec2(angleX, angleY);
}

std::vector<double> linspace(double start, double stop, int n) {
	std::vector<double> samples;
	if (n <= 0) {
		return samples;
	}
	if (n == 1) {
		samples.push_back(0.5 * (start + stop));
		return samples;
	}
	samples.reserve(n);
	double step = (stop - start) / (n - 1);
	for (int i = 0; i < n; i++) {
		samples.push_back(start + i * step);
	}
	// land exactly on the end point
	samples.back() = stop;
	return samples;
}

glm::dvec3 nanVector() {
	double nan = std::numeric_limits<double>::quiet_NaN();
	return glm::dvec3(nan, nan, nan);
}

bool isFiniteVector(const glm::dvec3& v) {
	return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

glm::dvec3 wavelengthToRGB(double wavelength) {
	double R = 0.0, G = 0.0, B = 0.0;

	if (wavelength >= 380.0 && wavelength <= 440.0) {
		R = -1.0 * (wavelength - 440.0) / (440.0 - 380.0);
		B = 1.0;
	}
	else if (wavelength > 440.0 && wavelength <= 490.0) {
		G = (wavelength - 440.0) / (490.0 - 440.0);
		B = 1.0;
	}
	else if (wavelength > 490.0 && wavelength <= 510.0) {
		G = 1.0;
		B = -1.0 * (wavelength - 510.0) / (510.0 - 490.0);
	}
	else if (wavelength > 510.0 && wavelength <= 580.0) {
		R = (wavelength - 510.0) / (580.0 - 510.0);
		G = 1.0;
	}
	else if (wavelength > 580.0 && wavelength <= 645.0) {
		R = 1.0;
		G = -1.0 * (wavelength - 645.0) / (645.0 - 580.0);
	}
	else if (wavelength > 645.0 && wavelength <= 750.0) {
		R = 1.0;
	}

	// intensity falls off near the vision limits
	double factor = 0.0;
	if (wavelength >= 380.0 && wavelength <= 420.0) {
		factor = 0.3 + 0.7 * (wavelength - 380.0) / (420.0 - 380.0);
	}
	else if (wavelength > 420.0 && wavelength <= 700.0) {
		factor = 1.0;
	}
	else if (wavelength > 700.0 && wavelength <= 750.0) {
		factor = 0.3 + 0.7 * (750.0 - wavelength) / (750.0 - 700.0);
	}

	return glm::dvec3(R, G, B) * factor;
}
