#pragma once

#include "optical_system.h"

#include <glm/glm.hpp>

struct ParaxialModel {
	glm::dmat2 systemMatrix{ 1.0 }; // first surface to last surface before the sensor
	double effectiveFocalLength = 0.0;
	double backFocalDistance = 0.0;  // from the last surface before the sensor to the paraxial focus
	double sensorDistance = 0.0;     // from the last surface before the sensor to the sensor vertex
	double defocus = 0.0;            // sensorDistance - backFocalDistance
	double entrancePupilDiameter = 0.0;
	double fNumber = 0.0;
};

// First-order model of the unfolded system. Assumes the surface vertices lie on the traced axis;
// tilted folds such as a diagonal flat are handled by following the reflected axis.
// Throws ConfigurationError for afocal systems or a system without a pupil stop.
ParaxialModel paraxialModel(const SequentialSystem& system, double wavelength = 550.0);
