#pragma once

#include <glm/glm.hpp>

// Why a ray stopped. Per-ray outcomes are never thrown.
enum class RayStatus {
	Alive,
	Missed,                  // no forward intersection with the surface
	Vignetted,               // intersection outside the aperture
	DegenerateGeometry,      // no real root, or ray parallel to a degenerate surface
	NumericOverflow,         // non-finite values during the solve
	Absorbed,
	TotalInternalReflection,
	AimFailed                // stop resolution could not aim this ray
};

const char* toString(RayStatus status);

struct Ray {
	glm::dvec3 position{ 0.0 };
	glm::dvec3 direction{ 0.0, 0.0, 1.0 };
	double wavelength = 550.0;
	double index = 1.0; // refractive index of the medium the ray travels in
	bool alive = true;
	RayStatus status = RayStatus::Alive;

	glm::dvec3 at(double t) const;
};

// Dead copy of a ray with NaN position and direction, keeping wavelength and status.
Ray deadRay(const Ray& ray, RayStatus status);
