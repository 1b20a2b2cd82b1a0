#pragma once

#include "ray_function.h"
#include "surface.h"

#include <glm/glm.hpp>
#include <vector>

// Spot of one (wavelength, field) point in the surface's local xy plane.
struct SpotStatistics {
	glm::dvec2 centroid{ 0.0 };
	double rmsRadius = 0.0;
	double geometricRadius = 0.0; // largest distance to the centroid
	int alive = 0;
};

// Local xy of the alive rays of one (wavelength, field) point, one entry per alive pupil sample.
std::vector<glm::dvec2> spotDiagram(const RayFunction& rays, const Surface& surface, int surfaceIndex, int w, int fx, int fy);
// Centroid and radii are NaN when no ray is alive.
SpotStatistics spotStatistics(const RayFunction& rays, const Surface& surface, int surfaceIndex, int w, int fx, int fy);
// Mean RMS radius over all (wavelength, field) points with at least one alive ray; NaN if there are none.
double meanRmsRadius(const RayFunction& rays, const Surface& surface, int surfaceIndex);
