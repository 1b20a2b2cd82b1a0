#pragma once

#include "input_grid.h"
#include "ray.h"

#include <glm/glm.hpp>
#include <vector>

// Ray state after every surface for every grid cell, built once per propagation.
// Surface indices follow SequentialSystem: the last index is the sensor.
class RayFunction {
public:
	// states holds surfaceCount entries per cell, cell-major.
	RayFunction(InputGrid grid, std::vector<Ray> initialRays, int surfaceCount, std::vector<Ray> states);

	const InputGrid& getGrid() const;
	int getSurfaceCount() const;

	const Ray& initialState(const GridIndex& index) const;
	const Ray& state(const GridIndex& index, int surface) const;
	const Ray& state(std::size_t cell, int surface) const;
	const Ray& sensorState(const GridIndex& index) const;

	// Mean global position over the pupil axes of alive rays at (w, fx, fy); NaN when none are alive.
	glm::dvec3 centroid(int w, int fx, int fy, int surface) const;
	// Position minus the centroid of the ray's own field point; NaN for dead rays.
	glm::dvec3 residual(const GridIndex& index, int surface) const;
	// Root mean square distance to the centroid over alive rays; NaN when none are alive.
	double rmsRadius(int w, int fx, int fy, int surface) const;
	int aliveCount(int w, int fx, int fy, int surface) const;
	int aliveCount(int surface) const;

private:
	InputGrid m_grid;
	std::vector<Ray> m_initial;
	int m_surface_count;
	std::vector<Ray> m_states;
};
