#include "ray_function.h"

#include "errors.h"
#include "utils.h"

#include <cmath>
#include <limits>
#include <utility>

RayFunction::RayFunction(InputGrid grid, std::vector<Ray> initialRays, int surfaceCount, std::vector<Ray> states)
	: m_grid(std::move(grid)), m_initial(std::move(initialRays)), m_surface_count(surfaceCount), m_states(std::move(states)) {
	if (m_surface_count <= 0) {
		throw ConfigurationError("ray function needs at least one surface");
	}
	if (m_initial.size() != m_grid.getCellCount() || m_states.size() != m_grid.getCellCount() * m_surface_count) {
		throw ConfigurationError("ray function states do not match the grid shape");
	}
}

const InputGrid& RayFunction::getGrid() const {
	return m_grid;
}

int RayFunction::getSurfaceCount() const {
	return m_surface_count;
}

const Ray& RayFunction::initialState(const GridIndex& index) const {
	return m_initial.at(m_grid.flatIndex(index));
}

const Ray& RayFunction::state(const GridIndex& index, int surface) const {
	return state(m_grid.flatIndex(index), surface);
}

const Ray& RayFunction::state(std::size_t cell, int surface) const {
	if (surface < 0 || surface >= m_surface_count) {
		throw ConfigurationError("surface index " + std::to_string(surface) + " out of range");
	}
	return m_states.at(cell * m_surface_count + surface);
}

const Ray& RayFunction::sensorState(const GridIndex& index) const {
	return state(index, m_surface_count - 1);
}

glm::dvec3 RayFunction::centroid(int w, int fx, int fy, int surface) const {
	GridShape shape = m_grid.getShape();
	glm::dvec3 sum(0.0);
	int count = 0;
	for (int px = 0; px < shape.pupilX; px++) {
		for (int py = 0; py < shape.pupilY; py++) {
			const Ray& ray = state(GridIndex{ w, fx, fy, px, py }, surface);
			if (ray.alive) {
				sum += ray.position;
				count++;
			}
		}
	}
	if (count == 0) {
		return nanVector();
	}
	return sum / static_cast<double>(count);
}

glm::dvec3 RayFunction::residual(const GridIndex& index, int surface) const {
	const Ray& ray = state(index, surface);
	if (!ray.alive) {
		return nanVector();
	}
	return ray.position - centroid(index.w, index.fx, index.fy, surface);
}

double RayFunction::rmsRadius(int w, int fx, int fy, int surface) const {
	glm::dvec3 center = centroid(w, fx, fy, surface);
	if (!isFiniteVector(center)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	GridShape shape = m_grid.getShape();
	double sum = 0.0;
	int count = 0;
	for (int px = 0; px < shape.pupilX; px++) {
		for (int py = 0; py < shape.pupilY; py++) {
			const Ray& ray = state(GridIndex{ w, fx, fy, px, py }, surface);
			if (ray.alive) {
				glm::dvec3 d = ray.position - center;
				sum += glm::dot(d, d);
				count++;
			}
		}
	}
	return std::sqrt(sum / count);
}

int RayFunction::aliveCount(int w, int fx, int fy, int surface) const {
	GridShape shape = m_grid.getShape();
	int count = 0;
	for (int px = 0; px < shape.pupilX; px++) {
		for (int py = 0; py < shape.pupilY; py++) {
			if (state(GridIndex{ w, fx, fy, px, py }, surface).alive) {
				count++;
			}
		}
	}
	return count;
}

int RayFunction::aliveCount(int surface) const {
	int count = 0;
	for (std::size_t cell = 0; cell < m_grid.getCellCount(); cell++) {
		if (state(cell, surface).alive) {
			count++;
		}
	}
	return count;
}
