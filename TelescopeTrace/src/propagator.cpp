#include "propagator.h"

#include "errors.h"
#include "logging.h"

#include <utility>

Propagator::Propagator(SequentialSystem system, ParallelOptions options)
	: m_system(std::move(system)), m_options(options) {
}

const SequentialSystem& Propagator::getSystem() const {
	return m_system;
}

std::vector<Ray> Propagator::traceRay(const Ray& ray) const {
	std::vector<Ray> states;
	states.reserve(m_system.getSurfaceCount());
	Ray current = ray;
	for (int s = 0; s < m_system.getSurfaceCount(); s++) {
		current = m_system.getSurface(s).trace(current);
		states.push_back(current);
	}
	return states;
}

RayFunction Propagator::propagate(const InputGrid& grid, const RayBundle& bundle) const {
	if (bundle.rays.empty()) {
		throw ConfigurationError("cannot propagate an empty ray bundle");
	}
	if (!(bundle.shape == grid.getShape()) || bundle.rays.size() != grid.getCellCount()) {
		throw ConfigurationError("ray bundle shape does not match the input grid");
	}

	int surfaceCount = m_system.getSurfaceCount();
	std::vector<Ray> states(bundle.rays.size() * surfaceCount);
	parallelForChunks(bundle.rays.size(), m_options, [&](std::size_t begin, std::size_t end) {
		for (std::size_t cell = begin; cell < end; cell++) {
			Ray current = bundle.rays[cell];
			for (int s = 0; s < surfaceCount; s++) {
				current = m_system.getSurface(s).trace(current);
				states[cell * surfaceCount + s] = current;
			}
		}
	});

	RayFunction rays(grid, bundle.rays, surfaceCount, std::move(states));
	logMessage(LogLevel::Debug, "propagated " + std::to_string(bundle.rays.size()) + " rays through " + std::to_string(surfaceCount)
		+ " surfaces, " + std::to_string(rays.aliveCount(surfaceCount - 1)) + " reached the sensor");
	return rays;
}
