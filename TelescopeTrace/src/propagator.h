#pragma once

#include "input_grid.h"
#include "optical_system.h"
#include "parallel.h"
#include "ray.h"
#include "ray_function.h"
#include "ray_generator.h"

#include <vector>

// Traces ray bundles surface by surface through a sequential system.
class Propagator {
public:
	explicit Propagator(SequentialSystem system, ParallelOptions options = {});

	const SequentialSystem& getSystem() const;

	// Every ray is traced independently; once dead it stays dead with NaN states.
	// Throws ConfigurationError when the bundle does not match the grid, CancelledError when cancelled.
	RayFunction propagate(const InputGrid& grid, const RayBundle& bundle) const;

	// States after each surface for a single ray, sensor last.
	std::vector<Ray> traceRay(const Ray& ray) const;

private:
	SequentialSystem m_system;
	ParallelOptions m_options;
};
