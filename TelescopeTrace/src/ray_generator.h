#pragma once

#include "input_grid.h"
#include "parallel.h"
#include "ray.h"
#include "stop_resolver.h"

#include <vector>

// Initial rays for every grid cell, dense and in grid order. Cells that could not be aimed are dead.
struct RayBundle {
	GridShape shape;
	std::vector<Ray> rays;
};

// Throws ConfigurationError when the resolution was built for a different grid shape.
RayBundle generateRays(const InputGrid& grid, const StopResolution& resolution, const ParallelOptions& options = {});
