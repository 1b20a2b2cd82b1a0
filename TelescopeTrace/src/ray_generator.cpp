#include "ray_generator.h"

#include "errors.h"

RayBundle generateRays(const InputGrid& grid, const StopResolution& resolution, const ParallelOptions& options) {
	if (!(grid.getShape() == resolution.getShape())) {
		throw ConfigurationError("stop resolution was computed for a different grid shape");
	}

	RayBundle bundle;
	bundle.shape = grid.getShape();
	bundle.rays.resize(grid.getCellCount());
	parallelForChunks(bundle.rays.size(), options, [&](std::size_t begin, std::size_t end) {
		for (std::size_t cell = begin; cell < end; cell++) {
			const LaunchCell& launch = resolution.getLaunch(cell);
			Ray ray;
			ray.position = launch.origin;
			ray.direction = launch.direction;
			ray.wavelength = grid.getWavelengths()[grid.gridIndex(cell).w];
			if (launch.status != RayStatus::Alive) {
				ray = deadRay(ray, launch.status);
			}
			bundle.rays[cell] = ray;
		}
	});
	return bundle;
}
