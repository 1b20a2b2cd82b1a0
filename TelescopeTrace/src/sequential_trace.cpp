#include "sequential_trace.h"

#include "propagator.h"
#include "ray_generator.h"

#include <utility>

TraceResult traceSystem(const SequentialSystem& system, const InputGrid& grid, const TraceSettings& settings) {
	StopResolution resolution = resolveStops(system, grid, settings);
	RayFunction rays = traceResolved(system, grid, resolution, settings);
	return TraceResult{ std::move(resolution), std::move(rays) };
}

RayFunction traceResolved(const SequentialSystem& system, const InputGrid& grid, const StopResolution& resolution, const TraceSettings& settings) {
	RayBundle bundle = generateRays(grid, resolution, settings.parallel);
	Propagator propagator(system, settings.parallel);
	return propagator.propagate(grid, bundle);
}
