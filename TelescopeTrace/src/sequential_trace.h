#pragma once

#include "input_grid.h"
#include "optical_system.h"
#include "ray_function.h"
#include "stop_resolver.h"
#include "trace_settings.h"

struct TraceResult {
	StopResolution resolution;
	RayFunction rays;
};

// Stop resolution, ray generation and propagation in one call.
TraceResult traceSystem(const SequentialSystem& system, const InputGrid& grid, const TraceSettings& settings);
// Reuses an existing stop resolution, e.g. while only the sensor moves.
RayFunction traceResolved(const SequentialSystem& system, const InputGrid& grid, const StopResolution& resolution, const TraceSettings& settings);
