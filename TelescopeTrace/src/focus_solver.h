#pragma once

#include "input_grid.h"
#include "optical_system.h"
#include "ray_generator.h"
#include "stop_resolver.h"
#include "trace_settings.h"

#include <memory>
#include <pagmo/problem.hpp>
#include <pagmo/types.hpp>
#include <string>

struct FocusSettings {
	double searchRange = 5.0;     // sensor shift bounds, +- along the sensor's local axis
	unsigned generations = 30;
	unsigned populationSize = 16;
	unsigned seed = 42;
};

struct FocusResult {
	double sensorShift = 0.0;
	double rmsRadius = 0.0;        // mean RMS spot radius at the best shift
	double nominalRmsRadius = 0.0; // mean RMS spot radius without a shift
	unsigned long long evaluations = 0;
};

// pagmo problem: one decision variable, the sensor shift; fitness is the mean RMS spot radius on the sensor.
// Launch rays are fixed, so field angles stay those of the nominal focus.
struct FocusProblem {
	std::shared_ptr<const SequentialSystem> m_system;
	std::shared_ptr<const InputGrid> m_grid;
	std::shared_ptr<const RayBundle> m_bundle;
	ParallelOptions m_parallel;
	double m_range = 1.0;

	void init(const SequentialSystem& system, const InputGrid& grid, const RayBundle& bundle, const ParallelOptions& parallel, double range);
	// Mean RMS radius for a given shift; NaN when no ray reaches the sensor.
	double rmsForShift(double shift) const;
	pagmo::vector_double fitness(const pagmo::vector_double& dv) const;
	std::pair<pagmo::vector_double, pagmo::vector_double> get_bounds() const;
	std::string get_name() const;
};

// Copy of the system with the sensor moved by `shift` along its own local z axis.
SequentialSystem shiftSensor(const SequentialSystem& system, double shift);

// Particle swarm search for the sensor shift with the smallest mean RMS spot radius.
FocusResult solveBestFocus(const SequentialSystem& system, const InputGrid& grid, const StopResolution& resolution,
	const TraceSettings& settings, const FocusSettings& focus);
