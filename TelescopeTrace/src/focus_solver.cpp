#include "focus_solver.h"

#include "errors.h"
#include "logging.h"
#include "propagator.h"
#include "spot_analysis.h"

#include <chrono>
#include <cmath>
#include <pagmo/algorithm.hpp>
#include <pagmo/algorithms/pso.hpp>
#include <pagmo/population.hpp>
#include <sstream>

namespace {

// fitness of a shift that loses every ray
constexpr double kLostFocusPenalty = 1e10;

}

void FocusProblem::init(const SequentialSystem& system, const InputGrid& grid, const RayBundle& bundle, const ParallelOptions& parallel, double range) {
	m_system = std::make_shared<const SequentialSystem>(system);
	m_grid = std::make_shared<const InputGrid>(grid);
	m_bundle = std::make_shared<const RayBundle>(bundle);
	m_parallel = parallel;
	m_range = range;
}

double FocusProblem::rmsForShift(double shift) const {
	Propagator propagator(shiftSensor(*m_system, shift), m_parallel);
	RayFunction rays = propagator.propagate(*m_grid, *m_bundle);
	int sensorIndex = m_system->getSurfaceCount() - 1;
	return meanRmsRadius(rays, propagator.getSystem().getSensor(), sensorIndex);
}

pagmo::vector_double FocusProblem::fitness(const pagmo::vector_double& dv) const {
	double rms = rmsForShift(dv[0]);
	if (!std::isfinite(rms)) {
		return { kLostFocusPenalty };
	}
	return { rms };
}

std::pair<pagmo::vector_double, pagmo::vector_double> FocusProblem::get_bounds() const {
	return { { -m_range }, { m_range } };
}

std::string FocusProblem::get_name() const {
	return "sensor focus";
}

SequentialSystem shiftSensor(const SequentialSystem& system, double shift) {
	const Surface& sensor = system.getSensor();
	Transform moved = sensor.getTransform().then(Transform::translation(sensor.getTransform().getAxis() * shift));
	return system.withSensor(sensor.withTransform(moved));
}

FocusResult solveBestFocus(const SequentialSystem& system, const InputGrid& grid, const StopResolution& resolution,
	const TraceSettings& settings, const FocusSettings& focus) {
	if (!(focus.searchRange > 0.0)) {
		throw ConfigurationError("focus search range must be positive");
	}
	if (focus.generations < 1) {
		throw ConfigurationError("focus search needs at least one generation");
	}
	if (focus.populationSize < 6) {
		throw ConfigurationError("focus search needs a population of at least 6");
	}

	RayBundle bundle = generateRays(grid, resolution, settings.parallel);
	FocusProblem problem;
	problem.init(system, grid, bundle, settings.parallel, focus.searchRange);

	auto start = std::chrono::steady_clock::now();
	pagmo::problem prob{ problem };
	pagmo::algorithm algo{ pagmo::pso(1u, 0.7298, 2.05, 2.05, 0.5, 5u, 2u, 4u, true, focus.seed) };
	pagmo::population pop(prob, focus.populationSize - 1, focus.seed);
	// the nominal position is always a candidate
	pop.push_back({ 0.0 });

	FocusResult result;
	result.nominalRmsRadius = problem.rmsForShift(0.0);

	for (unsigned gen = 0; gen < focus.generations; gen++) {
		pop = algo.evolve(pop);
		std::ostringstream progress;
		progress << "focus gen " << gen + 1 << "/" << focus.generations << ": shift " << pop.champion_x()[0]
			<< ", mean rms radius " << pop.champion_f()[0];
		logMessage(LogLevel::Debug, progress.str());
	}

	result.sensorShift = pop.champion_x()[0];
	result.rmsRadius = pop.champion_f()[0];
	result.evaluations = pop.get_problem().get_fevals();

	auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
	std::ostringstream summary;
	summary << "best focus: shift " << result.sensorShift << ", mean rms radius " << result.rmsRadius
		<< " (nominal " << result.nominalRmsRadius << "), " << result.evaluations << " evaluations in " << elapsed.count() << " ms";
	logMessage(LogLevel::Info, summary.str());
	return result;
}
