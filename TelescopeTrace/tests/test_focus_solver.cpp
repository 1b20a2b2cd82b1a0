#include <cmath>
#include <iostream>
#include <string>

#include "errors.h"
#include "focus_solver.h"
#include "logging.h"
#include "preset_systems.h"
#include "stop_resolver.h"

static int g_failures = 0;

static void check(bool condition, const std::string& what) {
	if (!condition) {
		std::cerr << "FAIL: " << what << std::endl;
		g_failures++;
	}
}

static bool near(double a, double b, double tolerance) {
	return std::abs(a - b) <= tolerance;
}

int main() {
	setLogLevel(LogLevel::Warn);

	SequentialSystem nominal = primeFocusTelescope(PrimeFocusParameters{});
	SequentialSystem shifted = shiftSensor(nominal, 2.0);
	check(near(shifted.getSensor().getTransform().getVertex().z, 502.0, 1e-12), "shift moves the sensor along its axis");
	check(shifted.getSensor().getName() == "sensor" && shifted.getStops().fieldIndex == 1, "shifted sensor keeps its role");

	InputGrid grid = InputGrid::uniform({ 550.0 }, 1, 1, 5, 5);
	TraceSettings settings;
	StopResolution resolution = resolveStops(shifted, grid, settings);

	FocusSettings focus;
	FocusResult best = solveBestFocus(shifted, grid, resolution, settings, focus);
	check(near(best.sensorShift, -2.0, 0.05), "search finds the paraxial focus");
	check(best.rmsRadius <= best.nominalRmsRadius, "best focus no worse than nominal");
	check(best.rmsRadius < 0.1 * best.nominalRmsRadius, "best focus much sharper than 2 mm of defocus");
	check(best.evaluations > focus.populationSize, "swarm evaluated the problem");

	FocusProblem problem;
	problem.init(shifted, grid, generateRays(grid, resolution), settings.parallel, 5.0);
	check(problem.get_bounds().first[0] == -5.0 && problem.get_bounds().second[0] == 5.0, "bounds follow the range");
	check(near(problem.rmsForShift(-2.0), 0.0, 1e-6), "no blur at the focus");
	check(problem.fitness({ 0.0 })[0] == problem.rmsForShift(0.0), "fitness is the mean rms radius");

	bool threw = false;
	try {
		FocusSettings bad = focus;
		bad.searchRange = 0.0;
		solveBestFocus(shifted, grid, resolution, settings, bad);
	}
	catch (const ConfigurationError&) {
		threw = true;
	}
	check(threw, "zero search range rejected");

	threw = false;
	try {
		FocusSettings idle = focus;
		idle.generations = 0;
		solveBestFocus(shifted, grid, resolution, settings, idle);
	}
	catch (const ConfigurationError&) {
		threw = true;
	}
	check(threw, "search without generations rejected");

	if (g_failures > 0) {
		std::cerr << "[focus_solver] " << g_failures << " failures" << std::endl;
		return 1;
	}
	std::cout << "[focus_solver] ok" << std::endl;
	return 0;
}
