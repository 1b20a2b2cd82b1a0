#include <cmath>
#include <iostream>
#include <string>

#include "logging.h"
#include "preset_systems.h"
#include "sequential_trace.h"
#include "spot_analysis.h"
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

	NewtonianParameters parameters;
	SequentialSystem system = newtonianTelescope(parameters);
	check(system.getSurfaceCount() == 3, "primary, diagonal and sensor");
	check(system.getStops().pupilIndex == 0 && system.getStops().fieldIndex == 2, "stops on the primary and the sensor");

	InputGrid grid = InputGrid::uniform({ 550.0 }, 3, 3, 5, 5);
	TraceSettings settings;
	TraceResult result = traceSystem(system, grid, settings);
	const RayFunction& rays = result.rays;
	const int sensorIndex = 2;

	// a flat fold leaves the field angle of the prime focus unchanged
	glm::dvec2 halfAngles = result.resolution.getFieldHalfAngles();
	double expected = std::atan(parameters.sensor.halfWidthX() / parameters.focalLength);
	check(near(halfAngles.x, expected, 1e-8) && near(halfAngles.y, expected, 1e-8), "field half-angles");

	check(rays.aliveCount(0, 1, 1, 1) == 13, "on-axis beam fits on the diagonal");
	check(rays.aliveCount(0, 1, 1, sensorIndex) == 13, "on-axis beam reaches the sensor");

	glm::dvec3 focus = rays.centroid(0, 1, 1, sensorIndex);
	check(glm::length(focus - glm::dvec3(0.0, -100.0, 600.0)) < 1e-6, "focus folded to the side of the tube");
	SpotStatistics axial = spotStatistics(rays, system.getSensor(), sensorIndex, 0, 1, 1);
	check(axial.rmsRadius < 0.01 * parameters.sensor.pixelPitch, "diagonal keeps the axial image sharp");

	// the diagonal sends the beam towards -y
	const Ray& chief = rays.state(GridIndex{ 0, 1, 1, 2, 2 }, 1);
	check(near(chief.direction.y, -1.0, 1e-9) && near(chief.position.z, 600.0, 1e-9), "reflection off the diagonal");

	const Ray& edgeChief = rays.sensorState(GridIndex{ 0, 2, 1, 2, 2 });
	check(edgeChief.alive, "edge field chief ray reaches the sensor");
	glm::dvec3 local = system.getSensor().getTransform().pointToLocal(edgeChief.position);
	check(near(std::abs(local.x), parameters.sensor.halfWidthX(), 1e-6) && near(local.z, 0.0, 1e-9), "edge field lands on the sensor edge");

	// a small diagonal clips the beam
	NewtonianParameters narrow = parameters;
	narrow.diagonalRadius = 10.0;
	SequentialSystem clipped = newtonianTelescope(narrow);
	TraceResult clippedResult = traceSystem(clipped, grid, settings);
	check(clippedResult.rays.aliveCount(0, 1, 1, 1) < 13, "undersized diagonal vignettes");
	check(clippedResult.rays.state(GridIndex{ 0, 1, 1, 0, 2 }, 1).status == RayStatus::Vignetted, "marginal ray lost at the diagonal");

	if (g_failures > 0) {
		std::cerr << "[newtonian] " << g_failures << " failures" << std::endl;
		return 1;
	}
	std::cout << "[newtonian] ok" << std::endl;
	return 0;
}
