#include <iostream>
#include <numbers>
#include <string>

#include "errors.h"
#include "logging.h"
#include "optical_system.h"
#include "preset_systems.h"
#include "system_builder.h"

static int g_failures = 0;

static void check(bool condition, const std::string& what) {
	if (!condition) {
		std::cerr << "FAIL: " << what << std::endl;
		g_failures++;
	}
}

template <typename F>
static void checkRejected(F build, const std::string& what) {
	try {
		build();
		check(false, what);
	}
	catch (const ConfigurationError&) {
	}
}

static Surface flat(const std::string& name, double z, bool pupil = false, bool field = false) {
	return Surface(name, FlatSag{}, TransparentMaterial{}, CircularAperture{ 50.0, 0.0 },
		Transform::translation(glm::dvec3(0.0, 0.0, z)), pupil, field);
}

int main() {
	setLogLevel(LogLevel::Warn);

	SequentialSystem system = primeFocusTelescope(PrimeFocusParameters{});
	check(system.getSurfaceCount() == 2, "primary plus sensor");
	check(system.getStops().pupilIndex == 0 && system.getStops().fieldIndex == 1, "preset stops");
	check(system.getSurface(1).getName() == "sensor", "last index is the sensor");
	check(system.findSurface("primary") == 0 && system.findSurface("sensor") == 1 && system.findSurface("tube") == -1, "findSurface");
	check(system.describe().size() == 2, "one description line per surface");
	checkRejected([&] { system.getSurface(2); }, "index past the sensor");
	checkRejected([&] { system.getSurface(-1); }, "negative index");

	checkRejected([] { SequentialSystem({ flat("a", 10.0, true), flat("b", 20.0, true) }, flat("s", 30.0)); }, "two pupil stops");
	checkRejected([] { SequentialSystem({ flat("a", 10.0, false, true) }, flat("s", 30.0, false, true)); }, "field stop on a surface and the sensor");

	SequentialSystem sensorOnly({}, flat("s", 30.0, true));
	check(sensorOnly.getSurfaceCount() == 1 && sensorOnly.getStops().pupilIndex == 0, "a bare sensor is a valid system");

	// the on-axis ray through the vertex meets the sensor centre
	Ray axial;
	SurfaceHit hit = system.traceToSurface(axial, 1, true);
	check(hit.status == RayStatus::Alive && glm::length(hit.globalPoint - glm::dvec3(0.0, 0.0, 500.0)) < 1e-9, "traceToSurface reaches the sensor");
	Ray outside;
	outside.position = glm::dvec3(150.0, 0.0, 0.0);
	check(system.traceToSurface(outside, 1, true).status == RayStatus::Vignetted, "clipped at the primary");
	check(system.traceToSurface(outside, 1, false).status == RayStatus::Alive, "unclipped passes the primary");

	SequentialSystem moved = system.withSensor(system.getSensor().withTransform(Transform::translation(glm::dvec3(0.0, 0.0, 501.0))));
	check(moved.getSensor().getTransform().getVertex().z == 501.0 && system.getSensor().getTransform().getVertex().z == 500.0, "withSensor copies");

	SystemBuilder builder;
	builder.addSurface(flat("a", 10.0));
	builder.addSurface(flat("c", 30.0));
	builder.insertSurface(1, flat("b", 20.0));
	check(builder.getSurfaces().size() == 3 && builder.getSurfaces()[1].getName() == "b", "insertSurface");
	checkRejected([&] { builder.addSurface(flat("a", 40.0)); }, "duplicate surface name");
	checkRejected([&] { builder.insertSurface(7, flat("d", 40.0)); }, "insert out of range");
	checkRejected([&] { builder.build(); }, "build without a sensor");

	builder.setSensor(flat("sensor", 50.0));
	builder.setPupilStop("a");
	builder.setPupilStop("b");
	builder.setFieldStop("sensor");
	checkRejected([&] { builder.setFieldStop("nothing"); }, "stop on a missing surface");
	builder.removeSurface("c");
	builder.replaceSurface("a", flat("a2", 5.0));
	checkRejected([&] { builder.removeSurface("c"); }, "remove a missing surface");

	SequentialSystem built = builder.build();
	check(built.getSurfaceCount() == 3, "built surface count");
	check(built.getSurface(0).getName() == "a2", "replaced surface");
	check(built.getStops().pupilIndex == 1 && built.getStops().fieldIndex == 2, "stop flags moved");

	if (g_failures > 0) {
		std::cerr << "[optical_system] " << g_failures << " failures" << std::endl;
		return 1;
	}
	std::cout << "[optical_system] ok" << std::endl;
	return 0;
}
