#include <cmath>
#include <iostream>
#include <limits>
#include <numbers>
#include <string>

#include "errors.h"
#include "focus_solver.h"
#include "logging.h"
#include "paraxial_model.h"
#include "preset_systems.h"
#include "ray_transfer_matrices.h"

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

template <typename F>
static void checkRejected(F run, const std::string& what) {
	try {
		run();
		check(false, what);
	}
	catch (const ConfigurationError&) {
	}
}

int main() {
	setLogLevel(LogLevel::Warn);

	RayTransferMatrixBuilder builder;
	glm::dmat2 gap = builder.getTranslationMatrix(50.0);
	check(gap[1][0] == 50.0 && gap[0][0] == 1.0 && gap[1][1] == 1.0, "translation matrix");
	glm::dmat2 mirror = builder.getReflectionMatrix(-1000.0);
	check(near(mirror[0][1], -0.002, 1e-15), "concave mirror power");
	check(builder.getReflectionMatrix(std::numeric_limits<double>::infinity())[0][1] == 0.0, "flat mirror has no power");
	glm::dmat2 interface = builder.getRefractionMatrix(1.0, 1.5, 100.0);
	check(near(interface[1][1], 1.0 / 1.5, 1e-15), "refraction scales the angle");

	ParaxialModel prime = paraxialModel(primeFocusTelescope(PrimeFocusParameters{}));
	check(near(prime.effectiveFocalLength, 500.0, 1e-9), "prime focus focal length");
	check(near(prime.backFocalDistance, 500.0, 1e-9), "prime focus back focal distance");
	check(near(prime.defocus, 0.0, 1e-9), "sensor at the paraxial focus");
	check(near(prime.entrancePupilDiameter, 200.0, 0.0), "entrance pupil diameter");
	check(near(prime.fNumber, 2.5, 1e-12), "f/2.5");

	ParaxialModel newtonian = paraxialModel(newtonianTelescope(NewtonianParameters{}));
	check(near(newtonian.effectiveFocalLength, 500.0, 1e-9), "fold keeps the focal length");
	check(near(newtonian.backFocalDistance, 100.0, 1e-9), "focus 100 mm past the diagonal");
	check(near(newtonian.sensorDistance, 100.0, 1e-9) && near(newtonian.defocus, 0.0, 1e-9), "newtonian sensor in focus");

	ParaxialModel shifted = paraxialModel(shiftSensor(primeFocusTelescope(PrimeFocusParameters{}), 2.0));
	check(near(shifted.defocus, -2.0, 1e-9), "sensor moved towards the primary");

	Transform flipped = Transform::rotationX(std::numbers::pi).then(Transform::translation(glm::dvec3(0.0, 0.0, 1000.0)));
	Surface sphere("sphere", SphericalSag{ 1200.0 }, MirrorMaterial{}, CircularAperture{ 50.0, 0.0 }, flipped, true, false);
	Surface sensor = makeSensor(SensorFormat{}, Transform::translation(glm::dvec3(0.0, 0.0, 400.0)));
	ParaxialModel spherical = paraxialModel(SequentialSystem({ sphere }, sensor));
	check(near(spherical.effectiveFocalLength, 600.0, 1e-9), "spherical mirror focal length is half the radius");
	check(near(spherical.fNumber, 6.0, 1e-12), "f/6 sphere");

	Surface plane("plane", FlatSag{}, MirrorMaterial{}, CircularAperture{ 50.0, 0.0 }, flipped, true, false);
	checkRejected([&] { paraxialModel(SequentialSystem({ plane }, sensor)); }, "a flat mirror is afocal");
	Surface unflagged = sphere.withStops(false, false);
	checkRejected([&] { paraxialModel(SequentialSystem({ unflagged }, sensor)); }, "no pupil stop");
	checkRejected([&] { paraxialModel(SequentialSystem({}, sensor.withStops(true, true))); }, "nothing in front of the sensor");

	if (g_failures > 0) {
		std::cerr << "[paraxial_model] " << g_failures << " failures" << std::endl;
		return 1;
	}
	std::cout << "[paraxial_model] ok" << std::endl;
	return 0;
}
