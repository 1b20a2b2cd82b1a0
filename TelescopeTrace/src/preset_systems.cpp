#include "preset_systems.h"

#include "errors.h"
#include "logging.h"

#include <numbers>
#include <vector>

namespace {

Surface parabolicPrimary(double apertureRadius, double obscurationRadius, double focalLength, double mirrorDistance) {
	// flipped so the local +z axis points back at the sky
	Transform placement = Transform::rotationX(std::numbers::pi).then(Transform::translation(glm::dvec3(0.0, 0.0, mirrorDistance)));
	return Surface("primary", ParabolicSag{ focalLength }, MirrorMaterial{},
		CircularAperture{ apertureRadius, obscurationRadius }, placement, true, false);
}

void logSystem(const std::string& title, const SequentialSystem& system) {
	logMessage(LogLevel::Info, title + " with " + std::to_string(system.getSurfaceCount()) + " surfaces");
	for (const std::string& line : system.describe()) {
		logMessage(LogLevel::Debug, line);
	}
}

}

Surface makeSensor(const SensorFormat& format, const Transform& placement, const Material& material) {
	if (!(format.pixelPitch > 0.0) || format.pixelsX <= 0 || format.pixelsY <= 0) {
		throw ConfigurationError("sensor needs a positive pixel pitch and pixel count");
	}
	return Surface("sensor", FlatSag{}, material,
		RectangularAperture{ format.halfWidthX(), format.halfWidthY() }, placement, false, true);
}

SequentialSystem primeFocusTelescope(const PrimeFocusParameters& parameters) {
	if (!(parameters.focalLength > 0.0) || parameters.focalLength >= parameters.mirrorDistance) {
		throw ConfigurationError("prime focus must lie between the launch plane and the primary");
	}
	std::vector<Surface> surfaces;
	surfaces.push_back(parabolicPrimary(parameters.apertureRadius, parameters.obscurationRadius, parameters.focalLength, parameters.mirrorDistance));

	double focusZ = parameters.mirrorDistance - parameters.focalLength;
	Surface sensor = makeSensor(parameters.sensor, Transform::translation(glm::dvec3(0.0, 0.0, focusZ)), parameters.sensorMaterial);

	SequentialSystem system(surfaces, sensor);
	logSystem("prime focus telescope", system);
	return system;
}

SequentialSystem newtonianTelescope(const NewtonianParameters& parameters) {
	if (!(parameters.focalLength > 0.0) || parameters.focalLength >= parameters.mirrorDistance) {
		throw ConfigurationError("focus must lie between the launch plane and the primary");
	}
	if (!(parameters.diagonalOffset > 0.0) || parameters.diagonalOffset >= parameters.focalLength) {
		throw ConfigurationError("diagonal must sit between the primary and its focus");
	}
	std::vector<Surface> surfaces;
	surfaces.push_back(parabolicPrimary(parameters.apertureRadius, parameters.obscurationRadius, parameters.focalLength, parameters.mirrorDistance));

	// tilted so the beam coming down from the primary leaves along -y
	double diagonalZ = parameters.mirrorDistance - parameters.focalLength + parameters.diagonalOffset;
	Transform diagonalPlacement = Transform::rotationX(std::numbers::pi / 4.0).then(Transform::translation(glm::dvec3(0.0, 0.0, diagonalZ)));
	surfaces.push_back(Surface("diagonal", FlatSag{}, MirrorMaterial{},
		CircularAperture{ parameters.diagonalRadius, 0.0 }, diagonalPlacement));

	Transform sensorPlacement = Transform::rotationX(std::numbers::pi / 2.0).then(Transform::translation(glm::dvec3(0.0, -parameters.diagonalOffset, diagonalZ)));
	Surface sensor = makeSensor(parameters.sensor, sensorPlacement, parameters.sensorMaterial);

	SequentialSystem system(surfaces, sensor);
	logSystem("newtonian telescope", system);
	return system;
}
