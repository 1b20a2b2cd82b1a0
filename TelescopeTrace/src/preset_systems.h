#pragma once

#include "material.h"
#include "optical_system.h"
#include "sensor_format.h"

// Parabolic primary facing the sky at distance mirrorDistance from the launch plane (z = 0),
// sensor at the prime focus. The primary is the pupil stop, the sensor the field stop.
struct PrimeFocusParameters {
	double apertureRadius = 100.0;
	double focalLength = 500.0;
	double obscurationRadius = 0.0;
	double mirrorDistance = 1000.0;
	SensorFormat sensor;
	Material sensorMaterial = TransparentMaterial{};
};

// Prime focus folded sideways (towards -y) by a 45 degree flat diagonal.
struct NewtonianParameters {
	double apertureRadius = 100.0;
	double focalLength = 500.0;
	double obscurationRadius = 0.0;
	double mirrorDistance = 1000.0;
	double diagonalOffset = 100.0; // distance from the diagonal to the focus
	double diagonalRadius = 40.0;
	SensorFormat sensor;
	Material sensorMaterial = TransparentMaterial{};
};

SequentialSystem primeFocusTelescope(const PrimeFocusParameters& parameters);
SequentialSystem newtonianTelescope(const NewtonianParameters& parameters);

// Flat sensor with a rectangular aperture matching the pixel grid, flagged as field stop.
// Transparent by default; a SensorMaterial makes the image record electrons instead of hits.
Surface makeSensor(const SensorFormat& format, const Transform& placement, const Material& material = TransparentMaterial{});
