#pragma once

#include "ray.h"
#include "surface.h"

#include <string>
#include <vector>

// Indices of the flagged stops; the sensor has index getSurfaces().size(). -1 when not flagged.
struct StopSelection {
	int pupilIndex = -1;
	int fieldIndex = -1;
};

// Ordered chain of surfaces followed by a sensor. Immutable; modified copies come from the with* methods.
class SequentialSystem {
public:
	// Throws ConfigurationError when more than one surface (sensor included) is flagged as pupil or field stop.
	SequentialSystem(std::vector<Surface> surfaces, Surface sensor);

	const std::vector<Surface>& getSurfaces() const;
	const Surface& getSensor() const;
	// Surfaces plus the sensor.
	int getSurfaceCount() const;
	// Index getSurfaces().size() returns the sensor.
	const Surface& getSurface(int index) const;
	int findSurface(const std::string& name) const;
	StopSelection getStops() const;

	SequentialSystem withSensor(const Surface& sensor) const;

	// Traces a single ray through every surface before targetIndex and intersects the target.
	// Material interactions are applied on the way; apertures only when clipApertures is set.
	SurfaceHit traceToSurface(const Ray& ray, int targetIndex, bool clipApertures) const;

	std::vector<std::string> describe() const;

private:
	std::vector<Surface> m_surfaces;
	Surface m_sensor;
	StopSelection m_stops;
};
