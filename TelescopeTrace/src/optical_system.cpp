#include "optical_system.h"

#include "errors.h"

#include <utility>

SequentialSystem::SequentialSystem(std::vector<Surface> surfaces, Surface sensor)
	: m_surfaces(std::move(surfaces)), m_sensor(std::move(sensor)) {
	for (int i = 0; i < getSurfaceCount(); i++) {
		const Surface& surface = getSurface(i);
		if (surface.isPupilStop()) {
			if (m_stops.pupilIndex >= 0) {
				throw ConfigurationError("pupil stop flagged on both '" + getSurface(m_stops.pupilIndex).getName() + "' and '" + surface.getName() + "'");
			}
			m_stops.pupilIndex = i;
		}
		if (surface.isFieldStop()) {
			if (m_stops.fieldIndex >= 0) {
				throw ConfigurationError("field stop flagged on both '" + getSurface(m_stops.fieldIndex).getName() + "' and '" + surface.getName() + "'");
			}
			m_stops.fieldIndex = i;
		}
	}
}

const std::vector<Surface>& SequentialSystem::getSurfaces() const {
	return m_surfaces;
}

const Surface& SequentialSystem::getSensor() const {
	return m_sensor;
}

int SequentialSystem::getSurfaceCount() const {
	return static_cast<int>(m_surfaces.size()) + 1;
}

const Surface& SequentialSystem::getSurface(int index) const {
	if (index < 0 || index > static_cast<int>(m_surfaces.size())) {
		throw ConfigurationError("surface index " + std::to_string(index) + " out of range");
	}
	if (index == static_cast<int>(m_surfaces.size())) {
		return m_sensor;
	}
	return m_surfaces[index];
}

int SequentialSystem::findSurface(const std::string& name) const {
	for (int i = 0; i < getSurfaceCount(); i++) {
		if (getSurface(i).getName() == name) {
			return i;
		}
	}
	return -1;
}

StopSelection SequentialSystem::getStops() const {
	return m_stops;
}

SequentialSystem SequentialSystem::withSensor(const Surface& sensor) const {
	return SequentialSystem(m_surfaces, sensor);
}

SurfaceHit SequentialSystem::traceToSurface(const Ray& ray, int targetIndex, bool clipApertures) const {
	const Surface& target = getSurface(targetIndex);
	Ray current = ray;
	for (int i = 0; i < targetIndex; i++) {
		current = m_surfaces[i].trace(current, clipApertures);
		if (!current.alive) {
			SurfaceHit hit;
			hit.status = current.status;
			return hit;
		}
	}
	return target.intersect(current, clipApertures);
}

std::vector<std::string> SequentialSystem::describe() const {
	std::vector<std::string> lines;
	for (int i = 0; i < getSurfaceCount(); i++) {
		lines.push_back("[" + std::to_string(i) + "] " + getSurface(i).describe());
	}
	return lines;
}
