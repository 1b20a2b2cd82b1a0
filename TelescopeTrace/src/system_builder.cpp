#include "system_builder.h"

#include "errors.h"

SystemBuilder::SystemBuilder() {
}

const std::vector<Surface>& SystemBuilder::getSurfaces() const {
	return m_surfaces;
}

std::vector<Surface>::iterator SystemBuilder::findSurface(const std::string& name) {
	for (auto it = m_surfaces.begin(); it != m_surfaces.end(); ++it) {
		if (it->getName() == name) {
			return it;
		}
	}
	throw ConfigurationError("no surface named '" + name + "'");
}

bool SystemBuilder::hasSurface(const std::string& name) const {
	for (const Surface& surface : m_surfaces) {
		if (surface.getName() == name) {
			return true;
		}
	}
	return m_sensor && m_sensor->getName() == name;
}

void SystemBuilder::addSurface(const Surface& surface) {
	for (const Surface& existing : m_surfaces) {
		if (existing.getName() == surface.getName()) {
			throw ConfigurationError("surface name '" + surface.getName() + "' already used");
		}
	}
	m_surfaces.push_back(surface);
}

void SystemBuilder::insertSurface(int position, const Surface& surface) {
	if (position < 0 || position > static_cast<int>(m_surfaces.size())) {
		throw ConfigurationError("insert position " + std::to_string(position) + " out of range");
	}
	addSurface(surface);
	// addSurface appended it, rotate it into place
	Surface inserted = m_surfaces.back();
	m_surfaces.pop_back();
	m_surfaces.insert(m_surfaces.begin() + position, inserted);
}

void SystemBuilder::removeSurface(const std::string& name) {
	m_surfaces.erase(findSurface(name));
}

void SystemBuilder::replaceSurface(const std::string& name, const Surface& surface) {
	auto it = findSurface(name);
	*it = surface;
}

void SystemBuilder::setSensor(const Surface& sensor) {
	m_sensor = sensor;
}

void SystemBuilder::setPupilStop(const std::string& name) {
	if (!hasSurface(name)) {
		throw ConfigurationError("no surface named '" + name + "'");
	}
	for (Surface& surface : m_surfaces) {
		bool match = surface.getName() == name;
		surface = surface.withStops(match, surface.isFieldStop());
	}
	if (m_sensor) {
		bool match = m_sensor->getName() == name;
		m_sensor = m_sensor->withStops(match, m_sensor->isFieldStop());
	}
}

void SystemBuilder::setFieldStop(const std::string& name) {
	if (!hasSurface(name)) {
		throw ConfigurationError("no surface named '" + name + "'");
	}
	for (Surface& surface : m_surfaces) {
		bool match = surface.getName() == name;
		surface = surface.withStops(surface.isPupilStop(), match);
	}
	if (m_sensor) {
		bool match = m_sensor->getName() == name;
		m_sensor = m_sensor->withStops(m_sensor->isPupilStop(), match);
	}
}

SequentialSystem SystemBuilder::build() const {
	if (!m_sensor) {
		throw ConfigurationError("system has no sensor");
	}
	return SequentialSystem(m_surfaces, *m_sensor);
}
