#pragma once

#include "optical_system.h"
#include "surface.h"

#include <optional>
#include <string>
#include <vector>

// Incremental construction of a sequential system, surfaces addressed by name.
class SystemBuilder {
public:
	SystemBuilder();
	const std::vector<Surface>& getSurfaces() const;
	void addSurface(const Surface& surface);
	// Inserts before the surface at `position`; throws ConfigurationError when out of range.
	void insertSurface(int position, const Surface& surface);
	void removeSurface(const std::string& name);
	void replaceSurface(const std::string& name, const Surface& surface);
	void setSensor(const Surface& sensor);
	// Moves the stop flag to the named surface (or the sensor) and clears it everywhere else.
	void setPupilStop(const std::string& name);
	void setFieldStop(const std::string& name);
	SequentialSystem build() const;

private:
	std::vector<Surface>::iterator findSurface(const std::string& name);
	bool hasSurface(const std::string& name) const;

	std::vector<Surface> m_surfaces;
	std::optional<Surface> m_sensor;
};
