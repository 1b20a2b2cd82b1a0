#pragma once

#include "optical_system.h"
#include "ray_function.h"

#include <glm/glm.hpp>
#include <string>
#include <vector>

// Global-frame polyline for external plotting.
struct Polyline {
	std::string label;
	std::vector<glm::dvec3> points;
};

// Collects surface cross-sections and ray paths of a traced system.
class LayoutSampler {
public:
	LayoutSampler(SequentialSystem system, int profileSamples);

	// Profile along the local x axis of every surface, sensor included.
	std::vector<Polyline> sampleSurfaces() const;
	// Path of each selected ray from its launch point through every surface it reached.
	// With meridionalOnly, only the central pupil x column of the first wavelength is kept.
	std::vector<Polyline> sampleRays(const RayFunction& rays, bool meridionalOnly) const;

private:
	SequentialSystem m_system;
	int m_profile_samples;
};

// Rows of kind,label,point,x,y,z. Throws IoError when the file cannot be written.
void writeLayoutCsv(const std::string& path, const std::vector<Polyline>& surfaces, const std::vector<Polyline>& rays);
