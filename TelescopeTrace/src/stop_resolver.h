#pragma once

#include "input_grid.h"
#include "optical_system.h"
#include "ray.h"
#include "trace_settings.h"

#include <glm/glm.hpp>
#include <vector>

struct LaunchCell {
	glm::dvec3 origin{ 0.0 };
	glm::dvec3 direction{ 0.0, 0.0, 1.0 };
	RayStatus status = RayStatus::AimFailed;
};

// Physical mapping from normalized grid coordinates to launch rays. Produced once, read-only afterwards.
class StopResolution {
public:
	StopResolution(StopSelection stops, glm::dvec2 fieldHalfAngles, glm::dvec2 pupilExtent, GridShape shape, std::vector<LaunchCell> launches);

	StopSelection getStops() const;
	// Half-angles in radians mapped to normalized field +-1.
	glm::dvec2 getFieldHalfAngles() const;
	// Pupil stop half widths mapped to normalized pupil +-1.
	glm::dvec2 getPupilExtent() const;
	GridShape getShape() const;
	const LaunchCell& getLaunch(std::size_t cell) const;
	const std::vector<LaunchCell>& getLaunches() const;
	int getAimFailures() const;

private:
	StopSelection m_stops;
	glm::dvec2 m_field_half_angles;
	glm::dvec2 m_pupil_extent;
	GridShape m_shape;
	std::vector<LaunchCell> m_launches;
};

// Checks that both stops are flagged, distinct and bounded. Throws ConfigurationError otherwise.
void validateStops(const SequentialSystem& system, const StopSelection& stops);

// Field half-angle per axis so the chief ray of field +-1 lands on the field stop's aperture edge.
glm::dvec2 resolveFieldHalfAngles(const SequentialSystem& system, const StopSelection& stops, double wavelength, const TraceSettings& settings);

// Launch point on the launch plane whose ray reaches `target` (pupil stop local xy). Apertures are ignored.
LaunchCell aimRay(const SequentialSystem& system, int pupilIndex, const glm::dvec3& direction, const glm::dvec2& target,
	double wavelength, const TraceSettings& settings);

StopResolution resolveStops(const SequentialSystem& system, const InputGrid& grid, const TraceSettings& settings);
StopResolution resolveStops(const SequentialSystem& system, const StopSelection& stops, const InputGrid& grid, const TraceSettings& settings);
