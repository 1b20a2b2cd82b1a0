#include "stop_resolver.h"

#include "errors.h"
#include "logging.h"
#include "utils.h"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <sstream>
#include <utility>

namespace {

constexpr double kFieldTrialAngle = 1e-3;

double stopScale(const Surface& stop) {
	glm::dvec2 extent = apertureExtent(stop.getAperture());
	return std::max(extent.x, extent.y);
}

Ray launchRay(const glm::dvec2& launch, double launchPlaneZ, const glm::dvec3& direction, double wavelength) {
	Ray ray;
	ray.position = glm::dvec3(launch.x, launch.y, launchPlaneZ);
	ray.direction = direction;
	ray.wavelength = wavelength;
	return ray;
}

double toDegrees(double radians) {
	return radians * 180.0 / std::numbers::pi;
}

}

StopResolution::StopResolution(StopSelection stops, glm::dvec2 fieldHalfAngles, glm::dvec2 pupilExtent, GridShape shape, std::vector<LaunchCell> launches)
	: m_stops(stops), m_field_half_angles(fieldHalfAngles), m_pupil_extent(pupilExtent), m_shape(shape), m_launches(std::move(launches)) {
	if (m_launches.size() != m_shape.cellCount()) {
		throw ConfigurationError("stop resolution launch table does not match the grid shape");
	}
}

StopSelection StopResolution::getStops() const {
	return m_stops;
}

glm::dvec2 StopResolution::getFieldHalfAngles() const {
	return m_field_half_angles;
}

glm::dvec2 StopResolution::getPupilExtent() const {
	return m_pupil_extent;
}

GridShape StopResolution::getShape() const {
	return m_shape;
}

const LaunchCell& StopResolution::getLaunch(std::size_t cell) const {
	return m_launches.at(cell);
}

const std::vector<LaunchCell>& StopResolution::getLaunches() const {
	return m_launches;
}

int StopResolution::getAimFailures() const {
	return static_cast<int>(std::count_if(m_launches.begin(), m_launches.end(),
		[](const LaunchCell& cell) { return cell.status != RayStatus::Alive; }));
}

void validateStops(const SequentialSystem& system, const StopSelection& stops) {
	if (stops.pupilIndex < 0) {
		throw ConfigurationError("no pupil stop flagged");
	}
	if (stops.fieldIndex < 0) {
		throw ConfigurationError("no field stop flagged");
	}
	if (stops.pupilIndex == stops.fieldIndex) {
		throw ConfigurationError("pupil stop and field stop are the same surface");
	}
	const Surface& pupil = system.getSurface(stops.pupilIndex);
	const Surface& field = system.getSurface(stops.fieldIndex);
	if (!isBounded(pupil.getAperture())) {
		throw ConfigurationError("pupil stop '" + pupil.getName() + "' has an unbounded aperture");
	}
	if (!isBounded(field.getAperture())) {
		throw ConfigurationError("field stop '" + field.getName() + "' has an unbounded aperture");
	}
}

LaunchCell aimRay(const SequentialSystem& system, int pupilIndex, const glm::dvec3& direction, const glm::dvec2& target,
	double wavelength, const TraceSettings& settings) {
	LaunchCell cell;
	cell.direction = direction;
	cell.origin = nanVector();
	if (direction.z == 0.0) {
		return cell;
	}

	const Surface& stop = system.getSurface(pupilIndex);
	double scale = stopScale(stop);
	double tolerance = settings.aimTolerance * scale;
	double step = settings.aimStep * scale;

	// back-project the target along the ray direction onto the launch plane
	double targetZ = sagHeight(stop.getSag(), target.x, target.y);
	if (!std::isfinite(targetZ)) {
		targetZ = 0.0;
	}
	glm::dvec3 stopPoint = stop.getTransform().pointToGlobal(glm::dvec3(target, targetZ));
	double s = (settings.launchPlaneZ - stopPoint.z) / direction.z;
	glm::dvec2 launch(stopPoint.x + s * direction.x, stopPoint.y + s * direction.y);

	auto residual = [&](const glm::dvec2& point, glm::dvec2& r) {
		SurfaceHit hit = system.traceToSurface(launchRay(point, settings.launchPlaneZ, direction, wavelength), pupilIndex, false);
		if (hit.status != RayStatus::Alive) {
			return false;
		}
		r = glm::dvec2(hit.localPoint.x, hit.localPoint.y) - target;
		return true;
	};

	for (int iteration = 0; iteration <= settings.aimIterations; iteration++) {
		glm::dvec2 r;
		if (!residual(launch, r)) {
			return cell;
		}
		if (glm::length(r) <= tolerance) {
			cell.origin = glm::dvec3(launch, settings.launchPlaneZ);
			cell.status = RayStatus::Alive;
			return cell;
		}
		if (iteration == settings.aimIterations) {
			break;
		}

		glm::dvec2 rx;
		glm::dvec2 ry;
		if (!residual(launch + glm::dvec2(step, 0.0), rx) || !residual(launch + glm::dvec2(0.0, step), ry)) {
			return cell;
		}
		glm::dmat2 jacobian((rx - r) / step, (ry - r) / step);
		double det = glm::determinant(jacobian);
		if (!std::isfinite(det) || std::abs(det) < 1e-300) {
			return cell;
		}
		launch -= glm::inverse(jacobian) * r;
	}
	return cell;
}

glm::dvec2 resolveFieldHalfAngles(const SequentialSystem& system, const StopSelection& stops, double wavelength, const TraceSettings& settings) {
	const Surface& fieldStop = system.getSurface(stops.fieldIndex);
	glm::dvec2 extent = apertureExtent(fieldStop.getAperture());
	glm::dvec2 halfAngles(0.0);

	for (int axis = 0; axis < 2; axis++) {
		// chief ray landing coordinate on the field stop for a field angle along this axis
		auto landing = [&](double angle) {
			glm::dvec2 angles(0.0);
			angles[axis] = angle;
			glm::dvec3 direction = directionFromFieldAngles(angles);
			LaunchCell chief = aimRay(system, stops.pupilIndex, direction, glm::dvec2(0.0), wavelength, settings);
			if (chief.status != RayStatus::Alive) {
				throw ConfigurationError("chief ray could not be aimed at the pupil stop centre");
			}
			Ray ray = launchRay(glm::dvec2(chief.origin), settings.launchPlaneZ, direction, wavelength);
			SurfaceHit hit = system.traceToSurface(ray, stops.fieldIndex, false);
			if (hit.status != RayStatus::Alive) {
				throw ConfigurationError("chief ray does not reach field stop '" + fieldStop.getName() + "'");
			}
			return hit.localPoint[axis];
		};

		double a0 = 0.0;
		double x0 = landing(a0);
		double a1 = kFieldTrialAngle;
		double x1 = landing(a1);
		if (x1 == x0) {
			throw ConfigurationError("field stop position does not depend on the field angle");
		}
		double target = x1 > x0 ? extent[axis] : -extent[axis];
		double tolerance = settings.fieldTolerance * extent[axis];

		bool converged = std::abs(x1 - target) <= tolerance;
		for (int iteration = 0; iteration < settings.fieldIterations && !converged; iteration++) {
			double slope = (x1 - x0) / (a1 - a0);
			if (slope == 0.0 || !std::isfinite(slope)) {
				break;
			}
			double a2 = a1 - (x1 - target) / slope;
			a0 = a1;
			x0 = x1;
			a1 = a2;
			x1 = landing(a1);
			converged = std::abs(x1 - target) <= tolerance;
		}
		if (!converged) {
			throw ConfigurationError("field half-angle search did not converge on '" + fieldStop.getName() + "'");
		}
		halfAngles[axis] = std::abs(a1);
	}
	return halfAngles;
}

StopResolution resolveStops(const SequentialSystem& system, const InputGrid& grid, const TraceSettings& settings) {
	return resolveStops(system, system.getStops(), grid, settings);
}

StopResolution resolveStops(const SequentialSystem& system, const StopSelection& stops, const InputGrid& grid, const TraceSettings& settings) {
	validateStops(system, stops);

	glm::dvec2 fieldHalfAngles = resolveFieldHalfAngles(system, stops, grid.getWavelengths().front(), settings);
	glm::dvec2 pupilExtent = apertureExtent(system.getSurface(stops.pupilIndex).getAperture());

	std::vector<LaunchCell> launches(grid.getCellCount());
	parallelForChunks(launches.size(), settings.parallel, [&](std::size_t begin, std::size_t end) {
		for (std::size_t cell = begin; cell < end; cell++) {
			GridIndex index = grid.gridIndex(cell);
			glm::dvec2 angles(grid.getFieldX()[index.fx] * fieldHalfAngles.x, grid.getFieldY()[index.fy] * fieldHalfAngles.y);
			glm::dvec2 target(grid.getPupilX()[index.px] * pupilExtent.x, grid.getPupilY()[index.py] * pupilExtent.y);
			launches[cell] = aimRay(system, stops.pupilIndex, directionFromFieldAngles(angles), target,
				grid.getWavelengths()[index.w], settings);
		}
	});

	StopResolution resolution(stops, fieldHalfAngles, pupilExtent, grid.getShape(), std::move(launches));

	std::ostringstream summary;
	summary << "stops resolved: pupil '" << system.getSurface(stops.pupilIndex).getName()
		<< "', field '" << system.getSurface(stops.fieldIndex).getName()
		<< "', field half-angles (" << toDegrees(fieldHalfAngles.x) << ", " << toDegrees(fieldHalfAngles.y) << ") deg";
	logMessage(LogLevel::Info, summary.str());
	if (resolution.getAimFailures() > 0) {
		logMessage(LogLevel::Warn, std::to_string(resolution.getAimFailures()) + " of " + std::to_string(resolution.getLaunches().size()) + " rays could not be aimed");
	}
	return resolution;
}
