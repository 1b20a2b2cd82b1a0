#include "paraxial_model.h"

#include "errors.h"
#include "material.h"
#include "ray_transfer_matrices.h"

#include <cmath>
#include <limits>
#include <variant>

namespace {

// Radius of curvature as seen by a beam travelling along `beam`.
double orientedRadius(const Surface& surface, const glm::dvec3& beam) {
	double curvature = conicCoefficients(surface.getSag()).curvature;
	if (curvature == 0.0) {
		return std::numeric_limits<double>::infinity();
	}
	double radius = 1.0 / curvature;
	return glm::dot(surface.getTransform().getAxis(), beam) >= 0.0 ? radius : -radius;
}

}

ParaxialModel paraxialModel(const SequentialSystem& system, double wavelength) {
	const std::vector<Surface>& surfaces = system.getSurfaces();
	StopSelection stops = system.getStops();
	if (stops.pupilIndex < 0) {
		throw ConfigurationError("paraxial model needs a pupil stop");
	}
	if (surfaces.empty()) {
		throw ConfigurationError("paraxial model needs at least one surface before the sensor");
	}

	RayTransferMatrixBuilder builder;
	ParaxialModel model;
	glm::dmat2 m(1.0);
	glm::dvec3 beam(0.0, 0.0, 1.0);
	double index = 1.0;

	for (std::size_t i = 0; i < surfaces.size(); i++) {
		const Surface& surface = surfaces[i];
		if (i > 0) {
			double distance = glm::length(surface.getTransform().getVertex() - surfaces[i - 1].getTransform().getVertex());
			m = builder.getTranslationMatrix(distance) * m;
		}
		double radius = orientedRadius(surface, beam);
		const Material& material = surface.getMaterial();
		if (std::holds_alternative<MirrorMaterial>(material)) {
			m = builder.getReflectionMatrix(radius) * m;
			glm::dvec3 axis = surface.getTransform().getAxis();
			beam = glm::normalize(reflectDirection(beam, axis));
		}
		else if (const RefractorMaterial* glass = std::get_if<RefractorMaterial>(&material)) {
			double glassIndex = refractiveIndex(*glass, wavelength);
			double next = std::abs(index - glassIndex) < 1e-12 ? 1.0 : glassIndex;
			m = builder.getRefractionMatrix(index, next, radius) * m;
			index = next;
		}
	}

	double a = m[0][0];
	double c = m[0][1];
	if (std::abs(c) < 1e-15) {
		throw ConfigurationError("system is afocal, no paraxial focus");
	}
	model.systemMatrix = m;
	model.effectiveFocalLength = -1.0 / c;
	model.backFocalDistance = -a / c;
	model.sensorDistance = glm::length(system.getSensor().getTransform().getVertex() - surfaces.back().getTransform().getVertex());
	model.defocus = model.sensorDistance - model.backFocalDistance;
	model.entrancePupilDiameter = 2.0 * apertureExtent(system.getSurface(stops.pupilIndex).getAperture()).x;
	model.fNumber = std::abs(model.effectiveFocalLength) / model.entrancePupilDiameter;
	return model;
}
