#include "material.h"

#include "errors.h"
#include "utils.h"

#include <cmath>
#include <sstream>

namespace {

Ray refract(const RefractorMaterial& material, const Ray& ray, const glm::dvec3& normal) {
	double glassIndex = refractiveIndex(material, ray.wavelength);
	// a ray already inside this glass leaves into air
	double n1 = ray.index;
	double n2 = std::abs(ray.index - glassIndex) < 1e-12 ? 1.0 : glassIndex;

	// orient the normal against the incoming ray
	glm::dvec3 n = normal;
	double cosIncidence = -glm::dot(ray.direction, n);
	if (cosIncidence < 0.0) {
		n = -n;
		cosIncidence = -cosIncidence;
	}

	double eta = n1 / n2;
	double k = 1.0 - eta * eta * (1.0 - cosIncidence * cosIncidence);
	if (k < 0.0) {
		Ray dead = ray;
		dead.alive = false;
		dead.status = RayStatus::TotalInternalReflection;
		return dead;
	}

	Ray out = ray;
	out.direction = glm::normalize(eta * ray.direction + (eta * cosIncidence - std::sqrt(k)) * n);
	out.index = n2;
	return out;
}

}

std::vector<glm::dvec2> siliconAbsorption() {
	return {
		{ 300.0, 1.84e5 }, { 350.0, 1.04e5 }, { 400.0, 9.52e3 }, { 450.0, 2.55e3 }, { 500.0, 1.11e3 },
		{ 550.0, 639.0 }, { 600.0, 414.0 }, { 650.0, 281.0 }, { 700.0, 190.0 }, { 750.0, 130.0 },
		{ 800.0, 85.0 }, { 850.0, 53.5 }, { 900.0, 30.6 }, { 950.0, 15.7 }, { 1000.0, 6.4 },
		{ 1050.0, 1.63 }, { 1100.0, 0.35 },
	};
}

void validateMaterial(const Material& material) {
	if (const RefractorMaterial* refractor = std::get_if<RefractorMaterial>(&material)) {
		if (!(refractor->cauchyA >= 1.0) || !std::isfinite(refractor->cauchyB)) {
			throw ConfigurationError("refractor needs a Cauchy A >= 1 and a finite B");
		}
	}
	if (const SensorMaterial* sensor = std::get_if<SensorMaterial>(&material)) {
		if (!(sensor->thicknessImplant > 0.0) || !(sensor->thicknessSubstrate > 0.0)
			|| !std::isfinite(sensor->thicknessImplant) || !std::isfinite(sensor->thicknessSubstrate)) {
			throw ConfigurationError("sensor material needs positive implant and substrate thicknesses");
		}
		if (!(sensor->cceBacksurface >= 0.0 && sensor->cceBacksurface <= 1.0)) {
			throw ConfigurationError("back surface charge collection efficiency must lie in [0, 1]");
		}
		if (!(sensor->substrateIndex >= 1.0) || !std::isfinite(sensor->substrateIndex)) {
			throw ConfigurationError("sensor substrate index must be finite and >= 1");
		}
		if (sensor->absorption.empty()) {
			throw ConfigurationError("sensor material needs an absorption table");
		}
		for (std::size_t i = 0; i < sensor->absorption.size(); i++) {
			const glm::dvec2& entry = sensor->absorption[i];
			if (!(entry.x > 0.0) || !(entry.y >= 0.0) || !std::isfinite(entry.x) || !std::isfinite(entry.y)) {
				throw ConfigurationError("sensor absorption entries need a positive wavelength and a non-negative coefficient");
			}
			if (i > 0 && !(entry.x > sensor->absorption[i - 1].x)) {
				throw ConfigurationError("sensor absorption table must be sorted by wavelength");
			}
		}
	}
}

std::string describeMaterial(const Material& material) {
	std::ostringstream out;
	std::visit(Overloaded{
		[&](const MirrorMaterial&) { out << "mirror"; },
		[&](const AbsorberMaterial&) { out << "absorber"; },
		[&](const TransparentMaterial&) { out << "transparent"; },
		[&](const RefractorMaterial& m) { out << "refractor(A=" << m.cauchyA << ", B=" << m.cauchyB << ")"; },
		[&](const SensorMaterial& m) { out << "ccd(substrate=" << m.thicknessSubstrate << ", implant=" << m.thicknessImplant << ")"; },
	}, material);
	return out.str();
}

double refractiveIndex(const RefractorMaterial& material, double wavelength) {
	return material.cauchyA + material.cauchyB / (wavelength * wavelength);
}

glm::dvec3 reflectDirection(const glm::dvec3& direction, const glm::dvec3& normal) {
	return direction - 2.0 * glm::dot(direction, normal) * normal;
}

Ray interact(const Material& material, const Ray& ray, const glm::dvec3& normal) {
	return std::visit(Overloaded{
		[&](const MirrorMaterial&) {
			Ray out = ray;
			out.direction = glm::normalize(reflectDirection(ray.direction, normal));
			return out;
		},
		[&](const AbsorberMaterial&) {
			Ray out = ray;
			out.alive = false;
			out.status = RayStatus::Absorbed;
			return out;
		},
		[&](const TransparentMaterial&) { return ray; },
		[&](const RefractorMaterial& m) { return refract(m, ray, normal); },
		[&](const SensorMaterial&) { return ray; },
	}, material);
}
