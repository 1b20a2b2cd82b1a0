#include "sensor_response.h"

#include <algorithm>
#include <cmath>
#include <variant>

namespace {

// hc in eV nm
constexpr double kPhotonEnergyScale = 1239.841984;
constexpr double kEnergyBandgap = 1.12;
constexpr double kEnergyElectronHole = 3.65;

// Snell's law into the silicon, real index only.
double cosInside(const SensorMaterial& material, double cosIncidence) {
	double c = std::clamp(std::abs(cosIncidence), 0.0, 1.0);
	double sinInside = std::sqrt(1.0 - c * c) / material.substrateIndex;
	return std::sqrt(1.0 - sinInside * sinInside);
}

}

double quantumYieldIdeal(double wavelength) {
	if (!(wavelength > 0.0)) {
		return 0.0;
	}
	double energy = kPhotonEnergyScale / wavelength;
	if (energy > kEnergyElectronHole) {
		return energy / kEnergyElectronHole;
	}
	if (energy > kEnergyBandgap) {
		return 1.0;
	}
	return 0.0;
}

double absorptionCoefficient(const SensorMaterial& material, double wavelength) {
	const std::vector<glm::dvec2>& table = material.absorption;
	if (wavelength <= table.front().x) {
		return table.front().y;
	}
	if (wavelength > table.back().x) {
		return 0.0;
	}
	auto upper = std::lower_bound(table.begin(), table.end(), wavelength,
		[](const glm::dvec2& entry, double w) { return entry.x < w; });
	const glm::dvec2& hi = *upper;
	const glm::dvec2& lo = *(upper - 1);
	double fraction = (wavelength - lo.x) / (hi.x - lo.x);
	if (lo.y > 0.0 && hi.y > 0.0) {
		return std::exp(std::log(lo.y) + fraction * (std::log(hi.y) - std::log(lo.y)));
	}
	return lo.y + fraction * (hi.y - lo.y);
}

double absorbance(const SensorMaterial& material, double wavelength, double cosIncidence) {
	double alpha = absorptionCoefficient(material, wavelength);
	return 1.0 - std::exp(-alpha * material.thicknessSubstrate / cosInside(material, cosIncidence));
}

double chargeCollectionEfficiency(double absorption, double thicknessImplant, double cceBacksurface, double cosIncidence) {
	double z0 = absorption * thicknessImplant / cosIncidence;
	if (z0 < 1e-12) {
		// (1 - exp(-z0)) / z0 -> 1
		return 1.0;
	}
	return cceBacksurface + (1.0 - cceBacksurface) / z0 * (1.0 - std::exp(-z0));
}

double quantumEfficiencyEffective(const SensorMaterial& material, double wavelength, double cosIncidence) {
	double inside = cosInside(material, cosIncidence);
	double cce = chargeCollectionEfficiency(absorptionCoefficient(material, wavelength), material.thicknessImplant,
		material.cceBacksurface, inside);
	return absorbance(material, wavelength, cosIncidence) * cce;
}

double responsivity(const SensorMaterial& material, double wavelength, double cosIncidence) {
	return quantumEfficiencyEffective(material, wavelength, cosIncidence) * quantumYieldIdeal(wavelength);
}

long long electronsMeasured(long long photons, const SensorMaterial& material, double wavelength, double cosIncidence, std::mt19937& rng) {
	if (photons <= 0) {
		return 0;
	}
	double expectedAbsorbed = absorbance(material, wavelength, cosIncidence) * static_cast<double>(photons);
	long long absorbed = 0;
	if (expectedAbsorbed > 0.0) {
		std::poisson_distribution<long long> poisson(expectedAbsorbed);
		absorbed = poisson(rng);
	}

	double electrons = quantumYieldIdeal(wavelength) * static_cast<double>(absorbed);
	double integral = 0.0;
	double fractional = std::modf(electrons, &integral);
	std::uniform_real_distribution<double> uniform(0.0, 1.0);
	long long total = static_cast<long long>(integral) + (uniform(rng) < fractional ? 1 : 0);

	double cce = chargeCollectionEfficiency(absorptionCoefficient(material, wavelength), material.thicknessImplant,
		material.cceBacksurface, cosInside(material, cosIncidence));
	std::binomial_distribution<long long> collected(total, std::clamp(cce, 0.0, 1.0));
	return collected(rng);
}

double incidenceCosine(const Surface& sensor, const Ray& ray) {
	glm::dvec3 local = sensor.getTransform().pointToLocal(ray.position);
	glm::dvec3 normal = sensor.getTransform().directionToGlobal(sagNormal(sensor.getSag(), local.x, local.y));
	return glm::dot(ray.direction, normal);
}

double hitWeight(const Surface& sensor, const Ray& ray) {
	if (!ray.alive) {
		return 0.0;
	}
	const SensorMaterial* material = std::get_if<SensorMaterial>(&sensor.getMaterial());
	if (material == nullptr) {
		return 1.0;
	}
	return responsivity(*material, ray.wavelength, incidenceCosine(sensor, ray));
}
