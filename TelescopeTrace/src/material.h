#pragma once

#include "ray.h"

#include <glm/glm.hpp>
#include <string>
#include <variant>
#include <vector>

// What a surface does to a ray once it has been hit.

struct MirrorMaterial {
};

struct AbsorberMaterial {
};

// Passes rays unchanged, used for sensors and dummy planes.
struct TransparentMaterial {
};

// Interface into glass with Cauchy dispersion n(lambda) = a + b / lambda^2, lambda in nm.
// A ray already travelling in this glass leaves into air (n = 1).
struct RefractorMaterial {
	double cauchyA = 1.5;
	double cauchyB = 0.0;
};

// Absorption coefficient of crystalline silicon at 300 K, (wavelength nm, alpha 1/mm), 300 to 1100 nm.
std::vector<glm::dvec2> siliconAbsorption();

// Light-sensitive silicon of a backilluminated CCD. Hits are recorded and the ray is not traced
// into the silicon; the material only sets how many electrons a hit yields (see sensor_response.h).
// Lengths in mm.
struct SensorMaterial {
	double thicknessImplant = 2.317e-4;
	double thicknessSubstrate = 7e-3;
	double cceBacksurface = 0.21;        // charge collection efficiency at the back surface
	double substrateIndex = 4.0;         // real index of the silicon, bends rays towards the normal
	std::vector<glm::dvec2> absorption = siliconAbsorption(); // sorted by wavelength
};

using Material = std::variant<MirrorMaterial, AbsorberMaterial, TransparentMaterial, RefractorMaterial, SensorMaterial>;

void validateMaterial(const Material& material);
std::string describeMaterial(const Material& material);

double refractiveIndex(const RefractorMaterial& material, double wavelength);

// d' = d - 2 (d.n) n, for any orientation of n.
glm::dvec3 reflectDirection(const glm::dvec3& direction, const glm::dvec3& normal);

// Applies the material at the hit point. `ray` must already sit on the surface, `normal` is a unit
// vector in the same frame. A terminated ray comes back dead with its status set; this never throws.
Ray interact(const Material& material, const Ray& ray, const glm::dvec3& normal);
