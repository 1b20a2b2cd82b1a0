#pragma once

#include "material.h"
#include "ray.h"
#include "surface.h"

#include <random>

// Photon to electron conversion of a backilluminated silicon CCD. Wavelengths in nm.
// cosIncidence is the cosine between the incoming ray and the sensor normal, outside the silicon.

// Electrons per absorbed photon: 0 below the 1.12 eV bandgap, 1 up to 3.65 eV, E / 3.65 eV above.
double quantumYieldIdeal(double wavelength);

// Interpolated in log space between table entries; 0 past the long-wavelength end of the table.
double absorptionCoefficient(const SensorMaterial& material, double wavelength);

// Fraction of the photons absorbed inside the substrate.
double absorbance(const SensorMaterial& material, double wavelength, double cosIncidence);

// Fraction of the photo-electrons that reach the potential well. Absorption in 1/mm, thickness in mm,
// cosIncidence measured inside the silicon.
double chargeCollectionEfficiency(double absorption, double thicknessImplant, double cceBacksurface, double cosIncidence);

// Absorbance times charge collection efficiency.
double quantumEfficiencyEffective(const SensorMaterial& material, double wavelength, double cosIncidence);

// Expected electrons per incident photon.
double responsivity(const SensorMaterial& material, double wavelength, double cosIncidence);

// One random realisation for `photons` incident photons: Poisson absorption, fractional quantum yield
// resolved by a uniform draw, then binomial charge collection.
long long electronsMeasured(long long photons, const SensorMaterial& material, double wavelength, double cosIncidence, std::mt19937& rng);

// Cosine between a ray that landed on `sensor` and the local surface normal there.
double incidenceCosine(const Surface& sensor, const Ray& ray);

// Expected electrons per photon for a ray that landed on `sensor`: the responsivity for a SensorMaterial,
// 1 for any other material, 0 for a dead ray.
double hitWeight(const Surface& sensor, const Ray& ray);
