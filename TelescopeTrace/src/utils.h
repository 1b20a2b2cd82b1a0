#pragma once

#include <glm/glm.hpp>
#include <vector>

// Global-frame direction for a pair of field angles (x, y), object space travels along +z.
glm::dvec3 directionFromFieldAngles(const glm::dvec2& fieldAngles);
// Inverse of directionFromFieldAngles for directions with positive z.
glm::dvec2 fieldAnglesFromDirection(const glm::dvec3& direction);

// n evenly spaced samples in [start, stop]; a single sample sits at the midpoint.
std::vector<double> linspace(double start, double stop, int n);

glm::dvec3 nanVector();
bool isFiniteVector(const glm::dvec3& v);

glm::dvec3 wavelengthToRGB(double wavelength);

// Visitor built from lambdas, one per variant alternative.
template <class... Ts>
struct Overloaded : Ts... {
	using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;
