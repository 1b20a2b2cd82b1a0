#pragma once

#include "ray.h"

#include <glm/glm.hpp>
#include <string>
#include <variant>

// All sag variants are conics  c*(x^2 + y^2 + (1+k)*z^2) - 2*z = 0  with vertex curvature c and conic constant k.
// The vertex sits at the local origin and the local +z axis is the optical axis of the surface.

struct FlatSag {
};

// z = r^2 / (4f). Focus at local (0, 0, f); negative f flips the concavity.
struct ParabolicSag {
	double focalLength = 0.0;
};

// Radius of curvature, centre at local (0, 0, radius).
struct SphericalSag {
	double radius = 0.0;
};

struct ConicSag {
	double radius = 0.0;
	double conic = 0.0; // k: 0 sphere, -1 parabola, < -1 hyperbola
};

using SagProfile = std::variant<FlatSag, ParabolicSag, SphericalSag, ConicSag>;

struct ConicCoefficients {
	double curvature; // c = 1 / R
	double conic;     // k
};

struct SagSolve {
	RayStatus status = RayStatus::Missed;
	double t = 0.0;
};

ConicCoefficients conicCoefficients(const SagProfile& sag);

// Throws ConfigurationError for zero or non-finite focal lengths and radii.
void validateSag(const SagProfile& sag);
std::string describeSag(const SagProfile& sag);

// Surface height at (x, y); NaN outside the conic's domain.
double sagHeight(const SagProfile& sag, double x, double y);
// Unit normal at (x, y), pointing towards local +z at the vertex.
glm::dvec3 sagNormal(const SagProfile& sag, double x, double y);

// Forward intersection of a local-frame ray with the sag (apertures are not considered).
// Picks the smallest root with t >= 0 that lies on the branch through the vertex.
SagSolve intersectSag(const SagProfile& sag, const glm::dvec3& origin, const glm::dvec3& direction);
