#pragma once

#include <glm/mat2x2.hpp>

// Paraxial 2x2 matrices acting on (height, angle). glm is column-major: glm::dmat2(a, c, b, d) is [[a, b], [c, d]].
// Radii follow the optical sign convention: positive when the centre of curvature lies downstream.
class RayTransferMatrixBuilder {
public:
	RayTransferMatrixBuilder();
	glm::dmat2 getTranslationMatrix(double distance) const;
	glm::dmat2 getRefractionMatrix(double n1, double n2, double radius) const;
	glm::dmat2 getReflectionMatrix(double radius) const;
};
