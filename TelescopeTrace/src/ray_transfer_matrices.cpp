#include "ray_transfer_matrices.h"

#include <cmath>

RayTransferMatrixBuilder::RayTransferMatrixBuilder() {
}

glm::dmat2 RayTransferMatrixBuilder::getTranslationMatrix(double distance) const {
	return glm::dmat2(1.0, 0.0, distance, 1.0);
}

glm::dmat2 RayTransferMatrixBuilder::getRefractionMatrix(double n1, double n2, double radius) const {
	// radius 0 or inf is a flat interface
	double power = (radius == 0.0 || std::isinf(radius)) ? 0.0 : (n1 - n2) / (n2 * radius);
	return glm::dmat2(1.0, power, 0.0, n1 / n2);
}

glm::dmat2 RayTransferMatrixBuilder::getReflectionMatrix(double radius) const {
	// unfolded: the axis keeps pointing along the reflected beam
	double power = (radius == 0.0 || std::isinf(radius)) ? 0.0 : 2.0 / radius;
	return glm::dmat2(1.0, power, 0.0, 1.0);
}
