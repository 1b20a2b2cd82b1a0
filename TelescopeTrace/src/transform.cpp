#include "transform.h"

#include "errors.h"

#include <cmath>
#include <glm/gtc/matrix_transform.hpp>

namespace {

constexpr double kRotationTolerance = 1e-9;

bool isProperRotation(const glm::dmat3& m) {
	glm::dmat3 gram = glm::transpose(m) * m;
	for (int col = 0; col < 3; col++) {
		for (int row = 0; row < 3; row++) {
			double expected = col == row ? 1.0 : 0.0;
			if (!(std::abs(gram[col][row] - expected) <= kRotationTolerance)) {
				return false;
			}
		}
	}
	return std::abs(glm::determinant(m) - 1.0) <= kRotationTolerance;
}

}

Transform::Transform() : m_rotation(1.0), m_translation(0.0) {
}

Transform::Transform(const glm::dmat3& rotation, const glm::dvec3& translation) {
	if (!isProperRotation(rotation)) {
		throw ConfigurationError("transform rotation must be orthonormal with determinant +1");
	}
	if (!std::isfinite(translation.x) || !std::isfinite(translation.y) || !std::isfinite(translation.z)) {
		throw ConfigurationError("transform translation must be finite");
	}
	m_rotation = rotation;
	m_translation = translation;
}

Transform Transform::identity() {
	return Transform();
}

Transform Transform::translation(const glm::dvec3& offset) {
	return Transform(glm::dmat3(1.0), offset);
}

Transform Transform::rotation(double angle, const glm::dvec3& axis) {
	glm::dmat4 rotation4 = glm::rotate(glm::dmat4(1.0), angle, glm::normalize(axis));
	return Transform(glm::dmat3(rotation4), glm::dvec3(0.0));
}

Transform Transform::rotationX(double angle) {
	return rotation(angle, glm::dvec3(1.0, 0.0, 0.0));
}

Transform Transform::rotationY(double angle) {
	return rotation(angle, glm::dvec3(0.0, 1.0, 0.0));
}

Transform Transform::rotationZ(double angle) {
	return rotation(angle, glm::dvec3(0.0, 0.0, 1.0));
}

glm::dvec3 Transform::pointToGlobal(const glm::dvec3& localPoint) const {
	return m_rotation * localPoint + m_translation;
}

glm::dvec3 Transform::pointToLocal(const glm::dvec3& globalPoint) const {
	// rotation matrices are orthonormal, the transpose is the inverse
	return glm::transpose(m_rotation) * (globalPoint - m_translation);
}

glm::dvec3 Transform::directionToGlobal(const glm::dvec3& localDirection) const {
	return m_rotation * localDirection;
}

glm::dvec3 Transform::directionToLocal(const glm::dvec3& globalDirection) const {
	return glm::transpose(m_rotation) * globalDirection;
}

Transform Transform::inverse() const {
	glm::dmat3 inverseRotation = glm::transpose(m_rotation);
	return Transform(inverseRotation, -(inverseRotation * m_translation));
}

Transform Transform::then(const Transform& outer) const {
	return Transform(outer.m_rotation * m_rotation, outer.m_rotation * m_translation + outer.m_translation);
}

const glm::dmat3& Transform::getRotation() const {
	return m_rotation;
}

const glm::dvec3& Transform::getTranslation() const {
	return m_translation;
}

glm::dvec3 Transform::getVertex() const {
	return m_translation;
}

glm::dvec3 Transform::getAxis() const {
	return m_rotation * glm::dvec3(0.0, 0.0, 1.0);
}

Transform compose(const std::vector<Transform>& chain) {
	Transform result = Transform::identity();
	for (const Transform& transform : chain) {
		result = result.then(transform);
	}
	return result;
}
