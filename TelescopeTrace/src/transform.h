#pragma once

#include <glm/glm.hpp>
#include <vector>

// Rigid placement of a surface: local -> global is rotate, then translate.
class Transform {
public:
	Transform();
	// Throws ConfigurationError unless rotation is a proper rotation (R^T R = I, det R = +1).
	Transform(const glm::dmat3& rotation, const glm::dvec3& translation);

	static Transform identity();
	static Transform translation(const glm::dvec3& offset);
	static Transform rotation(double angle, const glm::dvec3& axis);
	static Transform rotationX(double angle);
	static Transform rotationY(double angle);
	static Transform rotationZ(double angle);

	glm::dvec3 pointToGlobal(const glm::dvec3& localPoint) const;
	glm::dvec3 pointToLocal(const glm::dvec3& globalPoint) const;
	glm::dvec3 directionToGlobal(const glm::dvec3& localDirection) const;
	glm::dvec3 directionToLocal(const glm::dvec3& globalDirection) const;

	Transform inverse() const;
	// This transform followed by outer, both expressed in the same fixed global frame.
	Transform then(const Transform& outer) const;

	const glm::dmat3& getRotation() const;
	const glm::dvec3& getTranslation() const;
	// Global position of the local origin, i.e. the surface vertex.
	glm::dvec3 getVertex() const;
	// Global direction of the local +z axis.
	glm::dvec3 getAxis() const;

private:
	glm::dmat3 m_rotation;
	glm::dvec3 m_translation;
};

// Applies the transforms in order: chain[0] first, chain.back() last.
Transform compose(const std::vector<Transform>& chain);
