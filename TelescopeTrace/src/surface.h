#pragma once

#include "aperture.h"
#include "material.h"
#include "ray.h"
#include "sag_profile.h"
#include "transform.h"

#include <glm/glm.hpp>
#include <string>
#include <vector>

// Geometric hit of a ray on a surface, before the material acts.
struct SurfaceHit {
	RayStatus status = RayStatus::Missed;
	double t = 0.0;
	glm::dvec3 localPoint{ 0.0 };
	glm::dvec3 localDirection{ 0.0 };
	glm::dvec3 globalPoint{ 0.0 };
};

// One optical surface of a sequential system. Immutable once constructed.
class Surface {
public:
	Surface(std::string name, SagProfile sag, Material material, Aperture aperture, Transform transform,
		bool isPupilStop = false, bool isFieldStop = false);

	const std::string& getName() const;
	const SagProfile& getSag() const;
	const Material& getMaterial() const;
	const Aperture& getAperture() const;
	const Transform& getTransform() const;
	bool isPupilStop() const;
	bool isFieldStop() const;

	// Solves the hit in the local frame. With clipToAperture, a hit outside the aperture is Vignetted.
	SurfaceHit intersect(const Ray& globalRay, bool clipToAperture = true) const;
	// Intersects and applies the material. The result is a new ray in the global frame.
	// Missed or vignetted rays come back with NaN position; absorbed rays keep their hit point.
	Ray trace(const Ray& globalRay, bool clipToAperture = true) const;

	// Global points on the sag along the outer aperture outline.
	std::vector<glm::dvec3> sampleOutline(int samples) const;
	// Global cross-section along the local x axis; points inside a central obscuration are NaN.
	std::vector<glm::dvec3> sampleProfile(int samples) const;

	Surface withTransform(const Transform& transform) const;
	Surface withStops(bool isPupilStop, bool isFieldStop) const;
	Surface withName(std::string name) const;

	std::string describe() const;

private:
	std::string m_name;
	SagProfile m_sag;
	Material m_material;
	Aperture m_aperture;
	Transform m_transform;
	bool m_is_pupil_stop = false;
	bool m_is_field_stop = false;
};
