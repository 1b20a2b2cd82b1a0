#include "surface.h"

#include "logging.h"
#include "utils.h"

#include <cmath>
#include <sstream>
#include <utility>

Surface::Surface(std::string name, SagProfile sag, Material material, Aperture aperture, Transform transform,
	bool isPupilStop, bool isFieldStop)
	: m_name(std::move(name)), m_sag(sag), m_material(material), m_aperture(aperture), m_transform(transform),
	m_is_pupil_stop(isPupilStop), m_is_field_stop(isFieldStop) {
	validateSag(m_sag);
	validateAperture(m_aperture);
	validateMaterial(m_material);
}

const std::string& Surface::getName() const {
	return m_name;
}

const SagProfile& Surface::getSag() const {
	return m_sag;
}

const Material& Surface::getMaterial() const {
	return m_material;
}

const Aperture& Surface::getAperture() const {
	return m_aperture;
}

const Transform& Surface::getTransform() const {
	return m_transform;
}

bool Surface::isPupilStop() const {
	return m_is_pupil_stop;
}

bool Surface::isFieldStop() const {
	return m_is_field_stop;
}

SurfaceHit Surface::intersect(const Ray& globalRay, bool clipToAperture) const {
	SurfaceHit hit;
	hit.localPoint = m_transform.pointToLocal(globalRay.position);
	hit.localDirection = m_transform.directionToLocal(globalRay.direction);

	SagSolve solve = intersectSag(m_sag, hit.localPoint, hit.localDirection);
	hit.status = solve.status;
	if (solve.status != RayStatus::Alive) {
		return hit;
	}

	hit.t = solve.t;
	hit.localPoint = hit.localPoint + solve.t * hit.localDirection;
	hit.globalPoint = m_transform.pointToGlobal(hit.localPoint);
	if (clipToAperture && !apertureContains(m_aperture, hit.localPoint.x, hit.localPoint.y)) {
		hit.status = RayStatus::Vignetted;
	}
	return hit;
}

Ray Surface::trace(const Ray& globalRay, bool clipToAperture) const {
	if (!globalRay.alive) {
		return deadRay(globalRay, globalRay.status);
	}

	SurfaceHit hit = intersect(globalRay, clipToAperture);
	if (hit.status != RayStatus::Alive) {
		if (hit.status == RayStatus::NumericOverflow && getLogLevel() == LogLevel::Debug) {
			logMessage(LogLevel::Debug, "non-finite intersection on surface '" + m_name + "'");
		}
		return deadRay(globalRay, hit.status);
	}

	Ray localRay = globalRay;
	localRay.position = hit.localPoint;
	localRay.direction = hit.localDirection;
	glm::dvec3 normal = sagNormal(m_sag, hit.localPoint.x, hit.localPoint.y);

	Ray out = interact(m_material, localRay, normal);
	out.position = hit.globalPoint;
	if (out.alive) {
		out.direction = glm::normalize(m_transform.directionToGlobal(out.direction));
	}
	else {
		out.direction = nanVector();
	}
	return out;
}

std::vector<glm::dvec3> Surface::sampleOutline(int samples) const {
	std::vector<glm::dvec3> outline;
	for (const glm::dvec2& p : apertureBoundary(m_aperture, samples)) {
		double z = sagHeight(m_sag, p.x, p.y);
		outline.push_back(m_transform.pointToGlobal(glm::dvec3(p.x, p.y, z)));
	}
	return outline;
}

std::vector<glm::dvec3> Surface::sampleProfile(int samples) const {
	std::vector<glm::dvec3> profile;
	if (!isBounded(m_aperture) || samples < 2) {
		return profile;
	}
	double obscuration = 0.0;
	if (const CircularAperture* circular = std::get_if<CircularAperture>(&m_aperture)) {
		obscuration = circular->obscurationRadius;
	}

	double halfWidth = apertureExtent(m_aperture).x;
	for (double x : linspace(-halfWidth, halfWidth, samples)) {
		if (std::abs(x) < obscuration) {
			profile.push_back(nanVector());
			continue;
		}
		double z = sagHeight(m_sag, x, 0.0);
		profile.push_back(m_transform.pointToGlobal(glm::dvec3(x, 0.0, z)));
	}
	return profile;
}

Surface Surface::withTransform(const Transform& transform) const {
	Surface copy = *this;
	copy.m_transform = transform;
	return copy;
}

Surface Surface::withStops(bool isPupilStop, bool isFieldStop) const {
	Surface copy = *this;
	copy.m_is_pupil_stop = isPupilStop;
	copy.m_is_field_stop = isFieldStop;
	return copy;
}

Surface Surface::withName(std::string name) const {
	Surface copy = *this;
	copy.m_name = std::move(name);
	return copy;
}

std::string Surface::describe() const {
	std::ostringstream out;
	glm::dvec3 vertex = m_transform.getVertex();
	out << m_name << ": " << describeSag(m_sag) << ", " << describeMaterial(m_material) << ", " << describeAperture(m_aperture)
		<< ", vertex (" << vertex.x << ", " << vertex.y << ", " << vertex.z << ")";
	if (m_is_pupil_stop) {
		out << " [pupil stop]";
	}
	if (m_is_field_stop) {
		out << " [field stop]";
	}
	return out.str();
}
