#include "ray.h"

#include "utils.h"

const char* toString(RayStatus status) {
	switch (status) {
	case RayStatus::Alive: return "alive";
	case RayStatus::Missed: return "missed";
	case RayStatus::Vignetted: return "vignetted";
	case RayStatus::DegenerateGeometry: return "degenerate";
	case RayStatus::NumericOverflow: return "overflow";
	case RayStatus::Absorbed: return "absorbed";
	case RayStatus::TotalInternalReflection: return "tir";
	case RayStatus::AimFailed: return "aim_failed";
	}
	return "unknown";
}

glm::dvec3 Ray::at(double t) const {
	return position + t * direction;
}

Ray deadRay(const Ray& ray, RayStatus status) {
	Ray dead = ray;
	dead.position = nanVector();
	dead.direction = nanVector();
	dead.alive = false;
	dead.status = status;
	return dead;
}
