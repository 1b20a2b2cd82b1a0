#include "sag_profile.h"

#include "errors.h"
#include "utils.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace {

constexpr double kForwardTolerance = 1e-9;
constexpr double kBranchTolerance = 1e-6;

double curvatureFromRadius(double radius) {
	if (std::isinf(radius)) {
		return 0.0;
	}
	return 1.0 / radius;
}

bool onVertexBranch(const SagProfile& sag, const glm::dvec3& point) {
	double height = sagHeight(sag, point.x, point.y);
	if (!std::isfinite(height)) {
		return false;
	}
	return std::abs(point.z - height) <= kBranchTolerance * std::max(1.0, std::abs(height));
}

}

ConicCoefficients conicCoefficients(const SagProfile& sag) {
	return std::visit(Overloaded{
		[](const FlatSag&) { return ConicCoefficients{ 0.0, 0.0 }; },
		[](const ParabolicSag& p) { return ConicCoefficients{ 1.0 / (2.0 * p.focalLength), -1.0 }; },
		[](const SphericalSag& s) { return ConicCoefficients{ curvatureFromRadius(s.radius), 0.0 }; },
		[](const ConicSag& c) { return ConicCoefficients{ curvatureFromRadius(c.radius), c.conic }; },
	}, sag);
}

void validateSag(const SagProfile& sag) {
	std::visit(Overloaded{
		[](const FlatSag&) {},
		[](const ParabolicSag& p) {
			if (p.focalLength == 0.0 || !std::isfinite(p.focalLength)) {
				throw ConfigurationError("parabolic sag needs a finite, non-zero focal length");
			}
		},
		[](const SphericalSag& s) {
			if (s.radius == 0.0 || std::isnan(s.radius)) {
				throw ConfigurationError("spherical sag needs a non-zero radius (infinity for flat)");
			}
		},
		[](const ConicSag& c) {
			if (c.radius == 0.0 || std::isnan(c.radius) || !std::isfinite(c.conic)) {
				throw ConfigurationError("conic sag needs a non-zero radius and a finite conic constant");
			}
		},
	}, sag);
}

std::string describeSag(const SagProfile& sag) {
	std::ostringstream out;
	std::visit(Overloaded{
		[&](const FlatSag&) { out << "flat"; },
		[&](const ParabolicSag& p) { out << "parabolic(f=" << p.focalLength << ")"; },
		[&](const SphericalSag& s) { out << "spherical(R=" << s.radius << ")"; },
		[&](const ConicSag& c) { out << "conic(R=" << c.radius << ", k=" << c.conic << ")"; },
	}, sag);
	return out.str();
}

double sagHeight(const SagProfile& sag, double x, double y) {
	ConicCoefficients coefficients = conicCoefficients(sag);
	double c = coefficients.curvature;
	if (c == 0.0) {
		return 0.0;
	}
	double r2 = x * x + y * y;
	double arg = 1.0 - (1.0 + coefficients.conic) * c * c * r2;
	if (arg < 0.0) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	return c * r2 / (1.0 + std::sqrt(arg));
}

glm::dvec3 sagNormal(const SagProfile& sag, double x, double y) {
	ConicCoefficients coefficients = conicCoefficients(sag);
	double c = coefficients.curvature;
	double z = sagHeight(sag, x, y);
	// negative half gradient of the implicit conic
	glm::dvec3 n(-c * x, -c * y, 1.0 - c * (1.0 + coefficients.conic) * z);
	return glm::normalize(n);
}

SagSolve intersectSag(const SagProfile& sag, const glm::dvec3& origin, const glm::dvec3& direction) {
	SagSolve solve;
	if (!isFiniteVector(origin) || !isFiniteVector(direction)) {
		solve.status = RayStatus::NumericOverflow;
		return solve;
	}

	ConicCoefficients coefficients = conicCoefficients(sag);
	double c = coefficients.curvature;
	double u = 1.0 + coefficients.conic;
	const glm::dvec3& o = origin;
	const glm::dvec3& d = direction;

	double A = c * (d.x * d.x + d.y * d.y + u * d.z * d.z);
	double B = 2.0 * (c * (o.x * d.x + o.y * d.y + u * o.z * d.z) - d.z);
	double C = c * (o.x * o.x + o.y * o.y + u * o.z * o.z) - 2.0 * o.z;

	double roots[2];
	int rootCount = 0;
	if (A == 0.0) {
		if (B == 0.0) {
			solve.status = RayStatus::DegenerateGeometry;
			return solve;
		}
		roots[rootCount++] = -C / B;
	}
	else {
		double discriminant = B * B - 4.0 * A * C;
		if (discriminant < 0.0) {
			solve.status = RayStatus::DegenerateGeometry;
			return solve;
		}
		// numerically stable pair of roots
		double q = -0.5 * (B + std::copysign(std::sqrt(discriminant), B));
		roots[rootCount++] = q / A;
		if (q != 0.0) {
			roots[rootCount++] = C / q;
		}
	}
	if (rootCount == 2 && roots[1] < roots[0]) {
		std::swap(roots[0], roots[1]);
	}

	bool sawNonFinite = false;
	for (int i = 0; i < rootCount; i++) {
		double t = roots[i];
		if (!std::isfinite(t)) {
			sawNonFinite = true;
			continue;
		}
		if (t < -kForwardTolerance) {
			continue;
		}
		t = std::max(t, 0.0);
		glm::dvec3 point = o + t * d;
		if (!isFiniteVector(point)) {
			sawNonFinite = true;
			continue;
		}
		if (!onVertexBranch(sag, point)) {
			continue;
		}
		solve.status = RayStatus::Alive;
		solve.t = t;
		return solve;
	}

	solve.status = sawNonFinite ? RayStatus::NumericOverflow : RayStatus::Missed;
	return solve;
}
