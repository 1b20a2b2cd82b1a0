#include "aperture.h"

#include "errors.h"
#include "utils.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <sstream>

namespace {

// rays aimed exactly at the rim must stay inside
constexpr double kRimTolerance = 1e-9;

bool insidePolygon(const PolygonAperture& polygon, double x, double y) {
	// a regular polygon is the intersection of its edge half-planes
	double apothem = polygon.radius * std::cos(std::numbers::pi / polygon.sides);
	double limit = apothem * (1.0 + kRimTolerance);
	for (int i = 0; i < polygon.sides; i++) {
		double edgeNormalAngle = polygon.rotation + (2.0 * i + 1.0) * std::numbers::pi / polygon.sides;
		double distance = x * std::cos(edgeNormalAngle) + y * std::sin(edgeNormalAngle);
		if (distance > limit) {
			return false;
		}
	}
	return true;
}

}

void validateAperture(const Aperture& aperture) {
	std::visit(Overloaded{
		[](const UnboundedAperture&) {},
		[](const CircularAperture& a) {
			if (!(a.radius > 0.0) || !std::isfinite(a.radius)) {
				throw ConfigurationError("circular aperture needs a positive radius");
			}
			if (a.obscurationRadius < 0.0 || a.obscurationRadius >= a.radius) {
				throw ConfigurationError("obscuration radius must lie in [0, radius)");
			}
		},
		[](const RectangularAperture& a) {
			if (!(a.halfWidthX > 0.0) || !(a.halfWidthY > 0.0) || !std::isfinite(a.halfWidthX) || !std::isfinite(a.halfWidthY)) {
				throw ConfigurationError("rectangular aperture needs positive half widths");
			}
		},
		[](const PolygonAperture& a) {
			if (!(a.radius > 0.0) || !std::isfinite(a.radius)) {
				throw ConfigurationError("polygon aperture needs a positive radius");
			}
			if (a.sides < 3) {
				throw ConfigurationError("polygon aperture needs at least 3 sides");
			}
		},
	}, aperture);
}

std::string describeAperture(const Aperture& aperture) {
	std::ostringstream out;
	std::visit(Overloaded{
		[&](const UnboundedAperture&) { out << "unbounded"; },
		[&](const CircularAperture& a) {
			out << "circular(r=" << a.radius;
			if (a.obscurationRadius > 0.0) {
				out << ", obscuration=" << a.obscurationRadius;
			}
			out << ")";
		},
		[&](const RectangularAperture& a) { out << "rectangular(" << 2.0 * a.halfWidthX << "x" << 2.0 * a.halfWidthY << ")"; },
		[&](const PolygonAperture& a) { out << "polygon(r=" << a.radius << ", sides=" << a.sides << ")"; },
	}, aperture);
	return out.str();
}

bool apertureContains(const Aperture& aperture, double x, double y) {
	if (!std::isfinite(x) || !std::isfinite(y)) {
		return false;
	}
	return std::visit(Overloaded{
		[](const UnboundedAperture&) { return true; },
		[&](const CircularAperture& a) {
			double r = std::hypot(x, y);
			return r <= a.radius * (1.0 + kRimTolerance) && r >= a.obscurationRadius;
		},
		[&](const RectangularAperture& a) {
			return std::abs(x) <= a.halfWidthX * (1.0 + kRimTolerance) && std::abs(y) <= a.halfWidthY * (1.0 + kRimTolerance);
		},
		[&](const PolygonAperture& a) { return insidePolygon(a, x, y); },
	}, aperture);
}

glm::dvec2 apertureExtent(const Aperture& aperture) {
	return std::visit(Overloaded{
		[](const UnboundedAperture&) {
			double inf = std::numeric_limits<double>::infinity();
			return glm::dvec2(inf, inf);
		},
		[](const CircularAperture& a) { return glm::dvec2(a.radius, a.radius); },
		[](const RectangularAperture& a) { return glm::dvec2(a.halfWidthX, a.halfWidthY); },
		[](const PolygonAperture& a) {
			double maxX = 0.0;
			double maxY = 0.0;
			for (int i = 0; i < a.sides; i++) {
				double theta = a.rotation + 2.0 * std::numbers::pi * i / a.sides;
				maxX = std::max(maxX, std::abs(a.radius * std::cos(theta)));
				maxY = std::max(maxY, std::abs(a.radius * std::sin(theta)));
			}
			return glm::dvec2(maxX, maxY);
		},
	}, aperture);
}

bool isBounded(const Aperture& aperture) {
	return !std::holds_alternative<UnboundedAperture>(aperture);
}

std::vector<glm::dvec2> apertureBoundary(const Aperture& aperture, int samples) {
	std::vector<glm::dvec2> outline;
	if (samples < 3) {
		return outline;
	}
	std::visit(Overloaded{
		[](const UnboundedAperture&) {},
		[&](const CircularAperture& a) {
			for (int i = 0; i < samples; i++) {
				double theta = 2.0 * std::numbers::pi * i / samples;
				outline.push_back(glm::dvec2(a.radius * std::cos(theta), a.radius * std::sin(theta)));
			}
		},
		[&](const RectangularAperture& a) {
			// walk the perimeter at constant spacing
			double perimeter = 4.0 * (a.halfWidthX + a.halfWidthY);
			for (int i = 0; i < samples; i++) {
				double s = perimeter * i / samples;
				double w = 2.0 * a.halfWidthX;
				double h = 2.0 * a.halfWidthY;
				if (s < w) {
					outline.push_back(glm::dvec2(-a.halfWidthX + s, -a.halfWidthY));
				}
				else if (s < w + h) {
					outline.push_back(glm::dvec2(a.halfWidthX, -a.halfWidthY + (s - w)));
				}
				else if (s < 2.0 * w + h) {
					outline.push_back(glm::dvec2(a.halfWidthX - (s - w - h), a.halfWidthY));
				}
				else {
					outline.push_back(glm::dvec2(-a.halfWidthX, a.halfWidthY - (s - 2.0 * w - h)));
				}
			}
		},
		[&](const PolygonAperture& a) {
			for (int i = 0; i < samples; i++) {
				double s = static_cast<double>(a.sides) * i / samples;
				int edge = static_cast<int>(s);
				double fraction = s - edge;
				double theta0 = a.rotation + 2.0 * std::numbers::pi * edge / a.sides;
				double theta1 = a.rotation + 2.0 * std::numbers::pi * (edge + 1) / a.sides;
				glm::dvec2 v0(a.radius * std::cos(theta0), a.radius * std::sin(theta0));
				glm::dvec2 v1(a.radius * std::cos(theta1), a.radius * std::sin(theta1));
				outline.push_back(v0 + fraction * (v1 - v0));
			}
		},
	}, aperture);
	return outline;
}
