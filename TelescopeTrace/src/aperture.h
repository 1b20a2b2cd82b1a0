#pragma once

#include <glm/glm.hpp>
#include <string>
#include <variant>
#include <vector>

// Lateral boundaries in the surface's local xy plane, centred on the local axis.

// Accepts everything. Not allowed on stop surfaces.
struct UnboundedAperture {
};

// Annulus when obscurationRadius > 0, e.g. a central obstruction.
struct CircularAperture {
	double radius = 0.0;
	double obscurationRadius = 0.0;
};

struct RectangularAperture {
	double halfWidthX = 0.0;
	double halfWidthY = 0.0;
};

// Iris-like polygon with the given circumradius; first vertex at angle `rotation` from the x axis.
struct PolygonAperture {
	double radius = 0.0;
	int sides = 6;
	double rotation = 0.0;
};

using Aperture = std::variant<UnboundedAperture, CircularAperture, RectangularAperture, PolygonAperture>;

void validateAperture(const Aperture& aperture);
std::string describeAperture(const Aperture& aperture);

bool apertureContains(const Aperture& aperture, double x, double y);
// Half widths of the bounding box; infinite for an unbounded aperture.
glm::dvec2 apertureExtent(const Aperture& aperture);
bool isBounded(const Aperture& aperture);
// Closed outer outline with `samples` points, empty for an unbounded aperture.
std::vector<glm::dvec2> apertureBoundary(const Aperture& aperture, int samples);
