#include <cmath>
#include <iostream>
#include <numbers>
#include <string>

#include "aperture.h"
#include "errors.h"

static int g_failures = 0;

static void check(bool condition, const std::string& what) {
	if (!condition) {
		std::cerr << "FAIL: " << what << std::endl;
		g_failures++;
	}
}

template <class Fn>
static void checkRejected(Fn fn, const std::string& what) {
	bool threw = false;
	try {
		fn();
	}
	catch (const ConfigurationError&) {
		threw = true;
	}
	check(threw, what);
}

int main() {
	Aperture circle = CircularAperture{ 100.0, 0.0 };
	check(apertureContains(circle, 100.0, 0.0), "point exactly on the rim is inside");
	check(apertureContains(circle, 60.0, 80.0), "oblique rim point is inside");
	check(!apertureContains(circle, 100.001, 0.0), "point beyond the rim is outside");
	check(!apertureContains(circle, NAN, 0.0), "NaN is never inside");
	check(apertureExtent(circle) == glm::dvec2(100.0, 100.0), "circle extent");

	Aperture annulus = CircularAperture{ 100.0, 20.0 };
	check(!apertureContains(annulus, 10.0, 0.0), "central obscuration blocks");
	check(apertureContains(annulus, 20.0, 0.0), "obscuration edge is open");

	Aperture rectangle = RectangularAperture{ 7.68, 3.0 };
	check(apertureContains(rectangle, -7.68, 3.0), "rectangle corner is inside");
	check(!apertureContains(rectangle, 0.0, 3.01), "rectangle rejects beyond half width");
	check(apertureExtent(rectangle) == glm::dvec2(7.68, 3.0), "rectangle extent");
	std::vector<glm::dvec2> rectangleOutline = apertureBoundary(rectangle, 40);
	check(rectangleOutline.size() == 40, "rectangle outline sample count");
	for (const glm::dvec2& p : rectangleOutline) {
		check(apertureContains(rectangle, p.x, p.y), "rectangle outline lies on the boundary");
	}

	// hexagon with a vertex on +x: apothem 10 cos(30 deg)
	Aperture hexagon = PolygonAperture{ 10.0, 6, 0.0 };
	check(apertureContains(hexagon, 10.0, 0.0), "polygon vertex is inside");
	check(apertureContains(hexagon, 0.0, 8.6), "inside the flat edge");
	check(!apertureContains(hexagon, 0.0, 9.0), "outside the flat edge");
	glm::dvec2 hexagonExtent = apertureExtent(hexagon);
	check(std::abs(hexagonExtent.x - 10.0) < 1e-12, "hexagon x extent reaches the vertex");
	check(std::abs(hexagonExtent.y - 10.0 * std::sin(std::numbers::pi / 3.0)) < 1e-12, "hexagon y extent");
	for (const glm::dvec2& p : apertureBoundary(hexagon, 36)) {
		check(apertureContains(hexagon, p.x, p.y), "polygon outline lies inside");
	}

	Aperture open = UnboundedAperture{};
	check(!isBounded(open) && isBounded(circle), "boundedness");
	check(std::isinf(apertureExtent(open).x), "unbounded extent is infinite");
	check(apertureBoundary(open, 16).empty(), "unbounded aperture has no outline");
	check(apertureContains(open, 1e12, -1e12), "unbounded aperture accepts everything");

	checkRejected([] { validateAperture(CircularAperture{ 0.0, 0.0 }); }, "zero radius is rejected");
	checkRejected([] { validateAperture(CircularAperture{ 10.0, 10.0 }); }, "obscuration as large as the aperture is rejected");
	checkRejected([] { validateAperture(PolygonAperture{ 10.0, 2, 0.0 }); }, "two-sided polygon is rejected");
	checkRejected([] { validateAperture(RectangularAperture{ 1.0, -1.0 }); }, "negative half width is rejected");

	if (g_failures > 0) {
		std::cerr << "[aperture] " << g_failures << " failures" << std::endl;
		return 1;
	}
	std::cout << "[aperture] ok" << std::endl;
	return 0;
}
