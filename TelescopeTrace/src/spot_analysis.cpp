#include "spot_analysis.h"

#include <algorithm>
#include <cmath>
#include <limits>

std::vector<glm::dvec2> spotDiagram(const RayFunction& rays, const Surface& surface, int surfaceIndex, int w, int fx, int fy) {
	std::vector<glm::dvec2> points;
	GridShape shape = rays.getGrid().getShape();
	for (int px = 0; px < shape.pupilX; px++) {
		for (int py = 0; py < shape.pupilY; py++) {
			const Ray& ray = rays.state(GridIndex{ w, fx, fy, px, py }, surfaceIndex);
			if (!ray.alive) {
				continue;
			}
			glm::dvec3 local = surface.getTransform().pointToLocal(ray.position);
			points.push_back(glm::dvec2(local.x, local.y));
		}
	}
	return points;
}

SpotStatistics spotStatistics(const RayFunction& rays, const Surface& surface, int surfaceIndex, int w, int fx, int fy) {
	SpotStatistics stats;
	std::vector<glm::dvec2> points = spotDiagram(rays, surface, surfaceIndex, w, fx, fy);
	stats.alive = static_cast<int>(points.size());
	if (points.empty()) {
		double nan = std::numeric_limits<double>::quiet_NaN();
		stats.centroid = glm::dvec2(nan);
		stats.rmsRadius = nan;
		stats.geometricRadius = nan;
		return stats;
	}

	for (const glm::dvec2& p : points) {
		stats.centroid += p;
	}
	stats.centroid /= static_cast<double>(points.size());

	double sum = 0.0;
	for (const glm::dvec2& p : points) {
		double r = glm::length(p - stats.centroid);
		sum += r * r;
		stats.geometricRadius = std::max(stats.geometricRadius, r);
	}
	stats.rmsRadius = std::sqrt(sum / points.size());
	return stats;
}

double meanRmsRadius(const RayFunction& rays, const Surface& surface, int surfaceIndex) {
	GridShape shape = rays.getGrid().getShape();
	double sum = 0.0;
	int count = 0;
	for (int w = 0; w < shape.wavelengths; w++) {
		for (int fx = 0; fx < shape.fieldX; fx++) {
			for (int fy = 0; fy < shape.fieldY; fy++) {
				SpotStatistics stats = spotStatistics(rays, surface, surfaceIndex, w, fx, fy);
				if (stats.alive > 0) {
					sum += stats.rmsRadius;
					count++;
				}
			}
		}
	}
	if (count == 0) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	return sum / count;
}
