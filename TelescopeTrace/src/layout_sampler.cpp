#include "layout_sampler.h"

#include "errors.h"
#include "utils.h"

#include <fstream>
#include <sstream>
#include <utility>

LayoutSampler::LayoutSampler(SequentialSystem system, int profileSamples)
	: m_system(std::move(system)), m_profile_samples(profileSamples) {
}

std::vector<Polyline> LayoutSampler::sampleSurfaces() const {
	std::vector<Polyline> lines;
	for (int s = 0; s < m_system.getSurfaceCount(); s++) {
		const Surface& surface = m_system.getSurface(s);
		Polyline line;
		line.label = surface.getName();
		line.points = surface.sampleProfile(m_profile_samples);
		lines.push_back(line);
	}
	return lines;
}

std::vector<Polyline> LayoutSampler::sampleRays(const RayFunction& rays, bool meridionalOnly) const {
	std::vector<Polyline> lines;
	const InputGrid& grid = rays.getGrid();
	GridShape shape = grid.getShape();
	for (std::size_t cell = 0; cell < grid.getCellCount(); cell++) {
		GridIndex index = grid.gridIndex(cell);
		if (meridionalOnly && (index.w != 0 || index.px != shape.pupilX / 2)) {
			continue;
		}
		const Ray& initial = rays.initialState(index);
		if (!isFiniteVector(initial.position)) {
			continue;
		}

		Polyline line;
		std::ostringstream label;
		label << "w" << index.w << "_f" << index.fx << "_" << index.fy << "_p" << index.px << "_" << index.py;
		line.label = label.str();
		line.points.push_back(initial.position);
		for (int s = 0; s < rays.getSurfaceCount(); s++) {
			const Ray& ray = rays.state(cell, s);
			if (!isFiniteVector(ray.position)) {
				break;
			}
			line.points.push_back(ray.position);
			if (!ray.alive) {
				break;
			}
		}
		lines.push_back(line);
	}
	return lines;
}

void writeLayoutCsv(const std::string& path, const std::vector<Polyline>& surfaces, const std::vector<Polyline>& rays) {
	std::ofstream out(path);
	if (!out) {
		throw IoError("could not open " + path + " for writing");
	}
	out.precision(12);
	out << "kind,label,point,x,y,z\n";
	auto writeLines = [&](const char* kind, const std::vector<Polyline>& lines) {
		for (const Polyline& line : lines) {
			for (std::size_t i = 0; i < line.points.size(); i++) {
				const glm::dvec3& p = line.points[i];
				out << kind << "," << line.label << "," << i << "," << p.x << "," << p.y << "," << p.z << "\n";
			}
		}
	};
	writeLines("surface", surfaces);
	writeLines("ray", rays);
	if (!out) {
		throw IoError("failed while writing " + path);
	}
}
