#include "ray_table_csv.h"

#include "errors.h"

#include <fstream>

void writeRayTable(std::ostream& out, const RayFunction& rays) {
	const InputGrid& grid = rays.getGrid();
	out.precision(12);
	out << "w,fx,fy,px,py,surface,wavelength,field_x,field_y,pupil_x,pupil_y,x,y,z,dx,dy,dz,alive,status\n";
	for (std::size_t cell = 0; cell < grid.getCellCount(); cell++) {
		GridIndex index = grid.gridIndex(cell);
		for (int s = 0; s < rays.getSurfaceCount(); s++) {
			const Ray& ray = rays.state(cell, s);
			out << index.w << "," << index.fx << "," << index.fy << "," << index.px << "," << index.py << "," << s << ","
				<< grid.getWavelengths()[index.w] << "," << grid.getFieldX()[index.fx] << "," << grid.getFieldY()[index.fy] << ","
				<< grid.getPupilX()[index.px] << "," << grid.getPupilY()[index.py] << ","
				<< ray.position.x << "," << ray.position.y << "," << ray.position.z << ","
				<< ray.direction.x << "," << ray.direction.y << "," << ray.direction.z << ","
				<< (ray.alive ? 1 : 0) << "," << toString(ray.status) << "\n";
		}
	}
}

void writeRayTable(const std::string& path, const RayFunction& rays) {
	std::ofstream out(path);
	if (!out) {
		throw IoError("could not open " + path + " for writing");
	}
	writeRayTable(out, rays);
	if (!out) {
		throw IoError("failed while writing " + path);
	}
}
