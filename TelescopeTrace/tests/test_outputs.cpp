#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "errors.h"
#include "layout_sampler.h"
#include "logging.h"
#include "preset_systems.h"
#include "ray_table_csv.h"
#include "sensor_image.h"
#include "sequential_trace.h"

static int g_failures = 0;

static void check(bool condition, const std::string& what) {
	if (!condition) {
		std::cerr << "FAIL: " << what << std::endl;
		g_failures++;
	}
}

static int countLines(std::istream& in) {
	int lines = 0;
	std::string line;
	while (std::getline(in, line)) {
		lines++;
	}
	return lines;
}

template <typename F>
static void checkIoError(F run, const std::string& what) {
	try {
		run();
		check(false, what);
	}
	catch (const IoError&) {
	}
}

int main() {
	setLogLevel(LogLevel::Warn);

	PrimeFocusParameters parameters;
	SequentialSystem system = primeFocusTelescope(parameters);
	InputGrid grid = InputGrid::uniform({ 550.0 }, 1, 1, 5, 5);
	TraceResult result = traceSystem(system, grid, TraceSettings{});
	const RayFunction& rays = result.rays;
	const int sensorIndex = 1;
	std::filesystem::path scratch = std::filesystem::temp_directory_path();
	const std::string missingDir = "/nonexistent-telescope-trace-dir/";

	std::ostringstream table;
	writeRayTable(table, rays);
	std::istringstream tableIn(table.str());
	std::string header;
	std::getline(tableIn, header);
	check(header.rfind("w,fx,fy,px,py,surface,", 0) == 0, "ray table header");
	check(countLines(tableIn) == 25 * 2, "one row per cell and surface");
	check(table.str().find("vignetted") != std::string::npos, "dead rows carry their status");
	checkIoError([&] { writeRayTable(missingDir + "rays.csv", rays); }, "ray table in a missing directory");

	std::string tablePath = (scratch / "telescope_trace_rays.csv").string();
	writeRayTable(tablePath, rays);
	std::ifstream tableFile(tablePath);
	check(countLines(tableFile) == 51, "ray table file written");
	tableFile.close();
	std::filesystem::remove(tablePath);

	// all 13 on-axis rays land in the central pixels
	cv::Mat counts = accumulateHits(rays, system.getSensor(), sensorIndex, parameters.sensor);
	check(counts.rows == 1024 && counts.cols == 1024 && counts.type() == CV_32SC1, "hit count image format");
	check(cv::sum(counts)[0] == 13.0, "every alive ray counted once");
	check(counts.at<int>(511, 511) + counts.at<int>(511, 512) + counts.at<int>(512, 511) + counts.at<int>(512, 512) == 13, "hits at the image centre");

	cv::Mat image = renderSensorImage(rays, system.getSensor(), sensorIndex, parameters.sensor);
	check(image.type() == CV_8UC3, "rendered image is 8 bit BGR");
	double maxValue = 0.0;
	cv::minMaxLoc(image.reshape(1), nullptr, &maxValue);
	check(maxValue == 255.0, "brightest pixel at full scale");
	checkIoError([&] { writeSensorImage(missingDir + "sensor.png", image); }, "image in a missing directory");

	LayoutSampler sampler(system, 9);
	std::vector<Polyline> surfaces = sampler.sampleSurfaces();
	check(surfaces.size() == 2 && surfaces[0].label == "primary" && surfaces[0].points.size() == 9, "surface profiles");
	std::vector<Polyline> paths = sampler.sampleRays(rays, true);
	check(paths.size() == 5, "meridional fan of the central pupil column");
	check(paths[2].points.size() == 3 && paths[2].points[0].z == 0.0, "launch, primary and sensor points");
	check(sampler.sampleRays(rays, false).size() == 25, "every aimed ray has a path");

	// the sampler owns its copy of the system
	LayoutSampler detached(primeFocusTelescope(parameters), 9);
	std::vector<Polyline> detachedSurfaces = detached.sampleSurfaces();
	check(detachedSurfaces.size() == 2 && detachedSurfaces[1].label == surfaces[1].label, "sampler built from a temporary system");
	check(detachedSurfaces[0].points.size() == 9 && detachedSurfaces[0].points[4] == surfaces[0].points[4], "temporary system samples like the original");
	check(detached.sampleRays(rays, true).size() == 5, "ray paths from a sampler built from a temporary");

	std::string layoutPath = (scratch / "telescope_trace_layout.csv").string();
	writeLayoutCsv(layoutPath, surfaces, paths);
	std::ifstream layoutFile(layoutPath);
	check(countLines(layoutFile) == 1 + 2 * 9 + 5 * 3, "layout rows");
	layoutFile.close();
	std::filesystem::remove(layoutPath);
	checkIoError([&] { writeLayoutCsv(missingDir + "layout.csv", surfaces, paths); }, "layout in a missing directory");

	if (g_failures > 0) {
		std::cerr << "[outputs] " << g_failures << " failures" << std::endl;
		return 1;
	}
	std::cout << "[outputs] ok" << std::endl;
	return 0;
}
