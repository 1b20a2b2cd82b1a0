#include <atomic>
#include <cmath>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "errors.h"
#include "focus_solver.h"
#include "input_grid.h"
#include "layout_sampler.h"
#include "logging.h"
#include "paraxial_model.h"
#include "preset_systems.h"
#include "ray_table_csv.h"
#include "run_config.h"
#include "sensor_image.h"
#include "sensor_response.h"
#include "sequential_trace.h"
#include "spot_analysis.h"

namespace {

std::atomic<bool> g_cancel{ false };

void onInterrupt(int) {
	g_cancel.store(true);
}

}

class Application {
public:
	explicit Application(const RunConfig& config)
		: m_config(config), m_system(buildSystem(config)) {
		m_settings.parallel.numThreads = config.threads;
		m_settings.parallel.chunkSize = config.chunkSize;
		m_settings.parallel.cancel = &g_cancel;
	}

	int run() {
		InputGrid grid = InputGrid::uniform(m_config.wavelengths, m_config.fieldX, m_config.fieldY, m_config.pupilX, m_config.pupilY);
		printParaxial();

		TraceResult result = traceSystem(m_system, grid, m_settings);
		printSpots(result.rays);
		printSensorResponse(result.rays);

		if (m_config.bestFocus) {
			FocusSettings focus;
			focus.searchRange = m_config.focusRange;
			focus.generations = static_cast<unsigned>(m_config.focusGenerations);
			FocusResult best = solveBestFocus(m_system, grid, result.resolution, m_settings, focus);
			std::cout << "Best focus: sensor shift " << best.sensorShift << ", mean RMS radius " << best.rmsRadius
				<< " (nominal " << best.nominalRmsRadius << ")" << std::endl;
		}

		int sensorIndex = m_system.getSurfaceCount() - 1;
		if (!m_config.rayTablePath.empty()) {
			writeRayTable(m_config.rayTablePath, result.rays);
			std::cout << "Ray table written to " << m_config.rayTablePath << std::endl;
		}
		if (!m_config.imagePath.empty()) {
			cv::Mat image = renderSensorImage(result.rays, m_system.getSensor(), sensorIndex, m_config.sensor);
			writeSensorImage(m_config.imagePath, image);
			std::cout << "Sensor image written to " << m_config.imagePath << std::endl;
		}
		if (!m_config.layoutPath.empty()) {
			LayoutSampler sampler(m_system, 65);
			writeLayoutCsv(m_config.layoutPath, sampler.sampleSurfaces(), sampler.sampleRays(result.rays, true));
			std::cout << "Layout written to " << m_config.layoutPath << std::endl;
		}
		return 0;
	}

private:
	static Material sensorMaterial(const RunConfig& config) {
		if (config.sensorMaterial == "ccd") {
			return SensorMaterial{};
		}
		return TransparentMaterial{};
	}

	static SequentialSystem buildSystem(const RunConfig& config) {
		if (config.preset == "newtonian") {
			NewtonianParameters parameters;
			parameters.apertureRadius = config.apertureRadius;
			parameters.focalLength = config.focalLength;
			parameters.obscurationRadius = config.obscurationRadius;
			parameters.mirrorDistance = config.mirrorDistance;
			parameters.diagonalOffset = config.diagonalOffset;
			parameters.diagonalRadius = config.diagonalRadius;
			parameters.sensor = config.sensor;
			parameters.sensorMaterial = sensorMaterial(config);
			return newtonianTelescope(parameters);
		}
		PrimeFocusParameters parameters;
		parameters.apertureRadius = config.apertureRadius;
		parameters.focalLength = config.focalLength;
		parameters.obscurationRadius = config.obscurationRadius;
		parameters.mirrorDistance = config.mirrorDistance;
		parameters.sensor = config.sensor;
		parameters.sensorMaterial = sensorMaterial(config);
		return primeFocusTelescope(parameters);
	}

	void printParaxial() const {
		ParaxialModel model = paraxialModel(m_system, m_config.wavelengths.front());
		std::cout << "Effective focal length: " << model.effectiveFocalLength << std::endl;
		std::cout << "Back focal distance:    " << model.backFocalDistance << std::endl;
		std::cout << "Sensor defocus:         " << model.defocus << std::endl;
		std::cout << "f-number:               " << model.fNumber << std::endl;
	}

	void printSpots(const RayFunction& rays) const {
		const InputGrid& grid = rays.getGrid();
		GridShape shape = grid.getShape();
		int sensorIndex = m_system.getSurfaceCount() - 1;
		std::cout << "Spots on sensor (local mm):" << std::endl;
		std::cout << std::setw(10) << "lambda" << std::setw(8) << "fx" << std::setw(8) << "fy" << std::setw(14) << "cx" << std::setw(14) << "cy"
			<< std::setw(14) << "rms" << std::setw(14) << "geo" << std::setw(8) << "alive" << std::endl;
		for (int w = 0; w < shape.wavelengths; w++) {
			for (int fx = 0; fx < shape.fieldX; fx++) {
				for (int fy = 0; fy < shape.fieldY; fy++) {
					SpotStatistics spot = spotStatistics(rays, m_system.getSensor(), sensorIndex, w, fx, fy);
					std::cout << std::setw(10) << grid.getWavelengths()[w] << std::setw(8) << grid.getFieldX()[fx] << std::setw(8) << grid.getFieldY()[fy]
						<< std::setw(14) << spot.centroid.x << std::setw(14) << spot.centroid.y << std::setw(14) << spot.rmsRadius
						<< std::setw(14) << spot.geometricRadius << std::setw(8) << spot.alive << std::endl;
				}
			}
		}
		std::cout << "Mean RMS radius: " << meanRmsRadius(rays, m_system.getSensor(), sensorIndex)
			<< " (pixel pitch " << m_config.sensor.pixelPitch << ")" << std::endl;
	}

	void printSensorResponse(const RayFunction& rays) const {
		const SensorMaterial* material = std::get_if<SensorMaterial>(&m_system.getSensor().getMaterial());
		if (material == nullptr) {
			return;
		}
		std::cout << "CCD response at normal incidence:" << std::endl;
		for (double wavelength : m_config.wavelengths) {
			std::cout << std::setw(10) << wavelength << " nm: QE " << quantumEfficiencyEffective(*material, wavelength, 1.0)
				<< ", " << responsivity(*material, wavelength, 1.0) << " e-/photon" << std::endl;
		}
		int sensorIndex = m_system.getSurfaceCount() - 1;
		cv::Mat signal = accumulateSignal(rays, m_system.getSensor(), sensorIndex, m_config.sensor);
		std::cout << "Expected electrons per photon per ray, summed: " << cv::sum(signal)[0] << std::endl;
		if (m_config.exposurePhotons > 0) {
			cv::Mat exposure = simulateExposure(rays, m_system.getSensor(), sensorIndex, m_config.sensor, m_config.exposurePhotons, 42u);
			double peak = 0.0;
			cv::minMaxLoc(exposure, nullptr, &peak);
			std::cout << "Simulated exposure of " << m_config.exposurePhotons << " photons per ray: "
				<< cv::sum(exposure)[0] << " electrons, peak pixel " << peak << std::endl;
		}
	}

	RunConfig m_config;
	SequentialSystem m_system;
	TraceSettings m_settings;
};

int main(int argc, char** argv)
{
	std::vector<std::string> args(argv + 1, argv + argc);
	for (const std::string& arg : args) {
		if (arg == "--help" || arg == "-h") {
			std::cout << usage();
			return 0;
		}
	}

	try {
		RunConfig config = parseArguments(args);
		setLogLevel(config.logLevel);
		std::signal(SIGINT, onInterrupt);

		Application app(config);
		return app.run();
	}
	catch (const ConfigurationError& e) {
		std::cerr << "configuration error: " << e.what() << "\n" << usage();
		return 2;
	}
	catch (const CancelledError& e) {
		std::cerr << "cancelled: " << e.what() << std::endl;
		return 130;
	}
	catch (const TraceError& e) {
		std::cerr << "error: " << e.what() << std::endl;
		return 1;
	}
	catch (const std::exception& e) {
		std::cerr << "unexpected error: " << e.what() << std::endl;
		return 1;
	}
}
