#include <cmath>
#include <iostream>
#include <random>
#include <string>
#include <utility>
#include <variant>

#include "errors.h"
#include "logging.h"
#include "preset_systems.h"
#include "sensor_image.h"
#include "sensor_response.h"
#include "sequential_trace.h"

static int g_failures = 0;

static void check(bool condition, const std::string& what) {
	if (!condition) {
		std::cerr << "FAIL: " << what << std::endl;
		g_failures++;
	}
}

static bool near(double a, double b, double tolerance) {
	return std::abs(a - b) <= tolerance;
}

template <typename F>
static void checkRejected(F run, const std::string& what) {
	try {
		run();
		check(false, what);
	}
	catch (const ConfigurationError&) {
	}
}

int main() {
	setLogLevel(LogLevel::Warn);

	// one electron per photon across the visible, none below the bandgap
	check(quantumYieldIdeal(550.0) == 1.0, "visible photons yield one electron");
	check(near(quantumYieldIdeal(300.0), 1239.841984 / 300.0 / 3.65, 1e-12), "ultraviolet photons yield E / 3.65 eV");
	check(quantumYieldIdeal(1200.0) == 0.0, "photons below the bandgap yield nothing");
	check(quantumYieldIdeal(0.0) == 0.0, "non-positive wavelength yields nothing");

	SensorMaterial ccd;
	check(near(absorptionCoefficient(ccd, 500.0), 1110.0, 1e-9), "absorption at a table entry");
	check(near(absorptionCoefficient(ccd, 525.0), std::sqrt(1110.0 * 639.0), 1e-9), "log interpolation between entries");
	check(absorptionCoefficient(ccd, 250.0) == 184000.0, "clamped below the table");
	check(absorptionCoefficient(ccd, 1200.0) == 0.0, "silicon transparent past the table");

	double thick = absorbance(ccd, 550.0, 1.0);
	check(near(thick, 1.0 - std::exp(-639.0 * 0.007), 1e-12), "absorbance at normal incidence");
	check(absorbance(ccd, 550.0, 0.5) > thick, "oblique rays cross more silicon");
	check(absorbance(ccd, 1200.0, 1.0) == 0.0, "nothing absorbed past the table");

	check(chargeCollectionEfficiency(0.0, ccd.thicknessImplant, ccd.cceBacksurface, 1.0) == 1.0, "no loss without absorption");
	check(near(chargeCollectionEfficiency(1e9, ccd.thicknessImplant, ccd.cceBacksurface, 1.0), ccd.cceBacksurface, 1e-5), "surface absorption collects the back surface fraction");
	double z0 = 639.0 * ccd.thicknessImplant;
	double cce = ccd.cceBacksurface + (1.0 - ccd.cceBacksurface) / z0 * (1.0 - std::exp(-z0));
	check(near(chargeCollectionEfficiency(639.0, ccd.thicknessImplant, ccd.cceBacksurface, 1.0), cce, 1e-12), "implant loss at 550 nm");
	check(near(quantumEfficiencyEffective(ccd, 550.0, 1.0), thick * cce, 1e-12), "effective QE is absorbance times CCE");
	check(near(responsivity(ccd, 550.0, 1.0), thick * cce, 1e-12), "responsivity equals QE for single-electron photons");
	check(responsivity(ccd, 1200.0, 1.0) == 0.0, "no response below the bandgap");

	SensorMaterial unsorted = ccd;
	std::swap(unsorted.absorption[0], unsorted.absorption[1]);
	checkRejected([&] { validateMaterial(unsorted); }, "absorption table out of order");
	SensorMaterial leaky = ccd;
	leaky.cceBacksurface = 1.5;
	checkRejected([&] { validateMaterial(leaky); }, "back surface CCE above one");
	SensorMaterial empty = ccd;
	empty.absorption.clear();
	checkRejected([&] { validateMaterial(empty); }, "empty absorption table");
	SensorMaterial flat = ccd;
	flat.thicknessSubstrate = 0.0;
	checkRejected([&] { validateMaterial(flat); }, "zero substrate thickness");

	std::mt19937 rngA(7);
	std::mt19937 rngB(7);
	check(electronsMeasured(0, ccd, 550.0, 1.0, rngA) == 0, "no photons, no electrons");
	rngA.seed(7);
	long long first = electronsMeasured(100000, ccd, 550.0, 1.0, rngA);
	long long second = electronsMeasured(100000, ccd, 550.0, 1.0, rngB);
	check(first == second, "same seed, same electrons");
	check(near(static_cast<double>(first), 100000.0 * responsivity(ccd, 550.0, 1.0), 2000.0), "electrons near the expected count");

	// prime focus telescope with a transparent and a CCD sensor
	PrimeFocusParameters parameters;
	SequentialSystem plain = primeFocusTelescope(parameters);
	parameters.sensorMaterial = SensorMaterial{};
	SequentialSystem detector = primeFocusTelescope(parameters);
	check(std::holds_alternative<SensorMaterial>(detector.getSensor().getMaterial()), "preset carries the sensor material");
	const int sensorIndex = 1;

	InputGrid grid = InputGrid::uniform({ 550.0 }, 1, 1, 5, 5);
	TraceResult plainTrace = traceSystem(plain, grid, TraceSettings{});
	TraceResult detectorTrace = traceSystem(detector, grid, TraceSettings{});
	check(detectorTrace.rays.aliveCount(sensorIndex) == 13, "CCD sensor does not block rays");

	const Ray& chief = detectorTrace.rays.sensorState(GridIndex{ 0, 0, 0, 2, 2 });
	const Ray& plainChief = plainTrace.rays.sensorState(GridIndex{ 0, 0, 0, 2, 2 });
	check(chief.position == plainChief.position && chief.direction == plainChief.direction, "CCD sensor leaves the landed ray unchanged");
	check(near(std::abs(incidenceCosine(detector.getSensor(), chief)), 1.0, 1e-9), "on-axis chief ray at normal incidence");
	check(hitWeight(plain.getSensor(), plainChief) == 1.0, "transparent sensor counts one per hit");
	check(near(hitWeight(detector.getSensor(), chief), responsivity(ccd, 550.0, 1.0), 1e-9), "CCD hit weighted by responsivity");
	const Ray& corner = detectorTrace.rays.sensorState(GridIndex{ 0, 0, 0, 0, 0 });
	check(hitWeight(detector.getSensor(), corner) == 0.0, "dead ray carries no signal");

	cv::Mat plainSignal = accumulateSignal(plainTrace.rays, plain.getSensor(), sensorIndex, parameters.sensor);
	check(plainSignal.type() == CV_64FC1 && cv::sum(plainSignal)[0] == 13.0, "transparent signal equals the hit count");
	cv::Mat signal = accumulateSignal(detectorTrace.rays, detector.getSensor(), sensorIndex, parameters.sensor);
	check(near(cv::sum(signal)[0], 13.0 * responsivity(ccd, 550.0, 1.0), 0.01 * 13.0), "CCD signal is the hit count times the responsivity");
	check(cv::sum(accumulateHits(detectorTrace.rays, detector.getSensor(), sensorIndex, parameters.sensor))[0] == 13.0, "raw hit count unaffected by the material");

	cv::Mat exposure = simulateExposure(detectorTrace.rays, detector.getSensor(), sensorIndex, parameters.sensor, 10000, 42u);
	cv::Mat repeat = simulateExposure(detectorTrace.rays, detector.getSensor(), sensorIndex, parameters.sensor, 10000, 42u);
	check(exposure.type() == CV_32SC1 && cv::countNonZero(exposure != repeat) == 0, "exposure is reproducible for a seed");
	check(near(cv::sum(exposure)[0], 130000.0 * responsivity(ccd, 550.0, 1.0), 0.03 * 130000.0), "exposure near the expected electrons");
	check(cv::sum(simulateExposure(detectorTrace.rays, detector.getSensor(), sensorIndex, parameters.sensor, 0, 42u))[0] == 0.0, "dark exposure");
	checkRejected([&] { simulateExposure(plainTrace.rays, plain.getSensor(), sensorIndex, parameters.sensor, 100, 42u); }, "exposure without a sensor material");
	checkRejected([&] { simulateExposure(detectorTrace.rays, detector.getSensor(), sensorIndex, parameters.sensor, -1, 42u); }, "negative photon count");

	// infrared past the bandgap reaches the sensor but produces no signal
	InputGrid infrared = InputGrid::uniform({ 1200.0 }, 1, 1, 5, 5);
	TraceResult infraredTrace = traceSystem(detector, infrared, TraceSettings{});
	check(cv::sum(accumulateHits(infraredTrace.rays, detector.getSensor(), sensorIndex, parameters.sensor))[0] == 13.0, "infrared rays still land");
	cv::Mat dark = renderSensorImage(infraredTrace.rays, detector.getSensor(), sensorIndex, parameters.sensor);
	check(dark.type() == CV_8UC3 && cv::countNonZero(dark.reshape(1)) == 0, "rendered image weighted by the response");
	cv::Mat visible = renderSensorImage(detectorTrace.rays, detector.getSensor(), sensorIndex, parameters.sensor);
	check(cv::countNonZero(visible.reshape(1)) > 0, "visible light renders");

	if (g_failures > 0) {
		std::cerr << "[sensor_response] " << g_failures << " failures" << std::endl;
		return 1;
	}
	std::cout << "[sensor_response] ok" << std::endl;
	return 0;
}
