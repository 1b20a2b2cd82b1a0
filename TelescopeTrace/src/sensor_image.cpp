#include "sensor_image.h"

#include "errors.h"
#include "sensor_response.h"
#include "utils.h"

#include <cmath>
#include <random>
#include <variant>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace {

bool pixelOf(const Surface& sensor, const SensorFormat& format, const glm::dvec3& position, int& row, int& col) {
	glm::dvec3 local = sensor.getTransform().pointToLocal(position);
	double u = (local.x + format.halfWidthX()) / format.pixelPitch;
	double v = (format.halfWidthY() - local.y) / format.pixelPitch;
	if (!(u >= 0.0 && u < format.pixelsX && v >= 0.0 && v < format.pixelsY)) {
		return false;
	}
	col = static_cast<int>(std::floor(u));
	row = static_cast<int>(std::floor(v));
	return true;
}

}

cv::Mat accumulateHits(const RayFunction& rays, const Surface& sensor, int sensorIndex, const SensorFormat& format) {
	cv::Mat counts = cv::Mat::zeros(format.pixelsY, format.pixelsX, CV_32SC1);
	for (std::size_t cell = 0; cell < rays.getGrid().getCellCount(); cell++) {
		const Ray& ray = rays.state(cell, sensorIndex);
		int row;
		int col;
		if (ray.alive && pixelOf(sensor, format, ray.position, row, col)) {
			counts.at<int>(row, col) += 1;
		}
	}
	return counts;
}

cv::Mat accumulateSignal(const RayFunction& rays, const Surface& sensor, int sensorIndex, const SensorFormat& format) {
	cv::Mat signal = cv::Mat::zeros(format.pixelsY, format.pixelsX, CV_64FC1);
	for (std::size_t cell = 0; cell < rays.getGrid().getCellCount(); cell++) {
		const Ray& ray = rays.state(cell, sensorIndex);
		int row;
		int col;
		if (ray.alive && pixelOf(sensor, format, ray.position, row, col)) {
			signal.at<double>(row, col) += hitWeight(sensor, ray);
		}
	}
	return signal;
}

cv::Mat simulateExposure(const RayFunction& rays, const Surface& sensor, int sensorIndex, const SensorFormat& format,
	long long photonsPerRay, unsigned seed) {
	const SensorMaterial* material = std::get_if<SensorMaterial>(&sensor.getMaterial());
	if (material == nullptr) {
		throw ConfigurationError("exposure simulation needs a sensor material on '" + sensor.getName() + "'");
	}
	if (photonsPerRay < 0) {
		throw ConfigurationError("photons per ray must not be negative");
	}
	std::mt19937 rng(seed);
	cv::Mat electrons = cv::Mat::zeros(format.pixelsY, format.pixelsX, CV_32SC1);
	for (std::size_t cell = 0; cell < rays.getGrid().getCellCount(); cell++) {
		const Ray& ray = rays.state(cell, sensorIndex);
		int row;
		int col;
		if (ray.alive && pixelOf(sensor, format, ray.position, row, col)) {
			long long count = electronsMeasured(photonsPerRay, *material, ray.wavelength, incidenceCosine(sensor, ray), rng);
			electrons.at<int>(row, col) += static_cast<int>(count);
		}
	}
	return electrons;
}

cv::Mat renderSensorImage(const RayFunction& rays, const Surface& sensor, int sensorIndex, const SensorFormat& format) {
	cv::Mat accumulated = cv::Mat::zeros(format.pixelsY, format.pixelsX, CV_32FC3);
	for (std::size_t cell = 0; cell < rays.getGrid().getCellCount(); cell++) {
		const Ray& ray = rays.state(cell, sensorIndex);
		int row;
		int col;
		if (ray.alive && pixelOf(sensor, format, ray.position, row, col)) {
			glm::dvec3 rgb = wavelengthToRGB(ray.wavelength);
			if (rgb == glm::dvec3(0.0)) {
				// outside the visible band
				rgb = glm::dvec3(1.0);
			}
			rgb *= hitWeight(sensor, ray);
			accumulated.at<cv::Vec3f>(row, col) += cv::Vec3f(static_cast<float>(rgb.b), static_cast<float>(rgb.g), static_cast<float>(rgb.r));
		}
	}

	cv::Mat image;
	double maxValue = 0.0;
	cv::minMaxLoc(accumulated.reshape(1), nullptr, &maxValue);
	if (maxValue > 0.0) {
		accumulated.convertTo(image, CV_8UC3, 255.0 / maxValue);
	}
	else {
		image = cv::Mat::zeros(format.pixelsY, format.pixelsX, CV_8UC3);
	}
	return image;
}

void writeSensorImage(const std::string& path, const cv::Mat& image) {
	bool written = false;
	try {
		written = cv::imwrite(path, image);
	}
	catch (const cv::Exception& e) {
		throw IoError("could not write " + path + ": " + e.what());
	}
	if (!written) {
		throw IoError("could not write " + path);
	}
}
