#pragma once

#include "ray_function.h"
#include "sensor_format.h"
#include "surface.h"

#include <opencv2/core.hpp>
#include <string>

// Hit counts per pixel (CV_32SC1), row 0 at the top (+y). Rays outside the pixel grid are skipped.
cv::Mat accumulateHits(const RayFunction& rays, const Surface& sensor, int sensorIndex, const SensorFormat& format);

// Expected electrons per pixel (CV_64FC1), each hit weighted by the sensor material's responsivity.
// Sensors without a SensorMaterial count every hit as one electron.
cv::Mat accumulateSignal(const RayFunction& rays, const Surface& sensor, int sensorIndex, const SensorFormat& format);

// Electrons per pixel (CV_32SC1) for `photonsPerRay` photons carried by each alive ray, with shot noise
// and collection losses drawn from a generator seeded with `seed`. Needs a SensorMaterial.
cv::Mat simulateExposure(const RayFunction& rays, const Surface& sensor, int sensorIndex, const SensorFormat& format,
	long long photonsPerRay, unsigned seed);

// 8 bit BGR image, each hit coloured by its wavelength and weighted like accumulateSignal,
// the result normalized to full scale.
cv::Mat renderSensorImage(const RayFunction& rays, const Surface& sensor, int sensorIndex, const SensorFormat& format);

// Throws IoError when the image cannot be written.
void writeSensorImage(const std::string& path, const cv::Mat& image);
