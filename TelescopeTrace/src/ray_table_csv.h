#pragma once

#include "ray_function.h"

#include <ostream>
#include <string>

// One row per (wavelength, field x, field y, pupil x, pupil y, surface) with the ray state after that surface.
void writeRayTable(std::ostream& out, const RayFunction& rays);
// Throws IoError when the file cannot be written.
void writeRayTable(const std::string& path, const RayFunction& rays);
