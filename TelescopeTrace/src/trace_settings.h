#pragma once

#include "parallel.h"

struct TraceSettings {
	double launchPlaneZ = 0.0;   // global z of the plane rays are launched from
	double aimTolerance = 1e-9;  // relative to the pupil stop extent
	double aimStep = 1e-6;       // finite-difference step, relative to the pupil stop extent
	int aimIterations = 20;
	double fieldTolerance = 1e-10; // relative to the field stop extent, tighter than the aperture rim tolerance
	int fieldIterations = 50;
	ParallelOptions parallel;
};
