#pragma once

// Pixel grid of a sensor, centred on its local axis.
struct SensorFormat {
	double pixelPitch = 0.015;
	int pixelsX = 1024;
	int pixelsY = 1024;

	double halfWidthX() const { return 0.5 * pixelPitch * pixelsX; }
	double halfWidthY() const { return 0.5 * pixelPitch * pixelsY; }
};
