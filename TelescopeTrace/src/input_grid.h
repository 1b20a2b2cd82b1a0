#pragma once

#include <cstddef>
#include <vector>

struct GridShape {
	int wavelengths = 0;
	int fieldX = 0;
	int fieldY = 0;
	int pupilX = 0;
	int pupilY = 0;

	std::size_t cellCount() const;
	bool operator==(const GridShape& other) const = default;
};

struct GridIndex {
	int w = 0;
	int fx = 0;
	int fy = 0;
	int px = 0;
	int py = 0;
};

// Wavelengths x field(x, y) x pupil(x, y) with normalized field and pupil coordinates in [-1, 1].
// Cells are laid out with the wavelength axis outermost and pupil y innermost.
class InputGrid {
public:
	// Throws ConfigurationError for empty axes, coordinates outside [-1, 1] or non-positive wavelengths.
	InputGrid(std::vector<double> wavelengths, std::vector<double> fieldX, std::vector<double> fieldY,
		std::vector<double> pupilX, std::vector<double> pupilY);

	// Evenly spaced field and pupil axes spanning [-1, 1].
	static InputGrid uniform(std::vector<double> wavelengths, int fieldXCount, int fieldYCount, int pupilXCount, int pupilYCount);

	GridShape getShape() const;
	std::size_t getCellCount() const;
	std::size_t flatIndex(const GridIndex& index) const;
	GridIndex gridIndex(std::size_t flat) const;

	const std::vector<double>& getWavelengths() const;
	const std::vector<double>& getFieldX() const;
	const std::vector<double>& getFieldY() const;
	const std::vector<double>& getPupilX() const;
	const std::vector<double>& getPupilY() const;

private:
	std::vector<double> m_wavelengths;
	std::vector<double> m_field_x;
	std::vector<double> m_field_y;
	std::vector<double> m_pupil_x;
	std::vector<double> m_pupil_y;
};
