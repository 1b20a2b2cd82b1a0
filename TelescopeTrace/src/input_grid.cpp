#include "input_grid.h"

#include "errors.h"
#include "utils.h"

#include <cmath>
#include <string>
#include <utility>

namespace {

void validateNormalizedAxis(const std::vector<double>& axis, const std::string& name) {
	if (axis.empty()) {
		throw ConfigurationError(name + " axis is empty");
	}
	for (double value : axis) {
		if (!(value >= -1.0 && value <= 1.0)) {
			throw ConfigurationError(name + " coordinate " + std::to_string(value) + " outside [-1, 1]");
		}
	}
}

}

std::size_t GridShape::cellCount() const {
	if (wavelengths <= 0 || fieldX <= 0 || fieldY <= 0 || pupilX <= 0 || pupilY <= 0) {
		return 0;
	}
	return static_cast<std::size_t>(wavelengths) * fieldX * fieldY * pupilX * pupilY;
}

InputGrid::InputGrid(std::vector<double> wavelengths, std::vector<double> fieldX, std::vector<double> fieldY,
	std::vector<double> pupilX, std::vector<double> pupilY)
	: m_wavelengths(std::move(wavelengths)), m_field_x(std::move(fieldX)), m_field_y(std::move(fieldY)),
	m_pupil_x(std::move(pupilX)), m_pupil_y(std::move(pupilY)) {
	if (m_wavelengths.empty()) {
		throw ConfigurationError("wavelength axis is empty");
	}
	for (double wavelength : m_wavelengths) {
		if (!(wavelength > 0.0) || !std::isfinite(wavelength)) {
			throw ConfigurationError("wavelengths must be positive and finite");
		}
	}
	validateNormalizedAxis(m_field_x, "field x");
	validateNormalizedAxis(m_field_y, "field y");
	validateNormalizedAxis(m_pupil_x, "pupil x");
	validateNormalizedAxis(m_pupil_y, "pupil y");
}

InputGrid InputGrid::uniform(std::vector<double> wavelengths, int fieldXCount, int fieldYCount, int pupilXCount, int pupilYCount) {
	return InputGrid(std::move(wavelengths), linspace(-1.0, 1.0, fieldXCount), linspace(-1.0, 1.0, fieldYCount),
		linspace(-1.0, 1.0, pupilXCount), linspace(-1.0, 1.0, pupilYCount));
}

GridShape InputGrid::getShape() const {
	GridShape shape;
	shape.wavelengths = static_cast<int>(m_wavelengths.size());
	shape.fieldX = static_cast<int>(m_field_x.size());
	shape.fieldY = static_cast<int>(m_field_y.size());
	shape.pupilX = static_cast<int>(m_pupil_x.size());
	shape.pupilY = static_cast<int>(m_pupil_y.size());
	return shape;
}

std::size_t InputGrid::getCellCount() const {
	return getShape().cellCount();
}

std::size_t InputGrid::flatIndex(const GridIndex& index) const {
	GridShape shape = getShape();
	std::size_t flat = index.w;
	flat = flat * shape.fieldX + index.fx;
	flat = flat * shape.fieldY + index.fy;
	flat = flat * shape.pupilX + index.px;
	flat = flat * shape.pupilY + index.py;
	return flat;
}

GridIndex InputGrid::gridIndex(std::size_t flat) const {
	GridShape shape = getShape();
	GridIndex index;
	index.py = static_cast<int>(flat % shape.pupilY);
	flat /= shape.pupilY;
	index.px = static_cast<int>(flat % shape.pupilX);
	flat /= shape.pupilX;
	index.fy = static_cast<int>(flat % shape.fieldY);
	flat /= shape.fieldY;
	index.fx = static_cast<int>(flat % shape.fieldX);
	flat /= shape.fieldX;
	index.w = static_cast<int>(flat);
	return index;
}

const std::vector<double>& InputGrid::getWavelengths() const {
	return m_wavelengths;
}

const std::vector<double>& InputGrid::getFieldX() const {
	return m_field_x;
}

const std::vector<double>& InputGrid::getFieldY() const {
	return m_field_y;
}

const std::vector<double>& InputGrid::getPupilX() const {
	return m_pupil_x;
}

const std::vector<double>& InputGrid::getPupilY() const {
	return m_pupil_y;
}
