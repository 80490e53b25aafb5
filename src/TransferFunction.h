#pragma once

#include <QString>
#include <QStringList>

#include <array>
#include <vector>

// Intensity axis is normalized to [0,1] over the volume's scalar range.
struct OpacityPoint
{
	double intensity;
	double opacity;
};

struct ColorPoint
{
	double intensity;
	double r;
	double g;
	double b;
};

class TransferFunction
{
public:
	using Color = std::array<double, 3>;

	TransferFunction() = default;

	// Points are clamped to [0,1] and kept sorted; a point at an existing
	// intensity replaces it.
	void addOpacityPoint(double intensity, double opacity);
	void addColorPoint(double intensity, double r, double g, double b);
	void clear();

	const std::vector<OpacityPoint>& opacityPoints() const { return m_opacity; }
	const std::vector<ColorPoint>& colorPoints() const { return m_color; }
	bool isEmpty() const { return m_opacity.empty(); }

	// Piecewise linear; values outside the point span take the nearest endpoint.
	double opacityAt(double intensity) const;
	Color colorAt(double intensity) const;

	TransferFunction withOpacityScale(double factor) const;

	// Opacity is zero except within halfWidth of iso, rising linearly to 1 at
	// iso. Colors are taken from colorSource.
	static TransferFunction isosurface(double iso, double halfWidth, const TransferFunction& colorSource);

	bool operator==(const TransferFunction& other) const;
	bool operator!=(const TransferFunction& other) const { return !(*this == other); }

private:
	std::vector<OpacityPoint> m_opacity;
	std::vector<ColorPoint> m_color;
};

class TransferFunctionStore
{
public:
	static const QString kBone;
	static const QString kSoftTissue;
	static const QString kMrDefault;

	// Starts with the bone preset active.
	TransferFunctionStore();

	QStringList presetNames() const;
	bool hasPreset(const QString& name) const;
	// Throws std::invalid_argument for unknown names.
	const TransferFunction& preset(const QString& name) const;

	// Copies a preset into the active function.
	void setPreset(const QString& name);
	void setActive(const TransferFunction& tf);

	const TransferFunction& active() const { return m_active; }
	// Empty when the active function was edited directly.
	const QString& activePresetName() const { return m_activeName; }

private:
	std::vector<std::pair<QString, TransferFunction>> m_presets;
	TransferFunction m_active;
	QString m_activeName;
};
