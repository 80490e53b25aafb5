#include "TransferFunction.h"

#include <algorithm>
#include <stdexcept>

namespace
{
	double clamp01(double v)
	{
		return std::clamp(v, 0.0, 1.0);
	}

	template <typename Point>
	void insertSorted(std::vector<Point>& points, const Point& point)
	{
		auto it = std::lower_bound(points.begin(), points.end(), point.intensity,
			[](const Point& p, double t) { return p.intensity < t; });
		if (it != points.end() && it->intensity == point.intensity)
			*it = point;
		else
			points.insert(it, point);
	}

	// index of the segment [i, i+1] containing t, with t already inside the span
	template <typename Point>
	size_t segmentFor(const std::vector<Point>& points, double t)
	{
		auto it = std::upper_bound(points.begin(), points.end(), t,
			[](double value, const Point& p) { return value < p.intensity; });
		return static_cast<size_t>(std::distance(points.begin(), it)) - 1;
	}

	double fraction(double t, double a, double b)
	{
		return b > a ? (t - a) / (b - a) : 0.0;
	}
}

void TransferFunction::addOpacityPoint(double intensity, double opacity)
{
	insertSorted(m_opacity, OpacityPoint{ clamp01(intensity), clamp01(opacity) });
}

void TransferFunction::addColorPoint(double intensity, double r, double g, double b)
{
	insertSorted(m_color, ColorPoint{ clamp01(intensity), clamp01(r), clamp01(g), clamp01(b) });
}

void TransferFunction::clear()
{
	m_opacity.clear();
	m_color.clear();
}

double TransferFunction::opacityAt(double t) const
{
	if (m_opacity.empty())
		return 0.0;
	if (t <= m_opacity.front().intensity)
		return m_opacity.front().opacity;
	if (t >= m_opacity.back().intensity)
		return m_opacity.back().opacity;

	const size_t i = segmentFor(m_opacity, t);
	const OpacityPoint& a = m_opacity[i];
	const OpacityPoint& b = m_opacity[i + 1];
	return a.opacity + (b.opacity - a.opacity) * fraction(t, a.intensity, b.intensity);
}

TransferFunction::Color TransferFunction::colorAt(double t) const
{
	if (m_color.empty())
		return { 1.0, 1.0, 1.0 };
	if (t <= m_color.front().intensity) {
		const ColorPoint& p = m_color.front();
		return { p.r, p.g, p.b };
	}
	if (t >= m_color.back().intensity) {
		const ColorPoint& p = m_color.back();
		return { p.r, p.g, p.b };
	}

	const size_t i = segmentFor(m_color, t);
	const ColorPoint& a = m_color[i];
	const ColorPoint& b = m_color[i + 1];
	const double f = fraction(t, a.intensity, b.intensity);
	return { a.r + (b.r - a.r) * f, a.g + (b.g - a.g) * f, a.b + (b.b - a.b) * f };
}

TransferFunction TransferFunction::withOpacityScale(double factor) const
{
	TransferFunction scaled;
	scaled.m_color = m_color;
	for (const OpacityPoint& p : m_opacity)
		scaled.addOpacityPoint(p.intensity, p.opacity * factor);
	return scaled;
}

TransferFunction TransferFunction::isosurface(double iso, double halfWidth, const TransferFunction& colorSource)
{
	TransferFunction tf;
	tf.m_color = colorSource.m_color;

	iso = clamp01(iso);
	tf.addOpacityPoint(0.0, 0.0);
	tf.addOpacityPoint(1.0, 0.0);
	if (iso - halfWidth > 0.0)
		tf.addOpacityPoint(iso - halfWidth, 0.0);
	if (iso + halfWidth < 1.0)
		tf.addOpacityPoint(iso + halfWidth, 0.0);
	tf.addOpacityPoint(iso, 1.0);
	return tf;
}

bool TransferFunction::operator==(const TransferFunction& other) const
{
	auto sameOpacity = [](const OpacityPoint& a, const OpacityPoint& b) {
		return a.intensity == b.intensity && a.opacity == b.opacity;
	};
	auto sameColor = [](const ColorPoint& a, const ColorPoint& b) {
		return a.intensity == b.intensity && a.r == b.r && a.g == b.g && a.b == b.b;
	};
	return std::equal(m_opacity.begin(), m_opacity.end(), other.m_opacity.begin(), other.m_opacity.end(), sameOpacity)
		&& std::equal(m_color.begin(), m_color.end(), other.m_color.begin(), other.m_color.end(), sameColor);
}

const QString TransferFunctionStore::kBone = QStringLiteral("CT-Bone");
const QString TransferFunctionStore::kSoftTissue = QStringLiteral("CT-Soft-Tissue");
const QString TransferFunctionStore::kMrDefault = QStringLiteral("MR-Default");

TransferFunctionStore::TransferFunctionStore()
{
	TransferFunction bone;
	bone.addOpacityPoint(0.0, 0.0);
	bone.addOpacityPoint(0.3, 0.0);
	bone.addOpacityPoint(0.5, 0.5);
	bone.addOpacityPoint(1.0, 0.9);
	bone.addColorPoint(0.0, 0.0, 0.0, 0.0);
	bone.addColorPoint(0.5, 0.8, 0.7, 0.6);
	bone.addColorPoint(1.0, 1.0, 1.0, 1.0);
	m_presets.emplace_back(kBone, bone);

	TransferFunction soft;
	soft.addOpacityPoint(0.0, 0.0);
	soft.addOpacityPoint(0.2, 0.1);
	soft.addOpacityPoint(0.5, 0.3);
	soft.addOpacityPoint(1.0, 0.7);
	soft.addColorPoint(0.0, 0.0, 0.0, 0.0);
	soft.addColorPoint(0.3, 0.5, 0.3, 0.2);
	soft.addColorPoint(0.7, 0.9, 0.7, 0.6);
	soft.addColorPoint(1.0, 1.0, 0.9, 0.8);
	m_presets.emplace_back(kSoftTissue, soft);

	TransferFunction mr;
	mr.addOpacityPoint(0.0, 0.0);
	mr.addOpacityPoint(0.1, 0.1);
	mr.addOpacityPoint(0.5, 0.5);
	mr.addOpacityPoint(1.0, 0.9);
	mr.addColorPoint(0.0, 0.0, 0.0, 0.0);
	mr.addColorPoint(0.5, 0.5, 0.5, 0.7);
	mr.addColorPoint(1.0, 0.9, 0.9, 1.0);
	m_presets.emplace_back(kMrDefault, mr);

	setPreset(kBone);
}

QStringList TransferFunctionStore::presetNames() const
{
	QStringList names;
	for (const auto& entry : m_presets)
		names << entry.first;
	return names;
}

bool TransferFunctionStore::hasPreset(const QString& name) const
{
	return std::any_of(m_presets.begin(), m_presets.end(),
		[&name](const auto& entry) { return entry.first == name; });
}

const TransferFunction& TransferFunctionStore::preset(const QString& name) const
{
	for (const auto& entry : m_presets) {
		if (entry.first == name)
			return entry.second;
	}
	throw std::invalid_argument("Unknown transfer function preset: " + name.toStdString());
}

void TransferFunctionStore::setPreset(const QString& name)
{
	m_active = preset(name);
	m_activeName = name;
}

void TransferFunctionStore::setActive(const TransferFunction& tf)
{
	m_active = tf;
	m_activeName.clear();
}
