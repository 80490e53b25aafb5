#include "RenderCache.h"

QString RenderCache::keyFor(const VolumeCamera& camera, RenderMode mode, QualityTier tier)
{
	const auto& p = camera.position();
	return QStringLiteral("%1,%2,%3-%4-%5")
		.arg(p[0], 0, 'f', 1)
		.arg(p[1], 0, 'f', 1)
		.arg(p[2], 0, 'f', 1)
		.arg(renderModeName(mode))
		.arg(qualityTierName(tier));
}

bool RenderCache::lookup(const QString& key, QImage* image) const
{
	auto it = m_frames.constFind(key);
	if (it == m_frames.constEnd())
		return false;
	if (image)
		*image = it.value();
	return true;
}

void RenderCache::insert(const QString& key, const QImage& image)
{
	if (m_frames.contains(key)) {
		m_frames[key] = image;
		return;
	}

	while (m_order.size() >= kCapacity)
		m_frames.remove(m_order.dequeue());

	m_order.enqueue(key);
	m_frames.insert(key, image);
}

void RenderCache::clear()
{
	m_frames.clear();
	m_order.clear();
}
