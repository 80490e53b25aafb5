#pragma once

#include "RenderSettings.h"
#include "VolumeCamera.h"

#include <QHash>
#include <QImage>
#include <QQueue>
#include <QString>

// Bounded memo of finished frames. Eviction is strictly by insertion order;
// reading an entry does not extend its life.
class RenderCache
{
public:
	static constexpr int kCapacity = 20;

	static QString keyFor(const VolumeCamera& camera, RenderMode mode, QualityTier tier);

	bool lookup(const QString& key, QImage* image) const;
	void insert(const QString& key, const QImage& image);
	void clear();

	int size() const { return m_frames.size(); }
	bool contains(const QString& key) const { return m_frames.contains(key); }

private:
	QHash<QString, QImage> m_frames;
	QQueue<QString> m_order;
};
