#pragma once

#include <QByteArray>
#include <QList>
#include <QString>

// One 2D cross-section to be stacked into a volume. Either a file on disk
// or an encoded image held in memory.
struct FrameSource
{
	QString path;
	QByteArray bytes;

	static FrameSource fromFile(const QString& filePath)
	{
		FrameSource source;
		source.path = filePath;
		return source;
	}

	static FrameSource fromBytes(const QByteArray& data, const QString& name = QString())
	{
		FrameSource source;
		source.path = name;
		source.bytes = data;
		return source;
	}

	bool isInMemory() const { return !bytes.isEmpty(); }

	QString displayName() const
	{
		if (!path.isEmpty())
			return path;
		return QStringLiteral("<memory:%1 bytes>").arg(bytes.size());
	}

	bool operator==(const FrameSource& other) const
	{
		return path == other.path && bytes == other.bytes;
	}
	bool operator!=(const FrameSource& other) const { return !(*this == other); }
};

using FrameSourceList = QList<FrameSource>;
