#pragma once

#include "sb-errors.hpp"
#include "sb-time-codec.hpp"
#include "sb-timeline-data.hpp"

#include <QString>
#include <QTextStream>
#include <QVector>

#include <cstdint>

namespace sb {

struct FcpxmlDocumentInput {
	QString title;
	QString project_name;
	QVector<AssetResource> assets;
	QVector<SpineElement> spine;
	int64_t sequence_duration_frames = 0;
	int fps = default_frame_rate();
	int width = 1920;
	int height = 1080;
	QString version = "1.13";
};

class FcpxmlWriter {
public:
	static QString artifact_path_for_title(const QString &output_dir, const QString &title);
	static QString time_from_frames(int64_t frames, int fps);
	static QString frame_duration(int fps);
	static QString xml_escape(const QString &value);

	bool write_document(const QString &output_path, const FcpxmlDocumentInput &input, QString *error) const;
	QString build_document(const FcpxmlDocumentInput &input) const;

private:
	void append_assets(QTextStream &stream, const QVector<AssetResource> &assets) const;
	void append_spine(QTextStream &stream, const QVector<SpineElement> &spine, int fps) const;
};

} // namespace sb
