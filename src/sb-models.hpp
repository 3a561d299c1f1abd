#pragma once

#include "sb-clip-scheduler.hpp"
#include "sb-duration-splitter.hpp"
#include "sb-time-codec.hpp"

#include <QJsonObject>
#include <QString>

#include <cstdint>

namespace sb {

struct ExportSettings {
	int frame_rate = default_frame_rate();
	int64_t gap_threshold_frames = default_gap_threshold_frames();
	double split_seconds = default_split_seconds();
	int width = 1920;
	int height = 1080;
	QString fcpxml_version = "1.13";
	QString project_name;
};

QJsonObject export_settings_to_json(const ExportSettings &settings);
ExportSettings export_settings_from_json(const QJsonObject &json_obj);

bool load_export_settings(const QString &path, ExportSettings *settings, QString *error);
bool save_export_settings(const QString &path, const ExportSettings &settings, QString *error);

} // namespace sb
