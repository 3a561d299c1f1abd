#include "sb-models.hpp"

#include "sb-json-io.hpp"

#include <QFileInfo>

namespace sb {

QJsonObject export_settings_to_json(const ExportSettings &settings)
{
	QJsonObject json_obj;
	json_obj.insert("frameRate", settings.frame_rate);
	json_obj.insert("gapThresholdFrames", static_cast<qint64>(settings.gap_threshold_frames));
	json_obj.insert("splitSeconds", settings.split_seconds);
	json_obj.insert("width", settings.width);
	json_obj.insert("height", settings.height);
	json_obj.insert("fcpxmlVersion", settings.fcpxml_version);
	json_obj.insert("projectName", settings.project_name);
	return json_obj;
}

ExportSettings export_settings_from_json(const QJsonObject &json_obj)
{
	ExportSettings settings;
	if (json_obj.isEmpty())
		return settings;

	const int frame_rate = json_obj.value("frameRate").toInt(settings.frame_rate);
	if (frame_rate > 0)
		settings.frame_rate = frame_rate;

	const qint64 gap_threshold = json_obj.value("gapThresholdFrames").toInteger(settings.gap_threshold_frames);
	if (gap_threshold >= 0)
		settings.gap_threshold_frames = gap_threshold;

	const double split_seconds = json_obj.value("splitSeconds").toDouble(settings.split_seconds);
	if (split_seconds > 0.0)
		settings.split_seconds = split_seconds;

	const int width = json_obj.value("width").toInt(settings.width);
	const int height = json_obj.value("height").toInt(settings.height);
	if (width > 0 && height > 0) {
		settings.width = width;
		settings.height = height;
	}

	const QString version = json_obj.value("fcpxmlVersion").toString();
	if (!version.isEmpty())
		settings.fcpxml_version = version;
	settings.project_name = json_obj.value("projectName").toString();
	return settings;
}

bool load_export_settings(const QString &path, ExportSettings *settings, QString *error)
{
	if (!QFileInfo::exists(path)) {
		if (error)
			*error = QString("Settings file not found: %1").arg(path);
		return false;
	}

	QJsonObject json_obj;
	if (!read_json_object(path, &json_obj, error))
		return false;

	*settings = export_settings_from_json(json_obj);
	return true;
}

bool save_export_settings(const QString &path, const ExportSettings &settings, QString *error)
{
	return write_json_document(path, QJsonDocument(export_settings_to_json(settings)), error);
}

} // namespace sb
