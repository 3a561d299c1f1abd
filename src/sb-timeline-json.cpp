#include "sb-timeline-json.hpp"

#include "sb-json-io.hpp"
#include "sb-time-codec.hpp"

#include <QDir>
#include <QFileInfo>

namespace sb {

QJsonObject timeline_entry_to_json(const TimelineEntry &entry)
{
	QJsonArray images;
	for (const QString &image_path : entry.image_paths)
		images.push_back(image_path);

	QJsonObject json_obj;
	json_obj.insert("start", TimeCodec::format_timestamp(entry.span.start_seconds));
	json_obj.insert("end", TimeCodec::format_timestamp(entry.span.end_seconds));
	json_obj.insert("image", images);
	return json_obj;
}

std::optional<TimelineEntry> timeline_entry_from_json(const QJsonObject &json_obj, TimelineError *error)
{
	const std::optional<double> start = TimeCodec::parse_timestamp(json_obj.value("start").toString(), error);
	if (!start)
		return std::nullopt;
	const std::optional<double> end = TimeCodec::parse_timestamp(json_obj.value("end").toString(), error);
	if (!end)
		return std::nullopt;

	TimelineEntry entry;
	entry.span = {*start, *end};
	if (!entry.span.is_valid()) {
		set_error(error, TimelineErrorCode::InvalidInput,
			  QString("Timeline entry ends before it starts (%1 -> %2)")
				  .arg(json_obj.value("start").toString(), json_obj.value("end").toString()));
		return std::nullopt;
	}
	for (QJsonValue value : json_obj.value("image").toArray()) {
		if (value.isString())
			entry.image_paths.push_back(value.toString());
	}
	return entry;
}

QJsonArray timeline_to_json(const QVector<TimelineEntry> &entries)
{
	QJsonArray json_array;
	for (const TimelineEntry &entry : entries)
		json_array.push_back(timeline_entry_to_json(entry));
	return json_array;
}

std::optional<QVector<TimelineEntry>> timeline_from_json(const QJsonArray &json_array, TimelineError *error)
{
	QVector<TimelineEntry> entries;
	entries.reserve(json_array.size());
	for (QJsonValue value : json_array) {
		if (!value.isObject()) {
			set_error(error, TimelineErrorCode::InvalidInput, "Timeline entries must be JSON objects");
			return std::nullopt;
		}
		const std::optional<TimelineEntry> entry = timeline_entry_from_json(value.toObject(), error);
		if (!entry)
			return std::nullopt;
		entries.push_back(*entry);
	}
	return entries;
}

QString timeline_artifact_path(const QString &output_dir, const QString &title)
{
	return QDir(output_dir).filePath(title + "_timeline.json");
}

bool write_timeline_file(const QString &path, const QVector<TimelineEntry> &entries, QString *error)
{
	return write_json_document(path, QJsonDocument(timeline_to_json(entries)), error);
}

std::optional<QVector<TimelineEntry>> read_timeline_file(const QString &path, TimelineError *error)
{
	QJsonArray json_array;
	QString io_error;
	if (!read_json_array(path, &json_array, &io_error)) {
		set_error(error, TimelineErrorCode::InvalidInput, io_error);
		return std::nullopt;
	}
	return timeline_from_json(json_array, error);
}

QString split_key_to_string(const SplitKey &key)
{
	return QString("%1:%2").arg(key.segment_index).arg(key.split_index);
}

std::optional<SplitKey> split_key_from_string(const QString &text)
{
	const QStringList parts = text.split(':');
	if (parts.size() != 2)
		return std::nullopt;

	bool segment_ok = false;
	bool split_ok = false;
	SplitKey key;
	key.segment_index = parts.at(0).trimmed().toInt(&segment_ok);
	key.split_index = parts.at(1).trimmed().toInt(&split_ok);
	if (!segment_ok || !split_ok || key.segment_index < 0 || key.split_index < 0)
		return std::nullopt;
	return key;
}

std::optional<ImageAssignments> image_assignments_from_json(const QJsonObject &json_obj, const QString &base_dir,
							    TimelineError *error)
{
	const QDir base(base_dir);
	ImageAssignments assignments;

	for (auto it = json_obj.constBegin(); it != json_obj.constEnd(); ++it) {
		const std::optional<SplitKey> key = split_key_from_string(it.key());
		if (!key || !it.value().isArray()) {
			set_error(error, TimelineErrorCode::InvalidInput,
				  QString("Invalid image assignment '%1': expected \"<segment>:<split>\": [paths]")
					  .arg(it.key()));
			return std::nullopt;
		}

		QStringList paths;
		for (QJsonValue value : it.value().toArray()) {
			const QString path = value.toString();
			if (path.isEmpty())
				continue;
			paths.push_back(base_dir.isEmpty() || QDir::isAbsolutePath(path) ? path
											  : QDir::cleanPath(base.absoluteFilePath(path)));
		}
		assignments.insert(*key, paths);
	}
	return assignments;
}

QJsonObject image_assignments_to_json(const ImageAssignments &assignments)
{
	QJsonObject json_obj;
	for (auto it = assignments.constBegin(); it != assignments.constEnd(); ++it)
		json_obj.insert(split_key_to_string(it.key()), QJsonArray::fromStringList(it.value()));
	return json_obj;
}

std::optional<ImageAssignments> read_image_assignments_file(const QString &path, TimelineError *error)
{
	if (!QFileInfo::exists(path)) {
		set_error(error, TimelineErrorCode::InvalidInput, QString("Image assignment file not found: %1").arg(path));
		return std::nullopt;
	}

	QJsonObject json_obj;
	QString io_error;
	if (!read_json_object(path, &json_obj, &io_error)) {
		set_error(error, TimelineErrorCode::InvalidInput, io_error);
		return std::nullopt;
	}
	return image_assignments_from_json(json_obj, QFileInfo(path).absolutePath(), error);
}

} // namespace sb
