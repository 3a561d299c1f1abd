#pragma once

#include "sb-errors.hpp"
#include "sb-timeline-data.hpp"

#include <QJsonArray>
#include <QJsonObject>
#include <QString>
#include <QVector>

#include <optional>

namespace sb {

QJsonObject timeline_entry_to_json(const TimelineEntry &entry);
std::optional<TimelineEntry> timeline_entry_from_json(const QJsonObject &json_obj, TimelineError *error = nullptr);

QJsonArray timeline_to_json(const QVector<TimelineEntry> &entries);
std::optional<QVector<TimelineEntry>> timeline_from_json(const QJsonArray &json_array, TimelineError *error = nullptr);

QString timeline_artifact_path(const QString &output_dir, const QString &title);
bool write_timeline_file(const QString &path, const QVector<TimelineEntry> &entries, QString *error);
std::optional<QVector<TimelineEntry>> read_timeline_file(const QString &path, TimelineError *error = nullptr);

// Keys look like "<segment>:<split>".
QString split_key_to_string(const SplitKey &key);
std::optional<SplitKey> split_key_from_string(const QString &text);

// Relative image paths are resolved against base_dir.
std::optional<ImageAssignments> image_assignments_from_json(const QJsonObject &json_obj, const QString &base_dir,
							    TimelineError *error = nullptr);
QJsonObject image_assignments_to_json(const ImageAssignments &assignments);
std::optional<ImageAssignments> read_image_assignments_file(const QString &path, TimelineError *error = nullptr);

} // namespace sb
