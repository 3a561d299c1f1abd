#pragma once

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QString>

namespace sb {

// A missing file reads as an empty object.
bool read_json_object(const QString &path, QJsonObject *out_obj, QString *error);
bool read_json_array(const QString &path, QJsonArray *out_array, QString *error);

// Creates the parent directory and replaces the file atomically.
bool write_json_document(const QString &path, const QJsonDocument &doc, QString *error);

} // namespace sb
