#include "sb-json-io.hpp"

#include "sb-logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

namespace sb {
namespace {

bool read_json_document(const QString &path, QJsonDocument *out_doc, QString *error)
{
	QFile file(path);
	if (!file.open(QIODevice::ReadOnly)) {
		if (error)
			*error = QString("Failed to open JSON for read: %1").arg(path);
		return false;
	}

	QJsonParseError parse_error;
	*out_doc = QJsonDocument::fromJson(file.readAll(), &parse_error);
	if (parse_error.error != QJsonParseError::NoError) {
		if (error)
			*error = QString("Invalid JSON in %1: %2").arg(path, parse_error.errorString());
		return false;
	}
	return true;
}

} // namespace

bool read_json_object(const QString &path, QJsonObject *out_obj, QString *error)
{
	if (!QFile::exists(path)) {
		*out_obj = QJsonObject();
		return true;
	}

	QJsonDocument doc;
	if (!read_json_document(path, &doc, error))
		return false;
	if (!doc.isObject()) {
		if (error)
			*error = QString("Expected a JSON object in %1").arg(path);
		return false;
	}

	*out_obj = doc.object();
	return true;
}

bool read_json_array(const QString &path, QJsonArray *out_array, QString *error)
{
	QJsonDocument doc;
	if (!read_json_document(path, &doc, error))
		return false;
	if (!doc.isArray()) {
		if (error)
			*error = QString("Expected a JSON array in %1").arg(path);
		return false;
	}

	*out_array = doc.array();
	return true;
}

bool write_json_document(const QString &path, const QJsonDocument &doc, QString *error)
{
	QFileInfo info(path);
	QDir dir = info.dir();
	if (!dir.exists() && !dir.mkpath(".")) {
		if (error)
			*error = QString("Failed to create directory: %1").arg(dir.path());
		return false;
	}

	QSaveFile file(path);
	if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
		if (error)
			*error = QString("Failed to open JSON for write: %1").arg(path);
		return false;
	}

	if (file.write(doc.toJson(QJsonDocument::Indented)) == -1) {
		if (error)
			*error = QString("Failed to write JSON: %1").arg(path);
		return false;
	}

	if (!file.commit()) {
		if (error)
			*error = QString("Failed to commit JSON: %1").arg(path);
		return false;
	}

	qCDebug(sb_io, "[srt-storyboard] wrote %s", qUtf8Printable(path));
	return true;
}

} // namespace sb
