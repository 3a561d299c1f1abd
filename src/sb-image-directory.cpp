#include "sb-image-directory.hpp"

#include "sb-logging.hpp"

#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>
#include <QUrl>

namespace sb {
namespace {

const QStringList &image_suffixes()
{
	static const QStringList suffixes = {".jpg", ".jpeg", ".png", ".gif", ".webp"};
	return suffixes;
}

const QRegularExpression &image_name_pattern()
{
	static const QRegularExpression pattern(QStringLiteral("^seg(\\d+)_split(\\d+)_"));
	return pattern;
}

} // namespace

QString image_filename_for(int segment_index, int split_index, const QString &query, const QString &image_id,
			   const QString &source_url)
{
	QString clean_query;
	for (const QChar ch : query) {
		if (ch.isLetterOrNumber() || ch == '-' || ch == '_')
			clean_query.append(ch);
	}
	clean_query.truncate(20);

	const QString url_path = QUrl(source_url).path();
	QString suffix;
	const int dot = url_path.lastIndexOf('.');
	if (dot >= 0 && dot > url_path.lastIndexOf('/'))
		suffix = url_path.mid(dot).toLower();
	if (!image_suffixes().contains(suffix))
		suffix = ".jpg";

	return QString("seg%1_split%2_%3_%4%5")
		.arg(segment_index, 3, 10, QChar('0'))
		.arg(split_index)
		.arg(clean_query, image_id, suffix);
}

std::optional<SplitKey> split_key_from_image_filename(const QString &file_name)
{
	const QRegularExpressionMatch match = image_name_pattern().match(file_name);
	if (!match.hasMatch())
		return std::nullopt;

	const QString suffix = file_name.mid(file_name.lastIndexOf('.')).toLower();
	if (!image_suffixes().contains(suffix))
		return std::nullopt;

	SplitKey key;
	key.segment_index = match.captured(1).toInt();
	key.split_index = match.captured(2).toInt();
	return key;
}

bool scan_image_directory(const QString &dir_path, ImageAssignments *assignments, QString *error)
{
	const QDir dir(dir_path);
	if (!dir.exists()) {
		if (error)
			*error = QString("Image directory not found: %1").arg(dir_path);
		return false;
	}

	assignments->clear();
	int assigned = 0;
	const QFileInfoList files = dir.entryInfoList(QDir::Files | QDir::Readable, QDir::Name);
	for (const QFileInfo &info : files) {
		const std::optional<SplitKey> key = split_key_from_image_filename(info.fileName());
		if (!key) {
			qCDebug(sb_io, "[srt-storyboard] ignoring '%s': not a split image", qUtf8Printable(info.fileName()));
			continue;
		}
		(*assignments)[*key].push_back(info.absoluteFilePath());
		assigned += 1;
	}

	qCInfo(sb_io, "[srt-storyboard] assigned %d images from %s", assigned, qUtf8Printable(dir_path));
	return true;
}

} // namespace sb
