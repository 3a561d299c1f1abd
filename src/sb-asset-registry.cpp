#include "sb-asset-registry.hpp"

#include "sb-logging.hpp"

#include <QDir>
#include <QRegularExpression>
#include <QUrl>

namespace sb {
namespace {

const QRegularExpression &drive_letter_pattern()
{
	static const QRegularExpression pattern(QStringLiteral("^[A-Za-z]:[\\\\/]"));
	return pattern;
}

} // namespace

std::optional<QString> AssetRegistry::file_url_from_path(const QString &path)
{
	if (path.trimmed().isEmpty())
		return std::nullopt;

	if (drive_letter_pattern().match(path).hasMatch()) {
		QString normalized = path;
		normalized.replace('\\', '/');
		return QString("file://localhost/%1").arg(normalized);
	}

	if (!QDir::isAbsolutePath(path))
		return std::nullopt;

	return QUrl::fromLocalFile(path).toString(QUrl::FullyEncoded);
}

QString AssetRegistry::display_name_for_path(const QString &path)
{
	QString normalized = path;
	normalized.replace('\\', '/');
	const QString file_name = normalized.section('/', -1);
	const int dot = file_name.lastIndexOf('.');
	if (dot <= 0)
		return file_name;
	return file_name.left(dot);
}

void AssetRegistry::register_entries(const QVector<TimelineEntry> &entries, QStringList *omitted_paths)
{
	for (const TimelineEntry &entry : entries) {
		for (const QString &image_path : entry.image_paths) {
			if (register_image(image_path))
				continue;
			if (omitted_paths && !omitted_paths->contains(image_path))
				omitted_paths->push_back(image_path);
		}
	}
}

std::optional<QString> AssetRegistry::register_image(const QString &image_path, TimelineError *error)
{
	const auto existing = m_index_by_path.constFind(image_path);
	if (existing != m_index_by_path.constEnd())
		return m_resources.at(existing.value()).asset_id;

	const std::optional<QString> src = file_url_from_path(image_path);
	if (!src) {
		const QString message = QString("Cannot build a file URL for '%1'").arg(image_path);
		if (!m_rejected_paths.contains(image_path)) {
			qCWarning(sb_timeline, "[srt-storyboard] asset omitted: %s", qUtf8Printable(message));
			m_rejected_paths.push_back(image_path);
		}
		set_error(error, TimelineErrorCode::InvalidAssetPath, message);
		return std::nullopt;
	}

	// r0 is the format descriptor.
	AssetResource resource;
	resource.asset_id = QString("r%1").arg(m_resources.size() + 1);
	resource.image_path = image_path;
	resource.name = display_name_for_path(image_path);
	resource.src = *src;

	m_index_by_path.insert(image_path, static_cast<int>(m_resources.size()));
	m_resources.push_back(resource);
	return resource.asset_id;
}

QString AssetRegistry::asset_id_for(const QString &image_path) const
{
	const auto found = m_index_by_path.constFind(image_path);
	if (found == m_index_by_path.constEnd())
		return QString();
	return m_resources.at(found.value()).asset_id;
}

const QVector<AssetResource> &AssetRegistry::resources() const
{
	return m_resources;
}

} // namespace sb
