#pragma once

#include "sb-errors.hpp"
#include "sb-timeline-data.hpp"

#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

namespace sb {

class AssetRegistry {
public:
	// Media URL for an image location. Drive-letter paths map to file://localhost/ with forward slashes;
	// other paths must be absolute. Empty or relative paths have no URL.
	static std::optional<QString> file_url_from_path(const QString &path);
	// File stem of the image, used for asset and clip names.
	static QString display_name_for_path(const QString &path);

	// Registers every image of every entry in first-seen order. Images without a media URL are
	// skipped and reported through omitted_paths.
	void register_entries(const QVector<TimelineEntry> &entries, QStringList *omitted_paths = nullptr);
	// Fails with InvalidAssetPath when the image has no media URL.
	std::optional<QString> register_image(const QString &image_path, TimelineError *error = nullptr);

	QString asset_id_for(const QString &image_path) const;
	const QVector<AssetResource> &resources() const;

private:
	QVector<AssetResource> m_resources;
	QHash<QString, int> m_index_by_path;
	QStringList m_rejected_paths;
};

} // namespace sb
