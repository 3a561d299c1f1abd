#pragma once

#include "sb-timeline-data.hpp"

#include <QString>

#include <optional>

namespace sb {

// seg<NNN>_split<M>_<query>_<id><ext>, the layout the image fetcher stores downloads under.
QString image_filename_for(int segment_index, int split_index, const QString &query, const QString &image_id,
			   const QString &source_url);

std::optional<SplitKey> split_key_from_image_filename(const QString &file_name);

// Assigns every image file in the directory to the split its name encodes, ordered by file name.
bool scan_image_directory(const QString &dir_path, ImageAssignments *assignments, QString *error);

} // namespace sb
