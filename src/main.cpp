/*
srt-storyboard
Copyright (C) 2026 srt-storyboard contributors

This program is free software; you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation; either version 2 of the License, or
(at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License along
with this program. If not, see <https://www.gnu.org/licenses/>
*/

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>

#include <cstdio>

#include "sb-image-directory.hpp"
#include "sb-logging.hpp"
#include "sb-models.hpp"
#include "sb-srt-parser.hpp"
#include "sb-timeline-builder.hpp"
#include "sb-timeline-json.hpp"
#include "sb-timeline-report.hpp"

namespace {

struct CommandLineOptions {
	QString srt_path;
	QString video_title;
	QString image_dir;
	QString assignments_path;
	QString output_dir = ".";
	QString settings_path;
	int fps_override = 0;
	bool preview = false;
	bool stats = false;
	bool verbose = false;
};

class StoryboardApp {
public:
	explicit StoryboardApp(const CommandLineOptions &options) : m_options(options) {}

	int run()
	{
		sb::ExportSettings settings;
		if (!m_options.settings_path.isEmpty()) {
			QString error;
			if (!sb::load_export_settings(m_options.settings_path, &settings, &error))
				return fail(error);
		}
		if (m_options.fps_override > 0)
			settings.frame_rate = m_options.fps_override;

		const sb::TimelineBuilder builder(settings);

		QVector<sb::SubtitleEntry> subtitles;
		QString io_error;
		if (!m_parser.parse_file(m_options.srt_path, &subtitles, &io_error))
			return fail(io_error);

		sb::TimelineError error;
		const std::optional<QVector<sb::TextSplit>> splits = builder.split_subtitles(subtitles, &error);
		if (!splits)
			return fail(describe(error));

		sb::ImageAssignments assignments;
		if (!load_assignments(&assignments))
			return 1;

		const QVector<sb::TimelineEntry> entries = sb::TimelineBuilder::assign_images(*splits, assignments);

		sb::ExportArtifacts artifacts;
		if (!builder.export_timeline(entries, m_options.video_title, m_options.output_dir, &artifacts, &error))
			return fail(describe(error));

		if (m_options.preview)
			std::fputs(qUtf8Printable(sb::format_timeline_preview(entries)), stdout);
		if (m_options.stats)
			std::fputs(qUtf8Printable(sb::format_split_statistics(sb::compute_split_statistics(*splits),
										     static_cast<int>(subtitles.size()))),
				   stdout);

		std::printf("Timeline: %s (%lld entries)\n", qUtf8Printable(artifacts.timeline_path),
			    static_cast<long long>(entries.size()));
		std::printf("FCPXML: %s (%d clips, %d gaps, %lld assets omitted)\n", qUtf8Printable(artifacts.fcpxml_path),
			    artifacts.report.clips_materialized - artifacts.report.clips_dropped,
			    artifacts.report.gap_elements, static_cast<long long>(artifacts.omitted_assets.size()));
		return 0;
	}

private:
	bool load_assignments(sb::ImageAssignments *assignments)
	{
		if (!m_options.assignments_path.isEmpty()) {
			sb::TimelineError error;
			const std::optional<sb::ImageAssignments> loaded =
				sb::read_image_assignments_file(m_options.assignments_path, &error);
			if (!loaded) {
				log_error(error.message);
				return false;
			}
			*assignments = *loaded;
			return true;
		}

		if (!m_options.image_dir.isEmpty()) {
			QString error;
			if (!sb::scan_image_directory(m_options.image_dir, assignments, &error)) {
				log_error(error);
				return false;
			}
		}
		return true;
	}

	static QString describe(const sb::TimelineError &error)
	{
		return QString("%1: %2").arg(QString::fromLatin1(sb::timeline_error_code_name(error.code)), error.message);
	}

	static void log_error(const QString &message)
	{
		qCCritical(sb_timeline, "[srt-storyboard] %s", qUtf8Printable(message));
	}

	static int fail(const QString &message)
	{
		log_error(message);
		return 1;
	}

	CommandLineOptions m_options;
	sb::SrtParser m_parser;
};

bool parse_command_line(const QCoreApplication &app, CommandLineOptions *options, QString *error)
{
	QCommandLineParser parser;
	parser.setApplicationDescription(
		"Builds an image timeline from an SRT file: each subtitle is split into sub-intervals of at most "
		"three seconds, already-downloaded images are assigned to the splits, and the result is written "
		"as <title>_timeline.json and <title>_timeline.fcpxml.");
	parser.addHelpOption();
	parser.addVersionOption();
	parser.addPositionalArgument("srt-file", "Path to the SRT subtitle file.");
	parser.addPositionalArgument("video-title", "Title of the video; names the event, project and output files.");

	const QCommandLineOption images_option("images", "Directory of seg<NNN>_split<M>_* images to assign.", "dir");
	const QCommandLineOption assignments_option("assignments", "JSON file mapping \"<segment>:<split>\" to images.",
						    "file");
	const QCommandLineOption output_option(QStringList{"o", "output-dir"}, "Directory for the output files.", "dir",
					       ".");
	const QCommandLineOption fps_option("fps", "Timeline frame rate (overrides the settings file).", "n");
	const QCommandLineOption settings_option("settings", "JSON export settings file.", "file");
	const QCommandLineOption preview_option("preview", "Print a preview of the first timeline entries.");
	const QCommandLineOption stats_option("stats", "Print split statistics.");
	const QCommandLineOption verbose_option(QStringList{"v", "verbose"}, "Enable debug logging.");
	parser.addOptions({images_option, assignments_option, output_option, fps_option, settings_option, preview_option,
			   stats_option, verbose_option});

	parser.process(app);

	const QStringList positional = parser.positionalArguments();
	if (positional.size() != 2) {
		*error = "Expected <srt-file> and <video-title>";
		return false;
	}

	options->srt_path = positional.at(0);
	options->video_title = positional.at(1);
	options->image_dir = parser.value(images_option);
	options->assignments_path = parser.value(assignments_option);
	options->output_dir = parser.value(output_option);
	options->settings_path = parser.value(settings_option);
	options->preview = parser.isSet(preview_option);
	options->stats = parser.isSet(stats_option);
	options->verbose = parser.isSet(verbose_option);

	if (!options->image_dir.isEmpty() && !options->assignments_path.isEmpty()) {
		*error = "--images and --assignments are mutually exclusive";
		return false;
	}

	if (parser.isSet(fps_option)) {
		bool ok = false;
		options->fps_override = parser.value(fps_option).toInt(&ok);
		if (!ok || options->fps_override <= 0) {
			*error = "--fps must be a positive integer";
			return false;
		}
	}

	if (!QFileInfo::exists(options->srt_path)) {
		*error = QString("SRT file not found: %1").arg(options->srt_path);
		return false;
	}
	return true;
}

} // namespace

int main(int argc, char *argv[])
{
	QCoreApplication app(argc, argv);
	QCoreApplication::setApplicationName("srt-storyboard");
	QCoreApplication::setApplicationVersion("1.0.0");

	CommandLineOptions options;
	QString error;
	if (!parse_command_line(app, &options, &error)) {
		std::fprintf(stderr, "srt-storyboard: %s\n", qUtf8Printable(error));
		return 1;
	}

	sb::set_verbose_logging(options.verbose);
	return StoryboardApp(options).run();
}
