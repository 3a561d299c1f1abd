#include "sb-fcpxml-writer.hpp"

#include <QDir>
#include <QSaveFile>
#include <QTextStream>

namespace sb {
namespace {

int effective_fps(int fps)
{
	return fps > 0 ? fps : default_frame_rate();
}

} // namespace

QString FcpxmlWriter::artifact_path_for_title(const QString &output_dir, const QString &title)
{
	return QDir(output_dir).filePath(title + "_timeline.fcpxml");
}

QString FcpxmlWriter::time_from_frames(int64_t frames, int fps)
{
	return QString("%1/%2s").arg(frames).arg(effective_fps(fps));
}

QString FcpxmlWriter::frame_duration(int fps)
{
	return QString("1/%1s").arg(effective_fps(fps));
}

bool FcpxmlWriter::write_document(const QString &output_path, const FcpxmlDocumentInput &input, QString *error) const
{
	QSaveFile file(output_path);
	if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
		if (error)
			*error = QString("Failed to open FCPXML for write: %1").arg(output_path);
		return false;
	}

	const QByteArray payload = build_document(input).toUtf8();
	if (file.write(payload) == -1) {
		if (error)
			*error = QString("Failed to write FCPXML: %1").arg(output_path);
		return false;
	}

	if (!file.commit()) {
		if (error)
			*error = QString("Failed to commit FCPXML: %1").arg(output_path);
		return false;
	}

	return true;
}

QString FcpxmlWriter::build_document(const FcpxmlDocumentInput &input) const
{
	const int fps = effective_fps(input.fps);
	const QString project_name = input.project_name.isEmpty() ? input.title : input.project_name;

	QString xml;
	QTextStream stream(&xml);
	stream.setEncoding(QStringConverter::Utf8);

	stream << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
	stream << "<!DOCTYPE fcpxml>\n";
	stream << "<fcpxml version=\"" << xml_escape(input.version) << "\">\n";
	stream << "  <resources>\n";
	stream << "    <format id=\"r0\" name=\"FFVideoFormatRateUndefined\" frameDuration=\"" << frame_duration(fps)
	       << "\" width=\"" << input.width << "\" height=\"" << input.height << "\"/>\n";
	append_assets(stream, input.assets);
	stream << "  </resources>\n";
	stream << "  <library>\n";
	stream << "    <event name=\"" << xml_escape(input.title) << "\">\n";
	stream << "      <project name=\"" << xml_escape(project_name) << "\">\n";
	stream << "        <sequence format=\"r0\" duration=\"" << time_from_frames(input.sequence_duration_frames, fps)
	       << "\" tcStart=\"0/1s\" tcFormat=\"NDF\">\n";
	stream << "          <spine>\n";
	append_spine(stream, input.spine, fps);
	stream << "          </spine>\n";
	stream << "        </sequence>\n";
	stream << "      </project>\n";
	stream << "    </event>\n";
	stream << "  </library>\n";
	stream << "</fcpxml>\n";

	stream.flush();
	return xml;
}

void FcpxmlWriter::append_assets(QTextStream &stream, const QVector<AssetResource> &assets) const
{
	for (const AssetResource &asset : assets) {
		stream << "    <asset id=\"" << xml_escape(asset.asset_id) << "\" name=\"" << xml_escape(asset.name)
		       << "\" start=\"0/1s\" duration=\"0/1s\" hasVideo=\"1\">\n";
		stream << "      <media-rep kind=\"original-media\" src=\"" << xml_escape(asset.src) << "\"/>\n";
		stream << "    </asset>\n";
	}
}

void FcpxmlWriter::append_spine(QTextStream &stream, const QVector<SpineElement> &spine, int fps) const
{
	for (const SpineElement &element : spine) {
		const QString offset = time_from_frames(element.offset_frames, fps);
		const QString duration = time_from_frames(element.duration_frames, fps);

		if (element.kind == SpineElement::Kind::Gap) {
			stream << "            <gap name=\"" << xml_escape(element.name) << "\" offset=\"" << offset
			       << "\" duration=\"" << duration << "\" start=\"0/1s\"/>\n";
			continue;
		}

		stream << "            <video ref=\"" << xml_escape(element.asset_id) << "\" name=\""
		       << xml_escape(element.name) << "\" offset=\"" << offset << "\" duration=\"" << duration
		       << "\" start=\"0/1s\" enabled=\"1\">\n";
		stream << "              <adjust-transform scale=\"1 1\" position=\"0 0\" anchor=\"0 0\"/>\n";
		stream << "            </video>\n";
	}
}

QString FcpxmlWriter::xml_escape(const QString &value)
{
	QString escaped = value;
	escaped.replace('&', "&amp;");
	escaped.replace('<', "&lt;");
	escaped.replace('>', "&gt;");
	escaped.replace('"', "&quot;");
	escaped.replace('\'', "&apos;");
	return escaped;
}

} // namespace sb
