#include "planmark.hpp"

#include "MuPdfDocument.hpp"
#include "XlsxExporter.hpp"

#include <QDebug>
#include <QFileInfo>
#include <QStandardPaths>
#include <QTextStream>

namespace
{

// Keeps one record per line in the preview
static inline QString
tsv_cell(QString s)
{
    s.replace(QLatin1Char('\t'), QLatin1Char(' '));
    s.replace(QLatin1Char('\r'), QLatin1Char(' '));
    s.replace(QLatin1Char('\n'), QLatin1Char(' '));
    return s;
}

} // namespace

void
init_args(argparse::ArgumentParser &program)
{
    program.add_description(
        "Extract review comments from annotated drawing PDFs into an .xlsx "
        "sheet, tagged with the drawing number of each page.");

    program.add_argument("-o", "--output")
        .help("Path of the .xlsx file (single input only)")
        .nargs(1)
        .metavar("OUTPUT_PATH");

    program.add_argument("-c", "--config")
        .help("Path to config.toml file")
        .nargs(1)
        .metavar("CONFIG_PATH");

    program.add_argument("-l", "--language")
        .help("Language of headers and labels: ja or en")
        .nargs(1)
        .metavar("LANG");

    program.add_argument("-p", "--preview")
        .help("Print the extracted rows to stdout as TSV")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("-q", "--quiet")
        .help("Do not report page progress")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--verbose")
        .help("Enable debug logging")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("files").remaining().metavar("FILE_PATH(s)");
}

planmark::planmark() noexcept {}

planmark::~planmark() noexcept {}

bool
planmark::ReadArgsParser(argparse::ArgumentParser &argparser) noexcept
{
    if (argparser.is_used("--config"))
    {
        m_config_file_path
            = QString::fromStdString(argparser.get<std::string>("--config"));
        m_config_from_args = true;
    }

    if (argparser.is_used("--language"))
    {
        Language lang{};
        const QString code
            = QString::fromStdString(argparser.get<std::string>("--language"));
        if (!parseLanguage(code, lang))
        {
            qCritical() << "Unknown language" << code << "(expected ja or en)";
            return false;
        }
        m_language_override = lang;
    }

    if (argparser.is_used("--output"))
    {
        m_output_override
            = QString::fromStdString(argparser.get<std::string>("--output"));
    }

    m_preview = argparser.get<bool>("--preview");
    m_quiet   = argparser.get<bool>("--quiet");

    if (auto files = argparser.present<std::vector<std::string>>("files"))
    {
        for (const std::string &f : *files)
            m_files << QString::fromStdString(f);
    }

    if (m_files.isEmpty())
    {
        qCritical() << "No input file given";
        return false;
    }

    if (!m_output_override.isEmpty() && m_files.size() > 1)
    {
        qCritical() << "--output can only be used with a single input file";
        return false;
    }

    initConfig();
    return true;
}

// Initialize the config related stuff
void
planmark::initConfig() noexcept
{
    m_config_dir = QDir(
        QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation));

    // If config file path is not set, use the default one
    if (m_config_file_path.isEmpty())
        m_config_file_path = m_config_dir.filePath("config.toml");
    else if (m_config_from_args && !QFileInfo::exists(m_config_file_path))
        qWarning() << "Config file" << m_config_file_path
                   << "does not exist. Loading default config.";

    Config loaded = m_config;
    QString error;
    if (loadConfigFile(m_config_file_path, loaded, &error))
    {
        m_config = loaded;
        qDebug() << "planmark::initConfig(): Using config"
                 << m_config_file_path;
    }
    else
    {
        qWarning().noquote()
            << "There are one or more error(s) in your config file"
            << m_config_file_path << ":\n"
            << error << "\nLoading default config.";
    }

    if (m_language_override)
        m_config.output.language = *m_language_override;
}

int
planmark::Run() noexcept
{
    int failures = 0;
    for (const QString &file : m_files)
    {
        if (!ProcessFile(file))
            ++failures;
    }
    return failures == 0 ? 0 : 1;
}

bool
planmark::ProcessFile(const QString &filePath) noexcept
{
    MuPdfDocument doc;
    if (!doc.open(filePath))
    {
        qCritical() << "Cannot open" << filePath;
        return false;
    }

    if (!doc.isPDF())
        qWarning() << filePath
                   << "is not a PDF file; it has no annotations to extract";

    CommentExtractor extractor;
    if (!m_quiet)
    {
        extractor.setProgressCallback([&filePath](int done, int total)
        {
            QTextStream err(stderr);
            err << QFileInfo(filePath).fileName() << ": page " << done << "/"
                << total << (done == total ? "\n" : "\r");
        });
    }

    const std::vector<ExtractedRow> rows = extractor.extract(doc);

    if (rows.empty())
    {
        qWarning() << "No comments found in" << filePath
                   << "- check that the PDF contains annotations";
        return true;
    }

    if (m_preview)
        PrintPreview(filePath, rows);

    const QString out = m_output_override.isEmpty()
                            ? m_config.outputPathFor(filePath)
                            : m_output_override;

    XlsxExporter exporter(m_config);
    if (!exporter.write(out, rows))
    {
        qCritical() << "Failed to write" << out;
        return false;
    }

    qInfo().noquote() << QString("%1: %2 comment(s) -> %3")
                             .arg(QFileInfo(filePath).fileName())
                             .arg(rows.size())
                             .arg(out);
    return true;
}

void
planmark::PrintPreview(const QString &filePath,
                       const std::vector<ExtractedRow> &rows) const noexcept
{
    const XlsxExporter renderer(m_config);
    QTextStream out(stdout);

    if (m_files.size() > 1)
        out << "# " << filePath << "\n";

    out << renderer.labels().headers.join(QLatin1Char('\t')) << "\n";
    for (const ExtractedRow &r : rows)
    {
        QStringList cells = renderer.cells(r);
        for (QString &cell : cells)
            cell = tsv_cell(cell);
        out << cells.join(QLatin1Char('\t')) << "\n";
    }
    out.flush();
}
