#include "Config.hpp"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>

namespace
{

template <typename T>
static inline void
set_if_present(toml::node_view<const toml::node> node, T &target)
{
    if (auto v = node.value<T>())
        target = *v;
}

static inline void
set_qstring_if_present(toml::node_view<const toml::node> n, QString &dst)
{
    if (auto v = n.value<std::string>())
        dst = QString::fromStdString(*v);
}

static inline void
set_language_if_present(toml::node_view<const toml::node> n, Language &dst)
{
    if (auto v = n.value<std::string>())
    {
        if (!parseLanguage(QString::fromStdString(*v), dst))
            qWarning() << "Config: unknown language" << v->c_str()
                       << ", keeping default";
    }
}

static inline void
set_width_if_present(toml::node_view<const toml::node> n, double &dst)
{
    if (auto v = n.value<double>(); v && *v > 0)
        dst = *v;
}

} // namespace

QString
Config::outputPathFor(const QString &inputPath) const noexcept
{
    const QFileInfo info(inputPath);
    QString name = output.file_name_format;
    name.replace(QStringLiteral("{}"), info.fileName());
    return info.absoluteDir().filePath(name);
}

QString
Config::sheetName() const noexcept
{
    if (!output.sheet_name.isEmpty())
        return output.sheet_name;
    return Labels::forLanguage(output.language).sheet_name;
}

void
applyConfigTable(const toml::table &table, Config &config) noexcept
{
    /* output */
    auto output = table["output"];
    set_language_if_present(output["language"], config.output.language);
    set_qstring_if_present(output["sheet_name"], config.output.sheet_name);
    set_qstring_if_present(output["file_name_format"],
                           config.output.file_name_format);
    set_if_present(output["freeze_header"], config.output.freeze_header);
    set_if_present(output["autofilter"], config.output.autofilter);

    /* columns */
    auto columns = table["columns"];
    set_width_if_present(columns["page_width"], config.columns.page_width);
    set_width_if_present(columns["drawing_width"],
                         config.columns.drawing_width);
    set_width_if_present(columns["comment_width"],
                         config.columns.comment_width);
    set_width_if_present(columns["author_width"], config.columns.author_width);
    set_width_if_present(columns["modified_width"],
                         config.columns.modified_width);
    set_width_if_present(columns["color_name_width"],
                         config.columns.color_name_width);
    set_width_if_present(columns["color_hex_width"],
                         config.columns.color_hex_width);
}

bool
loadConfigFile(const QString &path, Config &config, QString *error) noexcept
{
    if (path.isEmpty() || !QFile::exists(path))
        return true;

    toml::table toml;

    try
    {
        toml = toml::parse_file(path.toStdString());
    }
    catch (std::exception &e)
    {
        if (error)
            *error = QString::fromUtf8(e.what());
        return false;
    }

    applyConfigTable(toml, config);
    return true;
}
