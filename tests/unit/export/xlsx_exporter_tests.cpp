#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <QByteArray>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include "ColorFormatter.hpp"
#include "RegionTextSelector.hpp"
#include "XlsxExporter.hpp"

namespace
{
std::vector<ExtractedRow> sampleRows()
{
    return {
        {1, QStringLiteral("A-101"), QStringLiteral("Fix wall"),
         QStringLiteral("Kimura"), QStringLiteral("D:20240115093000+09'00'"),
         ColorName::Red, QStringLiteral("#ff0000")},
        {2, RegionTextSelector::UNREADABLE, QStringLiteral("Check door"),
         QString(), QString(), ColorName::Other, ColorFormatter::NOT_SPECIFIED},
        {2, RegionTextSelector::UNREADABLE, QStringLiteral("ink"), QString(),
         QString(), ColorName::Other, QStringLiteral("(0, 1, 1, 0)")},
    };
}

QByteArray fileHead(const QString &path, qint64 n)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly))
        return {};
    return f.read(n);
}

} // namespace

TEST_CASE("workbook is written as a zip package")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("comments.xlsx"));

    XlsxExporter exporter{Config{}};
    REQUIRE(exporter.write(path, sampleRows()));

    const QFileInfo info(path);
    CHECK(info.exists());
    CHECK(info.size() > 0);
    CHECK(fileHead(path, 2) == QByteArrayLiteral("PK"));
}

TEST_CASE("empty row set still produces a workbook with a header")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("empty.xlsx"));

    Config config;
    config.output.language = Language::English;
    XlsxExporter exporter(config);
    CHECK(exporter.labels().headers.first() == QStringLiteral("Page"));
    CHECK(exporter.write(path, {}));
    CHECK(QFileInfo::exists(path));
}

TEST_CASE("invalid sheet name falls back to the default one")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("fallback.xlsx"));

    Config config;
    config.output.sheet_name = QStringLiteral("bad/name[1]");
    XlsxExporter exporter(config);
    CHECK(exporter.write(path, sampleRows()));
    CHECK(QFileInfo::exists(path));
}

TEST_CASE("unwritable destination is reported")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path
        = dir.filePath(QStringLiteral("missing/sub/dir/out.xlsx"));

    XlsxExporter exporter{Config{}};
    CHECK_FALSE(exporter.write(path, sampleRows()));
}

TEST_CASE("rows are rendered in column order with Japanese labels")
{
    const XlsxExporter exporter{Config{}};
    const auto rows = sampleRows();

    CHECK(exporter.labels().headers
          == QStringList{QStringLiteral("ページ"), QStringLiteral("図面番号"),
                         QStringLiteral("コメント内容"),
                         QStringLiteral("作成者"), QStringLiteral("更新日時"),
                         QStringLiteral("色名"), QStringLiteral("色コード")});

    CHECK(exporter.cells(rows[0])
          == QStringList{QStringLiteral("1"), QStringLiteral("A-101"),
                         QStringLiteral("Fix wall"), QStringLiteral("Kimura"),
                         QStringLiteral("D:20240115093000+09'00'"),
                         QStringLiteral("赤"), QStringLiteral("#ff0000")});

    CHECK(exporter.cells(rows[1])
          == QStringList{QStringLiteral("2"), QStringLiteral("(読取不可)"),
                         QStringLiteral("Check door"), QString(), QString(),
                         QStringLiteral("その他"), QStringLiteral("指定なし")});

    CHECK(exporter.cells(rows[2]).last() == QStringLiteral("(0, 1, 1, 0)"));
}

TEST_CASE("rows are rendered in column order with English labels")
{
    Config config;
    config.output.language = Language::English;
    const XlsxExporter exporter(config);
    const auto rows = sampleRows();

    CHECK(exporter.labels().headers
          == QStringList{QStringLiteral("Page"), QStringLiteral("Drawing No."),
                         QStringLiteral("Comment"), QStringLiteral("Author"),
                         QStringLiteral("Modified"), QStringLiteral("Color"),
                         QStringLiteral("Color Code")});

    CHECK(exporter.cells(rows[0])
          == QStringList{QStringLiteral("1"), QStringLiteral("A-101"),
                         QStringLiteral("Fix wall"), QStringLiteral("Kimura"),
                         QStringLiteral("D:20240115093000+09'00'"),
                         QStringLiteral("Red"), QStringLiteral("#ff0000")});

    CHECK(exporter.cells(rows[1])
          == QStringList{QStringLiteral("2"), QStringLiteral("(unreadable)"),
                         QStringLiteral("Check door"), QString(), QString(),
                         QStringLiteral("Other"),
                         QStringLiteral("(not specified)")});
}

TEST_CASE("oversized cell text is truncated with a marker")
{
    const QString shortText = QStringLiteral("Fix wall");
    CHECK(XlsxExporter::fitCell(shortText) == shortText);

    const QString exact(XlsxExporter::MAX_CELL_CHARS, QLatin1Char('x'));
    CHECK(XlsxExporter::fitCell(exact) == exact);

    const QString longText(40000, QLatin1Char('x'));
    const QString fitted = XlsxExporter::fitCell(longText);
    CHECK(fitted.size() == XlsxExporter::MAX_CELL_CHARS);
    CHECK(fitted.endsWith(XlsxExporter::TRUNCATED_MARKER));

    SUBCASE("surrogate pairs are not split")
    {
        const QString emoji = QString::fromUcs4(U"\U0001F600", 1);
        QString text(XlsxExporter::MAX_CELL_CHARS
                         - XlsxExporter::TRUNCATED_MARKER.size() - 1,
                     QLatin1Char('x'));
        text += emoji + emoji;
        const QString cut = XlsxExporter::fitCell(text);
        CHECK(cut.endsWith(XlsxExporter::TRUNCATED_MARKER));
        CHECK_FALSE(cut.chopped(XlsxExporter::TRUNCATED_MARKER.size())
                        .back()
                        .isHighSurrogate());
    }
}

TEST_CASE("workbook with an oversized comment is still written")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("long.xlsx"));

    auto rows       = sampleRows();
    rows[0].comment = QString(40000, QLatin1Char('x'));

    XlsxExporter exporter{Config{}};
    CHECK(exporter.write(path, rows));
    CHECK(QFileInfo::exists(path));
}
