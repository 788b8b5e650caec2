#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <QTemporaryDir>
#include <algorithm>

#include "ColorFormatter.hpp"
#include "CommentExtractor.hpp"
#include "MuPdfDocument.hpp"
#include "RegionTextSelector.hpp"
#include "pdf_fixture.hpp"

using fixture::kPageH;
using fixture::kPageW;

TEST_CASE("annotated drawing set is read through MuPDF")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("drawings.pdf"));
    REQUIRE(fixture::write_pdf(path, fixture::kDrawingSet,
                                fixture::kDrawingSetComments));

    MuPdfDocument doc;
    REQUIRE(doc.open(path));
    CHECK(doc.isPDF());
    REQUIRE(doc.pageCount() == 2);

    const QSizeF size = doc.pageSize(0);
    CHECK(size.width() == doctest::Approx(kPageW));
    CHECK(size.height() == doctest::Approx(kPageH));

    SUBCASE("text outside the clip is not reported")
    {
        const QRectF region
            = RegionTextSelector::searchRegion(size.width(), size.height());
        const auto blocks = doc.textBlocks(0, region);

        REQUIRE_FALSE(blocks.empty());
        for (const TextBlock &b : blocks)
        {
            CHECK_FALSE(b.text.contains(QStringLiteral("GENERAL")));
            CHECK(b.bbox.intersects(region));
        }

        CHECK(doc.textBlocks(1, RegionTextSelector::searchRegion(
                                    size.width(), size.height()))
                  .empty());
    }

    SUBCASE("annotations keep their native order and fields")
    {
        const auto annots = doc.annotations(0);
        REQUIRE(annots.size() == 3);

        REQUIRE(annots[0].content.has_value());
        CHECK(*annots[0].content == QStringLiteral("Fix wall"));
        CHECK(annots[0].author.value_or(QString()) == QStringLiteral("Kimura"));
        REQUIRE(annots[0].modified.has_value());
        CHECK(annots[0].modified->startsWith(QStringLiteral("D:")));
        REQUIRE(annots[0].stroke_color.has_value());
        CHECK(annots[0].stroke_color->size() == 3);

        REQUIRE(annots[2].stroke_color.has_value());
        CHECK(annots[2].stroke_color->size() == 1);

        const auto page2 = doc.annotations(1);
        REQUIRE(page2.size() == 1);
        CHECK_FALSE(page2[0].stroke_color.has_value());
    }

    SUBCASE("whole document extraction")
    {
        const auto rows = CommentExtractor().extract(doc);
        REQUIRE(rows.size() == 3);

        CHECK(rows[0].page == 1);
        CHECK(rows[0].drawing_number == QStringLiteral("A-101"));
        CHECK(rows[0].comment == QStringLiteral("Fix wall"));
        CHECK(rows[0].author == QStringLiteral("Kimura"));
        CHECK(rows[0].color_name == ColorName::Red);
        CHECK(rows[0].color_hex == QStringLiteral("#ff0000"));

        CHECK(rows[1].page == 1);
        CHECK(rows[1].comment == QStringLiteral("Gray note"));
        CHECK(rows[1].color_hex == QStringLiteral("#7f7f7f"));
        CHECK(rows[1].color_name == ColorName::Other);

        CHECK(rows[2].page == 2);
        CHECK(rows[2].drawing_number == RegionTextSelector::UNREADABLE);
        CHECK(rows[2].comment == QStringLiteral("Check door"));
        CHECK(rows[2].color_name == ColorName::Other);
        CHECK(rows[2].color_hex == ColorFormatter::NOT_SPECIFIED);
    }
}

TEST_CASE("characters overlapping the search region are kept whole")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("edge.pdf"));
    REQUIRE(fixture::write_pdf(path, fixture::kEdgeSheet));

    MuPdfDocument doc;
    REQUIRE(doc.open(path));
    const QSizeF size = doc.pageSize(0);
    const QRectF region
        = RegionTextSelector::searchRegion(size.width(), size.height());
    const auto blocks = doc.textBlocks(0, region);

    SUBCASE("glyph on the midline")
    {
        const auto it = std::find_if(
            blocks.cbegin(), blocks.cend(), [](const TextBlock &b)
        { return b.text.contains(QStringLiteral("WER")); });
        REQUIRE(it != blocks.cend());
        CHECK_FALSE(it->text.contains(QStringLiteral("TOW")));
        CHECK(it->bbox.left() < region.left());
    }

    SUBCASE("drawing number whose descender leaves the page")
    {
        CHECK(RegionTextSelector::select(blocks, size.width(), size.height())
              == QStringLiteral("A-101"));
    }
}

TEST_CASE("missing file cannot be opened")
{
    MuPdfDocument doc;
    CHECK_FALSE(doc.open(QStringLiteral("/nonexistent/drawing.pdf")));
    CHECK_FALSE(doc.isOpen());
    CHECK(doc.pageCount() == 0);
    CHECK(doc.annotations(0).empty());
    CHECK(doc.pageSize(0).isEmpty());
}
