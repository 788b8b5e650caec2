#include "CommentExtractor.hpp"

#include "RegionTextSelector.hpp"

#include <QDebug>
#include <iterator>

std::vector<ExtractedRow>
CommentExtractor::extract(PageSource &source) const
{
    std::vector<ExtractedRow> rows;
    const int count = source.pageCount();

    qDebug() << "CommentExtractor::extract(): Processing" << count << "pages";

    for (int pageno = 0; pageno < count; ++pageno)
    {
        std::vector<ExtractedRow> page_rows = extractPage(source, pageno);
        rows.insert(rows.end(), std::make_move_iterator(page_rows.begin()),
                    std::make_move_iterator(page_rows.end()));

        if (m_progress)
            m_progress(pageno + 1, count);
    }

    return rows;
}

std::vector<ExtractedRow>
CommentExtractor::extractPage(PageSource &source, int pageno) const
{
    std::vector<ExtractedRow> rows;

    const QSizeF size = source.pageSize(pageno);
    if (!(size.width() > 0) || !(size.height() > 0))
    {
        qWarning() << "CommentExtractor::extractPage(): Skipping page"
                   << pageno + 1 << "with invalid size" << size;
        return rows;
    }

    const QRectF region
        = RegionTextSelector::searchRegion(size.width(), size.height());
    const QString drawing_no = RegionTextSelector::select(
        source.textBlocks(pageno, region), size.width(), size.height());

    qDebug() << "CommentExtractor::extractPage(): Page" << pageno + 1
             << "drawing number:" << drawing_no;

    std::vector<NormalizedAnnotation> annots
        = AnnotationNormalizer::normalize(source.annotations(pageno));
    rows.reserve(annots.size());

    for (NormalizedAnnotation &a : annots)
    {
        rows.push_back({pageno + 1, drawing_no, std::move(a.comment),
                        std::move(a.author), std::move(a.modified),
                        a.color_name, std::move(a.color_hex)});
    }

    return rows;
}
