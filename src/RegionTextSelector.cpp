#include "RegionTextSelector.hpp"

#include "utils.hpp"

#include <algorithm>
#include <stdexcept>

namespace RegionTextSelector
{

QRectF
searchRegion(qreal pageWidth, qreal pageHeight)
{
    return QRectF(QPointF(pageWidth * 0.5, pageHeight * 0.5),
                  QPointF(pageWidth, pageHeight));
}

std::vector<Candidate>
candidates(const std::vector<TextBlock> &blocks)
{
    std::vector<Candidate> out;
    out.reserve(blocks.size());

    for (const TextBlock &b : blocks)
    {
        QString text = b.text.trimmed();
        if (text.isEmpty())
            continue;

        out.push_back({std::move(text), b.bbox.bottom(), b.bbox.right()});
    }

    return out;
}

QString
select(const std::vector<TextBlock> &blocks, qreal pageWidth,
       qreal pageHeight)
{
    if (!(pageWidth > 0) || !(pageHeight > 0))
        throw std::invalid_argument("page dimensions must be positive");

    std::vector<Candidate> list = candidates(blocks);
    if (list.empty())
        return UNREADABLE;

    // Lowest first, then rightmost. Equal keys keep block order.
    std::stable_sort(list.begin(), list.end(),
                     [](const Candidate &a, const Candidate &b)
    {
        if (a.bottom != b.bottom)
            return a.bottom > b.bottom;
        return a.right > b.right;
    });

    return strip_newlines(list.front().text);
}

} // namespace RegionTextSelector
