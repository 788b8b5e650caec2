#pragma once

// Picks the drawing number of a sheet from the text in its title block
// corner. Purely positional: the lowest block wins, then the rightmost one.
// Nothing looks at the content, so a stray "Scale 1:100" printed below the
// drawing number will be picked instead.

#include "PageSource.hpp"

#include <QRectF>
#include <QString>
#include <vector>

namespace RegionTextSelector
{

inline const QString UNREADABLE = QStringLiteral("(unreadable)");

struct Candidate
{
    QString text;
    qreal bottom;
    qreal right;
};

// Bottom-right quadrant of the page, edges included. Text blocks handed to
// select() must come from exactly this rectangle.
QRectF
searchRegion(qreal pageWidth, qreal pageHeight);

std::vector<Candidate>
candidates(const std::vector<TextBlock> &blocks);

// Throws std::invalid_argument on non-positive page dimensions
QString
select(const std::vector<TextBlock> &blocks, qreal pageWidth,
       qreal pageHeight);

} // namespace RegionTextSelector
