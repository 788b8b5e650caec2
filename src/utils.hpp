#pragma once

#include <QRectF>
#include <QString>
#include <algorithm>

// True when the rects share at least one point. Touching edges count,
// unlike QRectF::intersects().
static inline bool
rect_touches(const QRectF &a, const QRectF &b) noexcept
{
    return a.left() <= b.right() && a.right() >= b.left()
           && a.top() <= b.bottom() && a.bottom() >= b.top();
}

static inline bool
is_blank(const QString &s) noexcept
{
    return std::all_of(s.cbegin(), s.cend(),
                       [](QChar c) { return c.isSpace(); });
}

// Removes line breaks without inserting anything in their place
static inline QString
strip_newlines(QString s)
{
    s.remove(QLatin1Char('\n'));
    s.remove(QLatin1Char('\r'));
    return s;
}

// NaN maps to 0
static inline double
clamp_unit(double v) noexcept
{
    if (!(v > 0.0))
        return 0.0;
    return std::min(v, 1.0);
}
