#include "ColorFormatter.hpp"

#include "utils.hpp"

#include <QRegularExpression>
#include <QStringList>
#include <cmath>

namespace
{

QString
hexTriplet(int r, int g, int b)
{
    return QStringLiteral("#%1%2%3")
        .arg(r, 2, 16, QLatin1Char('0'))
        .arg(g, 2, 16, QLatin1Char('0'))
        .arg(b, 2, 16, QLatin1Char('0'));
}

} // namespace

namespace ColorFormatter
{

int
toByte(double channel) noexcept
{
    return static_cast<int>(std::floor(clamp_unit(channel) * 255.0));
}

QString
toHex(const std::optional<std::vector<float>> &channels)
{
    if (!channels || channels->empty())
        return NOT_SPECIFIED;

    const std::vector<float> &c = *channels;

    switch (c.size())
    {
        case 3:
            return hexTriplet(toByte(c[0]), toByte(c[1]), toByte(c[2]));

        case 1:
        {
            const int v = toByte(c[0]);
            return hexTriplet(v, v, v);
        }

        default:
        {
            QStringList parts;
            parts.reserve(static_cast<qsizetype>(c.size()));
            for (float v : c)
                parts << QString::number(v);
            return QStringLiteral("(%1)").arg(parts.join(QStringLiteral(", ")));
        }
    }
}

bool
isHexCode(const QString &s) noexcept
{
    static const QRegularExpression re(QStringLiteral("^#[0-9a-fA-F]{6}$"));
    return re.match(s).hasMatch();
}

} // namespace ColorFormatter
