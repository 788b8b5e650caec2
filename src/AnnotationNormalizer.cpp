#include "AnnotationNormalizer.hpp"

#include "ColorFormatter.hpp"
#include "utils.hpp"

#include <array>
#include <utility>

namespace AnnotationNormalizer
{

ColorName
classify(const QString &hex) noexcept
{
    static const std::array<std::pair<QLatin1String, ColorName>, 3> table{{
        {QLatin1String("#FF0000"), ColorName::Red},
        {QLatin1String("#0000FF"), ColorName::Blue},
        {QLatin1String("#000000"), ColorName::Black},
    }};

    for (const auto &[code, name] : table)
    {
        if (hex.compare(code, Qt::CaseInsensitive) == 0)
            return name;
    }

    return ColorName::Other;
}

std::vector<NormalizedAnnotation>
normalize(const std::vector<AnnotationRecord> &annotations)
{
    std::vector<NormalizedAnnotation> out;
    out.reserve(annotations.size());

    for (const AnnotationRecord &a : annotations)
    {
        if (!a.content || is_blank(*a.content))
            continue;

        NormalizedAnnotation n;
        n.comment    = *a.content;
        n.author     = a.author.value_or(QString());
        n.modified   = a.modified.value_or(QString());
        n.color_hex  = ColorFormatter::toHex(a.stroke_color);
        n.color_name = classify(n.color_hex);
        out.push_back(std::move(n));
    }

    return out;
}

} // namespace AnnotationNormalizer
