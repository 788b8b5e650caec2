#pragma once

#include "PageSource.hpp"

#include <QString>
#include <vector>

enum class ColorName
{
    Red = 0,
    Blue,
    Black,
    Other
};

struct NormalizedAnnotation
{
    QString comment;
    QString author;
    QString modified;
    ColorName color_name{ColorName::Other};
    QString color_hex;
};

namespace AnnotationNormalizer
{

// Case-insensitive, exact match only: "#fe0000" is Other
ColorName
classify(const QString &hex) noexcept;

// Drops annotations without a comment (absent, empty or whitespace only) and
// keeps the order of the rest
std::vector<NormalizedAnnotation>
normalize(const std::vector<AnnotationRecord> &annotations);

} // namespace AnnotationNormalizer
