#pragma once

#include <QString>
#include <optional>
#include <vector>

namespace ColorFormatter
{

// Stands for "annotation has no stroke color"; never a valid hex code
inline const QString NOT_SPECIFIED = QStringLiteral("(not specified)");

// 0..1 channel to 0..255, truncating. Out-of-range input is clamped.
int
toByte(double channel) noexcept;

// 3 channels -> "#rrggbb", 1 channel -> gray "#vvvvvv", absent or empty ->
// NOT_SPECIFIED. Any other channel count (CMYK) is returned as the raw
// tuple, e.g. "(0, 0.5, 1, 0)".
QString
toHex(const std::optional<std::vector<float>> &channels);

bool
isHexCode(const QString &s) noexcept;

} // namespace ColorFormatter
