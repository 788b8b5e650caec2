#pragma once

// User-facing text of the export. Extraction itself works with the
// language-independent values; they are only translated here.

#include "AnnotationNormalizer.hpp"

#include <QString>
#include <QStringList>

enum class Language
{
    Japanese = 0,
    English
};

// "ja" / "en", case-insensitive. Leaves `out` untouched on failure.
bool
parseLanguage(const QString &code, Language &out) noexcept;

struct Labels
{
    QStringList headers; // page, drawing no., comment, author, modified,
                         // color name, color code
    QString sheet_name;
    QString red;
    QString blue;
    QString black;
    QString other;
    QString unreadable;
    QString not_specified;

    static Labels forLanguage(Language lang);

    QString colorName(ColorName name) const noexcept;
    QString drawingNumber(const QString &value) const noexcept;
    QString colorHex(const QString &value) const noexcept;
};
