#include "Labels.hpp"

#include "ColorFormatter.hpp"
#include "RegionTextSelector.hpp"

bool
parseLanguage(const QString &code, Language &out) noexcept
{
    const QString c = code.trimmed().toLower();
    if (c == QLatin1String("ja"))
    {
        out = Language::Japanese;
        return true;
    }
    if (c == QLatin1String("en"))
    {
        out = Language::English;
        return true;
    }
    return false;
}

Labels
Labels::forLanguage(Language lang)
{
    Labels l;

    switch (lang)
    {
        case Language::English:
            l.headers = {QStringLiteral("Page"),     QStringLiteral("Drawing No."),
                         QStringLiteral("Comment"),  QStringLiteral("Author"),
                         QStringLiteral("Modified"), QStringLiteral("Color"),
                         QStringLiteral("Color Code")};
            l.sheet_name    = QStringLiteral("Comments");
            l.red           = QStringLiteral("Red");
            l.blue          = QStringLiteral("Blue");
            l.black         = QStringLiteral("Black");
            l.other         = QStringLiteral("Other");
            l.unreadable    = RegionTextSelector::UNREADABLE;
            l.not_specified = ColorFormatter::NOT_SPECIFIED;
            break;

        case Language::Japanese:
            l.headers = {QStringLiteral("ページ"),   QStringLiteral("図面番号"),
                         QStringLiteral("コメント内容"), QStringLiteral("作成者"),
                         QStringLiteral("更新日時"), QStringLiteral("色名"),
                         QStringLiteral("色コード")};
            l.sheet_name    = QStringLiteral("コメント一覧");
            l.red           = QStringLiteral("赤");
            l.blue          = QStringLiteral("青");
            l.black         = QStringLiteral("黒");
            l.other         = QStringLiteral("その他");
            l.unreadable    = QStringLiteral("(読取不可)");
            l.not_specified = QStringLiteral("指定なし");
            break;
    }

    return l;
}

QString
Labels::colorName(ColorName name) const noexcept
{
    switch (name)
    {
        case ColorName::Red:
            return red;
        case ColorName::Blue:
            return blue;
        case ColorName::Black:
            return black;
        case ColorName::Other:
            break;
    }
    return other;
}

QString
Labels::drawingNumber(const QString &value) const noexcept
{
    return value == RegionTextSelector::UNREADABLE ? unreadable : value;
}

QString
Labels::colorHex(const QString &value) const noexcept
{
    return value == ColorFormatter::NOT_SPECIFIED ? not_specified : value;
}
