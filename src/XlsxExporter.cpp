#include "XlsxExporter.hpp"

#include "ColorFormatter.hpp"

#include <QByteArray>
#include <QDebug>

namespace
{

constexpr lxw_col_t COLUMN_COUNT = 7;

static inline lxw_error
write_text(lxw_worksheet *sheet, lxw_row_t row, lxw_col_t col,
           const QString &text, lxw_format *format)
{
    const QByteArray utf8 = XlsxExporter::fitCell(text).toUtf8();
    return worksheet_write_string(sheet, row, col, utf8.constData(), format);
}

// Relative luminance decides between black and white text on a swatch
static inline lxw_color_t
contrast_color(lxw_color_t rgb) noexcept
{
    const double r = (rgb >> 16) & 0xFF;
    const double g = (rgb >> 8) & 0xFF;
    const double b = rgb & 0xFF;
    return (0.299 * r + 0.587 * g + 0.114 * b) > 140.0 ? LXW_COLOR_BLACK
                                                       : LXW_COLOR_WHITE;
}

} // namespace

XlsxExporter::XlsxExporter(const Config &config) noexcept
    : m_config(config), m_labels(Labels::forLanguage(config.output.language))
{
}

bool
XlsxExporter::write(const QString &path,
                    const std::vector<ExtractedRow> &rows) noexcept
{
    const QByteArray file = path.toUtf8();
    m_workbook            = workbook_new(file.constData());
    if (!m_workbook)
    {
        qWarning() << "XlsxExporter::write(): Cannot create workbook" << path;
        return false;
    }

    m_swatch_formats.clear();
    m_cell_errors = 0;

    QByteArray sheet_name = m_config.sheetName().toUtf8();
    if (workbook_validate_sheet_name(m_workbook, sheet_name.constData())
        != LXW_NO_ERROR)
    {
        qWarning() << "XlsxExporter::write(): Invalid sheet name"
                   << m_config.sheetName() << ", using" << m_labels.sheet_name;
        sheet_name = m_labels.sheet_name.toUtf8();
    }

    lxw_worksheet *sheet
        = workbook_add_worksheet(m_workbook, sheet_name.constData());
    if (!sheet)
    {
        qWarning() << "XlsxExporter::write(): Cannot add worksheet";
        workbook_close(m_workbook);
        m_workbook = nullptr;
        return false;
    }

    m_header_format = workbook_add_format(m_workbook);
    format_set_bold(m_header_format);
    format_set_bg_color(m_header_format, 0xD9D9D9);
    format_set_border(m_header_format, LXW_BORDER_THIN);

    m_text_format = workbook_add_format(m_workbook);
    format_set_text_wrap(m_text_format);
    format_set_align(m_text_format, LXW_ALIGN_VERTICAL_TOP);

    setColumnWidths(sheet);
    writeHeader(sheet);

    lxw_row_t row = 1;
    for (const ExtractedRow &data : rows)
        writeRow(sheet, row++, data);

    if (m_config.output.freeze_header)
        worksheet_freeze_panes(sheet, 1, 0);

    if (m_config.output.autofilter)
        check(worksheet_autofilter(sheet, 0, 0, row - 1, COLUMN_COUNT - 1), 0,
              0);

    const lxw_error err = workbook_close(m_workbook);
    m_workbook          = nullptr;
    m_header_format     = nullptr;
    m_text_format       = nullptr;
    m_swatch_formats.clear();

    if (err != LXW_NO_ERROR)
    {
        qWarning() << "XlsxExporter::write(): Cannot save" << path << ":"
                   << lxw_strerror(err);
        return false;
    }

    if (m_cell_errors > 0)
    {
        qWarning() << "XlsxExporter::write():" << m_cell_errors
                   << "cell(s) could not be written to" << path;
        return false;
    }

    qDebug() << "XlsxExporter::write(): Wrote" << rows.size() << "rows to"
             << path;
    return true;
}

void
XlsxExporter::setColumnWidths(lxw_worksheet *sheet) noexcept
{
    const auto &c                     = m_config.columns;
    const double widths[COLUMN_COUNT] = {
        c.page_width,     c.drawing_width,    c.comment_width,
        c.author_width,   c.modified_width,   c.color_name_width,
        c.color_hex_width};

    for (lxw_col_t col = 0; col < COLUMN_COUNT; ++col)
        check(worksheet_set_column(sheet, col, col, widths[col], nullptr), 0,
              col);
}

void
XlsxExporter::writeHeader(lxw_worksheet *sheet) noexcept
{
    for (lxw_col_t col = 0; col < COLUMN_COUNT; ++col)
        check(write_text(sheet, 0, col, m_labels.headers.value(col),
                         m_header_format),
              0, col);
}

QStringList
XlsxExporter::cells(const ExtractedRow &row) const
{
    return {QString::number(row.page),
            m_labels.drawingNumber(row.drawing_number),
            row.comment,
            row.author,
            row.modified,
            m_labels.colorName(row.color_name),
            m_labels.colorHex(row.color_hex)};
}

QString
XlsxExporter::fitCell(const QString &text)
{
    // QString counts UTF-16 units, never fewer than libxlsxwriter's
    // code points
    if (text.size() <= MAX_CELL_CHARS)
        return text;

    QString out = text.left(MAX_CELL_CHARS - TRUNCATED_MARKER.size());
    if (!out.isEmpty() && out.back().isHighSurrogate())
        out.chop(1);
    return out + TRUNCATED_MARKER;
}

void
XlsxExporter::writeRow(lxw_worksheet *sheet, lxw_row_t row,
                       const ExtractedRow &data) noexcept
{
    const QStringList text = cells(data);

    // Page is written as a number, the rest as text
    check(worksheet_write_number(sheet, row, 0, data.page, nullptr), row, 0);
    for (lxw_col_t col = 1; col < COLUMN_COUNT; ++col)
    {
        lxw_format *format = nullptr;
        if (col == 2)
            format = m_text_format;
        else if (col == COLUMN_COUNT - 1)
            format = swatchFormat(data.color_hex);
        check(write_text(sheet, row, col, text.value(col), format), row, col);
    }
}

// Colors the hex code cell with the annotation color itself. Non-hex values
// (not specified, CMYK tuples) stay unformatted.
lxw_format *
XlsxExporter::swatchFormat(const QString &hex) noexcept
{
    if (!ColorFormatter::isHexCode(hex))
        return nullptr;

    const QString key = hex.toLower();
    if (auto it = m_swatch_formats.constFind(key);
        it != m_swatch_formats.cend())
        return it.value();

    bool ok                 = false;
    const lxw_color_t color = key.mid(1).toUInt(&ok, 16);
    if (!ok)
        return nullptr;

    lxw_format *format = workbook_add_format(m_workbook);
    format_set_pattern(format, LXW_PATTERN_SOLID);
    // 0x000000 means "unset" to libxlsxwriter
    format_set_bg_color(format, color == 0 ? LXW_COLOR_BLACK : color);
    format_set_font_color(format, contrast_color(color));
    m_swatch_formats.insert(key, format);
    return format;
}

void
XlsxExporter::check(lxw_error err, lxw_row_t row, lxw_col_t col) noexcept
{
    if (err == LXW_NO_ERROR)
        return;

    ++m_cell_errors;
    qWarning() << "XlsxExporter: cell" << row << col << ":"
               << lxw_strerror(err);
}
