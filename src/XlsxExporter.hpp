#pragma once

// Writes extracted rows to a single-sheet .xlsx workbook

#include "CommentExtractor.hpp"
#include "Config.hpp"
#include "Labels.hpp"

#include <QHash>
#include <QString>
#include <QStringList>
#include <vector>

extern "C"
{
#include <xlsxwriter.h>
}

class XlsxExporter
{
public:
    explicit XlsxExporter(const Config &config) noexcept;

    inline const Labels &labels() const noexcept
    {
        return m_labels;
    }

    // false when the workbook could not be saved or a cell was rejected
    bool write(const QString &path,
               const std::vector<ExtractedRow> &rows) noexcept;

    // One row as displayed, in column order, labels applied
    QStringList cells(const ExtractedRow &row) const;

    // Excel caps a cell at 32767 characters. Longer text is cut and ends
    // with TRUNCATED_MARKER.
    static QString fitCell(const QString &text);

    static constexpr int MAX_CELL_CHARS = 32767;
    inline static const QString TRUNCATED_MARKER = QStringLiteral(" [...]");

private:
    void writeHeader(lxw_worksheet *sheet) noexcept;
    void writeRow(lxw_worksheet *sheet, lxw_row_t row,
                  const ExtractedRow &data) noexcept;
    void setColumnWidths(lxw_worksheet *sheet) noexcept;
    lxw_format *swatchFormat(const QString &hex) noexcept;
    void check(lxw_error err, lxw_row_t row, lxw_col_t col) noexcept;

    Config m_config;
    Labels m_labels;

    // Valid only while write() runs
    lxw_workbook *m_workbook{nullptr};
    lxw_format *m_header_format{nullptr};
    lxw_format *m_text_format{nullptr};
    QHash<QString, lxw_format *> m_swatch_formats;
    int m_cell_errors{0};
};
