#pragma once

// Wrapper for MuPDF, read-only

#include "PageSource.hpp"

#include <QString>

extern "C"
{
#include <mupdf/fitz.h>
#include <mupdf/pdf.h>
}

class MuPdfDocument : public PageSource
{
public:
    MuPdfDocument() noexcept;
    ~MuPdfDocument() noexcept override;

    MuPdfDocument(const MuPdfDocument &)            = delete;
    MuPdfDocument &operator=(const MuPdfDocument &) = delete;

    bool open(const QString &filePath) noexcept;
    void close() noexcept;

    inline bool isOpen() const noexcept
    {
        return m_doc != nullptr;
    }

    inline bool isPDF() const noexcept
    {
        return m_pdf_doc != nullptr;
    }

    inline QString filePath() const noexcept
    {
        return m_filepath;
    }

    int pageCount() const noexcept override
    {
        return m_page_count;
    }

    QSizeF pageSize(int pageno) const noexcept override;
    std::vector<TextBlock> textBlocks(int pageno,
                                      const QRectF &clip) noexcept override;
    std::vector<AnnotationRecord> annotations(int pageno) noexcept override;

private:
    fz_context *m_ctx{nullptr};
    fz_document *m_doc{nullptr};
    pdf_document *m_pdf_doc{nullptr};
    QString m_filepath;
    int m_page_count{0};
};
