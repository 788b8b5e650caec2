#pragma once

// Per-page view of a document, as consumed by CommentExtractor

#include <QRectF>
#include <QSizeF>
#include <QString>
#include <optional>
#include <vector>

struct TextBlock
{
    QRectF bbox; // page coordinates, y grows downwards
    QString text;
};

struct AnnotationRecord
{
    std::optional<QString> content;
    std::optional<QString> author;   // /T
    std::optional<QString> modified; // /M, raw PDF date string
    std::optional<std::vector<float>> stroke_color; // 1 (gray) or 3 (RGB)
};

class PageSource
{
public:
    virtual ~PageSource() = default;

    virtual int pageCount() const noexcept = 0;

    // Returns an empty size if the page cannot be loaded
    virtual QSizeF pageSize(int pageno) const noexcept = 0;

    // Only text lying inside `clip` is reported
    virtual std::vector<TextBlock> textBlocks(int pageno,
                                              const QRectF &clip) noexcept
        = 0;

    // Annotations in the document's native order
    virtual std::vector<AnnotationRecord> annotations(int pageno) noexcept = 0;
};
