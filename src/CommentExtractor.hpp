#pragma once

// Walks every page of a document, reads the drawing number from the title
// block corner and stamps it onto each of the page's comments.

#include "AnnotationNormalizer.hpp"
#include "PageSource.hpp"

#include <QString>
#include <functional>
#include <utility>
#include <vector>

struct ExtractedRow
{
    int page;               // 1-based
    QString drawing_number; // or RegionTextSelector::UNREADABLE
    QString comment;
    QString author;
    QString modified;
    ColorName color_name;
    QString color_hex;
};

class CommentExtractor
{
public:
    // (pages done, page count)
    using ProgressCallback = std::function<void(int, int)>;

    CommentExtractor() = default;

    inline void setProgressCallback(ProgressCallback callback) noexcept
    {
        m_progress = std::move(callback);
    }

    std::vector<ExtractedRow> extract(PageSource &source) const;

    // One page; `pageno` is 0-based, rows carry pageno + 1
    std::vector<ExtractedRow> extractPage(PageSource &source, int pageno) const;

private:
    ProgressCallback m_progress{};
};
