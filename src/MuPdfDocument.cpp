#include "MuPdfDocument.hpp"

#include "utils.hpp"

#include <QDebug>
#include <QFileInfo>
#include <QStringList>

#define CSTR(x) x.toStdString().c_str()

namespace
{

static inline QRectF
qrect_from_fz(const fz_rect &r) noexcept
{
    return QRectF(QPointF(r.x0, r.y0), QPointF(r.x1, r.y1));
}

// Rebuilds a text block from the characters whose box overlaps `clip`.
// Glyphs cut by the clip edge are kept whole. Returns an empty block if no
// character overlaps.
TextBlock
clip_text_block(const fz_stext_block *block, const QRectF &clip)
{
    TextBlock out;
    QStringList lines;
    bool have_box{false};

    for (fz_stext_line *l = block->u.t.first_line; l; l = l->next)
    {
        QString line;
        for (fz_stext_char *c = l->first_char; c; c = c->next)
        {
            const QRectF r = qrect_from_fz(fz_rect_from_quad(c->quad));
            if (!rect_touches(r, clip))
                continue;

            const char32_t cp = static_cast<char32_t>(c->c);
            line.append(QString::fromUcs4(&cp, 1));
            out.bbox = have_box ? out.bbox.united(r) : r;
            have_box = true;
        }

        if (!line.isEmpty())
            lines << line;
    }

    out.text = lines.join(QLatin1Char('\n'));
    return out;
}

std::optional<QString>
dict_text(fz_context *ctx, pdf_obj *dict, pdf_obj *key)
{
    pdf_obj *val = pdf_dict_get(ctx, dict, key);
    if (!pdf_is_string(ctx, val))
        return std::nullopt;
    return QString::fromUtf8(pdf_to_text_string(ctx, val));
}

} // namespace

MuPdfDocument::MuPdfDocument() noexcept
{
    m_ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!m_ctx)
    {
        qCritical() << "MuPdfDocument::MuPdfDocument(): Cannot create MuPDF "
                       "context";
        return;
    }
    fz_register_document_handlers(m_ctx);
}

MuPdfDocument::~MuPdfDocument() noexcept
{
    close();
    fz_drop_context(m_ctx);
}

void
MuPdfDocument::close() noexcept
{
    if (m_ctx)
        fz_drop_document(m_ctx, m_doc);
    m_doc        = nullptr;
    m_pdf_doc    = nullptr;
    m_page_count = 0;
    m_filepath.clear();
}

bool
MuPdfDocument::open(const QString &filePath) noexcept
{
    if (!m_ctx)
        return false;

    close();
    m_filepath = QFileInfo(filePath).absoluteFilePath();

    bool ok = false;
    fz_try(m_ctx)
    {
        m_doc = fz_open_document(m_ctx, CSTR(m_filepath));
        if (!m_doc)
            fz_throw(m_ctx, FZ_ERROR_GENERIC, "Failed to open document");

        m_pdf_doc    = pdf_specifics(m_ctx, m_doc);
        m_page_count = fz_count_pages(m_ctx, m_doc);
        ok           = true;
    }
    fz_catch(m_ctx)
    {
        qWarning() << "MuPdfDocument::open(): Cannot open" << m_filepath << ":"
                   << fz_caught_message(m_ctx);
    }

    if (!ok)
        close();

    return ok;
}

QSizeF
MuPdfDocument::pageSize(int pageno) const noexcept
{
    if (!m_doc || pageno < 0 || pageno >= m_page_count)
        return {};

    fz_page *page{nullptr};
    fz_rect bounds{};
    bool ok{false};

    fz_try(m_ctx)
    {
        page   = fz_load_page(m_ctx, m_doc, pageno);
        bounds = fz_bound_page(m_ctx, page);
        ok     = true;
    }
    fz_always(m_ctx)
    {
        fz_drop_page(m_ctx, page);
    }
    fz_catch(m_ctx)
    {
        qWarning() << "MuPdfDocument::pageSize(): Failed to load page"
                   << pageno + 1 << ":" << fz_caught_message(m_ctx);
    }

    if (!ok)
        return {};

    return QSizeF(bounds.x1 - bounds.x0, bounds.y1 - bounds.y0);
}

std::vector<TextBlock>
MuPdfDocument::textBlocks(int pageno, const QRectF &clip) noexcept
{
    std::vector<TextBlock> blocks;
    if (!m_doc || pageno < 0 || pageno >= m_page_count)
        return blocks;

    fz_page *page{nullptr};
    fz_stext_page *stext_page{nullptr};
    fz_stext_options opts{};
    opts.flags = FZ_STEXT_PRESERVE_LIGATURES | FZ_STEXT_PRESERVE_WHITESPACE;

    fz_try(m_ctx)
    {
        page       = fz_load_page(m_ctx, m_doc, pageno);
        stext_page = fz_new_stext_page_from_page(m_ctx, page, &opts);

        for (fz_stext_block *b = stext_page->first_block; b; b = b->next)
        {
            if (b->type != FZ_STEXT_BLOCK_TEXT)
                continue;

            // Cheap reject before looking at every character
            if (!rect_touches(qrect_from_fz(b->bbox), clip))
                continue;

            TextBlock block = clip_text_block(b, clip);
            if (!block.text.isEmpty())
                blocks.push_back(std::move(block));
        }
    }
    fz_always(m_ctx)
    {
        fz_drop_stext_page(m_ctx, stext_page);
        fz_drop_page(m_ctx, page);
    }
    fz_catch(m_ctx)
    {
        qWarning() << "MuPdfDocument::textBlocks(): Text extraction failed for "
                      "page"
                   << pageno + 1 << ":" << fz_caught_message(m_ctx);
        blocks.clear();
    }

    return blocks;
}

std::vector<AnnotationRecord>
MuPdfDocument::annotations(int pageno) noexcept
{
    std::vector<AnnotationRecord> out;
    if (!m_pdf_doc || pageno < 0 || pageno >= m_page_count)
        return out;

    fz_page *page{nullptr};

    fz_try(m_ctx)
    {
        page              = fz_load_page(m_ctx, m_doc, pageno);
        pdf_page *pdfPage = pdf_page_from_fz_page(m_ctx, page);

        for (pdf_annot *annot = pdfPage ? pdf_first_annot(m_ctx, pdfPage)
                                        : nullptr;
             annot; annot = pdf_next_annot(m_ctx, annot))
        {
            pdf_obj *obj = pdf_annot_obj(m_ctx, annot);

            AnnotationRecord rec;
            rec.content  = dict_text(m_ctx, obj, PDF_NAME(Contents));
            rec.author   = dict_text(m_ctx, obj, PDF_NAME(T));
            rec.modified = dict_text(m_ctx, obj, PDF_NAME(M));

            float color[4]{0.0f, 0.0f, 0.0f, 0.0f};
            int n = 0;
            pdf_annot_color(m_ctx, annot, &n, color);
            if (n > 0)
                rec.stroke_color = std::vector<float>(color, color + n);

            out.push_back(std::move(rec));
        }
    }
    fz_always(m_ctx)
    {
        fz_drop_page(m_ctx, page);
    }
    fz_catch(m_ctx)
    {
        qWarning() << "MuPdfDocument::annotations(): Failed to read annotations "
                      "on page"
                   << pageno + 1 << ":" << fz_caught_message(m_ctx);
        out.clear();
    }

    return out;
}
