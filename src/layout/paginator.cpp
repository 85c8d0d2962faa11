/*
 * paginator.cpp - Density-driven page breaking and page rendering
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "paginator.h"
#include "contentrenderer.h"
#include "rendersurface.h"
#include "watermarkcompositor.h"

#include <QDebug>
#include <QStringList>

namespace Layout {

static constexpr int kShortParagraphChars = 80;
static constexpr int kHeadingLookahead = 3;
static constexpr int kProgressInterval = 10;

// --- Density analysis ---

DensityMetrics analyzeDensity(const Content::ElementList &elements, qreal basePageHeight)
{
    DensityMetrics m;
    m.totalElements = elements.size();

    qint64 textChars = 0;
    for (const auto &el : elements) {
        if (el.isTextual()) {
            ++m.textElements;
            textChars += el.text.size();
        } else if (el.kind == Content::ElementKind::Image) {
            ++m.imageCount;
        } else if (el.kind == Content::ElementKind::Table) {
            ++m.tableCount;
        }
    }

    if (m.textElements > 0)
        m.textDensity = static_cast<qreal>(textChars) / m.textElements;
    if (m.totalElements > 0) {
        m.imageDensity = static_cast<qreal>(m.imageCount) / m.totalElements;
        m.tableDensity = static_cast<qreal>(m.tableCount) / m.totalElements;
    }

    if (m.imageDensity > 0.2 || m.tableDensity > 0.15 || m.textDensity > 200) {
        m.complexity = Complexity::High;
        m.recommendedPageHeight = basePageHeight * 1.2;
    } else if (m.imageDensity > 0.1 || m.tableDensity > 0.05 || m.textDensity > 100) {
        m.complexity = Complexity::Medium;
        m.recommendedPageHeight = basePageHeight * 1.1;
    } else {
        m.complexity = Complexity::Low;
        m.recommendedPageHeight = basePageHeight;
    }
    return m;
}

Strategy strategyFor(const DensityMetrics &density, const PageSetup &setup)
{
    Strategy s;
    s.complexity = density.complexity;
    s.pageHeight = density.recommendedPageHeight > 0
        ? density.recommendedPageHeight : setup.pageSizePoints().height();

    qreal marginFactor = 1.0;
    switch (density.complexity) {
    case Complexity::High:   marginFactor = 0.8; break;
    case Complexity::Medium: marginFactor = 0.9; break;
    case Complexity::Low:    marginFactor = 1.0; break;
    }
    s.marginTop = setup.margins.top() * marginFactor;
    s.marginBottom = setup.margins.bottom() * marginFactor;

    const bool dense = density.complexity == Complexity::High;
    s.lineSpacing = dense ? 14.0 : 16.0;
    s.paragraphSpacing = dense ? 8.0 : 12.0;

    if (density.imageDensity > 0.1)
        s.maxElementsPerPage = 50;
    else if (density.tableDensity > 0.1)
        s.maxElementsPerPage = 30;
    else
        s.maxElementsPerPage = 100;
    return s;
}

PageConfig Strategy::pageConfig(const PageSetup &setup) const
{
    PageConfig c;
    c.pageWidth = setup.pageSizePoints().width();
    c.pageHeight = pageHeight;
    c.marginTop = marginTop;
    c.marginBottom = marginBottom;
    c.marginLeft = setup.margins.left();
    c.marginRight = setup.margins.right();
    c.lineSpacing = lineSpacing;
    c.paragraphSpacing = paragraphSpacing;
    return c;
}

// --- Break scoring ---

static bool isParagraph(const Content::Element &el)
{
    return el.kind == Content::ElementKind::Paragraph;
}

static bool isShortParagraph(const Content::Element &el)
{
    return isParagraph(el) && el.text.size() <= kShortParagraphChars;
}

QList<BreakCandidate> scoreBreakPoints(const Content::ElementList &elements)
{
    QList<BreakCandidate> candidates;
    const int n = elements.size();
    candidates.reserve(n);

    for (int i = 0; i < n; ++i) {
        const Content::Element &el = elements[i];
        const Content::Element *prev = i > 0 ? &elements[i - 1] : nullptr;
        int score = 50;
        QStringList reasons;

        if (el.kind == Content::ElementKind::Heading) {
            score += 30;
            reasons << QStringLiteral("before heading");
        }
        if (prev && isParagraph(*prev) && isParagraph(el)) {
            score += 10;
            reasons << QStringLiteral("between paragraphs");
        }
        if (i > 0 && i < n - 1) {
            for (int j = i + 1; j <= qMin(n - 1, i + kHeadingLookahead); ++j) {
                if (elements[j].kind == Content::ElementKind::Heading) {
                    score += 20;
                    reasons << QStringLiteral("section ahead");
                    break;
                }
            }
        }
        if (el.kind == Content::ElementKind::Table) {
            score -= 40;
            reasons << QStringLiteral("table");
        }
        if (el.kind == Content::ElementKind::Image) {
            score -= 20;
            reasons << QStringLiteral("image");
        }
        // A one-line paragraph stranded on either side of the break
        const bool orphan = prev && isParagraph(*prev) && isShortParagraph(el);
        const bool widow = prev && isShortParagraph(*prev) && isParagraph(el);
        if (orphan || widow) {
            score -= 15;
            reasons << (orphan ? QStringLiteral("orphan") : QStringLiteral("widow"));
        }

        BreakCandidate c;
        c.elementIndex = i;
        c.score = qBound(0, score, 100);
        c.reason = reasons.isEmpty() ? QStringLiteral("neutral") : reasons.join(QLatin1String(", "));
        candidates.append(c);
    }
    return candidates;
}

// --- Paginator ---

Paginator::Paginator(const PageSetup &setup)
    : m_setup(setup)
{
}

Plan Paginator::prepare(Content::ElementList &elements) const
{
    Plan p;
    p.density = analyzeDensity(elements, m_setup.pageSizePoints().height());
    p.strategy = strategyFor(p.density, m_setup);
    p.config = p.strategy.pageConfig(m_setup);

    estimateAll(elements, p.config);
    p.candidates = scoreBreakPoints(elements);

    qDebug() << "Paginator: complexity" << static_cast<int>(p.density.complexity)
             << "page height" << p.strategy.pageHeight
             << "max elements" << p.strategy.maxElementsPerPage;
    return p;
}

void Paginator::plan(const Content::ElementList &elements, Plan &plan) const
{
    plan.pages.clear();
    plan.breakIndices.clear();
    if (plan.candidates.size() != elements.size())
        plan.candidates = scoreBreakPoints(elements);

    const qreal usable = plan.config.usableHeight();
    const int maxElements = qMax(1, plan.strategy.maxElementsPerPage);

    plan.pages.append(PagePlan{{}, QStringLiteral("first page")});
    qreal y = 0;
    int count = 0;
    int pageStart = 0;

    auto startPage = [&](int index, const QString &reason) {
        plan.pages.append(PagePlan{{}, reason});
        plan.breakIndices.append(index);
        y = 0;
        count = 0;
        pageStart = index;
    };
    auto place = [&](const PlacedSlice &item) {
        plan.pages.last().items.append(item);
        y += item.slice.height + gapAfter(elements[item.elementIndex].kind);
        ++count;
    };

    int i = 0;
    while (i < elements.size()) {
        const Content::Element &el = elements[i];
        const qreal height = el.estimatedHeight;
        const int score = plan.candidates[i].score;

        if (count > 0) {
            if (score > kPreferredBreakScore) {
                startPage(i, QStringLiteral("preferred break (%1)").arg(plan.candidates[i].reason));
            } else if (height > usable - y) {
                // Prefer a good break among the last few elements of this page
                int best = -1;
                for (int j = qMax(pageStart + 1, i - kNearbyWindow); j <= i; ++j) {
                    if (plan.candidates[j].score > kNearbyBreakScore
                        && (best < 0 || plan.candidates[j].score >= plan.candidates[best].score))
                        best = j;
                }
                if (best >= 0 && best < i) {
                    QList<PlacedSlice> moved;
                    QList<PlacedSlice> &items = plan.pages.last().items;
                    while (!items.isEmpty() && items.last().elementIndex >= best)
                        moved.prepend(items.takeLast());
                    startPage(best, QStringLiteral("nearby break (%1)")
                                        .arg(plan.candidates[best].reason));
                    for (const PlacedSlice &item : moved)
                        place(item);
                    continue; // re-evaluate element i on the new page
                }
                startPage(i, best == i ? QStringLiteral("nearby break (%1)").arg(plan.candidates[i].reason)
                                       : QStringLiteral("overflow"));
            } else if (count >= maxElements) {
                startPage(i, QStringLiteral("element limit"));
            } else if ((el.kind == Content::ElementKind::Table && height > kOversizedTableHeight)
                       || (el.kind == Content::ElementKind::Image && height > kOversizedImageHeight)) {
                startPage(i, QStringLiteral("oversized %1").arg(Content::kindName(el.kind)));
            }
        }

        const QList<Slice> slices = sliceElement(el, plan.config);
        if (slices.size() > 1) {
            // Taller than a page: dedicated page plus continuation pages
            if (count > 0)
                startPage(i, QStringLiteral("oversized %1").arg(Content::kindName(el.kind)));
            for (int s = 0; s < slices.size(); ++s) {
                if (s > 0) {
                    plan.pages.append(PagePlan{{}, QStringLiteral("continuation")});
                    y = 0;
                    count = 0;
                }
                place(PlacedSlice{i, slices[s], s > 0});
            }
            pageStart = i;
            qDebug() << "Paginator: element" << i << "split over" << slices.size() << "pages";
        } else {
            place(PlacedSlice{i, slices.value(0), false});
        }
        ++i;
    }

    qDebug() << "Paginator: planned" << plan.pages.size() << "pages for"
             << elements.size() << "elements," << plan.breakIndices.size() << "breaks";
}

Watermark::PageContext Paginator::pageContext(const Content::ElementList &elements,
                                              const Plan &plan, int pageIndex)
{
    Watermark::PageContext ctx;
    ctx.pageNumber = pageIndex + 1;
    ctx.totalPages = plan.pages.size();
    ctx.pageSize = QSizeF(plan.config.pageWidth, plan.config.pageHeight);

    for (const PlacedSlice &item : plan.pages[pageIndex].items) {
        const Content::Element &el = elements[item.elementIndex];
        if (el.kind == Content::ElementKind::Image)
            ctx.hasImages = true;
        else if (el.kind == Content::ElementKind::Table)
            ctx.hasTables = true;
        else if (el.isTextual()) {
            const QStringList lines = textLines(el, plan.config);
            if (item.slice.firstUnit == 0 && item.slice.unitCount >= lines.size()) {
                ctx.textLength += el.text.size();
            } else {
                const int last = qMin(static_cast<int>(lines.size()),
                                      item.slice.firstUnit + item.slice.unitCount);
                for (int l = item.slice.firstUnit; l < last; ++l)
                    ctx.textLength += lines[l].size();
            }
        }
    }
    return ctx;
}

int Paginator::render(const Content::ElementList &elements, const Plan &plan,
                      Render::Surface &surface, const Watermark::Compositor &compositor,
                      const ProgressCallback &progress)
{
    Render::ContentRenderer renderer(surface, plan.config);
    const QSizeF pageSize(plan.config.pageWidth, plan.config.pageHeight);
    int drawn = 0;

    m_state = State::AccumulatingPage;
    for (int p = 0; p < plan.pages.size(); ++p) {
        surface.beginPage(pageSize);
        qreal top = 0;
        for (const PlacedSlice &item : plan.pages[p].items) {
            const Content::Element &el = elements[item.elementIndex];
            top += renderer.draw(el, item.slice, top) + gapAfter(el.kind);
            if (!item.continuation) {
                ++drawn;
                if (progress && drawn % kProgressInterval == 0)
                    progress(drawn, elements.size());
            }
        }

        // The page is complete: stamp it before moving on
        compositor.composite(surface, pageContext(elements, plan, p));
        surface.endPage();
    }
    m_state = State::Finalizing;

    if (progress)
        progress(drawn, elements.size());
    m_placeholders = renderer.placeholderCount();
    return plan.pages.size();
}

} // namespace Layout
