/*
 * paginator.h - Density-driven page breaking and page rendering
 *
 * The paginator works in two passes over an estimated element list:
 *
 *   plan()    density analysis -> strategy -> break scoring -> page walk.
 *             Pure; the result lists the slices on every page and the
 *             element indices where new pages begin.
 *   render()  draws each planned page on a surface and hands the finished
 *             page to the watermark compositor before closing it.
 *
 * Planning first means the total page count is known while compositing,
 * so "last page" watermark gating is exact.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGESTAMP_PAGINATOR_H
#define PAGESTAMP_PAGINATOR_H

#include <QList>
#include <QString>

#include <functional>

#include "contentmodel.h"
#include "layoutestimator.h"
#include "pagesetup.h"

namespace Render { class Surface; }
namespace Watermark { class Compositor; struct PageContext; }

namespace Layout {

enum class Complexity { Low, Medium, High };

struct DensityMetrics {
    int totalElements = 0;
    int textElements = 0;       // paragraphs and headings
    int imageCount = 0;
    int tableCount = 0;
    qreal textDensity = 0;      // average characters per text element
    qreal imageDensity = 0;     // images / elements
    qreal tableDensity = 0;     // tables / elements
    Complexity complexity = Complexity::Low;
    qreal recommendedPageHeight = 0;
};

struct Strategy {
    qreal pageHeight = 792.0;
    qreal marginTop = 72.0;
    qreal marginBottom = 72.0;
    qreal lineSpacing = 16.0;
    qreal paragraphSpacing = 12.0;
    int maxElementsPerPage = 100;
    Complexity complexity = Complexity::Low;

    PageConfig pageConfig(const PageSetup &setup) const;
};

struct BreakCandidate {
    int elementIndex = 0;
    int score = 0;              // 0..100, higher = better place to break
    QString reason;
};

struct PlacedSlice {
    int elementIndex = 0;
    Slice slice;
    bool continuation = false;  // not the first piece of its element
};

struct PagePlan {
    QList<PlacedSlice> items;
    QString breakReason;        // why this page was started
};

struct Plan {
    DensityMetrics density;
    Strategy strategy;
    PageConfig config;
    QList<BreakCandidate> candidates;   // one per element
    QList<int> breakIndices;            // elements that start a new page
    QList<PagePlan> pages;
};

// Thresholds of the per-element break decision
constexpr int kPreferredBreakScore = 70;
constexpr int kNearbyBreakScore = 60;
constexpr int kNearbyWindow = 2;
constexpr qreal kOversizedTableHeight = 300.0;
constexpr qreal kOversizedImageHeight = 400.0;

DensityMetrics analyzeDensity(const Content::ElementList &elements, qreal basePageHeight);
Strategy strategyFor(const DensityMetrics &density, const PageSetup &setup);
QList<BreakCandidate> scoreBreakPoints(const Content::ElementList &elements);

class Paginator {
public:
    enum class State { Idle, AccumulatingPage, Finalizing };

    // (elements drawn so far, total elements)
    using ProgressCallback = std::function<void(int, int)>;

    explicit Paginator(const PageSetup &setup = PageSetup());

    // Choose the strategy for the document and resolve every element's
    // footprint with it. Elements are read-only after this call.
    Plan prepare(Content::ElementList &elements) const;

    // Page walk over estimated elements; fills pages and breakIndices.
    void plan(const Content::ElementList &elements, Plan &plan) const;

    // Draw the plan. Returns the number of pages drawn.
    int render(const Content::ElementList &elements, const Plan &plan,
               Render::Surface &surface, const Watermark::Compositor &compositor,
               const ProgressCallback &progress = ProgressCallback());

    State state() const { return m_state; }
    int placeholderCount() const { return m_placeholders; }

    static Watermark::PageContext pageContext(const Content::ElementList &elements,
                                              const Plan &plan, int pageIndex);

private:
    PageSetup m_setup;
    State m_state = State::Idle;
    int m_placeholders = 0;
};

} // namespace Layout

#endif // PAGESTAMP_PAGINATOR_H
