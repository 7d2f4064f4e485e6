#include "InsertionLocator.h"

#include <cstdlib>

InsertionLocator::InsertionLocator(const RoutineLayout* layout)
    : m_layout(layout)
{}

// ══════════════════════════════════════════════════════════════
// locate
// ══════════════════════════════════════════════════════════════
LadderResult<RungLocation> InsertionLocator::locate(int x, int y) const
{
    const int rungNumber = m_layout->rungAt(y);
    if (rungNumber < 0)
        return LadderResult<RungLocation>::failure(LadderError::NoRungAtCoordinate,
            QString("no rung at y=%1").arg(y));

    const LayoutResult& r = m_layout->rung(rungNumber);
    RungLocation loc;
    loc.rungNumber = rungNumber;

    const Branch* best = nullptr;
    for (const Branch& b : r.branches) {
        if (!b.containsPoint(x, y)) continue;
        if (!best || b.area() < best->area())
            best = &b;
    }
    if (best) {
        loc.branchId    = best->id;
        loc.branchLevel = best->branchLevel + 1;
    }
    return LadderResult<RungLocation>::success(loc);
}

// ══════════════════════════════════════════════════════════════
// findInsertionPosition
// ══════════════════════════════════════════════════════════════
LadderResult<int> InsertionLocator::findInsertionPosition(int x, int rungNumber,
                                                          int branchLevel,
                                                          BranchId branchId) const
{
    if (rungNumber < 0 || rungNumber >= m_layout->rungCount())
        return LadderResult<int>::failure(LadderError::RungNotFound,
            QString("rung %1 is not laid out").arg(rungNumber));

    const LayoutResult& r = m_layout->rung(rungNumber);
    if (branchId != NoBranch && !r.branch(branchId))
        return LadderResult<int>::failure(LadderError::BranchNotFound,
            QString("branch %1 not found in rung %2").arg(branchId).arg(rungNumber));

    const LayoutElement* closest = nullptr;
    int closestCenter = 0;
    int closestDist   = 0;
    for (const LayoutElement& le : r.elements) {
        if (le.railIndex < 0 || le.railBranchId != branchId || le.branchLevel != branchLevel)
            continue;

        // 嵌套分支块以整个分支的横向中心计
        int center = le.centerX();
        if (le.kind == RungElementKind::BranchStart) {
            const Branch* b = r.branch(le.branchId);
            if (b) center = (b->startX + b->endX) / 2;
        }
        const int dist = std::abs(x - center);
        if (!closest || dist < closestDist) {
            closest       = &le;
            closestCenter = center;
            closestDist   = dist;
        }
    }

    if (!closest) return LadderResult<int>::success(0);
    const int slot = (x < closestCenter) ? closest->railIndex : closest->railIndex + 1;
    return LadderResult<int>::success(slot);
}

LadderResult<InsertionTarget> InsertionLocator::resolveInsertion(const QPoint& p) const
{
    using Result = LadderResult<InsertionTarget>;

    const LadderResult<RungLocation> loc = locate(p);
    if (!loc.ok())
        return Result::failure(LadderError::InvalidInsertionPoint,
            QString("(%1, %2) is outside every rung").arg(p.x()).arg(p.y()));
    if (p.x() < m_layout->config().leftRailX)
        return Result::failure(LadderError::InvalidInsertionPoint,
            QString("(%1, %2) is left of the rail").arg(p.x()).arg(p.y()));

    const LadderResult<int> slot = findInsertionPosition(p.x(), loc.value.rungNumber,
                                                         loc.value.branchLevel,
                                                         loc.value.branchId);
    if (!slot.ok()) return Result::failure(slot.status);

    InsertionTarget t;
    t.rungNumber  = loc.value.rungNumber;
    t.branchLevel = loc.value.branchLevel;
    t.branchId    = loc.value.branchId;
    t.slot        = slot.value;
    return Result::success(t);
}

const LayoutElement* InsertionLocator::elementAt(const QPoint& p) const
{
    const int rungNumber = m_layout->rungAt(p.y());
    if (rungNumber < 0) return nullptr;
    for (const LayoutElement& le : m_layout->rung(rungNumber).elements)
        if (le.rect.contains(p)) return &le;
    return nullptr;
}
