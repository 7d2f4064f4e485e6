#include "BranchRegistry.h"

#include <algorithm>

void BranchRegistry::begin(int railBaseY, int branchSpacing)
{
    m_stack.clear();
    m_catalog.clear();
    m_railBaseY     = railBaseY;
    m_branchSpacing = branchSpacing;
    m_deepestRow    = 0;
}

BranchId BranchRegistry::open(int position, int startX, BranchId parentRail, BranchId root,
                              int level, int parentRow, int startRight)
{
    Branch b;
    b.id             = m_catalog.size();
    b.parentBranchId = parentRail;
    b.rootBranchId   = (root == NoBranch) ? b.id : root;
    b.startPosition  = position;
    b.branchLevel    = level;
    b.row            = parentRow + 1;
    b.startX         = startX;
    m_catalog.append(b);

    OpenBranch f;
    f.id          = b.id;
    f.railBefore  = parentRail;
    f.rootBefore  = root;
    f.levelBefore = level;
    f.rowBefore   = parentRow;
    f.maxRow      = b.row;
    f.maxRight    = startRight;
    m_stack.push(f);

    m_deepestRow = std::max(m_deepestRow, b.row);
    return b.id;
}

LadderResult<BranchId> BranchRegistry::next(int position, int railRight)
{
    if (m_stack.isEmpty())
        return LadderResult<BranchId>::failure(LadderError::UnbalancedBranch,
            QString("branch-next at position %1 has no open branch").arg(position));

    OpenBranch& f = m_stack.top();
    f.maxRight = std::max(f.maxRight, railRight);

    Branch c;
    c.id             = m_catalog.size();
    c.parentBranchId = f.id;
    c.rootBranchId   = m_catalog[f.id].rootBranchId;
    c.startPosition  = position;
    c.branchLevel    = m_catalog[f.id].branchLevel;
    c.row            = f.maxRow + 1;
    c.isRail         = true;
    c.startX         = m_catalog[f.id].startX;

    Branch& parent = m_catalog[f.id];
    if (!parent.childBranchIds.isEmpty())
        m_catalog[parent.childBranchIds.last()].endPosition = position - 1;
    parent.childBranchIds.append(c.id);
    m_catalog.append(c);

    f.maxRow     = c.row;
    m_deepestRow = std::max(m_deepestRow, c.row);
    return LadderResult<BranchId>::success(c.id);
}

LadderResult<BranchRegistry::OpenBranch>
BranchRegistry::close(int position, BranchId expectedId, int railRight,
                      int leadGap, int markerWidth)
{
    using Result = LadderResult<OpenBranch>;
    if (m_stack.isEmpty())
        return Result::failure(LadderError::UnbalancedBranch,
            QString("branch-end at position %1 has no open branch").arg(position));
    if (expectedId != NoBranch && expectedId != m_stack.top().id)
        return Result::failure(LadderError::UnbalancedBranch,
            QString("branch-end at position %1 closes branch %2, but branch %3 is open")
                .arg(position).arg(expectedId).arg(m_stack.top().id));

    OpenBranch f = m_stack.pop();
    f.maxRight = std::max(f.maxRight, railRight);

    Branch& b = m_catalog[f.id];
    b.endPosition = position;
    if (!b.childBranchIds.isEmpty())
        m_catalog[b.childBranchIds.last()].endPosition = position - 1;

    // ── 包围盒 ──
    const int half = m_branchSpacing / 2;
    b.endX    = f.maxRight + leadGap + markerWidth;
    b.branchY = railY(b.row);
    b.startY  = b.branchY - half;
    b.endY    = railY(f.maxRow) + half - 1;
    reconcileChildren(b);

    if (!m_stack.isEmpty())
        m_stack.top().maxRow = std::max(m_stack.top().maxRow, f.maxRow);
    return Result::success(f);
}

// 子支路共享父分支的横向范围，纵向依次堆叠
void BranchRegistry::reconcileChildren(Branch& parent)
{
    const int half = m_branchSpacing / 2;
    const QVector<BranchId> kids = parent.childBranchIds;
    for (int i = 0; i < kids.size(); ++i) {
        Branch& c = m_catalog[kids[i]];
        c.startX  = parent.startX;
        c.endX    = parent.endX;
        c.branchY = railY(c.row);
        c.startY  = c.branchY - half;
    }
    for (int i = 0; i < kids.size(); ++i) {
        Branch& c = m_catalog[kids[i]];
        c.endY = (i + 1 < kids.size()) ? m_catalog[kids[i + 1]].startY - 1
                                       : parent.endY;
    }
}

LadderStatus BranchRegistry::finish() const
{
    if (m_stack.isEmpty()) return LadderStatus::success();
    return {LadderError::UnbalancedBranch,
            QString("branch opened at position %1 is never closed")
                .arg(m_catalog[m_stack.top().id].startPosition)};
}
