#pragma once
#include <QPoint>
#include "../core/layout/RoutineLayout.h"

// 坐标落在哪条梯级 / 哪条母线上
struct RungLocation {
    int      rungNumber  = -1;
    int      branchLevel = 0;
    BranchId branchId    = NoBranch;   // 母线（主母线为 NoBranch）
};

// 可插入的逻辑位置：rung + 母线 + 母线局部序号
struct InsertionTarget {
    int      rungNumber  = -1;
    int      branchLevel = 0;
    BranchId branchId    = NoBranch;
    int      slot        = 0;

    bool operator==(const InsertionTarget& o) const {
        return rungNumber == o.rungNumber && branchLevel == o.branchLevel
            && branchId == o.branchId && slot == o.slot;
    }
    bool operator!=(const InsertionTarget& o) const { return !(*this == o); }
};

// ──────────────────────────────────────────────────────────────
// InsertionLocator — 屏幕坐标 → 逻辑插入点（只读，不修改任何状态）
//   悬停预览与放置 / 拖放共用同一套解析
// ──────────────────────────────────────────────────────────────
class InsertionLocator {
public:
    explicit InsertionLocator(const RoutineLayout* layout);

    // 梯级由 y 决定；分支取包含该点的最小包围盒，均不包含时为主母线
    LadderResult<RungLocation> locate(int x, int y) const;
    LadderResult<RungLocation> locate(const QPoint& p) const { return locate(p.x(), p.y()); }

    // 该母线的直接成员中，中心离 x 最近者之前 / 之后（相等算之后）；空母线为 0
    LadderResult<int> findInsertionPosition(int x, int rungNumber, int branchLevel,
                                            BranchId branchId) const;

    // locate + 母线原点检查 + 局部序号；不可插入时返回 InvalidInsertionPoint
    LadderResult<InsertionTarget> resolveInsertion(const QPoint& p) const;

    // 点下的布局元素（选择用）；无则 nullptr
    const LayoutElement* elementAt(const QPoint& p) const;

private:
    const RoutineLayout* m_layout;
};
