#pragma once
#include <QVector>
#include "RungElement.h"

// ──────────────────────────────────────────────────────────────
// Branch — 分支（'[' 打开）或并联支路（',' 打开）
//
//   结构部分由 Rung 标注时填写；几何部分（startX … endY）只在
//   布局引擎的 BranchRegistry 里填写，Rung 自己的副本保持 0。
//
//   并联支路的 parentBranchId = 所属分支，且出现在其 childBranchIds 中；
//   支路里再开的分支，parentBranchId = 所在支路。
// ──────────────────────────────────────────────────────────────
struct Branch {
    BranchId         id             = NoBranch;
    BranchId         parentBranchId = NoBranch;
    BranchId         rootBranchId   = NoBranch;
    QVector<BranchId> childBranchIds;
    int              startPosition  = 0;
    int              endPosition    = -1;   // 未闭合时为 -1
    int              branchLevel    = 0;
    int              row            = 0;    // 本支路所在的纵向行号（主母线 = 0）
    bool             isRail         = false; // true = ',' 打开的并联支路

    // ── 几何（虚拟坐标单位）──
    int startX  = 0;
    int endX    = 0;
    int branchY = 0;   // 支路母线 y
    int startY  = 0;   // 包围盒上沿
    int endY    = 0;   // 包围盒下沿（含）

    bool containsPoint(int x, int y) const {
        return x >= startX && x <= endX && y >= startY && y <= endY;
    }
    long long area() const {
        return (long long)(endX - startX + 1) * (long long)(endY - startY + 1);
    }

    bool sameStructure(const Branch& o) const {
        return id == o.id && parentBranchId == o.parentBranchId
            && rootBranchId == o.rootBranchId && childBranchIds == o.childBranchIds
            && startPosition == o.startPosition && endPosition == o.endPosition
            && branchLevel == o.branchLevel && row == o.row && isRail == o.isRail;
    }
    bool operator==(const Branch& o) const {
        return sameStructure(o) && startX == o.startX && endX == o.endX
            && branchY == o.branchY && startY == o.startY && endY == o.endY;
    }
    bool operator!=(const Branch& o) const { return !(*this == o); }
};
