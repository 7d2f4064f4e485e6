#pragma once
#include <QStack>
#include <QVector>
#include "../models/Branch.h"
#include "../models/LadderError.h"

// ──────────────────────────────────────────────────────────────────────────
// BranchRegistry — 一次从左到右布局遍历中的分支登记表
//
//   • 打开栈：'[' 压栈，']' 出栈；栈帧保存打开前的母线 / 层级 / 行号
//   • 闭合目录：按发现顺序稠密编号的 Branch 数组，随 LayoutResult 一起返回
//   • ']' 出栈时计算包围盒，并做子支路纵向协调：
//       第 i 条支路的 endY = 第 i+1 条的 startY - 1，最后一条延伸到父分支 endY
//   • 结构错误（栈空时遇到 ',' / ']'，']' 的 id 与出栈帧不符，遍历结束仍有
//     未闭合分支）返回 UnbalancedBranch，不做任何修复
// ──────────────────────────────────────────────────────────────────────────
class BranchRegistry {
public:
    struct OpenBranch {
        BranchId id          = NoBranch;
        BranchId railBefore  = NoBranch;
        BranchId rootBefore  = NoBranch;
        int      levelBefore = 0;
        int      rowBefore   = 0;
        int      maxRow      = 0;   // 分支内部用到的最深行
        int      maxRight    = 0;   // 各支路的最右边沿
    };

    // 新一轮遍历：railBaseY = 主母线 y
    void begin(int railBaseY, int branchSpacing);

    int railY(int row) const { return m_railBaseY + row * m_branchSpacing; }

    // '['：在 parentRail 上打开新分支，返回其 id
    BranchId open(int position, int startX, BranchId parentRail, BranchId root,
                  int level, int parentRow, int startRight);
    // ','：为栈顶分支追加一条并联支路，返回支路 id
    LadderResult<BranchId> next(int position, int railRight);
    // ']'：闭合栈顶分支；expectedId 为 NoBranch 时不校验。
    //   ']' 标记放在 maxRight + leadGap 处，宽 markerWidth；返回的帧中 maxRight 已含当前支路
    LadderResult<OpenBranch> close(int position, BranchId expectedId, int railRight,
                                   int leadGap, int markerWidth);
    // 遍历结束：检查是否还有未闭合分支
    LadderStatus finish() const;

    bool              hasOpen() const { return !m_stack.isEmpty(); }
    int               openCount() const { return m_stack.size(); }
    const OpenBranch& top() const { return m_stack.top(); }

    // 已打开 / 已闭合的分支，下标 = id
    const QVector<Branch>& catalog() const { return m_catalog; }
    const Branch&          branch(BranchId id) const { return m_catalog.at(id); }
    int                    deepestRow() const { return m_deepestRow; }

private:
    void reconcileChildren(Branch& parent);

    QStack<OpenBranch> m_stack;
    QVector<Branch>    m_catalog;
    int                m_railBaseY     = 0;
    int                m_branchSpacing = 0;
    int                m_deepestRow    = 0;
};
