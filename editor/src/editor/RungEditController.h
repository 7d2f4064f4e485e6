#pragma once
#include <QPoint>
#include <QString>
#include "InsertionLocator.h"
#include "../core/layout/RoutineLayout.h"
#include "../core/models/Routine.h"

// ──────────────────────────────────────────────────────────────────────────
// RungEditController — 修改例程并驱动重新布局
//
//   每个操作都在梯级副本上完成；模型修改与布局都成功后才提交，
//   任一步失败时 routine 与布局缓存都保持原样。
//   布局更新交给 RoutineLayout 的工作队列（高度级联到不动点）。
//
//   位置参数：
//     slot     —— 某条母线上的局部序号（见 Rung）
//     position —— 梯级序列中的绝对序号
// ──────────────────────────────────────────────────────────────────────────
class RungEditController {
public:
    RungEditController(Routine* routine, RoutineLayout* layout);

    // ── 指令 ──────────────────────────────────────────────────
    LadderStatus insertElementAt(int rung, int slot, BranchId branchContext,
                                 const InstructionRef& instruction);
    LadderStatus insertElementAtPoint(const QPoint& point, const InstructionRef& instruction,
                                      InsertionTarget* target = nullptr);
    // 指令 → 删除指令；分支标记 → 删除其所属分支 / 支路
    LadderStatus deleteElementAt(int rung, int position);
    LadderStatus removeInstruction(int rung, int position);
    LadderStatus replaceInstruction(int rung, int position, const InstructionRef& instruction);
    // toSlot 按移动前的编号；可跨梯级
    LadderStatus moveElement(int fromRung, int fromPosition,
                             int toRung, int toSlot, BranchId toContext);

    // ── 分支 ──────────────────────────────────────────────────
    // 用新分支包住 branchContext 母线上 [startSlot, endSlot) 的成员
    LadderStatus insertBranch(int rung, BranchId branchContext, int startSlot, int endSlot,
                              BranchId* newBranch = nullptr);
    LadderStatus insertBranchLevel(int rung, int position, BranchId* newRail = nullptr);
    LadderStatus removeBranch(int rung, BranchId id);

    // ── 梯级 ──────────────────────────────────────────────────
    LadderStatus setComment(int rung, const QString& comment);
    LadderStatus addRung(int index, const Rung& rung);
    LadderStatus removeRung(int index);
    LadderStatus replaceRung(int index, const Rung& rung);

    const Routine&       routine() const { return *m_routine; }
    const RoutineLayout& layout()  const { return *m_layout; }

private:
    // 提交梯级副本并重新布局；布局失败时回滚
    LadderStatus commit(int index, const Rung& edited, const QString& what);
    LadderStatus checkRung(int index) const;
    LadderStatus fail(const LadderStatus& status, const QString& what) const;

    Routine*       m_routine;
    RoutineLayout* m_layout;
};
