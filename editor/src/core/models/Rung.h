#pragma once
#include <QString>
#include <QVector>
#include "Branch.h"
#include "LadderError.h"
#include "RungElement.h"

// ──────────────────────────────────────────────────────────────────────────
// Rung — 一条梯级：有序元素序列（插入顺序 = 执行顺序）+ 注释
//
//   • 所有修改都先在候选序列上完成，再整体重新标注
//     （position / branchLevel / branchId / rootBranchId / 分支表），
//     标注失败则原状态不变 —— 不存在"改了一半"的梯级
//   • 分支 id 在每次提交时按发现顺序重新分配，只在当前版本内有效
//
// 插入位置有两种坐标：
//   ordinal —— 序列间隙序号（0 … size），新元素落在该序号上
//   slot    —— 某条母线上的局部序号：第 k 个直接成员之前；
//              成员 = 该母线上的指令 + 在该母线上打开的嵌套分支块
// ──────────────────────────────────────────────────────────────────────────
class Rung {
public:
    Rung() = default;

    // ── 访问 ──────────────────────────────────────────────────
    const QVector<RungElement>& sequence() const { return m_sequence; }
    int                size()    const { return m_sequence.size(); }
    bool               isEmpty() const { return m_sequence.isEmpty(); }
    const RungElement& at(int position) const { return m_sequence.at(position); }

    QString comment() const { return m_comment; }
    void    setComment(const QString& comment) { m_comment = comment; }
    // 注释行数（末尾换行不额外计一行；无注释为 0）
    int     commentLineCount() const { return countCommentLines(m_comment); }
    static int countCommentLines(const QString& comment);

    const QVector<Branch>& branches() const { return m_branches; }
    const Branch*          branch(BranchId id) const;
    bool                   hasBranches() const { return !m_branches.isEmpty(); }
    // 主母线以下用到的最深行号（并联支路也计入深度）
    int                    maxBranchDepth() const { return m_maxBranchDepth; }

    // ── 修改（失败时不改变任何状态）────────────────────────────
    LadderStatus setSequence(const QVector<RungElement>& elements);
    void         clear();

    LadderStatus insertInstruction(int slot, BranchId branchContext,
                                   const InstructionRef& instruction);
    // 用新分支包住同一母线上的间隙区间 [startOrdinal, endOrdinal)，并附带一条空支路
    LadderStatus insertBranch(int startOrdinal, int endOrdinal,
                              BranchId* newBranch = nullptr);
    // atPosition 处须为 BranchStart / BranchNext：在其后插入一条空并联支路
    LadderStatus insertBranchLevel(int atPosition, BranchId* newRail = nullptr);
    LadderStatus removeBranch(BranchId id);
    LadderStatus removeInstruction(int position);
    // toSlot 按移动前的编号计算（同母线向后移动时自动扣除自身）
    LadderStatus moveInstruction(int fromPosition, int toSlot, BranchId toContext);
    LadderStatus replaceInstruction(int position, const InstructionRef& instruction);

    // ── 查询 ──────────────────────────────────────────────────
    LadderResult<int> railInsertionOrdinal(BranchId context, int slot) const;
    QVector<int>      railMembers(BranchId context) const;
    BranchId          railAtGap(int ordinal) const;
    // 元素所在母线（分支标记返回其所在的外侧母线）
    BranchId          railOf(int position) const;
    int               slotOf(int position) const;
    int               branchNestingLevel(int position) const;
    int               findMatchingBranchEnd(int startPosition) const;
    QVector<InstructionRef> instructions() const;
    QVector<InstructionRef> instructionsInBranch(BranchId id) const;
    QVector<InstructionRef> mainLineInstructions() const;

    // 重新标注候选序列；结构损坏时返回 UnbalancedBranch
    static LadderStatus annotate(QVector<RungElement>& sequence,
                                 QVector<Branch>& branches,
                                 int* maxBranchDepth);

    bool operator==(const Rung& o) const {
        return m_sequence == o.m_sequence && m_comment == o.m_comment;
    }
    bool operator!=(const Rung& o) const { return !(*this == o); }

private:
    LadderStatus commit(QVector<RungElement> candidate);
    bool         validRail(BranchId context) const;

    QVector<RungElement> m_sequence;
    QString              m_comment;
    QVector<Branch>      m_branches;
    int                  m_maxBranchDepth = 0;
};
