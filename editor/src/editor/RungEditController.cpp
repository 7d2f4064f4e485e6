#include "RungEditController.h"

#include <utility>

#include "../utils/LadderLog.h"

RungEditController::RungEditController(Routine* routine, RoutineLayout* layout)
    : m_routine(routine), m_layout(layout)
{}

LadderStatus RungEditController::checkRung(int index) const
{
    if (m_routine->hasRung(index)) return LadderStatus::success();
    return {LadderError::RungNotFound, QString("rung %1 does not exist").arg(index)};
}

LadderStatus RungEditController::fail(const LadderStatus& status, const QString& what) const
{
    qCWarning(lcLadderEdit).noquote() << what << "failed:" << status.toString();
    return status;
}

LadderStatus RungEditController::commit(int index, const Rung& edited, const QString& what)
{
    const Rung before = m_routine->rung(index);
    m_routine->rung(index) = edited;

    const LadderStatus st = m_layout->invalidate(*m_routine, index);
    if (!st.ok()) {
        m_routine->rung(index) = before;
        return fail(st, what);
    }
    qCDebug(lcLadderEdit).noquote() << what << "on rung" << index;
    return st;
}

// ══════════════════════════════════════════════════════════════
// 指令
// ══════════════════════════════════════════════════════════════
LadderStatus RungEditController::insertElementAt(int rung, int slot, BranchId branchContext,
                                                 const InstructionRef& instruction)
{
    const QString what = QString("insert %1").arg(instruction.text());
    LadderStatus st = checkRung(rung);
    if (!st.ok()) return fail(st, what);

    Rung edited = m_routine->rung(rung);
    st = edited.insertInstruction(slot, branchContext, instruction);
    if (!st.ok()) return fail(st, what);
    return commit(rung, edited, what);
}

LadderStatus RungEditController::insertElementAtPoint(const QPoint& point,
                                                      const InstructionRef& instruction,
                                                      InsertionTarget* target)
{
    const InsertionLocator locator(m_layout);
    const LadderResult<InsertionTarget> t = locator.resolveInsertion(point);
    if (!t.ok()) {
        qCInfo(lcLadderEdit).noquote() << "no insertion point:" << t.status.toString();
        return t.status;
    }
    if (target) *target = t.value;
    return insertElementAt(t.value.rungNumber, t.value.slot, t.value.branchId, instruction);
}

LadderStatus RungEditController::deleteElementAt(int rung, int position)
{
    const QString what = QString("delete element %1").arg(position);
    LadderStatus st = checkRung(rung);
    if (!st.ok()) return fail(st, what);

    const Rung& current = m_routine->rung(rung);
    if (position < 0 || position >= current.size())
        return fail({LadderError::PositionOutOfRange,
                     QString("position %1 outside rung (0..%2)")
                         .arg(position).arg(current.size() - 1)}, what);

    const RungElement& e = current.at(position);
    if (e.isInstruction())
        return removeInstruction(rung, position);
    // '[' / ']' 删除整个分支，',' 删除它打开的支路
    return removeBranch(rung, e.branchId);
}

LadderStatus RungEditController::removeInstruction(int rung, int position)
{
    const QString what = QString("remove instruction %1").arg(position);
    LadderStatus st = checkRung(rung);
    if (!st.ok()) return fail(st, what);

    Rung edited = m_routine->rung(rung);
    st = edited.removeInstruction(position);
    if (!st.ok()) return fail(st, what);
    return commit(rung, edited, what);
}

LadderStatus RungEditController::replaceInstruction(int rung, int position,
                                                    const InstructionRef& instruction)
{
    const QString what = QString("replace instruction %1").arg(position);
    LadderStatus st = checkRung(rung);
    if (!st.ok()) return fail(st, what);

    Rung edited = m_routine->rung(rung);
    st = edited.replaceInstruction(position, instruction);
    if (!st.ok()) return fail(st, what);
    return commit(rung, edited, what);
}

LadderStatus RungEditController::moveElement(int fromRung, int fromPosition,
                                             int toRung, int toSlot, BranchId toContext)
{
    const QString what = QString("move element %1").arg(fromPosition);
    LadderStatus st = checkRung(fromRung);
    if (st.ok()) st = checkRung(toRung);
    if (!st.ok()) return fail(st, what);

    if (fromRung == toRung) {
        Rung edited = m_routine->rung(fromRung);
        st = edited.moveInstruction(fromPosition, toSlot, toContext);
        if (!st.ok()) return fail(st, what);
        return commit(fromRung, edited, what);
    }

    // 跨梯级：源梯级删除，目标梯级插入，两条一起提交
    Rung source = m_routine->rung(fromRung);
    Rung target = m_routine->rung(toRung);
    if (fromPosition < 0 || fromPosition >= source.size())
        return fail({LadderError::PositionOutOfRange,
                     QString("position %1 outside rung %2").arg(fromPosition).arg(fromRung)}, what);
    const InstructionRef ref = source.at(fromPosition).instruction;

    st = source.removeInstruction(fromPosition);
    if (st.ok()) st = target.insertInstruction(toSlot, toContext, ref);
    if (!st.ok()) return fail(st, what);

    const Rung sourceBefore = m_routine->rung(fromRung);
    const Rung targetBefore = m_routine->rung(toRung);
    m_routine->rung(fromRung) = source;
    m_routine->rung(toRung)   = target;

    st = m_layout->invalidate(*m_routine, QVector<int>{fromRung, toRung});
    if (!st.ok()) {
        m_routine->rung(fromRung) = sourceBefore;
        m_routine->rung(toRung)   = targetBefore;
        return fail(st, what);
    }
    qCDebug(lcLadderEdit) << "moved element from rung" << fromRung << "to rung" << toRung;
    return st;
}

// ══════════════════════════════════════════════════════════════
// 分支
// ══════════════════════════════════════════════════════════════
LadderStatus RungEditController::insertBranch(int rung, BranchId branchContext,
                                              int startSlot, int endSlot,
                                              BranchId* newBranch)
{
    const QString what = QString("insert branch");
    LadderStatus st = checkRung(rung);
    if (!st.ok()) return fail(st, what);

    Rung edited = m_routine->rung(rung);
    if (startSlot > endSlot) std::swap(startSlot, endSlot);

    const LadderResult<int> start = edited.railInsertionOrdinal(branchContext, startSlot);
    if (!start.ok()) return fail(start.status, what);
    const LadderResult<int> end = edited.railInsertionOrdinal(branchContext, endSlot);
    if (!end.ok()) return fail(end.status, what);

    BranchId id = NoBranch;
    st = edited.insertBranch(start.value, end.value, &id);
    if (!st.ok()) return fail(st, what);

    st = commit(rung, edited, what);
    if (st.ok() && newBranch) *newBranch = id;
    return st;
}

LadderStatus RungEditController::insertBranchLevel(int rung, int position, BranchId* newRail)
{
    const QString what = QString("insert branch level at %1").arg(position);
    LadderStatus st = checkRung(rung);
    if (!st.ok()) return fail(st, what);

    Rung edited = m_routine->rung(rung);
    BranchId id = NoBranch;
    st = edited.insertBranchLevel(position, &id);
    if (!st.ok()) return fail(st, what);

    st = commit(rung, edited, what);
    if (st.ok() && newRail) *newRail = id;
    return st;
}

LadderStatus RungEditController::removeBranch(int rung, BranchId id)
{
    const QString what = QString("remove branch %1").arg(id);
    LadderStatus st = checkRung(rung);
    if (!st.ok()) return fail(st, what);

    Rung edited = m_routine->rung(rung);
    st = edited.removeBranch(id);
    if (!st.ok()) return fail(st, what);
    return commit(rung, edited, what);
}

// ══════════════════════════════════════════════════════════════
// 梯级
// ══════════════════════════════════════════════════════════════
LadderStatus RungEditController::setComment(int rung, const QString& comment)
{
    const QString what = QString("set comment");
    LadderStatus st = checkRung(rung);
    if (!st.ok()) return fail(st, what);

    Rung edited = m_routine->rung(rung);
    edited.setComment(comment);
    return commit(rung, edited, what);
}

LadderStatus RungEditController::addRung(int index, const Rung& rung)
{
    const QString what = QString("add rung %1").arg(index);
    LadderStatus st = m_routine->insertRung(index, rung);
    if (!st.ok()) return fail(st, what);

    st = m_layout->rungInserted(*m_routine, index);
    if (!st.ok()) {
        const LadderStatus undone = m_routine->removeRung(index);
        if (!undone.ok()) qCWarning(lcLadderEdit) << undone.toString();
        return fail(st, what);
    }
    qCDebug(lcLadderEdit).noquote() << what;
    return st;
}

LadderStatus RungEditController::removeRung(int index)
{
    const QString what = QString("remove rung %1").arg(index);
    LadderStatus st = checkRung(index);
    if (!st.ok()) return fail(st, what);

    const Rung removed = m_routine->rung(index);
    st = m_routine->removeRung(index);
    if (!st.ok()) return fail(st, what);

    st = m_layout->rungRemoved(*m_routine, index);
    if (!st.ok()) {
        const LadderStatus undone = m_routine->insertRung(index, removed);
        if (!undone.ok()) qCWarning(lcLadderEdit) << undone.toString();
        return fail(st, what);
    }
    qCDebug(lcLadderEdit).noquote() << what;
    return st;
}

LadderStatus RungEditController::replaceRung(int index, const Rung& rung)
{
    const QString what = QString("replace rung %1").arg(index);
    const LadderStatus st = checkRung(index);
    if (!st.ok()) return fail(st, what);
    return commit(index, rung, what);
}
