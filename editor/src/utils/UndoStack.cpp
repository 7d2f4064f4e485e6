#include "UndoStack.h"

#include "LadderLog.h"
#include "../editor/RungEditController.h"

// ─────────────────────────────────────────────────────────────
// RungEditCmd
// ─────────────────────────────────────────────────────────────
RungEditCmd::RungEditCmd(RungEditController* controller, int rungIndex,
                         const Rung& before, const Rung& after,
                         const QString& text, QUndoCommand* parent)
    : QUndoCommand(text, parent), m_controller(controller), m_index(rungIndex),
      m_before(before), m_after(after)
{}

void RungEditCmd::apply(const Rung& rung)
{
    // push 时的首次 redo：模型已是目标状态
    if (m_controller->routine().hasRung(m_index)
        && m_controller->routine().rung(m_index) == rung)
        return;

    const LadderStatus st = m_controller->replaceRung(m_index, rung);
    if (!st.ok())
        qCWarning(lcLadderEdit).noquote() << text() << ":" << st.toString();
}

void RungEditCmd::redo() { apply(m_after); }
void RungEditCmd::undo() { apply(m_before); }

// ─────────────────────────────────────────────────────────────
// RungListCmd
// ─────────────────────────────────────────────────────────────
RungListCmd::RungListCmd(RungEditController* controller, Op op, int rungIndex,
                         const Rung& rung, const QString& text, QUndoCommand* parent)
    : QUndoCommand(text, parent), m_controller(controller), m_op(op),
      m_index(rungIndex), m_rung(rung)
{}

void RungListCmd::insert()
{
    const LadderStatus st = m_controller->addRung(m_index, m_rung);
    if (!st.ok())
        qCWarning(lcLadderEdit).noquote() << text() << ":" << st.toString();
}

void RungListCmd::remove()
{
    const LadderStatus st = m_controller->removeRung(m_index);
    if (!st.ok())
        qCWarning(lcLadderEdit).noquote() << text() << ":" << st.toString();
}

void RungListCmd::redo()
{
    if (m_op == Insert) insert();
    else                remove();
}

void RungListCmd::undo()
{
    if (m_op == Insert) remove();
    else                insert();
}
