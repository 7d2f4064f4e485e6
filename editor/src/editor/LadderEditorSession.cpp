#include "LadderEditorSession.h"

#include "../utils/LadderLog.h"
#include "../utils/UndoStack.h"

LadderEditorSession::LadderEditorSession(const LadderLayoutConfig& config, QObject* parent)
    : QObject(parent),
      m_layout(config),
      m_controller(&m_routine, &m_layout),
      m_locator(&m_layout),
      m_templateContact("XIC", {"NewContact"}),
      m_templateCoil("OTE", {"NewCoil"}),
      m_templateBlock("TON", {"Timer1", "1000", "0"})
{
    m_undoStack = new QUndoStack(this);

    // 任何撤销栈变化（压栈 / 撤销 / 重做）都意味着梯级内容变了
    connect(m_undoStack, &QUndoStack::indexChanged, this, [this](int) {
        clearSelection();
        emit layoutChanged();
    });
}

LadderStatus LadderEditorSession::report(const LadderStatus& st, const QString& what)
{
    if (!st.ok())
        emit logMessage(QString("%1: %2").arg(what, st.toString()));
    return st;
}

// ══════════════════════════════════════════════════════════════
// 例程 / 配置
// ══════════════════════════════════════════════════════════════
LadderStatus LadderEditorSession::loadRoutine(const Routine& routine)
{
    const Routine previous = m_routine;
    m_routine = routine;

    const LadderStatus st = m_layout.layoutAll(m_routine);
    if (!st.ok()) {
        m_routine = previous;
        return report(st, QString("Load routine %1").arg(routine.name));
    }

    cancel();
    m_undoStack->clear();
    clearSelection();
    emit logMessage(QString("Loaded routine %1 (%2 rungs)")
                        .arg(routine.name).arg(routine.rungCount()));
    emit layoutChanged();
    return st;
}

LadderStatus LadderEditorSession::setConfig(const LadderLayoutConfig& config)
{
    QString why;
    if (!config.isValid(&why))
        return report({LadderError::ParseError, why}, "Layout config");

    const LadderLayoutConfig previous = m_layout.config();
    m_layout.setConfig(config);
    const LadderStatus st = m_layout.layoutAll(m_routine);
    if (!st.ok()) {
        m_layout.setConfig(previous);
        return report(st, "Layout config");
    }
    emit layoutChanged();
    return st;
}

// ══════════════════════════════════════════════════════════════
// 模式
// ══════════════════════════════════════════════════════════════
void LadderEditorSession::setMode(EditorMode mode)
{
    if (mode == Mode_Drag && !m_selection.isValid()) {
        emit logMessage("Drag: nothing selected");
        return;
    }
    if (mode == Mode_ConnectBranch && !m_hasAnchor) {
        emit logMessage("Connect branch: no branch start");
        return;
    }
    if (mode != Mode_ConnectBranch)
        dropAnchor();

    m_mode = mode;
    qCDebug(lcLadderEdit).noquote() << "mode" << modeName(mode);
    emit modeChanged(mode);
}

QString LadderEditorSession::modeName(EditorMode mode)
{
    switch (mode) {
    case Mode_View:          return "View";
    case Mode_InsertContact: return "Insert contact";
    case Mode_InsertCoil:    return "Insert coil";
    case Mode_InsertBlock:   return "Insert block";
    case Mode_InsertBranch:  return "Insert branch";
    case Mode_ConnectBranch: return "Connect branch";
    case Mode_Drag:          return "Drag";
    }
    return "View";
}

InstructionRef LadderEditorSession::instructionTemplate(EditorMode mode) const
{
    switch (mode) {
    case Mode_InsertContact: return m_templateContact;
    case Mode_InsertCoil:    return m_templateCoil;
    case Mode_InsertBlock:   return m_templateBlock;
    default:                 return {};
    }
}

void LadderEditorSession::setInstructionTemplate(EditorMode mode, const InstructionRef& ref)
{
    switch (mode) {
    case Mode_InsertContact: m_templateContact = ref; break;
    case Mode_InsertCoil:    m_templateCoil    = ref; break;
    case Mode_InsertBlock:   m_templateBlock   = ref; break;
    default: break;
    }
}

void LadderEditorSession::dropAnchor()
{
    m_hasAnchor = false;
    m_anchor    = InsertionTarget();
}

void LadderEditorSession::cancel()
{
    dropAnchor();
    if (m_mode != Mode_View)
        setMode(Mode_View);
}

// ══════════════════════════════════════════════════════════════
// 选择
// ══════════════════════════════════════════════════════════════
bool LadderEditorSession::select(int rung, int position)
{
    if (!m_routine.hasRung(rung) || position < 0 || position >= m_routine.rung(rung).size())
        return false;
    m_selection = {rung, position};
    m_layout.setSelection(rung, position);
    emit selectionChanged();
    return true;
}

bool LadderEditorSession::selectAt(const QPoint& p)
{
    const LayoutElement* le = m_locator.elementAt(p);
    if (!le) {
        clearSelection();
        return false;
    }
    return select(le->rungNumber, le->position);
}

void LadderEditorSession::clearSelection()
{
    if (!m_selection.isValid()) return;
    m_selection = Selection();
    m_layout.setSelection(-1, -1);
    emit selectionChanged();
}

// ══════════════════════════════════════════════════════════════
// 指针事件
// ══════════════════════════════════════════════════════════════
LadderStatus LadderEditorSession::click(const QPoint& p)
{
    switch (m_mode) {
    case Mode_View:
        selectAt(p);
        return LadderStatus::success();

    case Mode_InsertContact:
    case Mode_InsertCoil:
    case Mode_InsertBlock:
        return insertAtPoint(p);

    case Mode_InsertBranch: {
        const LadderResult<InsertionTarget> t = m_locator.resolveInsertion(p);
        if (!t.ok()) return report(t.status, "Insert branch");
        m_anchor    = t.value;
        m_hasAnchor = true;
        setMode(Mode_ConnectBranch);
        return LadderStatus::success();
    }

    case Mode_ConnectBranch:
        return connectBranch(p);

    case Mode_Drag:
        return release(p);
    }
    return LadderStatus::success();
}

LadderStatus LadderEditorSession::insertAtPoint(const QPoint& p)
{
    const QString what = modeName(m_mode);
    const LadderResult<InsertionTarget> t = m_locator.resolveInsertion(p);
    if (!t.ok()) {
        // 点空：保持当前模式
        qCInfo(lcLadderEdit).noquote() << what << "missed:" << t.status.toString();
        return report(t.status, what);
    }

    const LadderStatus st = insertInstruction(t.value.rungNumber, t.value.slot,
                                              t.value.branchId, instructionTemplate(m_mode));
    if (st.ok()) setMode(Mode_View);
    return st;
}

LadderStatus LadderEditorSession::connectBranch(const QPoint& p)
{
    const InsertionTarget anchor = m_anchor;
    dropAnchor();

    const LadderResult<InsertionTarget> t = m_locator.resolveInsertion(p);
    LadderStatus st;
    if (!t.ok()) {
        st = t.status;
    } else if (t.value.rungNumber != anchor.rungNumber || t.value.branchId != anchor.branchId) {
        st = {LadderError::InvalidInsertionPoint,
              "branch end must be on the same rung and rail as its start"};
    } else {
        st = insertBranch(anchor.rungNumber, anchor.branchId, anchor.slot, t.value.slot);
    }

    if (!st.ok())
        emit logMessage(QString("Connect branch abandoned: %1").arg(st.toString()));
    setMode(Mode_View);
    return st;
}

LadderResult<InsertionTarget> LadderEditorSession::hover(const QPoint& p) const
{
    return m_locator.resolveInsertion(p);
}

bool LadderEditorSession::beginDrag()
{
    if (!m_selection.isValid()) {
        emit logMessage("Drag: nothing selected");
        return false;
    }
    setMode(Mode_Drag);
    return true;
}

LadderStatus LadderEditorSession::release(const QPoint& p)
{
    if (m_mode != Mode_Drag)
        return LadderStatus::success();

    const Selection sel = m_selection;
    const LadderResult<InsertionTarget> t = m_locator.resolveInsertion(p);
    const LadderStatus st = t.ok()
        ? moveElement(sel.rung, sel.position, t.value.rungNumber, t.value.slot, t.value.branchId)
        : report(t.status, "Drop");

    setMode(Mode_View);
    return st;
}

// ══════════════════════════════════════════════════════════════
// 可撤销的编辑操作
// ══════════════════════════════════════════════════════════════
template <typename Op>
LadderStatus LadderEditorSession::editRung(int rung, const QString& text, Op op)
{
    if (!m_routine.hasRung(rung))
        return report({LadderError::RungNotFound, QString("rung %1 does not exist").arg(rung)},
                      text);

    const Rung before = m_routine.rung(rung);
    const LadderStatus st = op();
    if (!st.ok()) return report(st, text);

    m_undoStack->push(new RungEditCmd(&m_controller, rung, before, m_routine.rung(rung), text));
    return st;
}

LadderStatus LadderEditorSession::insertInstruction(int rung, int slot, BranchId branchContext,
                                                    const InstructionRef& instruction)
{
    return editRung(rung, QString("Insert %1").arg(instruction.mnemonic), [&] {
        return m_controller.insertElementAt(rung, slot, branchContext, instruction);
    });
}

LadderStatus LadderEditorSession::insertBranch(int rung, BranchId branchContext,
                                               int startSlot, int endSlot)
{
    return editRung(rung, "Insert branch", [&] {
        return m_controller.insertBranch(rung, branchContext, startSlot, endSlot);
    });
}

LadderStatus LadderEditorSession::insertBranchLevel(int rung, int position)
{
    return editRung(rung, "Insert branch level", [&] {
        return m_controller.insertBranchLevel(rung, position);
    });
}

LadderStatus LadderEditorSession::removeBranch(int rung, BranchId id)
{
    return editRung(rung, "Remove branch", [&] {
        return m_controller.removeBranch(rung, id);
    });
}

LadderStatus LadderEditorSession::deleteElement(int rung, int position)
{
    return editRung(rung, "Delete", [&] {
        return m_controller.deleteElementAt(rung, position);
    });
}

LadderStatus LadderEditorSession::deleteSelection()
{
    if (!m_selection.isValid())
        return report({LadderError::PositionOutOfRange, "nothing selected"}, "Delete");
    const Selection sel = m_selection;
    return deleteElement(sel.rung, sel.position);
}

LadderStatus LadderEditorSession::replaceInstruction(int rung, int position,
                                                     const InstructionRef& instruction)
{
    return editRung(rung, QString("Edit %1").arg(instruction.mnemonic), [&] {
        return m_controller.replaceInstruction(rung, position, instruction);
    });
}

LadderStatus LadderEditorSession::moveElement(int fromRung, int fromPosition,
                                              int toRung, int toSlot, BranchId toContext)
{
    if (fromRung == toRung) {
        return editRung(fromRung, "Move", [&] {
            return m_controller.moveElement(fromRung, fromPosition, toRung, toSlot, toContext);
        });
    }

    if (!m_routine.hasRung(fromRung) || !m_routine.hasRung(toRung))
        return report({LadderError::RungNotFound, "move between unknown rungs"}, "Move");

    const Rung sourceBefore = m_routine.rung(fromRung);
    const Rung targetBefore = m_routine.rung(toRung);
    const LadderStatus st = m_controller.moveElement(fromRung, fromPosition,
                                                     toRung, toSlot, toContext);
    if (!st.ok()) return report(st, "Move");

    auto* macro = new QUndoCommand("Move");
    new RungEditCmd(&m_controller, fromRung, sourceBefore, m_routine.rung(fromRung), "Move", macro);
    new RungEditCmd(&m_controller, toRung, targetBefore, m_routine.rung(toRung), "Move", macro);
    m_undoStack->push(macro);
    return st;
}

LadderStatus LadderEditorSession::setComment(int rung, const QString& comment)
{
    return editRung(rung, "Edit comment", [&] {
        return m_controller.setComment(rung, comment);
    });
}

LadderStatus LadderEditorSession::addRung(int index, const Rung& rung)
{
    if (index < 0 || index > m_routine.rungCount())
        return report({LadderError::RungNotFound,
                       QString("cannot add rung at %1").arg(index)}, "Add rung");

    const int before = m_routine.rungCount();
    m_undoStack->push(new RungListCmd(&m_controller, RungListCmd::Insert, index, rung,
                                      "Add rung"));
    if (m_routine.rungCount() != before + 1)
        return report({LadderError::UnbalancedBranch, "rung could not be laid out"}, "Add rung");
    return LadderStatus::success();
}

LadderStatus LadderEditorSession::removeRung(int index)
{
    if (!m_routine.hasRung(index))
        return report({LadderError::RungNotFound,
                       QString("rung %1 does not exist").arg(index)}, "Remove rung");

    m_undoStack->push(new RungListCmd(&m_controller, RungListCmd::Remove, index,
                                      m_routine.rung(index), "Remove rung"));
    return LadderStatus::success();
}
