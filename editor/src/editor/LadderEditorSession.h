#pragma once
#include <QObject>
#include <QPoint>
#include <QUndoStack>
#include "InsertionLocator.h"
#include "RungEditController.h"

// ──────────────────────────────────────────────
// 编辑模式
// ──────────────────────────────────────────────
enum EditorMode {
    Mode_View,

    Mode_InsertContact,  // 插入触点  -| |-
    Mode_InsertCoil,     // 插入线圈  -( )-
    Mode_InsertBlock,    // 插入功能块

    Mode_InsertBranch,   // 第一次点击：记录分支起点
    Mode_ConnectBranch,  // 第二次点击：在同一母线上闭合分支

    Mode_Drag,           // 拖动选中的指令
};

// ──────────────────────────────────────────────────────────────────────────
// LadderEditorSession — 一个打开的例程的编辑会话
//
//   • 独占 routine、布局缓存和撤销栈；所有调用在同一线程（UI 事件循环）
//   • 模式：View → {插入 / 分支 / 拖动} → View
//       插入模式：成功插入后回到 View；点空则记录日志、保持当前模式
//       InsertBranch：记录锚点后进入 ConnectBranch；ConnectBranch 在同一
//         梯级同一母线上成功闭合，或目标无效时放弃锚点，两种情况都回到 View
//       Drag：必须有选中元素才能进入；释放后无论成败都回到 View
//   • 所有修改都压入 QUndoStack（梯级快照命令）
// ──────────────────────────────────────────────────────────────────────────
class LadderEditorSession : public QObject {
    Q_OBJECT
public:
    struct Selection {
        int rung     = -1;
        int position = -1;
        bool isValid() const { return rung >= 0 && position >= 0; }
    };

    explicit LadderEditorSession(const LadderLayoutConfig& config = LadderLayoutConfig(),
                                 QObject* parent = nullptr);

    LadderStatus loadRoutine(const Routine& routine);
    LadderStatus setConfig(const LadderLayoutConfig& config);

    const Routine&          routine() const { return m_routine; }
    const RoutineLayout&    layout()  const { return m_layout; }
    const InsertionLocator& locator() const { return m_locator; }
    QUndoStack*             undoStack() const { return m_undoStack; }

    // ── 模式 ──────────────────────────────────────────────────
    void       setMode(EditorMode mode);
    EditorMode currentMode() const { return m_mode; }
    static QString modeName(EditorMode mode);

    // 插入模式使用的指令模板
    InstructionRef instructionTemplate(EditorMode mode) const;
    void           setInstructionTemplate(EditorMode mode, const InstructionRef& ref);

    // ── 选择 ──────────────────────────────────────────────────
    bool      select(int rung, int position);
    bool      selectAt(const QPoint& p);
    void      clearSelection();
    Selection selection() const { return m_selection; }

    // ── 指针事件 ──────────────────────────────────────────────
    LadderStatus click(const QPoint& p);
    // 悬停预览：只解析，不修改
    LadderResult<InsertionTarget> hover(const QPoint& p) const;
    bool         beginDrag();
    LadderStatus release(const QPoint& p);
    // 放弃未完成的操作（丢弃分支锚点），回到 View
    void         cancel();

    bool            hasPendingAnchor() const { return m_hasAnchor; }
    InsertionTarget pendingAnchor() const { return m_anchor; }

    // ── 可撤销的编辑操作 ──────────────────────────────────────
    LadderStatus insertInstruction(int rung, int slot, BranchId branchContext,
                                   const InstructionRef& instruction);
    LadderStatus insertBranch(int rung, BranchId branchContext, int startSlot, int endSlot);
    LadderStatus insertBranchLevel(int rung, int position);
    LadderStatus removeBranch(int rung, BranchId id);
    LadderStatus deleteElement(int rung, int position);
    LadderStatus deleteSelection();
    LadderStatus replaceInstruction(int rung, int position, const InstructionRef& instruction);
    LadderStatus moveElement(int fromRung, int fromPosition,
                             int toRung, int toSlot, BranchId toContext);
    LadderStatus setComment(int rung, const QString& comment);
    LadderStatus addRung(int index, const Rung& rung = Rung());
    LadderStatus removeRung(int index);

    void undo() { m_undoStack->undo(); }
    void redo() { m_undoStack->redo(); }

signals:
    void modeChanged(EditorMode mode);
    void logMessage(const QString& msg);
    void layoutChanged();
    void selectionChanged();

private:
    // 在单条梯级上执行 op，成功后压入快照命令
    template <typename Op>
    LadderStatus editRung(int rung, const QString& text, Op op);
    LadderStatus report(const LadderStatus& st, const QString& what);
    LadderStatus insertAtPoint(const QPoint& p);
    LadderStatus connectBranch(const QPoint& p);
    void         dropAnchor();

    Routine            m_routine;
    RoutineLayout      m_layout;
    RungEditController m_controller;
    InsertionLocator   m_locator;
    QUndoStack*        m_undoStack = nullptr;

    EditorMode      m_mode      = Mode_View;
    bool            m_hasAnchor = false;
    InstructionRef  m_templateContact;
    InstructionRef  m_templateCoil;
    InstructionRef  m_templateBlock;
    InsertionTarget m_anchor;
    Selection       m_selection;
};
