#pragma once
#include <QUndoCommand>
#include "../core/models/Rung.h"

class RungEditController;

// ── 修改单条梯级（快照）──────────────────────────────────────
//   redo : 写回修改后的梯级
//   undo : 写回修改前的梯级
//   两者都经由 controller 提交，布局随之级联更新
//   （push 时的首次 redo 写回的就是当前内容，不改变任何东西）
class RungEditCmd : public QUndoCommand
{
public:
    RungEditCmd(RungEditController* controller, int rungIndex,
                const Rung& before, const Rung& after,
                const QString& text, QUndoCommand* parent = nullptr);
    void redo() override;
    void undo() override;

private:
    void apply(const Rung& rung);

    RungEditController* m_controller;
    int                 m_index;
    Rung                m_before;
    Rung                m_after;
};

// ── 插入 / 删除整条梯级 ──────────────────────────────────────
//   Insert: redo 插入 m_rung，undo 删除
//   Remove: redo 删除，undo 插回 m_rung
class RungListCmd : public QUndoCommand
{
public:
    enum Op { Insert, Remove };

    RungListCmd(RungEditController* controller, Op op, int rungIndex, const Rung& rung,
                const QString& text, QUndoCommand* parent = nullptr);
    void redo() override;
    void undo() override;

private:
    void insert();
    void remove();

    RungEditController* m_controller;
    Op                  m_op;
    int                 m_index;
    Rung                m_rung;
};
