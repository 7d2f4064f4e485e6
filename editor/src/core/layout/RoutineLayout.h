#pragma once
#include <QRect>
#include <QVector>
#include "LadderLayoutEngine.h"
#include "../models/Routine.h"

// ──────────────────────────────────────────────────────────────────────────
// RoutineLayout — 整个例程的布局缓存
//
//   • 梯级 n 的 y：n == 0 时为 topMargin，否则为 y[n-1] + h[n-1] + rungGap
//   • 高度级联：显式工作队列，按梯级序号升序处理；梯级重新布局后若下沿
//     位置变化，下一条梯级入队，直到不动点
//   • 任一梯级布局失败时整个缓存保持不变
// ──────────────────────────────────────────────────────────────────────────
class RoutineLayout {
public:
    explicit RoutineLayout(const LadderLayoutConfig& config = LadderLayoutConfig());

    const LadderLayoutConfig& config() const { return m_engine.config(); }
    const LadderLayoutEngine& engine() const { return m_engine; }
    // 更换配置后需要 layoutAll
    void setConfig(const LadderLayoutConfig& config) { m_engine.setConfig(config); }

    // 全部重新布局
    LadderStatus layoutAll(const Routine& routine);
    // 梯级内容变化
    LadderStatus invalidate(const Routine& routine, int rungIndex);
    LadderStatus invalidate(const Routine& routine, const QVector<int>& rungIndexes);
    // 梯级列表变化（routine 已完成插入 / 删除）
    LadderStatus rungInserted(const Routine& routine, int rungIndex);
    LadderStatus rungRemoved(const Routine& routine, int rungIndex);

    int                 rungCount() const { return m_results.size(); }
    const LayoutResult& rung(int index) const { return m_results.at(index); }
    const QVector<LayoutResult>& results() const { return m_results; }
    QVector<int>        rungYPositions() const;
    int                 rungY(int index) const { return m_results.at(index).y; }
    int                 rungHeight(int index) const { return m_results.at(index).height; }
    // y 所在的梯级；不在任何梯级范围内返回 -1
    int                 rungAt(int y) const;

    // 滚动区域：原点 → (最右的右母线 + leftRailX, 最后一条梯级下沿 + rungGap)
    QRect extent() const;

    // 选中标记：只标记一个元素，rung < 0 时全部清除；重新布局后自然清除
    void setSelection(int rung, int position);

    // 最近一次级联实际重新布局的梯级（升序）
    const QVector<int>& lastRelaidRungs() const { return m_lastRelaid; }

private:
    LadderStatus process(const Routine& routine, QVector<LayoutResult> results,
                         QList<int> queue);
    int          expectedY(const QVector<LayoutResult>& results, int index) const;

    LadderLayoutEngine    m_engine;
    QVector<LayoutResult> m_results;
    QVector<int>          m_lastRelaid;
};
