#include "RoutineLayout.h"

#include <algorithm>

#include "../../utils/LadderLog.h"

namespace {

// 有序去重入队
void enqueue(QList<int>& queue, int index)
{
    auto it = std::lower_bound(queue.begin(), queue.end(), index);
    if (it == queue.end() || *it != index)
        queue.insert(it, index);
}

} // namespace

RoutineLayout::RoutineLayout(const LadderLayoutConfig& config)
    : m_engine(config)
{}

int RoutineLayout::expectedY(const QVector<LayoutResult>& results, int index) const
{
    if (index == 0) return config().topMargin;
    return results.at(index - 1).bottom() + config().rungGap;
}

// ══════════════════════════════════════════════════════════════
// process —— 工作队列处理到不动点；成功后才替换缓存
// ══════════════════════════════════════════════════════════════
LadderStatus RoutineLayout::process(const Routine& routine, QVector<LayoutResult> results,
                                    QList<int> queue)
{
    QVector<int> relaid;

    while (!queue.isEmpty()) {
        const int i = queue.takeFirst();
        if (i < 0 || i >= results.size()) continue;

        const int y = expectedY(results, i);
        LadderResult<LayoutResult> r = m_engine.layoutRung(routine.rung(i), i, y);
        if (!r.ok()) {
            qCWarning(lcLadderLayout) << "layout of rung" << i << "failed:" << r.status.toString();
            return r.status;
        }

        const bool moved = results.at(i).isNull()
                        || results.at(i).bottom() != r.value.bottom();
        results[i] = r.value;
        relaid.append(i);

        if (moved && i + 1 < results.size())
            enqueue(queue, i + 1);
    }

    m_results    = results;
    m_lastRelaid = relaid;
    qCDebug(lcLadderLayout) << "relaid rungs" << relaid;
    return LadderStatus::success();
}

LadderStatus RoutineLayout::layoutAll(const Routine& routine)
{
    QList<int> queue;
    if (routine.rungCount() > 0) queue << 0;
    return process(routine, QVector<LayoutResult>(routine.rungCount()), queue);
}

LadderStatus RoutineLayout::invalidate(const Routine& routine, int rungIndex)
{
    return invalidate(routine, QVector<int>{rungIndex});
}

LadderStatus RoutineLayout::invalidate(const Routine& routine, const QVector<int>& rungIndexes)
{
    if (m_results.size() != routine.rungCount())
        return layoutAll(routine);

    QList<int> queue;
    for (int i : rungIndexes) {
        if (!routine.hasRung(i))
            return {LadderError::RungNotFound, QString("rung %1 does not exist").arg(i)};
        enqueue(queue, i);
    }
    return process(routine, m_results, queue);
}

LadderStatus RoutineLayout::rungInserted(const Routine& routine, int rungIndex)
{
    if (rungIndex < 0 || rungIndex > m_results.size()
        || m_results.size() + 1 != routine.rungCount())
        return layoutAll(routine);

    QVector<LayoutResult> results = m_results;
    results.insert(rungIndex, LayoutResult());
    return process(routine, results, QList<int>{rungIndex});
}

LadderStatus RoutineLayout::rungRemoved(const Routine& routine, int rungIndex)
{
    if (rungIndex < 0 || rungIndex >= m_results.size()
        || m_results.size() - 1 != routine.rungCount())
        return layoutAll(routine);

    QVector<LayoutResult> results = m_results;
    results.remove(rungIndex);
    QList<int> queue;
    if (rungIndex < results.size()) queue << rungIndex;
    return process(routine, results, queue);
}

// -------------------------------------------------------
// 查询
// -------------------------------------------------------
QVector<int> RoutineLayout::rungYPositions() const
{
    QVector<int> ys;
    ys.reserve(m_results.size());
    for (const LayoutResult& r : m_results) ys << r.y;
    return ys;
}

int RoutineLayout::rungAt(int y) const
{
    for (const LayoutResult& r : m_results)
        if (r.containsY(y)) return r.rungNumber;
    return -1;
}

void RoutineLayout::setSelection(int rung, int position)
{
    for (int i = 0; i < m_results.size(); ++i)
        for (LayoutElement& le : m_results[i].elements)
            le.selected = (i == rung && le.position == position);
}

QRect RoutineLayout::extent() const
{
    const LadderLayoutConfig& cfg = config();
    int right  = cfg.rightRailMinX;
    int bottom = cfg.topMargin;
    for (const LayoutResult& r : m_results) {
        right  = std::max(right, r.rightRailX);
        bottom = std::max(bottom, r.bottom());
    }
    return QRect(0, 0, right + cfg.leftRailX, bottom + cfg.rungGap);
}
