#pragma once
#include <QVector>
#include "LadderLayoutConfig.h"
#include "LayoutElement.h"
#include "../models/Rung.h"

// ──────────────────────────────────────────────────────────────────────────
// LadderLayoutEngine — 单条梯级的布局：一次前向遍历，输出 LayoutResult
//
//   横向：x = 上一元素右沿 + elementSpacing + minimumWireLength
//         主母线第一个元素在 leftRailX + railOffset；',' 回到分支起点 x；
//         ']' 放在各支路最右沿之后
//   纵向：railY = 梯级 y + rungPadding + 注释高度 + 行号 × branchSpacing，
//         元素以 railY 为中心
//   高度：2 × rungPadding + 注释高度 + 最深行 × branchSpacing
//
//   布局是 (序列, 注释, 梯级 y, 配置) 的纯函数，不保留任何状态。
// ──────────────────────────────────────────────────────────────────────────
class LadderLayoutEngine {
public:
    explicit LadderLayoutEngine(const LadderLayoutConfig& config = LadderLayoutConfig());

    const LadderLayoutConfig& config() const { return m_config; }
    void setConfig(const LadderLayoutConfig& config) { m_config = config; }

    LadderResult<LayoutResult> layoutRung(const Rung& rung, int rungNumber, int y) const;
    // 按给定序列原样布局（不重新标注）；结构损坏返回 UnbalancedBranch
    LadderResult<LayoutResult> layoutSequence(const QVector<RungElement>& sequence,
                                              const QString& comment,
                                              int rungNumber, int y) const;

    int rungHeight(int commentLines, int maxBranchDepth) const;

    // 由相邻元素边沿推导连线（左母线 → … → 右母线，含分支竖线）
    static QVector<WireSegment> wireSegments(const LayoutResult& result,
                                             const LadderLayoutConfig& config);

private:
    LadderLayoutConfig m_config;
};
