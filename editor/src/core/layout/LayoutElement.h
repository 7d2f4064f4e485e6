#pragma once
#include <QPoint>
#include <QRect>
#include <QString>
#include <QVector>
#include "../models/Branch.h"
#include "../models/RungElement.h"

// ──────────────────────────────────────────────────────────────
// LayoutElement — 一次布局中一个序列元素的几何结果（可随时重新生成）
// ──────────────────────────────────────────────────────────────
struct LayoutElement {
    RungElementKind kind            = RungElementKind::Instruction;
    InstructionKind instructionKind = InstructionKind::Block;  // 仅指令有效
    QRect           rect;
    int             railY        = 0;         // 所在母线的 y（元素纵向居中于此）
    int             rungNumber   = 0;
    int             position     = 0;         // 回指 RungElement::position
    int             branchLevel  = 0;
    BranchId        branchId     = NoBranch;
    BranchId        railBranchId = NoBranch;  // 所在母线
    int             railIndex    = -1;        // 母线上的成员序号；BranchNext / BranchEnd 为 -1
    QString         text;
    bool            selected     = false;

    int left()    const { return rect.x(); }
    int right()   const { return rect.x() + rect.width(); }
    int centerX() const { return rect.x() + rect.width() / 2; }

    bool operator==(const LayoutElement& o) const {
        return kind == o.kind && instructionKind == o.instructionKind && rect == o.rect
            && railY == o.railY && rungNumber == o.rungNumber && position == o.position
            && branchLevel == o.branchLevel && branchId == o.branchId
            && railBranchId == o.railBranchId && railIndex == o.railIndex
            && text == o.text && selected == o.selected;
    }
    bool operator!=(const LayoutElement& o) const { return !(*this == o); }
};

// 连线段（不单独保存，由 LadderLayoutEngine::wireSegments 按需计算）
struct WireSegment {
    QPoint from;
    QPoint to;
    bool isVertical() const { return from.x() == to.x(); }
    bool operator==(const WireSegment& o) const { return from == o.from && to == o.to; }
};

// 一条梯级一次布局的完整结果
struct LayoutResult {
    int rungNumber     = -1;   // < 0 表示尚未布局
    int y              = 0;
    int height         = 0;
    int commentHeight  = 0;
    int maxBranchDepth = 0;
    int rightRailX     = 0;
    QVector<LayoutElement> elements;   // 与序列一一对应，按 position 排列
    QVector<Branch>        branches;   // 已闭合分支目录（按 id 下标）

    bool isNull() const { return rungNumber < 0; }
    int  bottom() const { return y + height; }
    // 梯级纵向范围 [y, y + height)
    bool containsY(int py) const { return py >= y && py < y + height; }

    // 主母线 y
    int  baselineY(int rungPadding) const { return y + rungPadding + commentHeight; }

    const Branch* branch(BranchId id) const {
        if (id < 0 || id >= branches.size()) return nullptr;
        return &branches[id];
    }

    bool operator==(const LayoutResult& o) const {
        return rungNumber == o.rungNumber && y == o.y && height == o.height
            && commentHeight == o.commentHeight && maxBranchDepth == o.maxBranchDepth
            && rightRailX == o.rightRailX && elements == o.elements && branches == o.branches;
    }
    bool operator!=(const LayoutResult& o) const { return !(*this == o); }
};
