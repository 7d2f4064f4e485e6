#pragma once
#include <QSize>
#include <QString>
#include "../models/InstructionRef.h"
#include "../models/LadderError.h"

// ──────────────────────────────────────────────────────────────
// LadderLayoutConfig — 布局引擎的间距 / 尺寸常量（虚拟坐标单位）
//
// XML 存档格式：
//   <ladderLayout version="1">
//     <rail     leftX="40" offset="10" rightMinX="600"/>
//     <spacing  element="10" wire="10" branch="60"/>
//     <rung     padding="30" gap="20" topMargin="50"/>
//     <comment  lineHeight="14" padding="6"/>
//     <marker   width="10" height="10"/>
//     <contact  width="40" height="30"/>
//     <coil     width="40" height="30"/>
//     <block    width="80" height="40"/>
//   </ladderLayout>
//   缺省的元素 / 属性保持默认值。
// ──────────────────────────────────────────────────────────────
struct LadderLayoutConfig {
    // ── 母线 ──
    int leftRailX         = 40;
    int railOffset        = 10;   // 主母线第一个元素距左母线
    int rightRailMinX     = 600;

    // ── 间距 ──
    int elementSpacing    = 10;
    int minimumWireLength = 10;
    int branchSpacing     = 60;   // 相邻支路行的纵向间距

    // ── 梯级 ──
    int rungPadding       = 30;
    int rungGap           = 20;
    int topMargin         = 50;   // 第一条梯级的 y

    // ── 注释 ──
    int commentLineHeight = 14;
    int commentPadding    = 6;

    // ── 元素尺寸 ──
    int   branchMarkerWidth  = 10;
    int   branchMarkerHeight = 10;
    QSize contactSize{40, 30};
    QSize coilSize{40, 30};
    QSize blockSize{80, 40};

    QSize instructionSize(InstructionKind kind) const;
    // 注释块高度：lines × 行高 + 内边距；无注释为 0
    int   commentHeight(int commentLines) const;

    bool  isValid(QString* why = nullptr) const;

    // ---- XML 存档/读档（QDomDocument）----
    LadderStatus loadFromFile(const QString& path);
    LadderStatus loadFromXml(const QString& xml);
    LadderStatus saveToFile(const QString& path) const;
    QString      toXml() const;

    bool operator==(const LadderLayoutConfig& o) const;
    bool operator!=(const LadderLayoutConfig& o) const { return !(*this == o); }
};
