#pragma once
#include <QString>
#include <QStringList>
#include "Rung.h"

// ──────────────────────────────────────────────────────────────
// RungText — Logix 梯级文本 ↔ 元素序列
//
//   "XIC(A)[XIO(B),XIC(C)]OTE(D);"
//     → XIC(A)  [  XIO(B)  ,  XIC(C)  ]  OTE(D)
//
//   指令括号内的 '[' ',' ']'（数组下标、操作数分隔）属于指令本身，
//   只有括号外的才是分支标记。末尾的 ';' 可省略。
// ──────────────────────────────────────────────────────────────
namespace RungText {

// 切分为指令文本与分支标记 "[" "," "]"
LadderResult<QStringList> tokenize(const QString& text);

// 解析为元素序列；文本格式错误 → ParseError，分支不配对 → UnbalancedBranch
LadderResult<QVector<RungElement>> parseSequence(const QString& text);

// 解析并写入 rung（失败时 rung 不变；注释保持不变）
LadderStatus parse(const QString& text, Rung& rung);

// 序列 → 文本，总以 ';' 结尾
QString serialize(const QVector<RungElement>& sequence);
QString serialize(const Rung& rung);

} // namespace RungText
