#pragma once
#include "InstructionRef.h"

// 分支句柄：梯级内分支数组的下标（按发现顺序稠密分配）
using BranchId = int;
constexpr BranchId NoBranch = -1;

// 梯级序列中的元素类别
enum class RungElementKind {
    Instruction,
    BranchStart,  // '['
    BranchNext,   // ','  新的并联支路
    BranchEnd,    // ']'
};

// ──────────────────────────────────────────────────────────────
// RungElement — 梯级逻辑序列中的一项
//   position / branchId / rootBranchId / branchLevel 由 Rung 在每次
//   提交时重新标注，调用方构造时只需填 kind（和指令）。
// ──────────────────────────────────────────────────────────────
struct RungElement {
    RungElementKind kind         = RungElementKind::Instruction;
    int             position     = 0;
    BranchId        branchId     = NoBranch;  // 所在支路 / 打开或关闭的分支
    BranchId        rootBranchId = NoBranch;  // 嵌套链最外层分支
    int             branchLevel  = 0;         // 外层未闭合分支数
    InstructionRef  instruction;              // 仅 Instruction 有效

    static RungElement makeInstruction(const InstructionRef& ref) {
        RungElement e;
        e.kind        = RungElementKind::Instruction;
        e.instruction = ref;
        return e;
    }
    static RungElement makeMarker(RungElementKind kind) {
        RungElement e;
        e.kind = kind;
        return e;
    }

    bool isInstruction() const { return kind == RungElementKind::Instruction; }
    bool isBranchMarker() const { return kind != RungElementKind::Instruction; }

    bool operator==(const RungElement& o) const {
        return kind == o.kind && position == o.position && branchId == o.branchId
            && rootBranchId == o.rootBranchId && branchLevel == o.branchLevel
            && instruction == o.instruction;
    }
    bool operator!=(const RungElement& o) const { return !(*this == o); }
};
