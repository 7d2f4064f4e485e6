#pragma once
#include <QString>
#include <QStringList>

// 指令的图形类别
enum class InstructionKind {
    Contact,  // 输入条件  -| |-   XIC / XIO
    Coil,     // 输出线圈  -( )-   OTE / OTL / OTU
    Block,    // 功能块    TON / MOV / ADD …
};

// ──────────────────────────────────────────────────────────────
// InstructionRef — 梯级中一条指令的引用
//
// 指令本体（标签解析、数据类型等）属于 PLC 模型，不在本核心内；
// 这里只保存布局和显示需要的部分：助记符 + 操作数文本。
// ──────────────────────────────────────────────────────────────
class InstructionRef {
public:
    InstructionRef() = default;
    InstructionRef(const QString& mnemonic, const QStringList& operands);

    QString     mnemonic;   // "XIC"
    QStringList operands;   // {"Start_PB"}

    InstructionKind kind() const { return kindOf(mnemonic); }
    bool            isValid() const { return !mnemonic.isEmpty(); }

    // 完整文本，如 "XIC(Start_PB)"
    QString text() const;
    // 显示用：第一个操作数（块指令为逗号拼接），空时 "???"
    QString displayText() const;

    // 解析 "MOV(Src[0],Dest)"；失败时 ok=false 并返回无效引用
    static InstructionRef fromText(const QString& text, bool* ok = nullptr);

    // ---- 类别 ↔ 字符串 ----
    static InstructionKind kindOf(const QString& mnemonic);
    static QString         kindToString(InstructionKind k);
    static InstructionKind kindFromString(const QString& s);

    bool operator==(const InstructionRef& o) const {
        return mnemonic == o.mnemonic && operands == o.operands;
    }
    bool operator!=(const InstructionRef& o) const { return !(*this == o); }
};
