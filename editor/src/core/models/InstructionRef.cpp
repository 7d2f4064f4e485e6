#include "InstructionRef.h"

InstructionRef::InstructionRef(const QString& mnemonic, const QStringList& operands)
    : mnemonic(mnemonic), operands(operands)
{}

QString InstructionRef::text() const {
    return QString("%1(%2)").arg(mnemonic, operands.join(','));
}

QString InstructionRef::displayText() const {
    if (operands.isEmpty()) return "???";
    if (kind() == InstructionKind::Block) return operands.join(", ");
    return operands.first();
}

// -------------------------------------------------------
// 文本解析：助记符 + 最外层括号内按顶层逗号切分操作数
//   数组下标 / 嵌套括号中的逗号不切分
// -------------------------------------------------------
InstructionRef InstructionRef::fromText(const QString& text, bool* ok)
{
    if (ok) *ok = false;
    const QString t = text.trimmed();

    const int open = t.indexOf('(');
    if (open <= 0 || !t.endsWith(')')) return {};

    const QString name = t.left(open);
    for (const QChar c : name)
        if (!c.isLetterOrNumber() && c != '_') return {};

    const QString body = t.mid(open + 1, t.size() - open - 2);
    QStringList ops;
    QString cur;
    int depth = 0;
    for (const QChar c : body) {
        if (c == '(' || c == '[') {
            ++depth;
        } else if (c == ')' || c == ']') {
            if (--depth < 0) return {};
        } else if (c == ',' && depth == 0) {
            ops << cur.trimmed();
            cur.clear();
            continue;
        }
        cur += c;
    }
    if (depth != 0) return {};
    if (!cur.trimmed().isEmpty() || !ops.isEmpty())
        ops << cur.trimmed();

    if (ok) *ok = true;
    return InstructionRef(name, ops);
}

InstructionKind InstructionRef::kindOf(const QString& mnemonic) {
    const QString m = mnemonic.toUpper();
    if (m == "XIC" || m == "XIO")                return InstructionKind::Contact;
    if (m == "OTE" || m == "OTL" || m == "OTU")  return InstructionKind::Coil;
    return InstructionKind::Block;
}

QString InstructionRef::kindToString(InstructionKind k) {
    switch (k) {
    case InstructionKind::Contact: return "contact";
    case InstructionKind::Coil:    return "coil";
    case InstructionKind::Block:   return "block";
    }
    return "block";
}

InstructionKind InstructionRef::kindFromString(const QString& s) {
    if (s == "contact") return InstructionKind::Contact;
    if (s == "coil")    return InstructionKind::Coil;
    return InstructionKind::Block;
}
