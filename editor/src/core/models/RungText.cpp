#include "RungText.h"

namespace RungText {

static bool isNameChar(QChar c)
{
    return c.isLetterOrNumber() || c == '_' || c == '.' || c == ':';
}

LadderResult<QStringList> tokenize(const QString& text)
{
    QStringList tokens;
    QString     cur;
    int         depth = 0;      // 指令括号深度
    bool        ended = false;  // 已遇到 ';'

    auto fail = [](int at, const QString& what) {
        return LadderResult<QStringList>::failure(LadderError::ParseError,
            QString("%1 at column %2").arg(what).arg(at + 1));
    };

    for (int i = 0; i < text.size(); ++i) {
        const QChar c = text.at(i);

        if (depth > 0) {
            cur += c;
            if (c == '(') {
                ++depth;
            } else if (c == ')') {
                if (--depth == 0) {
                    tokens << cur;
                    cur.clear();
                }
            }
            continue;
        }

        if (c.isSpace()) {
            if (!cur.isEmpty()) return fail(i, "instruction without operands");
            continue;
        }
        if (ended) return fail(i, "text after ';'");

        if (c == '[' || c == ',' || c == ']') {
            if (!cur.isEmpty()) return fail(i, "instruction without operands");
            tokens << QString(c);
        } else if (c == ';') {
            if (!cur.isEmpty()) return fail(i, "instruction without operands");
            ended = true;
        } else if (c == '(') {
            if (cur.isEmpty()) return fail(i, "operands without mnemonic");
            cur += c;
            depth = 1;
        } else if (isNameChar(c)) {
            cur += c;
        } else {
            return fail(i, QString("unexpected '%1'").arg(c));
        }
    }

    if (depth > 0)          return fail(text.size() - 1, "unterminated operand list");
    if (!cur.isEmpty())     return fail(text.size() - 1, "instruction without operands");
    return LadderResult<QStringList>::success(tokens);
}

LadderResult<QVector<RungElement>> parseSequence(const QString& text)
{
    using Result = LadderResult<QVector<RungElement>>;

    const LadderResult<QStringList> tok = tokenize(text);
    if (!tok.ok()) return Result::failure(tok.status);

    QVector<RungElement> seq;
    for (const QString& t : tok.value) {
        if (t == "[")      seq << RungElement::makeMarker(RungElementKind::BranchStart);
        else if (t == ",") seq << RungElement::makeMarker(RungElementKind::BranchNext);
        else if (t == "]") seq << RungElement::makeMarker(RungElementKind::BranchEnd);
        else {
            bool ok = false;
            const InstructionRef ref = InstructionRef::fromText(t, &ok);
            if (!ok)
                return Result::failure(LadderError::ParseError,
                                       QString("malformed instruction '%1'").arg(t));
            seq << RungElement::makeInstruction(ref);
        }
    }

    QVector<Branch> branches;
    const LadderStatus st = Rung::annotate(seq, branches, nullptr);
    if (!st.ok()) return Result::failure(st);
    return Result::success(seq);
}

LadderStatus parse(const QString& text, Rung& rung)
{
    const LadderResult<QVector<RungElement>> r = parseSequence(text);
    if (!r.ok()) return r.status;
    return rung.setSequence(r.value);
}

QString serialize(const QVector<RungElement>& sequence)
{
    QString out;
    for (const RungElement& e : sequence) {
        switch (e.kind) {
        case RungElementKind::Instruction: out += e.instruction.text(); break;
        case RungElementKind::BranchStart: out += '[';                  break;
        case RungElementKind::BranchNext:  out += ',';                  break;
        case RungElementKind::BranchEnd:   out += ']';                  break;
        }
    }
    out += ';';
    return out;
}

QString serialize(const Rung& rung)
{
    return serialize(rung.sequence());
}

} // namespace RungText
