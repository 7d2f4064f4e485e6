#include "LadderLayoutEngine.h"

#include <QHash>
#include <QStack>
#include <algorithm>

#include "BranchRegistry.h"
#include "../../utils/LadderLog.h"

LadderLayoutEngine::LadderLayoutEngine(const LadderLayoutConfig& config)
    : m_config(config)
{}

int LadderLayoutEngine::rungHeight(int commentLines, int maxBranchDepth) const
{
    return 2 * m_config.rungPadding
         + m_config.commentHeight(commentLines)
         + maxBranchDepth * m_config.branchSpacing;
}

LadderResult<LayoutResult> LadderLayoutEngine::layoutRung(const Rung& rung,
                                                          int rungNumber, int y) const
{
    return layoutSequence(rung.sequence(), rung.comment(), rungNumber, y);
}

// ══════════════════════════════════════════════════════════════
// layoutSequence —— 单次前向遍历
// ══════════════════════════════════════════════════════════════
LadderResult<LayoutResult> LadderLayoutEngine::layoutSequence(
        const QVector<RungElement>& sequence, const QString& comment,
        int rungNumber, int y) const
{
    using Result = LadderResult<LayoutResult>;
    const LadderLayoutConfig& cfg = m_config;

    const int gap     = cfg.elementSpacing + cfg.minimumWireLength;
    const int markerW = cfg.branchMarkerWidth;
    const int markerH = cfg.branchMarkerHeight;

    LayoutResult out;
    out.rungNumber    = rungNumber;
    out.y             = y;
    out.commentHeight = cfg.commentHeight(Rung::countCommentLines(comment));
    out.elements.reserve(sequence.size());

    BranchRegistry registry;
    registry.begin(y + cfg.rungPadding + out.commentHeight, cfg.branchSpacing);

    // ── 游标 ──
    BranchId rail  = NoBranch;
    BranchId root  = NoBranch;
    int      level = 0;
    int      row   = 0;
    int      prevRight = cfg.leftRailX + cfg.railOffset - gap;
    int      maxRight  = cfg.leftRailX;
    QHash<BranchId, int> railMembers;

    for (int i = 0; i < sequence.size(); ++i) {
        const RungElement& e = sequence.at(i);

        LayoutElement le;
        le.kind       = e.kind;
        le.rungNumber = rungNumber;
        le.position   = i;

        switch (e.kind) {
        case RungElementKind::Instruction: {
            const QSize sz = cfg.instructionSize(e.instruction.kind());
            const int x = prevRight + gap;
            le.instructionKind = e.instruction.kind();
            le.railY        = registry.railY(row);
            le.rect         = QRect(x, le.railY - sz.height() / 2, sz.width(), sz.height());
            le.branchLevel  = level;
            le.branchId     = rail;
            le.railBranchId = rail;
            le.railIndex    = railMembers[rail]++;
            le.text         = e.instruction.displayText();
            prevRight = le.right();
            break;
        }

        case RungElementKind::BranchStart: {
            const int x = prevRight + gap;
            le.railY        = registry.railY(row);
            le.rect         = QRect(x, le.railY - markerH / 2, markerW, markerH);
            le.branchLevel  = level;
            le.railBranchId = rail;
            le.railIndex    = railMembers[rail]++;

            const BranchId id = registry.open(i, x, rail, root, level, row, x + markerW);
            le.branchId = id;

            rail  = id;
            root  = registry.branch(id).rootBranchId;
            level = level + 1;
            row   = registry.branch(id).row;
            prevRight = le.right();
            break;
        }

        case RungElementKind::BranchNext: {
            const LadderResult<BranchId> r = registry.next(i, prevRight);
            if (!r.ok()) {
                qCWarning(lcLadderLayout) << "rung" << rungNumber << r.status.toString();
                return Result::failure(r.status);
            }
            const Branch& c = registry.branch(r.value);
            row = c.row;
            le.railY        = registry.railY(row);
            le.rect         = QRect(c.startX, le.railY - markerH / 2, markerW, markerH);
            le.branchLevel  = level;
            le.branchId     = c.id;
            le.railBranchId = c.id;
            rail = c.id;
            prevRight = le.right();
            break;
        }

        case RungElementKind::BranchEnd: {
            const LadderResult<BranchRegistry::OpenBranch> r =
                registry.close(i, e.branchId, prevRight, gap, markerW);
            if (!r.ok()) {
                qCWarning(lcLadderLayout) << "rung" << rungNumber << r.status.toString();
                return Result::failure(r.status);
            }
            const BranchRegistry::OpenBranch& f = r.value;
            row   = f.rowBefore;
            rail  = f.railBefore;
            root  = f.rootBefore;
            level = f.levelBefore;

            le.railY        = registry.railY(row);
            le.rect         = QRect(f.maxRight + gap, le.railY - markerH / 2, markerW, markerH);
            le.branchLevel  = level;
            le.branchId     = f.id;
            le.railBranchId = rail;
            prevRight = le.right();
            break;
        }
        }

        maxRight = std::max(maxRight, prevRight);
        out.elements.append(le);
    }

    const LadderStatus st = registry.finish();
    if (!st.ok()) {
        qCWarning(lcLadderLayout) << "rung" << rungNumber << st.toString();
        return Result::failure(st);
    }

    out.maxBranchDepth = registry.deepestRow();
    out.height         = 2 * cfg.rungPadding + out.commentHeight
                       + out.maxBranchDepth * cfg.branchSpacing;
    out.rightRailX     = std::max(cfg.rightRailMinX, maxRight + gap);
    out.branches       = registry.catalog();

    qCDebug(lcLadderLayout) << "rung" << rungNumber << "laid out at y" << y
                            << "height" << out.height << "elements" << out.elements.size();
    return Result::success(out);
}

// ══════════════════════════════════════════════════════════════
// wireSegments —— 连线：每条母线左端到第一个元素、相邻元素之间、
//                 最后一个元素到分支 ']'（或右母线）；分支两端各有竖线
// ══════════════════════════════════════════════════════════════
QVector<WireSegment> LadderLayoutEngine::wireSegments(const LayoutResult& result,
                                                      const LadderLayoutConfig& config)
{
    QVector<WireSegment> wires;
    auto add = [&wires](const QPoint& from, const QPoint& to) {
        if (from != to) wires.append(WireSegment{from, to});
    };

    struct Frame { BranchId id; int parentY; };
    QStack<Frame> stack;

    const int baseY = result.baselineY(config.rungPadding);
    QPoint cursor(config.leftRailX, baseY);

    for (const LayoutElement& le : result.elements) {
        switch (le.kind) {
        case RungElementKind::Instruction:
            add(cursor, QPoint(le.left(), le.railY));
            cursor = QPoint(le.right(), le.railY);
            break;

        case RungElementKind::BranchStart: {
            const Branch* b = result.branch(le.branchId);
            if (!b) return wires;
            add(cursor, QPoint(le.left(), le.railY));
            add(QPoint(le.right(), le.railY), QPoint(le.right(), b->branchY));
            stack.push(Frame{b->id, le.railY});
            cursor = QPoint(le.right(), b->branchY);
            break;
        }

        case RungElementKind::BranchNext: {
            if (stack.isEmpty()) return wires;
            const Branch* b = result.branch(stack.top().id);
            const int parentY = stack.top().parentY;
            const int endLeft = b->endX - config.branchMarkerWidth;
            add(cursor, QPoint(endLeft, cursor.y()));
            add(QPoint(endLeft, cursor.y()), QPoint(endLeft, parentY));
            add(QPoint(le.right(), parentY), QPoint(le.right(), le.railY));
            cursor = QPoint(le.right(), le.railY);
            break;
        }

        case RungElementKind::BranchEnd: {
            if (stack.isEmpty()) return wires;
            const int parentY = stack.pop().parentY;
            add(cursor, QPoint(le.left(), cursor.y()));
            add(QPoint(le.left(), cursor.y()), QPoint(le.left(), parentY));
            cursor = QPoint(le.right(), le.railY);
            break;
        }
        }
    }

    add(cursor, QPoint(result.rightRailX, baseY));
    return wires;
}
