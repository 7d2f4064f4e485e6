#include "Rung.h"

#include <QStack>
#include <QStringList>
#include <algorithm>
#include <utility>

namespace {

// 标注时的打开分支帧
struct OpenFrame {
    BranchId branch     = NoBranch;
    BranchId railBefore = NoBranch;  // 分支所在的外侧母线
    int      levelBefore = 0;
    BranchId rootBefore = NoBranch;
    int      rowBefore  = 0;
    int      maxRow     = 0;         // 分支内部用到的最深行
};

} // namespace

// ══════════════════════════════════════════════════════════════
// annotate —— 一次从左到右的遍历，重建所有派生字段
// ══════════════════════════════════════════════════════════════
LadderStatus Rung::annotate(QVector<RungElement>& seq,
                            QVector<Branch>& branches,
                            int* maxBranchDepth)
{
    branches.clear();
    QStack<OpenFrame> stack;

    BranchId rail  = NoBranch;
    BranchId root  = NoBranch;
    int      level = 0;
    int      row   = 0;
    int      depth = 0;

    for (int i = 0; i < seq.size(); ++i) {
        RungElement& e = seq[i];
        e.position = i;

        switch (e.kind) {
        case RungElementKind::Instruction:
            e.branchId     = rail;
            e.rootBranchId = root;
            e.branchLevel  = level;
            break;

        case RungElementKind::BranchStart: {
            Branch b;
            b.id             = branches.size();
            b.parentBranchId = rail;
            b.rootBranchId   = (root == NoBranch) ? b.id : root;
            b.startPosition  = i;
            b.branchLevel    = level;
            b.row            = row + 1;
            branches.append(b);

            e.branchId     = b.id;
            e.rootBranchId = b.rootBranchId;
            e.branchLevel  = level;

            stack.push({b.id, rail, level, root, row, b.row});
            rail  = b.id;
            root  = b.rootBranchId;
            level = level + 1;
            row   = b.row;
            break;
        }

        case RungElementKind::BranchNext: {
            if (stack.isEmpty())
                return {LadderError::UnbalancedBranch,
                        QString("branch-next at position %1 has no open branch").arg(i)};
            OpenFrame& top = stack.top();
            Branch& parent = branches[top.branch];

            Branch c;
            c.id             = branches.size();
            c.parentBranchId = parent.id;
            c.rootBranchId   = parent.rootBranchId;
            c.startPosition  = i;
            c.branchLevel    = parent.branchLevel;
            c.row            = top.maxRow + 1;
            c.isRail         = true;

            // 前一条支路在此之前结束
            if (!parent.childBranchIds.isEmpty())
                branches[parent.childBranchIds.last()].endPosition = i - 1;
            parent.childBranchIds.append(c.id);
            top.maxRow = c.row;
            branches.append(c);

            e.branchId     = c.id;
            e.rootBranchId = c.rootBranchId;
            e.branchLevel  = level;
            rail = c.id;
            row  = c.row;
            break;
        }

        case RungElementKind::BranchEnd: {
            if (stack.isEmpty())
                return {LadderError::UnbalancedBranch,
                        QString("branch-end at position %1 has no open branch").arg(i)};
            const OpenFrame f = stack.pop();
            Branch& b = branches[f.branch];
            b.endPosition = i;
            if (!b.childBranchIds.isEmpty())
                branches[b.childBranchIds.last()].endPosition = i - 1;

            e.branchId     = b.id;
            e.rootBranchId = b.rootBranchId;
            e.branchLevel  = f.levelBefore;

            rail  = f.railBefore;
            root  = f.rootBefore;
            level = f.levelBefore;
            row   = f.rowBefore;
            depth = std::max(depth, f.maxRow);
            if (!stack.isEmpty())
                stack.top().maxRow = std::max(stack.top().maxRow, f.maxRow);
            break;
        }
        }
    }

    if (!stack.isEmpty())
        return {LadderError::UnbalancedBranch,
                QString("branch opened at position %1 is never closed")
                    .arg(branches[stack.top().branch].startPosition)};

    if (maxBranchDepth) *maxBranchDepth = depth;
    return LadderStatus::success();
}

LadderStatus Rung::commit(QVector<RungElement> candidate)
{
    QVector<Branch> branches;
    int depth = 0;
    const LadderStatus st = annotate(candidate, branches, &depth);
    if (!st.ok()) return st;

    m_sequence       = candidate;
    m_branches       = branches;
    m_maxBranchDepth = depth;
    return st;
}

LadderStatus Rung::setSequence(const QVector<RungElement>& elements)
{
    return commit(elements);
}

void Rung::clear()
{
    m_sequence.clear();
    m_branches.clear();
    m_maxBranchDepth = 0;
}

int Rung::countCommentLines(const QString& comment)
{
    if (comment.isEmpty()) return 0;
    QString c = comment;
    c.replace("\r\n", "\n");
    if (c.endsWith('\n')) c.chop(1);
    return c.split('\n').size();
}

const Branch* Rung::branch(BranchId id) const
{
    if (id < 0 || id >= m_branches.size()) return nullptr;
    return &m_branches[id];
}

bool Rung::validRail(BranchId context) const
{
    return context == NoBranch || branch(context) != nullptr;
}

// -------------------------------------------------------
// 母线查询
// -------------------------------------------------------
BranchId Rung::railAtGap(int ordinal) const
{
    if (ordinal <= 0 || ordinal > m_sequence.size()) return NoBranch;
    const RungElement& prev = m_sequence.at(ordinal - 1);
    if (prev.kind == RungElementKind::BranchEnd)
        return m_branches.at(prev.branchId).parentBranchId;
    return prev.branchId;
}

BranchId Rung::railOf(int position) const
{
    const RungElement& e = m_sequence.at(position);
    switch (e.kind) {
    case RungElementKind::Instruction:
        return e.branchId;
    case RungElementKind::BranchStart:
    case RungElementKind::BranchEnd:
        return m_branches.at(e.branchId).parentBranchId;
    case RungElementKind::BranchNext:
        return m_branches.at(e.branchId).parentBranchId;
    }
    return NoBranch;
}

QVector<int> Rung::railMembers(BranchId context) const
{
    QVector<int> members;
    for (const RungElement& e : m_sequence) {
        if (e.kind == RungElementKind::Instruction && e.branchId == context)
            members << e.position;
        else if (e.kind == RungElementKind::BranchStart
                 && m_branches.at(e.branchId).parentBranchId == context)
            members << e.position;
    }
    return members;
}

int Rung::slotOf(int position) const
{
    return railMembers(railOf(position)).indexOf(position);
}

LadderResult<int> Rung::railInsertionOrdinal(BranchId context, int slot) const
{
    if (!validRail(context))
        return LadderResult<int>::failure(LadderError::BranchNotFound,
            QString("branch %1 not found in rung").arg(context));

    const QVector<int> members = railMembers(context);
    if (slot < 0 || slot > members.size())
        return LadderResult<int>::failure(LadderError::PositionOutOfRange,
            QString("slot %1 outside rail (0..%2)").arg(slot).arg(members.size()));

    if (slot < members.size())
        return LadderResult<int>::success(members.at(slot));

    // 母线末尾
    if (context == NoBranch)
        return LadderResult<int>::success(m_sequence.size());
    const Branch& b = m_branches.at(context);
    if (b.isRail)
        return LadderResult<int>::success(b.endPosition + 1);
    if (b.childBranchIds.isEmpty())
        return LadderResult<int>::success(b.endPosition);
    return LadderResult<int>::success(m_branches.at(b.childBranchIds.first()).startPosition);
}

// ══════════════════════════════════════════════════════════════
// 修改操作
// ══════════════════════════════════════════════════════════════
LadderStatus Rung::insertInstruction(int slot, BranchId branchContext,
                                     const InstructionRef& instruction)
{
    const LadderResult<int> ord = railInsertionOrdinal(branchContext, slot);
    if (!ord.ok()) return ord.status;

    QVector<RungElement> candidate = m_sequence;
    candidate.insert(ord.value, RungElement::makeInstruction(instruction));
    return commit(candidate);
}

LadderStatus Rung::insertBranch(int startOrdinal, int endOrdinal, BranchId* newBranch)
{
    const int n = m_sequence.size();
    if (startOrdinal < 0 || endOrdinal < 0 || startOrdinal > n || endOrdinal > n)
        return {LadderError::PositionOutOfRange,
                QString("branch range [%1, %2) outside rung (0..%3)")
                    .arg(startOrdinal).arg(endOrdinal).arg(n)};
    if (startOrdinal > endOrdinal)
        std::swap(startOrdinal, endOrdinal);
    if (railAtGap(startOrdinal) != railAtGap(endOrdinal))
        return {LadderError::InvalidInsertionPoint,
                QString("branch ends %1 and %2 are on different rails")
                    .arg(startOrdinal).arg(endOrdinal)};

    QVector<RungElement> candidate = m_sequence;
    // 先插尾部，避免起点插入后序号偏移
    candidate.insert(endOrdinal, RungElement::makeMarker(RungElementKind::BranchEnd));
    candidate.insert(endOrdinal, RungElement::makeMarker(RungElementKind::BranchNext));
    candidate.insert(startOrdinal, RungElement::makeMarker(RungElementKind::BranchStart));

    const LadderStatus st = commit(candidate);
    if (st.ok() && newBranch)
        *newBranch = m_sequence.at(startOrdinal).branchId;
    return st;
}

LadderStatus Rung::insertBranchLevel(int atPosition, BranchId* newRail)
{
    if (atPosition < 0 || atPosition >= m_sequence.size())
        return {LadderError::PositionOutOfRange,
                QString("position %1 outside rung (0..%2)")
                    .arg(atPosition).arg(m_sequence.size() - 1)};

    const RungElement& e = m_sequence.at(atPosition);
    int target = -1;
    if (e.kind == RungElementKind::BranchStart) {
        const Branch& b = m_branches.at(e.branchId);
        target = b.childBranchIds.isEmpty()
                     ? b.endPosition
                     : m_branches.at(b.childBranchIds.first()).startPosition;
    } else if (e.kind == RungElementKind::BranchNext) {
        target = m_branches.at(e.branchId).endPosition + 1;
    } else {
        return {LadderError::WrongElementKind,
                QString("position %1 is not a branch start or branch-next").arg(atPosition)};
    }

    QVector<RungElement> candidate = m_sequence;
    candidate.insert(target, RungElement::makeMarker(RungElementKind::BranchNext));
    const LadderStatus st = commit(candidate);
    if (st.ok() && newRail)
        *newRail = m_sequence.at(target).branchId;
    return st;
}

LadderStatus Rung::removeBranch(BranchId id)
{
    const Branch* b = branch(id);
    if (!b)
        return {LadderError::BranchNotFound,
                QString("branch %1 not found in rung").arg(id)};
    if (b->endPosition < b->startPosition)
        return {LadderError::UnbalancedBranch,
                QString("branch %1 has no end").arg(id)};

    QVector<RungElement> candidate = m_sequence;
    candidate.remove(b->startPosition, b->endPosition - b->startPosition + 1);
    return commit(candidate);
}

LadderStatus Rung::removeInstruction(int position)
{
    if (position < 0 || position >= m_sequence.size())
        return {LadderError::PositionOutOfRange,
                QString("position %1 outside rung (0..%2)")
                    .arg(position).arg(m_sequence.size() - 1)};
    if (!m_sequence.at(position).isInstruction())
        return {LadderError::WrongElementKind,
                QString("position %1 is not an instruction").arg(position)};

    QVector<RungElement> candidate = m_sequence;
    candidate.remove(position);
    return commit(candidate);
}

LadderStatus Rung::moveInstruction(int fromPosition, int toSlot, BranchId toContext)
{
    if (fromPosition < 0 || fromPosition >= m_sequence.size())
        return {LadderError::PositionOutOfRange,
                QString("position %1 outside rung").arg(fromPosition)};
    if (!m_sequence.at(fromPosition).isInstruction())
        return {LadderError::WrongElementKind,
                QString("position %1 is not an instruction").arg(fromPosition)};
    if (!validRail(toContext))
        return {LadderError::BranchNotFound,
                QString("branch %1 not found in rung").arg(toContext)};

    const BranchId fromRail = railOf(fromPosition);
    const int      fromSlot = slotOf(fromPosition);
    if (fromRail == toContext && toSlot > fromSlot)
        --toSlot;

    // 删除指令不会改变分支标记，分支 id 保持不变
    Rung work = *this;
    const InstructionRef ref = m_sequence.at(fromPosition).instruction;
    LadderStatus st = work.removeInstruction(fromPosition);
    if (!st.ok()) return st;
    st = work.insertInstruction(toSlot, toContext, ref);
    if (!st.ok()) return st;

    *this = work;
    return st;
}

LadderStatus Rung::replaceInstruction(int position, const InstructionRef& instruction)
{
    if (position < 0 || position >= m_sequence.size())
        return {LadderError::PositionOutOfRange,
                QString("position %1 outside rung").arg(position)};
    if (!m_sequence.at(position).isInstruction())
        return {LadderError::WrongElementKind,
                QString("position %1 is not an instruction").arg(position)};

    m_sequence[position].instruction = instruction;
    return LadderStatus::success();
}

// -------------------------------------------------------
// 其他查询
// -------------------------------------------------------
int Rung::branchNestingLevel(int position) const
{
    if (position < 0 || position >= m_sequence.size()) return 0;
    return m_sequence.at(position).branchLevel;
}

int Rung::findMatchingBranchEnd(int startPosition) const
{
    if (startPosition < 0 || startPosition >= m_sequence.size()) return -1;
    const RungElement& e = m_sequence.at(startPosition);
    if (e.kind != RungElementKind::BranchStart) return -1;
    return m_branches.at(e.branchId).endPosition;
}

QVector<InstructionRef> Rung::instructions() const
{
    QVector<InstructionRef> out;
    for (const RungElement& e : m_sequence)
        if (e.isInstruction()) out << e.instruction;
    return out;
}

QVector<InstructionRef> Rung::instructionsInBranch(BranchId id) const
{
    QVector<InstructionRef> out;
    const Branch* b = branch(id);
    if (!b) return out;
    for (int i = b->startPosition; i <= b->endPosition; ++i)
        if (m_sequence.at(i).isInstruction()) out << m_sequence.at(i).instruction;
    return out;
}

QVector<InstructionRef> Rung::mainLineInstructions() const
{
    QVector<InstructionRef> out;
    for (const RungElement& e : m_sequence)
        if (e.isInstruction() && e.branchLevel == 0) out << e.instruction;
    return out;
}
