#include "tests/ladder_test_common.h"

#include <algorithm>

using namespace ladder_test;

namespace {

LayoutResult layoutOf(const Rung& rung, int y = 50, int rungNumber = 0)
{
    LadderLayoutEngine engine;
    const LadderResult<LayoutResult> r = engine.layoutRung(rung, rungNumber, y);
    EXPECT_TRUE(r.ok()) << r.status.toString().toStdString();
    return r.value;
}

bool hasWire(const QVector<WireSegment>& wires, QPoint from, QPoint to)
{
    return std::find(wires.begin(), wires.end(), WireSegment{from, to}) != wires.end();
}

} // namespace

TEST(LayoutEngineTest, StraightRungLeftToRight) {
    const LayoutResult r = layoutOf(rungFromText("XIC(A)XIO(B)OTE(C);"));

    ASSERT_EQ(r.elements.size(), 3);
    EXPECT_EQ(r.elements[0].rect, QRect(50, 65, 40, 30));
    EXPECT_EQ(r.elements[1].rect, QRect(110, 65, 40, 30));
    EXPECT_EQ(r.elements[2].rect, QRect(170, 65, 40, 30));
    for (const LayoutElement& le : r.elements) {
        EXPECT_EQ(le.railY, 80);
        EXPECT_EQ(le.branchLevel, 0);
        EXPECT_EQ(le.railBranchId, NoBranch);
    }
    EXPECT_EQ(r.elements[2].instructionKind, InstructionKind::Coil);
    EXPECT_EQ(r.elements[1].text, "B");
    EXPECT_EQ(r.height, 60);
    EXPECT_EQ(r.maxBranchDepth, 0);
    EXPECT_EQ(r.rightRailX, 600);
    EXPECT_TRUE(r.branches.isEmpty());
}

TEST(LayoutEngineTest, ElementsDoNotOverlapOnARail) {
    const LayoutResult r = layoutOf(rungFromText(
        "XIC(A)TON(Timer1,1000,0)MOV(Src,Dst)OTE(C);"));
    const int gap = LadderLayoutConfig().elementSpacing + LadderLayoutConfig().minimumWireLength;
    for (int i = 1; i < r.elements.size(); ++i)
        EXPECT_GE(r.elements[i].left(), r.elements[i - 1].right() + gap);
    EXPECT_EQ(r.elements[1].rect.size(), QSize(80, 40));
    EXPECT_EQ(r.elements[1].rect.top(), 60);
}

TEST(LayoutEngineTest, SimpleBranchGeometry) {
    const LayoutResult r = layoutOf(rungFromText("XIC(A)[XIC(B),XIC(C)]OTE(D);"));
    ASSERT_EQ(r.elements.size(), 7);

    const LayoutElement& start = r.elements[1];
    EXPECT_EQ(start.kind, RungElementKind::BranchStart);
    EXPECT_EQ(start.rect, QRect(110, 75, 10, 10));

    const LayoutElement& b = r.elements[2];
    EXPECT_EQ(b.rect, QRect(140, 125, 40, 30));
    EXPECT_EQ(b.railY, 140);
    EXPECT_EQ(b.branchLevel, 1);

    const LayoutElement& next = r.elements[3];
    EXPECT_EQ(next.rect.topLeft(), QPoint(110, 195));
    EXPECT_EQ(next.railY, 200);

    const LayoutElement& c = r.elements[4];
    EXPECT_EQ(c.rect.x(), 140);
    EXPECT_EQ(c.railY, 200);
    EXPECT_EQ(c.railBranchId, 1);

    EXPECT_EQ(r.elements[5].rect.topLeft(), QPoint(200, 75));
    EXPECT_EQ(r.elements[6].rect.x(), 230);
    EXPECT_EQ(r.elements[6].railY, 80);

    ASSERT_EQ(r.branches.size(), 2);
    const Branch& outer = r.branches[0];
    EXPECT_EQ(outer.startX, 110);
    EXPECT_EQ(outer.endX, 210);
    EXPECT_EQ(outer.branchY, 140);
    EXPECT_EQ(outer.startY, 110);
    EXPECT_EQ(outer.endY, 229);

    const Branch& rail = r.branches[1];
    EXPECT_TRUE(rail.isRail);
    EXPECT_EQ(rail.startX, 110);
    EXPECT_EQ(rail.endX, 210);
    EXPECT_EQ(rail.branchY, 200);
    EXPECT_EQ(rail.startY, 170);
    EXPECT_EQ(rail.endY, 229);

    EXPECT_EQ(r.maxBranchDepth, 2);
    EXPECT_EQ(r.height, 180);
}

TEST(LayoutEngineTest, RailIndexCountsMembersPerRail) {
    const LayoutResult r = layoutOf(rungFromText("XIC(A)[XIC(B),XIC(C)]OTE(D);"));
    EXPECT_EQ(r.elements[0].railIndex, 0);   // A
    EXPECT_EQ(r.elements[1].railIndex, 1);   // [
    EXPECT_EQ(r.elements[2].railIndex, 0);   // B
    EXPECT_EQ(r.elements[3].railIndex, -1);  // ,
    EXPECT_EQ(r.elements[4].railIndex, 0);   // C
    EXPECT_EQ(r.elements[5].railIndex, -1);  // ]
    EXPECT_EQ(r.elements[6].railIndex, 2);   // D
}

TEST(LayoutEngineTest, BranchCatalogMatchesRungStructure) {
    const Rung rung = rungFromText("XIC(A)[XIC(B)[XIC(C),XIC(D)],XIC(E)]OTE(F);");
    const LayoutResult r = layoutOf(rung);

    ASSERT_EQ(r.branches.size(), rung.branches().size());
    for (int i = 0; i < r.branches.size(); ++i)
        EXPECT_TRUE(r.branches[i].sameStructure(rung.branches()[i])) << "branch " << i;

    EXPECT_EQ(r.maxBranchDepth, 4);
    EXPECT_EQ(r.height, 60 + 4 * 60);
    // 内层分支的 ']' 放在内层各支路最右沿之后
    const int innerRight = std::max(r.elements[4].right(), r.elements[6].right());
    EXPECT_EQ(r.elements[7].left(), innerRight + 20);
    EXPECT_EQ(r.branches[1].endX, r.elements[7].right());
}

TEST(LayoutEngineTest, SiblingRailsDoNotOverlapNestedRows) {
    const LayoutResult r = layoutOf(rungFromText("XIC(A)[XIC(B)[XIC(C),XIC(D)],XIC(E)]OTE(F);"));
    // D 在内层支路（行 3），E 在外层第二条支路（行 4）
    EXPECT_LT(r.elements[6].rect.bottom(), r.elements[9].rect.top());
    EXPECT_EQ(r.branches[2].endY + 1, r.branches[3].startY);
    EXPECT_EQ(r.branches[3].endY, r.branches[0].endY);
}

TEST(LayoutEngineTest, RailChildrenStackWithoutGaps) {
    const LayoutResult r = layoutOf(rungFromText("[XIC(A),XIC(B),XIC(C)]OTE(D);"));
    const Branch& outer = r.branches[0];
    ASSERT_EQ(outer.childBranchIds.size(), 2);
    const Branch& first  = r.branches[outer.childBranchIds[0]];
    const Branch& second = r.branches[outer.childBranchIds[1]];
    EXPECT_EQ(first.endY, second.startY - 1);
    EXPECT_EQ(second.endY, outer.endY);
    EXPECT_EQ(r.maxBranchDepth, 3);
}

TEST(LayoutEngineTest, CommentPushesRailsDown) {
    const LayoutResult r = layoutOf(rungFromText("XIC(A)OTE(B);", "line one\nline two"));
    EXPECT_EQ(r.commentHeight, 34);
    EXPECT_EQ(r.height, 94);
    EXPECT_EQ(r.elements[0].railY, 50 + 30 + 34);
    EXPECT_EQ(r.baselineY(30), 114);
}

TEST(LayoutEngineTest, RightRailTracksWideRungs) {
    QString wide;
    for (int i = 0; i < 12; ++i) wide += QString("XIC(I%1)").arg(i);
    const LayoutResult r = layoutOf(rungFromText(wide + "OTE(Q);"));
    // 13 个元素：最后一个右沿 = 50 + 13×40 + 12×20
    EXPECT_EQ(r.elements.last().right(), 810);
    EXPECT_EQ(r.rightRailX, 830);
}

TEST(LayoutEngineTest, EmptyRung) {
    const LayoutResult r = layoutOf(Rung());
    EXPECT_TRUE(r.elements.isEmpty());
    EXPECT_EQ(r.height, 60);
    EXPECT_EQ(r.rightRailX, 600);
}

TEST(LayoutEngineTest, LayoutIsIdempotent) {
    const Rung rung = rungFromText("XIC(A)[XIC(B)[XIC(C),XIC(D)],XIC(E)]OTE(F);", "c");
    EXPECT_EQ(layoutOf(rung, 130, 1), layoutOf(rung, 130, 1));

    // y 平移只影响纵向坐标
    const LayoutResult a = layoutOf(rung, 50);
    const LayoutResult b = layoutOf(rung, 150);
    for (int i = 0; i < a.elements.size(); ++i)
        EXPECT_EQ(b.elements[i].rect, a.elements[i].rect.translated(0, 100));
}

TEST(LayoutEngineTest, UnbalancedSequenceIsReported) {
    LadderLayoutEngine engine;

    QVector<RungElement> strayEnd = {RungElement::makeInstruction(contact("A")),
                                     RungElement::makeMarker(RungElementKind::BranchEnd)};
    EXPECT_EQ(engine.layoutSequence(strayEnd, QString(), 0, 50).status.code(),
              LadderError::UnbalancedBranch);

    QVector<RungElement> strayNext = {RungElement::makeMarker(RungElementKind::BranchNext)};
    EXPECT_EQ(engine.layoutSequence(strayNext, QString(), 0, 50).status.code(),
              LadderError::UnbalancedBranch);

    QVector<RungElement> unclosed = {RungElement::makeMarker(RungElementKind::BranchStart),
                                     RungElement::makeInstruction(contact("A"))};
    EXPECT_EQ(engine.layoutSequence(unclosed, QString(), 0, 50).status.code(),
              LadderError::UnbalancedBranch);
}

TEST(LayoutEngineTest, MismatchedBranchEndIdIsReported) {
    const Rung rung = rungFromText("[[XIC(A)]];");
    QVector<RungElement> seq = rung.sequence();
    ASSERT_EQ(seq[3].branchId, 1);
    ASSERT_EQ(seq[4].branchId, 0);
    std::swap(seq[3].branchId, seq[4].branchId);

    LadderLayoutEngine engine;
    const LadderResult<LayoutResult> r = engine.layoutSequence(seq, QString(), 0, 50);
    EXPECT_EQ(r.status.code(), LadderError::UnbalancedBranch);
}

TEST(LayoutEngineTest, CustomConfigSpacing) {
    LadderLayoutConfig config;
    config.elementSpacing = 5;
    config.minimumWireLength = 5;
    config.branchSpacing = 40;
    LadderLayoutEngine engine(config);

    const LadderResult<LayoutResult> r =
        engine.layoutRung(rungFromText("XIC(A)[XIC(B)]OTE(C);"), 0, 0);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value.elements[1].left(), r.value.elements[0].right() + 10);
    EXPECT_EQ(r.value.elements[2].railY, r.value.elements[0].railY + 40);
    EXPECT_EQ(r.value.height, 60 + 40);
    EXPECT_EQ(engine.rungHeight(0, 1), 100);
}

TEST(WireSegmentsTest, StraightRung) {
    const LadderLayoutConfig config;
    const LayoutResult r = layoutOf(rungFromText("XIC(A)XIO(B)OTE(C);"));
    const QVector<WireSegment> wires = LadderLayoutEngine::wireSegments(r, config);

    ASSERT_EQ(wires.size(), 4);
    EXPECT_EQ(wires.first(), (WireSegment{QPoint(40, 80), QPoint(50, 80)}));
    EXPECT_EQ(wires[1], (WireSegment{QPoint(90, 80), QPoint(110, 80)}));
    EXPECT_EQ(wires.last(), (WireSegment{QPoint(210, 80), QPoint(600, 80)}));
    for (const WireSegment& w : wires)
        EXPECT_FALSE(w.isVertical());
}

TEST(WireSegmentsTest, BranchVerticals) {
    const LadderLayoutConfig config;
    const LayoutResult r = layoutOf(rungFromText("XIC(A)[XIC(B),XIC(C)]OTE(D);"));
    const QVector<WireSegment> wires = LadderLayoutEngine::wireSegments(r, config);

    // 分支左侧：主母线 → 第一条支路、主母线 → 第二条支路
    EXPECT_TRUE(hasWire(wires, QPoint(120, 80), QPoint(120, 140)));
    EXPECT_TRUE(hasWire(wires, QPoint(120, 80), QPoint(120, 200)));
    // 分支右侧汇合到 ']'
    EXPECT_TRUE(hasWire(wires, QPoint(180, 140), QPoint(200, 140)));
    EXPECT_TRUE(hasWire(wires, QPoint(200, 140), QPoint(200, 80)));
    EXPECT_TRUE(hasWire(wires, QPoint(180, 200), QPoint(200, 200)));
    EXPECT_TRUE(hasWire(wires, QPoint(200, 200), QPoint(200, 80)));
    // ']' 之后回到主母线
    EXPECT_TRUE(hasWire(wires, QPoint(210, 80), QPoint(230, 80)));
    EXPECT_TRUE(hasWire(wires, QPoint(270, 80), QPoint(600, 80)));
}
