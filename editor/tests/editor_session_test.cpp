#include "tests/ladder_test_common.h"

#include "src/editor/LadderEditorSession.h"

using namespace ladder_test;

class EditorSessionTest : public ::testing::Test {
protected:
    void load(const QStringList& rungs)
    {
        const LadderStatus st = session.loadRoutine(routineFromText(rungs));
        ASSERT_TRUE(st.ok()) << st.toString().toStdString();
    }

    void SetUp() override
    {
        QObject::connect(&session, &LadderEditorSession::modeChanged,
                         [this](EditorMode m) { modes.append(m); });
        QObject::connect(&session, &LadderEditorSession::logMessage,
                         [this](const QString& msg) { log.append(msg); });
        QObject::connect(&session, &LadderEditorSession::layoutChanged,
                         [this] { ++layoutChanges; });
    }

    QString rungText(int i) const { return text(session.routine().rung(i)); }

    QVector<EditorMode> modes;
    QStringList         log;
    int                 layoutChanges = 0;
    LadderEditorSession session;
};

TEST_F(EditorSessionTest, InsertContactAtPointReturnsToView) {
    load({"XIC(A)OTE(B);"});
    session.setMode(Mode_InsertContact);
    ASSERT_EQ(session.currentMode(), Mode_InsertContact);

    ASSERT_TRUE(session.click(QPoint(100, 80)).ok());
    EXPECT_EQ(rungText(0), "XIC(A)XIC(NewContact)OTE(B);");
    EXPECT_EQ(session.currentMode(), Mode_View);
    EXPECT_EQ(modes, QVector<EditorMode>({Mode_InsertContact, Mode_View}));
    EXPECT_EQ(session.undoStack()->count(), 1);
    EXPECT_EQ(session.layout().rung(0).elements.size(), 3);
}

TEST_F(EditorSessionTest, InsertMissKeepsMode) {
    load({"XIC(A)OTE(B);", "XIC(A)OTE(B);"});
    session.setMode(Mode_InsertCoil);

    EXPECT_EQ(session.click(QPoint(60, 115)).code(), LadderError::InvalidInsertionPoint);
    EXPECT_EQ(session.currentMode(), Mode_InsertCoil);
    EXPECT_FALSE(log.isEmpty());
    EXPECT_EQ(session.undoStack()->count(), 0);

    ASSERT_TRUE(session.click(QPoint(500, 160)).ok());
    EXPECT_EQ(rungText(1), "XIC(A)OTE(B)OTE(NewCoil);");
    EXPECT_EQ(session.currentMode(), Mode_View);
}

TEST_F(EditorSessionTest, InstructionTemplates) {
    EXPECT_EQ(session.instructionTemplate(Mode_InsertContact), InstructionRef("XIC", {"NewContact"}));
    EXPECT_EQ(session.instructionTemplate(Mode_InsertCoil), InstructionRef("OTE", {"NewCoil"}));
    EXPECT_EQ(session.instructionTemplate(Mode_InsertBlock),
              InstructionRef("TON", {"Timer1", "1000", "0"}));
    EXPECT_FALSE(session.instructionTemplate(Mode_View).isValid());

    load({"XIC(A)OTE(B);"});
    session.setInstructionTemplate(Mode_InsertBlock, InstructionRef("MOV", {"Src", "Dst"}));
    session.setMode(Mode_InsertBlock);
    ASSERT_TRUE(session.click(QPoint(100, 80)).ok());
    EXPECT_EQ(rungText(0), "XIC(A)MOV(Src,Dst)OTE(B);");
}

TEST_F(EditorSessionTest, ConnectBranchOnSameRail) {
    load({"XIC(A)XIC(B)OTE(C);"});
    session.setMode(Mode_InsertBranch);

    ASSERT_TRUE(session.click(QPoint(60, 80)).ok());
    EXPECT_EQ(session.currentMode(), Mode_ConnectBranch);
    ASSERT_TRUE(session.hasPendingAnchor());
    EXPECT_EQ(session.pendingAnchor(), (InsertionTarget{0, 0, NoBranch, 0}));

    ASSERT_TRUE(session.click(QPoint(160, 80)).ok());
    EXPECT_EQ(rungText(0), "[XIC(A)XIC(B),]OTE(C);");
    EXPECT_EQ(session.currentMode(), Mode_View);
    EXPECT_FALSE(session.hasPendingAnchor());
    EXPECT_EQ(session.layout().rungHeight(0), 180);
}

TEST_F(EditorSessionTest, ConnectBranchAcrossRungsIsAbandoned) {
    load({"XIC(A)XIC(B)OTE(C);", "XIC(A)OTE(B);"});
    session.setMode(Mode_InsertBranch);
    ASSERT_TRUE(session.click(QPoint(60, 80)).ok());

    EXPECT_EQ(session.click(QPoint(100, 160)).code(), LadderError::InvalidInsertionPoint);
    EXPECT_EQ(session.currentMode(), Mode_View);
    EXPECT_FALSE(session.hasPendingAnchor());
    EXPECT_EQ(rungText(0), "XIC(A)XIC(B)OTE(C);");
    EXPECT_TRUE(log.last().startsWith("Connect branch abandoned"));
    EXPECT_EQ(session.undoStack()->count(), 0);
}

TEST_F(EditorSessionTest, ConnectBranchOnEmptySpaceIsAbandoned) {
    load({"XIC(A)XIC(B)OTE(C);"});
    session.setMode(Mode_InsertBranch);
    ASSERT_TRUE(session.click(QPoint(60, 80)).ok());

    EXPECT_FALSE(session.click(QPoint(60, 500)).ok());
    EXPECT_EQ(session.currentMode(), Mode_View);
    EXPECT_EQ(rungText(0), "XIC(A)XIC(B)OTE(C);");
}

TEST_F(EditorSessionTest, ModeGuards) {
    load({"XIC(A)OTE(B);"});

    session.setMode(Mode_Drag);
    EXPECT_EQ(session.currentMode(), Mode_View);
    EXPECT_FALSE(session.beginDrag());

    session.setMode(Mode_ConnectBranch);
    EXPECT_EQ(session.currentMode(), Mode_View);
    EXPECT_TRUE(modes.isEmpty());

    // 切换到其他模式会丢弃分支锚点
    session.setMode(Mode_InsertBranch);
    ASSERT_TRUE(session.click(QPoint(60, 80)).ok());
    ASSERT_TRUE(session.hasPendingAnchor());
    session.cancel();
    EXPECT_FALSE(session.hasPendingAnchor());
    EXPECT_EQ(session.currentMode(), Mode_View);
}

TEST_F(EditorSessionTest, ViewClickSelects) {
    load({"XIC(A)OTE(B);", "XIC(A)OTE(B);"});

    ASSERT_TRUE(session.click(QPoint(140, 160)).ok());
    EXPECT_EQ(session.selection().rung, 1);
    EXPECT_EQ(session.selection().position, 1);
    EXPECT_TRUE(session.layout().rung(1).elements[1].selected);

    ASSERT_TRUE(session.click(QPoint(400, 160)).ok());
    EXPECT_FALSE(session.selection().isValid());
    EXPECT_FALSE(session.layout().rung(1).elements[1].selected);
}

TEST_F(EditorSessionTest, DragWithinRung) {
    load({"XIC(A)OTE(B);"});
    ASSERT_TRUE(session.select(0, 0));
    ASSERT_TRUE(session.beginDrag());
    EXPECT_EQ(session.currentMode(), Mode_Drag);

    ASSERT_TRUE(session.release(QPoint(500, 80)).ok());
    EXPECT_EQ(rungText(0), "OTE(B)XIC(A);");
    EXPECT_EQ(session.currentMode(), Mode_View);
    EXPECT_FALSE(session.selection().isValid());
}

TEST_F(EditorSessionTest, FailedDropStillReturnsToView) {
    load({"XIC(A)OTE(B);"});
    ASSERT_TRUE(session.select(0, 0));
    ASSERT_TRUE(session.beginDrag());

    EXPECT_EQ(session.release(QPoint(60, 400)).code(), LadderError::InvalidInsertionPoint);
    EXPECT_EQ(session.currentMode(), Mode_View);
    EXPECT_EQ(rungText(0), "XIC(A)OTE(B);");
}

TEST_F(EditorSessionTest, DragAcrossRungsUndoesAsOneStep) {
    load({"XIC(A)OTE(B);", "XIC(C)OTE(D);"});
    ASSERT_TRUE(session.select(0, 0));
    ASSERT_TRUE(session.beginDrag());
    ASSERT_TRUE(session.release(QPoint(100, 160)).ok());

    EXPECT_EQ(rungText(0), "OTE(B);");
    EXPECT_EQ(rungText(1), "XIC(C)XIC(A)OTE(D);");
    EXPECT_EQ(session.undoStack()->count(), 1);

    session.undo();
    EXPECT_EQ(rungText(0), "XIC(A)OTE(B);");
    EXPECT_EQ(rungText(1), "XIC(C)OTE(D);");
    EXPECT_EQ(session.layout().rung(1).elements.size(), 2);

    session.redo();
    EXPECT_EQ(rungText(0), "OTE(B);");
    EXPECT_EQ(rungText(1), "XIC(C)XIC(A)OTE(D);");
}

TEST_F(EditorSessionTest, UndoRedoRestoresLayout) {
    load({"XIC(A)OTE(B);", "XIC(A)OTE(B);"});
    const QVector<LayoutResult> original = session.layout().results();

    ASSERT_TRUE(session.insertBranch(0, NoBranch, 0, 1).ok());
    ASSERT_TRUE(session.setComment(1, "after the branch").ok());
    EXPECT_EQ(session.layout().rungY(1), 50 + 180 + 20);
    const QVector<LayoutResult> edited = session.layout().results();

    session.undo();
    session.undo();
    EXPECT_EQ(session.layout().results(), original);
    EXPECT_EQ(session.routine().rung(1).comment(), QString());

    session.redo();
    session.redo();
    EXPECT_EQ(session.layout().results(), edited);
    EXPECT_GE(layoutChanges, 6);
}

TEST_F(EditorSessionTest, FailedEditIsNotPushed) {
    load({"XIC(A)[XIC(B),XIC(C)]OTE(D);"});
    EXPECT_EQ(session.insertInstruction(0, 0, 9, contact("X")).code(), LadderError::BranchNotFound);
    EXPECT_EQ(session.deleteElement(3, 0).code(), LadderError::RungNotFound);
    EXPECT_EQ(session.deleteSelection().code(), LadderError::PositionOutOfRange);
    EXPECT_EQ(session.undoStack()->count(), 0);
    EXPECT_EQ(log.size(), 4);  // 载入一条 + 三条失败
}

TEST_F(EditorSessionTest, DeleteSelectedMarker) {
    load({"XIC(A)[XIC(B),XIC(C)]OTE(D);"});
    ASSERT_TRUE(session.select(0, 3));
    ASSERT_TRUE(session.deleteSelection().ok());
    EXPECT_EQ(rungText(0), "XIC(A)[XIC(B)]OTE(D);");

    ASSERT_TRUE(session.insertBranchLevel(0, 1).ok());
    EXPECT_EQ(rungText(0), "XIC(A)[XIC(B),]OTE(D);");
    ASSERT_TRUE(session.replaceInstruction(0, 2, InstructionRef("XIO", {"B"})).ok());
    ASSERT_TRUE(session.removeBranch(0, 0).ok());
    EXPECT_EQ(rungText(0), "XIC(A)OTE(D);");

    session.undo();
    EXPECT_EQ(rungText(0), "XIC(A)[XIO(B),]OTE(D);");
}

TEST_F(EditorSessionTest, AddAndRemoveRungsAreUndoable) {
    load({"XIC(A)OTE(B);"});

    ASSERT_TRUE(session.addRung(1, rungFromText("OTE(Z);")).ok());
    ASSERT_TRUE(session.addRung(0).ok());
    EXPECT_EQ(session.routine().rungCount(), 3);
    EXPECT_TRUE(session.routine().rung(0).isEmpty());
    EXPECT_EQ(session.layout().rungYPositions(), QVector<int>({50, 130, 210}));

    ASSERT_TRUE(session.removeRung(1).ok());
    EXPECT_EQ(rungText(1), "OTE(Z);");

    session.undo();
    EXPECT_EQ(rungText(1), "XIC(A)OTE(B);");
    session.undo();
    session.undo();
    EXPECT_EQ(session.routine().rungCount(), 1);
    EXPECT_EQ(session.layout().rungCount(), 1);

    EXPECT_EQ(session.addRung(5).code(), LadderError::RungNotFound);
    EXPECT_EQ(session.removeRung(5).code(), LadderError::RungNotFound);
}

TEST_F(EditorSessionTest, HoverDoesNotModify) {
    load({"XIC(A)OTE(B);"});
    const LadderResult<InsertionTarget> t = session.hover(QPoint(100, 80));
    ASSERT_TRUE(t.ok());
    EXPECT_EQ(t.value.slot, 1);
    EXPECT_EQ(rungText(0), "XIC(A)OTE(B);");
    EXPECT_EQ(session.undoStack()->count(), 0);
}

TEST_F(EditorSessionTest, LoadRoutineClearsHistory) {
    load({"XIC(A)OTE(B);"});
    ASSERT_TRUE(session.setComment(0, "x").ok());
    ASSERT_EQ(session.undoStack()->count(), 1);

    load({"OTE(Q);", "OTE(R);"});
    EXPECT_EQ(session.undoStack()->count(), 0);
    EXPECT_EQ(session.layout().rungCount(), 2);
}

TEST_F(EditorSessionTest, SetConfigRelaysOut) {
    load({"XIC(A)OTE(B);", "XIC(A)OTE(B);"});
    LadderLayoutConfig config;
    config.rungGap = 40;
    ASSERT_TRUE(session.setConfig(config).ok());
    EXPECT_EQ(session.layout().rungY(1), 50 + 60 + 40);

    LadderLayoutConfig bad;
    bad.branchSpacing = 0;
    EXPECT_EQ(session.setConfig(bad).code(), LadderError::ParseError);
    EXPECT_EQ(session.layout().config().rungGap, 40);
}
