#include "tests/ladder_test_common.h"

#include <QTemporaryDir>

TEST(LayoutConfigTest, Defaults) {
    LadderLayoutConfig config;
    EXPECT_TRUE(config.isValid());
    EXPECT_EQ(config.leftRailX, 40);
    EXPECT_EQ(config.rightRailMinX, 600);
    EXPECT_EQ(config.instructionSize(InstructionKind::Contact), QSize(40, 30));
    EXPECT_EQ(config.instructionSize(InstructionKind::Block), QSize(80, 40));
    EXPECT_EQ(config.commentHeight(0), 0);
    EXPECT_EQ(config.commentHeight(2), 34);
}

TEST(LayoutConfigTest, PartialXmlKeepsDefaults) {
    LadderLayoutConfig config;
    const LadderStatus st = config.loadFromXml(
        "<ladderLayout version=\"1\">"
        "  <spacing branch=\"80\"/>"
        "  <block width=\"120\"/>"
        "</ladderLayout>");
    ASSERT_TRUE(st.ok()) << st.toString().toStdString();
    EXPECT_EQ(config.branchSpacing, 80);
    EXPECT_EQ(config.blockSize, QSize(120, 40));
    EXPECT_EQ(config.elementSpacing, 10);
    EXPECT_EQ(config.contactSize, QSize(40, 30));
}

TEST(LayoutConfigTest, RejectedXmlLeavesConfigUnchanged) {
    LadderLayoutConfig config;
    config.rungGap = 33;
    const LadderLayoutConfig before = config;

    EXPECT_EQ(config.loadFromXml("<ladderLayout><rail leftX=\"abc\"/></ladderLayout>").code(),
              LadderError::ParseError);
    EXPECT_EQ(config.loadFromXml("<ladderLayout><spacing branch=\"0\"/></ladderLayout>").code(),
              LadderError::ParseError);
    EXPECT_EQ(config.loadFromXml("<layout/>").code(), LadderError::ParseError);
    EXPECT_EQ(config.loadFromXml("<ladderLayout>").code(), LadderError::ParseError);
    EXPECT_EQ(config, before);
}

TEST(LayoutConfigTest, SaveAndLoadFile) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("layout.xml");

    LadderLayoutConfig saved;
    saved.railOffset = 16;
    saved.commentLineHeight = 18;
    saved.coilSize = QSize(50, 36);
    ASSERT_TRUE(saved.saveToFile(path).ok());

    LadderLayoutConfig loaded;
    ASSERT_TRUE(loaded.loadFromFile(path).ok());
    EXPECT_EQ(loaded, saved);

    LadderLayoutConfig missing;
    EXPECT_EQ(missing.loadFromFile(dir.filePath("nope.xml")).code(), LadderError::ParseError);
}
