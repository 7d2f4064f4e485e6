#pragma once

#include <gtest/gtest.h>

#include <QString>
#include <QStringList>

#include "src/core/layout/RoutineLayout.h"
#include "src/core/models/RungText.h"

// gtest 输出 QString
inline void PrintTo(const QString& s, std::ostream* os) { *os << s.toStdString(); }

namespace ladder_test {

inline InstructionRef contact(const QString& tag) { return InstructionRef("XIC", {tag}); }
inline InstructionRef coil(const QString& tag)    { return InstructionRef("OTE", {tag}); }

// 由梯级文本构造；文本必须合法
inline Rung rungFromText(const QString& text, const QString& comment = QString())
{
    Rung rung;
    const LadderStatus st = RungText::parse(text, rung);
    EXPECT_TRUE(st.ok()) << st.toString().toStdString();
    rung.setComment(comment);
    return rung;
}

inline Routine routineFromText(const QStringList& rungs)
{
    Routine routine("MainRoutine");
    for (const QString& text : rungs)
        routine.appendRung(rungFromText(text));
    return routine;
}

inline QString text(const Rung& rung) { return RungText::serialize(rung); }

// 位置连续：0 … n-1
inline void expectContiguous(const Rung& rung)
{
    for (int i = 0; i < rung.size(); ++i)
        EXPECT_EQ(rung.at(i).position, i);
}

// 每个已闭合分支：start ≤ end；内部元素层级 ≥ 分支层级 + 1，
// 不在嵌套分支内的直接成员层级恰为分支层级 + 1；根分支在整条嵌套链上不变
inline void expectBranchInvariants(const Rung& rung)
{
    for (const Branch& b : rung.branches()) {
        EXPECT_LE(b.startPosition, b.endPosition) << "branch " << b.id;
        for (int i = b.startPosition + 1; i < b.endPosition; ++i) {
            const RungElement& e = rung.at(i);
            EXPECT_GE(e.branchLevel, b.branchLevel + 1) << "branch " << b.id << " pos " << i;
            EXPECT_EQ(e.rootBranchId, b.rootBranchId) << "branch " << b.id << " pos " << i;

            bool nested = false;
            for (const Branch& n : rung.branches()) {
                if (n.isRail || n.id == b.id) continue;
                if (n.startPosition > b.startPosition && n.endPosition < b.endPosition
                    && i > n.startPosition && i < n.endPosition)
                    nested = true;
            }
            if (!nested)
                EXPECT_EQ(e.branchLevel, b.branchLevel + 1) << "branch " << b.id << " pos " << i;
        }
    }
}

// 以默认配置布局整个例程
class RoutineFixture : public ::testing::Test {
protected:
    void load(const QStringList& rungs)
    {
        routine = routineFromText(rungs);
        const LadderStatus st = layout.layoutAll(routine);
        ASSERT_TRUE(st.ok()) << st.toString().toStdString();
    }

    LadderLayoutConfig config;
    Routine            routine;
    RoutineLayout      layout{config};
};

} // namespace ladder_test
