// 程序入口：ladderdump —— 读取梯级文本文件，输出每条梯级的布局

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QTextStream>

#include "core/layout/RoutineLayout.h"
#include "core/models/RungText.h"
#include "utils/LadderLog.h"

// 例程文本：每行一条梯级；'#' 开头的行累积为下一条梯级的注释
static LadderStatus readRoutine(const QString& path, Routine& routine)
{
    QFile file(path);
    if (!file.open(QFile::ReadOnly | QFile::Text))
        return {LadderError::ParseError, QString("cannot open %1").arg(path)};

    QTextStream in(&file);
    QStringList comment;
    int lineNo = 0;
    while (!in.atEnd()) {
        const QString line = in.readLine().trimmed();
        ++lineNo;
        if (line.isEmpty()) continue;
        if (line.startsWith('#')) {
            comment << line.mid(1).trimmed();
            continue;
        }

        Rung rung;
        const LadderStatus st = RungText::parse(line, rung);
        if (!st.ok())
            return {st.code(), QString("%1:%2: %3").arg(path).arg(lineNo).arg(st.message())};
        rung.setComment(comment.join('\n'));
        comment.clear();
        routine.appendRung(rung);
    }
    return LadderStatus::success();
}

static QString kindName(const LayoutElement& le)
{
    switch (le.kind) {
    case RungElementKind::Instruction: return InstructionRef::kindToString(le.instructionKind);
    case RungElementKind::BranchStart: return "[";
    case RungElementKind::BranchNext:  return ",";
    case RungElementKind::BranchEnd:   return "]";
    }
    return "?";
}

static void dumpRung(QTextStream& out, const Rung& rung, const LayoutResult& r,
                     const LadderLayoutConfig& config, bool wires)
{
    out << QString("rung %1  y=%2 height=%3 depth=%4 right=%5  %6\n")
               .arg(r.rungNumber).arg(r.y).arg(r.height).arg(r.maxBranchDepth)
               .arg(r.rightRailX).arg(RungText::serialize(rung));
    if (!rung.comment().isEmpty())
        out << "  comment: " << QString(rung.comment()).replace('\n', " | ") << "\n";

    for (const LayoutElement& le : r.elements) {
        out << QString("  %1 %2 %3 (%4,%5 %6x%7) level=%8 rail=%9 slot=%10\n")
                   .arg(le.position, 3).arg(kindName(le), -8).arg(le.text, -12)
                   .arg(le.rect.x()).arg(le.rect.y())
                   .arg(le.rect.width()).arg(le.rect.height())
                   .arg(le.branchLevel).arg(le.railBranchId).arg(le.railIndex);
    }
    for (const Branch& b : r.branches) {
        out << QString("  branch %1 %2 parent=%3 root=%4 pos=[%5,%6] level=%7 row=%8"
                       " box=(%9,%10)-(%11,%12)\n")
                   .arg(b.id).arg(QString(b.isRail ? "rail  " : "branch"))
                   .arg(b.parentBranchId).arg(b.rootBranchId)
                   .arg(b.startPosition).arg(b.endPosition)
                   .arg(b.branchLevel).arg(b.row)
                   .arg(b.startX).arg(b.startY).arg(b.endX).arg(b.endY);
    }
    if (wires) {
        for (const WireSegment& w : LadderLayoutEngine::wireSegments(r, config))
            out << QString("  wire (%1,%2)-(%3,%4)\n")
                       .arg(w.from.x()).arg(w.from.y()).arg(w.to.x()).arg(w.to.y());
    }
}

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);

    // 设置应用程序信息
    app.setApplicationName("ladderdump");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("TiZiTeam");

    QCommandLineParser parser;
    parser.setApplicationDescription("Lay out ladder rungs and print their geometry.");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOpt("config", "Layout config XML.", "file");
    QCommandLineOption wiresOpt("wires", "Also print wire segments.");
    parser.addOption(configOpt);
    parser.addOption(wiresOpt);
    parser.addPositionalArgument("routine", "Rung text file, one rung per line.");
    parser.process(app);

    QTextStream err(stderr);
    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        err << parser.helpText();
        return 2;
    }

    LadderLayoutConfig config;
    if (parser.isSet(configOpt)) {
        const LadderStatus st = config.loadFromFile(parser.value(configOpt));
        if (!st.ok()) {
            err << st.toString() << "\n";
            return 1;
        }
    }

    Routine routine(args.first());
    LadderStatus st = readRoutine(args.first(), routine);
    if (!st.ok()) {
        err << st.toString() << "\n";
        return 1;
    }

    RoutineLayout layout(config);
    st = layout.layoutAll(routine);
    if (!st.ok()) {
        err << st.toString() << "\n";
        return 1;
    }
    qCInfo(lcLadderLayout) << "laid out" << routine.rungCount() << "rungs";

    QTextStream out(stdout);
    for (int i = 0; i < routine.rungCount(); ++i)
        dumpRung(out, routine.rung(i), layout.rung(i), config, parser.isSet(wiresOpt));
    const QRect ext = layout.extent();
    out << QString("extent %1x%2\n").arg(ext.width()).arg(ext.height());
    return 0;
}
