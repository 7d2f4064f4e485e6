#include "LadderLayoutConfig.h"

#include <QDomDocument>
#include <QFile>
#include <QTextStream>

#include "../../utils/LadderLog.h"

QSize LadderLayoutConfig::instructionSize(InstructionKind kind) const
{
    switch (kind) {
    case InstructionKind::Contact: return contactSize;
    case InstructionKind::Coil:    return coilSize;
    case InstructionKind::Block:   return blockSize;
    }
    return blockSize;
}

int LadderLayoutConfig::commentHeight(int commentLines) const
{
    if (commentLines <= 0) return 0;
    return commentLines * commentLineHeight + commentPadding;
}

bool LadderLayoutConfig::isValid(QString* why) const
{
    auto bad = [why](const QString& msg) {
        if (why) *why = msg;
        return false;
    };
    if (elementSpacing < 0 || minimumWireLength < 0)
        return bad("element spacing and wire length must not be negative");
    if (branchSpacing <= 0)
        return bad("branch spacing must be positive");
    if (rungPadding < 0 || rungGap < 0 || commentLineHeight < 0 || commentPadding < 0)
        return bad("rung and comment spacing must not be negative");
    if (branchMarkerWidth <= 0 || branchMarkerHeight <= 0)
        return bad("branch marker size must be positive");
    for (const QSize& s : {contactSize, coilSize, blockSize})
        if (s.width() <= 0 || s.height() <= 0)
            return bad("instruction sizes must be positive");
    return true;
}

// ══════════════════════════════════════════════════════════════
// XML 读档
// ══════════════════════════════════════════════════════════════
LadderStatus LadderLayoutConfig::loadFromFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QFile::ReadOnly | QFile::Text)) {
        qCWarning(lcLadderModel) << "cannot open layout config" << path;
        return {LadderError::ParseError, QString("cannot open %1").arg(path)};
    }
    return loadFromXml(QString::fromUtf8(file.readAll()));
}

LadderStatus LadderLayoutConfig::loadFromXml(const QString& xml)
{
    QDomDocument doc;
    QString errMsg;
    int errLine = 0, errCol = 0;
    if (!doc.setContent(xml, &errMsg, &errLine, &errCol)) {
        const QString msg = QString("%1 (line %2, column %3)").arg(errMsg).arg(errLine).arg(errCol);
        qCWarning(lcLadderModel) << "layout config:" << msg;
        return {LadderError::ParseError, msg};
    }

    QDomElement root = doc.documentElement();
    if (root.tagName() != "ladderLayout")
        return {LadderError::ParseError,
                QString("unexpected root element <%1>").arg(root.tagName())};

    // 先在副本上读取，校验通过再整体替换
    LadderLayoutConfig cfg = *this;
    QString badAttr;

    auto readInt = [&badAttr](const QDomElement& e, const char* attr, int& out) {
        if (e.isNull() || !e.hasAttribute(attr)) return;
        bool ok = false;
        const int v = e.attribute(attr).trimmed().toInt(&ok);
        if (ok) out = v;
        else if (badAttr.isEmpty())
            badAttr = QString("%1@%2").arg(e.tagName(), QString(attr));
    };
    auto readSize = [&](const char* tag, QSize& out) {
        const QDomElement e = root.firstChildElement(tag);
        int w = out.width(), h = out.height();
        readInt(e, "width",  w);
        readInt(e, "height", h);
        out = QSize(w, h);
    };

    const QDomElement rail = root.firstChildElement("rail");
    readInt(rail, "leftX",     cfg.leftRailX);
    readInt(rail, "offset",    cfg.railOffset);
    readInt(rail, "rightMinX", cfg.rightRailMinX);

    const QDomElement spacing = root.firstChildElement("spacing");
    readInt(spacing, "element", cfg.elementSpacing);
    readInt(spacing, "wire",    cfg.minimumWireLength);
    readInt(spacing, "branch",  cfg.branchSpacing);

    const QDomElement rung = root.firstChildElement("rung");
    readInt(rung, "padding",   cfg.rungPadding);
    readInt(rung, "gap",       cfg.rungGap);
    readInt(rung, "topMargin", cfg.topMargin);

    const QDomElement comment = root.firstChildElement("comment");
    readInt(comment, "lineHeight", cfg.commentLineHeight);
    readInt(comment, "padding",    cfg.commentPadding);

    const QDomElement marker = root.firstChildElement("marker");
    readInt(marker, "width",  cfg.branchMarkerWidth);
    readInt(marker, "height", cfg.branchMarkerHeight);

    readSize("contact", cfg.contactSize);
    readSize("coil",    cfg.coilSize);
    readSize("block",   cfg.blockSize);

    if (!badAttr.isEmpty())
        return {LadderError::ParseError, QString("attribute %1 is not an integer").arg(badAttr)};

    QString why;
    if (!cfg.isValid(&why))
        return {LadderError::ParseError, why};

    *this = cfg;
    qCDebug(lcLadderModel) << "layout config loaded";
    return LadderStatus::success();
}

// ══════════════════════════════════════════════════════════════
// XML 存档
// ══════════════════════════════════════════════════════════════
QString LadderLayoutConfig::toXml() const
{
    QDomDocument doc;
    QDomProcessingInstruction pi = doc.createProcessingInstruction(
        "xml", "version=\"1.0\" encoding=\"UTF-8\"");
    doc.appendChild(pi);

    QDomElement root = doc.createElement("ladderLayout");
    root.setAttribute("version", "1");
    doc.appendChild(root);

    auto add = [&](const QString& tag) {
        QDomElement e = doc.createElement(tag);
        root.appendChild(e);
        return e;
    };

    QDomElement rail = add("rail");
    rail.setAttribute("leftX",     leftRailX);
    rail.setAttribute("offset",    railOffset);
    rail.setAttribute("rightMinX", rightRailMinX);

    QDomElement spacing = add("spacing");
    spacing.setAttribute("element", elementSpacing);
    spacing.setAttribute("wire",    minimumWireLength);
    spacing.setAttribute("branch",  branchSpacing);

    QDomElement rung = add("rung");
    rung.setAttribute("padding",   rungPadding);
    rung.setAttribute("gap",       rungGap);
    rung.setAttribute("topMargin", topMargin);

    QDomElement comment = add("comment");
    comment.setAttribute("lineHeight", commentLineHeight);
    comment.setAttribute("padding",    commentPadding);

    QDomElement marker = add("marker");
    marker.setAttribute("width",  branchMarkerWidth);
    marker.setAttribute("height", branchMarkerHeight);

    const struct { const char* tag; QSize size; } sizes[] = {
        {"contact", contactSize}, {"coil", coilSize}, {"block", blockSize},
    };
    for (const auto& s : sizes) {
        QDomElement e = add(s.tag);
        e.setAttribute("width",  s.size.width());
        e.setAttribute("height", s.size.height());
    }

    return doc.toString(2);
}

LadderStatus LadderLayoutConfig::saveToFile(const QString& path) const
{
    QFile file(path);
    if (!file.open(QFile::WriteOnly | QFile::Text)) {
        qCWarning(lcLadderModel) << "cannot write layout config" << path;
        return {LadderError::ParseError, QString("cannot write %1").arg(path)};
    }
    QTextStream stream(&file);
    stream << toXml();
    return LadderStatus::success();
}

bool LadderLayoutConfig::operator==(const LadderLayoutConfig& o) const
{
    return leftRailX == o.leftRailX && railOffset == o.railOffset
        && rightRailMinX == o.rightRailMinX
        && elementSpacing == o.elementSpacing && minimumWireLength == o.minimumWireLength
        && branchSpacing == o.branchSpacing
        && rungPadding == o.rungPadding && rungGap == o.rungGap && topMargin == o.topMargin
        && commentLineHeight == o.commentLineHeight && commentPadding == o.commentPadding
        && branchMarkerWidth == o.branchMarkerWidth && branchMarkerHeight == o.branchMarkerHeight
        && contactSize == o.contactSize && coilSize == o.coilSize && blockSize == o.blockSize;
}
