#pragma once
#include <QString>
#include <QVector>
#include "Rung.h"

// 一个梯形图例程：有序梯级列表
//   纵向堆叠（每条梯级的 y）由 RoutineLayout 根据各梯级高度推导
class Routine {
public:
    Routine() = default;
    explicit Routine(const QString& name) : name(name) {}

    QString name;

    int  rungCount() const { return m_rungs.size(); }
    bool isEmpty()   const { return m_rungs.isEmpty(); }
    bool hasRung(int index) const { return index >= 0 && index < m_rungs.size(); }

    const Rung& rung(int index) const { return m_rungs.at(index); }
    Rung&       rung(int index)       { return m_rungs[index]; }
    const QVector<Rung>& rungs() const { return m_rungs; }

    // index == rungCount() 时追加到末尾
    LadderStatus insertRung(int index, const Rung& rung);
    void         appendRung(const Rung& rung) { m_rungs.append(rung); }
    LadderStatus removeRung(int index);
    LadderStatus replaceRung(int index, const Rung& rung);
    void         clear() { m_rungs.clear(); }

    bool operator==(const Routine& o) const { return name == o.name && m_rungs == o.m_rungs; }
    bool operator!=(const Routine& o) const { return !(*this == o); }

private:
    QVector<Rung> m_rungs;
};
