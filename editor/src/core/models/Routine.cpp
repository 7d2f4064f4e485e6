#include "Routine.h"

LadderStatus Routine::insertRung(int index, const Rung& rung)
{
    if (index < 0 || index > m_rungs.size())
        return {LadderError::RungNotFound,
                QString("rung index %1 outside routine (0..%2)").arg(index).arg(m_rungs.size())};
    m_rungs.insert(index, rung);
    return LadderStatus::success();
}

LadderStatus Routine::removeRung(int index)
{
    if (!hasRung(index))
        return {LadderError::RungNotFound, QString("rung %1 does not exist").arg(index)};
    m_rungs.remove(index);
    return LadderStatus::success();
}

LadderStatus Routine::replaceRung(int index, const Rung& rung)
{
    if (!hasRung(index))
        return {LadderError::RungNotFound, QString("rung %1 does not exist").arg(index)};
    m_rungs[index] = rung;
    return LadderStatus::success();
}
