#include "LadderError.h"

QString LadderStatus::errorName(LadderError code)
{
    switch (code) {
    case LadderError::None:                  return "None";
    case LadderError::PositionOutOfRange:    return "PositionOutOfRange";
    case LadderError::BranchNotFound:        return "BranchNotFound";
    case LadderError::UnbalancedBranch:      return "UnbalancedBranch";
    case LadderError::InvalidInsertionPoint: return "InvalidInsertionPoint";
    case LadderError::NoRungAtCoordinate:    return "NoRungAtCoordinate";
    case LadderError::WrongElementKind:      return "WrongElementKind";
    case LadderError::ParseError:            return "ParseError";
    case LadderError::RungNotFound:          return "RungNotFound";
    }
    return "Unknown";
}

QString LadderStatus::toString() const
{
    if (ok()) return "OK";
    if (m_message.isEmpty()) return errorName(m_code);
    return QString("%1: %2").arg(errorName(m_code), m_message);
}
