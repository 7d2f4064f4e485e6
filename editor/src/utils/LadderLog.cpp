#include "LadderLog.h"

Q_LOGGING_CATEGORY(lcLadderModel,  "ladder.model",  QtInfoMsg)
Q_LOGGING_CATEGORY(lcLadderLayout, "ladder.layout", QtInfoMsg)
Q_LOGGING_CATEGORY(lcLadderEdit,   "ladder.edit",   QtInfoMsg)
