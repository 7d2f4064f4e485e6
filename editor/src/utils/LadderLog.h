#pragma once
#include <QLoggingCategory>

// 梯形图核心的日志分类
//   启用调试输出：QT_LOGGING_RULES="ladder.*.debug=true"
Q_DECLARE_LOGGING_CATEGORY(lcLadderModel)   // ladder.model  —— 序列解析 / 配置读写
Q_DECLARE_LOGGING_CATEGORY(lcLadderLayout)  // ladder.layout —— 布局与高度级联
Q_DECLARE_LOGGING_CATEGORY(lcLadderEdit)    // ladder.edit   —— 编辑操作 / 会话状态
