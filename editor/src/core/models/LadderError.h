#pragma once
#include <QString>

// ──────────────────────────────────────────────────────────────
// 梯形图核心的错误码
//   结构性错误（UnbalancedBranch）一律上报，绝不自动修复；
//   定位失败（NoRungAtCoordinate）只表示"没有目标"。
// ──────────────────────────────────────────────────────────────
enum class LadderError {
    None,
    PositionOutOfRange,     // 序号超出序列 / 母线范围
    BranchNotFound,         // 未知 branchId
    UnbalancedBranch,       // 分支起止不配对（结构损坏）
    InvalidInsertionPoint,  // 坐标不在梯级/母线范围内
    NoRungAtCoordinate,     // y 不落在任何梯级内
    WrongElementKind,       // 操作对象的元素类型不对
    ParseError,             // 梯级文本 / 配置 XML 解析失败
    RungNotFound,           // 梯级序号不存在
};

// 操作结果：成功，或 错误码 + 说明
class LadderStatus {
public:
    LadderStatus() = default;
    LadderStatus(LadderError code, const QString& message)
        : m_code(code), m_message(message) {}

    static LadderStatus success() { return {}; }

    bool        ok()      const { return m_code == LadderError::None; }
    LadderError code()    const { return m_code; }
    QString     message() const { return m_message; }

    // "BranchNotFound: branch 7 not found in rung"
    QString toString() const;

    static QString errorName(LadderError code);

private:
    LadderError m_code = LadderError::None;
    QString     m_message;
};

// 带返回值的结果（失败时 value 为默认值）
template <typename T>
struct LadderResult {
    LadderStatus status;
    T            value{};

    bool ok() const { return status.ok(); }

    static LadderResult success(const T& v) { return {LadderStatus::success(), v}; }
    static LadderResult failure(LadderError code, const QString& msg) {
        return {LadderStatus(code, msg), T{}};
    }
    static LadderResult failure(const LadderStatus& s) { return {s, T{}}; }
};
