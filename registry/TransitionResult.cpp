#include "TransitionResult.h"

namespace RailConflict::Registry {

TransitionResult::TransitionResult(Status status, const QString& reason)
    : m_status(status), m_reason(reason)
    , m_evaluationTime(QDateTime::currentDateTime()) {}

TransitionResult TransitionResult::applied(const QString& reason) {
    return TransitionResult(Status::APPLIED, reason);
}

TransitionResult TransitionResult::noOp(const QString& reason) {
    return TransitionResult(Status::NO_OP, reason);
}

TransitionResult TransitionResult::rejected(const QString& reason, const QString& ruleId) {
    auto result = TransitionResult(Status::REJECTED, reason);
    if (!ruleId.isEmpty()) result.setRuleId(ruleId);
    return result;
}

TransitionResult TransitionResult::notFound(const QString& entityId) {
    auto result = TransitionResult(Status::NOT_FOUND, QString("No active entry with id %1").arg(entityId));
    result.setRuleId("NOT_FOUND").setEntityId(entityId);
    return result;
}

QVariantMap TransitionResult::toVariantMap() const {
    QVariantMap map;
    map["success"] = isAccepted();
    map["status"] = transitionStatusToString(m_status);
    map["reason"] = m_reason;
    map["ruleId"] = m_ruleId;
    map["entityId"] = m_entityId;
    map["fromState"] = m_fromState;
    map["toState"] = m_toState;
    map["evaluationTime"] = m_evaluationTime;
    return map;
}

QString transitionStatusToString(TransitionResult::Status status) {
    switch (status) {
        case TransitionResult::Status::APPLIED:   return "APPLIED";
        case TransitionResult::Status::NO_OP:     return "NO_OP";
        case TransitionResult::Status::REJECTED:  return "REJECTED";
        case TransitionResult::Status::NOT_FOUND: return "NOT_FOUND";
        default:                                  return "UNKNOWN";
    }
}

} // namespace RailConflict::Registry
