#pragma once

#include <QObject>
#include <QString>
#include <QVariantMap>
#include <QDateTime>

namespace RailConflict::Registry {

// Outcome of an operator action against the registry.
class TransitionResult {
    Q_GADGET
    Q_PROPERTY(bool isApplied READ isApplied)
    Q_PROPERTY(bool isRejected READ isRejected)
    Q_PROPERTY(QString reason READ getReason)
    Q_PROPERTY(QString ruleId READ getRuleId)

public:
    enum class Status { APPLIED, NO_OP, REJECTED, NOT_FOUND };

private:
    Status m_status = Status::REJECTED;
    QString m_reason;
    QString m_ruleId;
    QString m_entityId;
    QString m_fromState;
    QString m_toState;
    QDateTime m_evaluationTime;

public:
    TransitionResult(Status status = Status::REJECTED, const QString& reason = "Unknown");

    bool isApplied() const { return m_status == Status::APPLIED; }
    bool isNoOp() const { return m_status == Status::NO_OP; }
    bool isRejected() const { return m_status == Status::REJECTED || m_status == Status::NOT_FOUND; }
    // Applied and no-op both leave the registry consistent with the request
    bool isAccepted() const { return isApplied() || isNoOp(); }

    Status getStatus() const { return m_status; }
    QString getReason() const { return m_reason; }
    QString getRuleId() const { return m_ruleId; }
    QString getEntityId() const { return m_entityId; }
    QString getFromState() const { return m_fromState; }
    QString getToState() const { return m_toState; }

    TransitionResult& setRuleId(const QString& ruleId) { m_ruleId = ruleId; return *this; }
    TransitionResult& setEntityId(const QString& entityId) { m_entityId = entityId; return *this; }
    TransitionResult& setStates(const QString& fromState, const QString& toState) {
        m_fromState = fromState;
        m_toState = toState;
        return *this;
    }

    static TransitionResult applied(const QString& reason = "Transition applied");
    static TransitionResult noOp(const QString& reason);
    static TransitionResult rejected(const QString& reason, const QString& ruleId = "");
    static TransitionResult notFound(const QString& entityId);

    Q_INVOKABLE QVariantMap toVariantMap() const;
};

QString transitionStatusToString(TransitionResult::Status status);

} // namespace RailConflict::Registry

Q_DECLARE_METATYPE(RailConflict::Registry::TransitionResult)
