#ifndef SESSIONERROR_H
#define SESSIONERROR_H

#include <QString>

enum class SessionError {
    None = 0,
    AlreadyActive,
    NoActiveSession,
    SessionNotFound,
    NetworkUnavailable,
    Conflict,
    Validation,
    Storage            // a local commit failed
};

inline QString sessionErrorToString(SessionError error)
{
    switch (error) {
        case SessionError::None: return "None";
        case SessionError::AlreadyActive: return "AlreadyActive";
        case SessionError::NoActiveSession: return "NoActiveSession";
        case SessionError::SessionNotFound: return "SessionNotFound";
        case SessionError::NetworkUnavailable: return "NetworkUnavailable";
        case SessionError::Conflict: return "Conflict";
        case SessionError::Validation: return "Validation";
        case SessionError::Storage: return "Storage";
    }
    return "Unknown";
}

/**
 * @brief Value-or-error returned by every UI-facing session operation
 *
 * For operations without a payload T is bool and the value tells whether a
 * transition actually happened (false for the documented no-ops).
 */
template<typename T>
struct SessionOutcome
{
    T value{};
    SessionError error = SessionError::None;
    QString message;

    bool isSuccess() const { return error == SessionError::None; }

    static SessionOutcome success(const T& value)
    {
        SessionOutcome outcome;
        outcome.value = value;
        return outcome;
    }

    static SessionOutcome failure(SessionError error, const QString& message = QString())
    {
        SessionOutcome outcome;
        outcome.error = error;
        outcome.message = message.isEmpty() ? sessionErrorToString(error) : message;
        return outcome;
    }
};

#endif // SESSIONERROR_H
