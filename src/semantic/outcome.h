#pragma once
#include "types.h"
#include <QString>

inline constexpr char kDegradedPlaceholder[] =
    "(Response received but requires different format parsing)";

struct StreamOutcome {
    OutcomeStatus status = OutcomeStatus::Completed;
    QString text;

    bool isDegraded() const { return status == OutcomeStatus::Degraded; }

    static StreamOutcome completed(const QString& text) {
        return {OutcomeStatus::Completed, text};
    }
    static StreamOutcome degraded() {
        return {OutcomeStatus::Degraded, QString::fromUtf8(kDegradedPlaceholder)};
    }
};
