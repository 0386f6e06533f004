#pragma once

#include <vector>

#include <QDate>
#include <QDateTime>
#include <QMetaType>
#include <QUuid>

namespace planner {
namespace data {

enum class GapModifier
{
    System,
    User,
    CalendarSync,
};

struct Gap
{
    QUuid id = QUuid::createUuid();
    QDate date;
    int start = 0; // minutes since midnight, inclusive
    int end = 0;   // exclusive
    int durationMinutes = 0;
    QUuid parentGapId;
    QUuid originGapId;
    GapModifier modifiedBy = GapModifier::System;
    QDateTime createdAt;
    QDateTime updatedAt;
};

} // namespace data
} // namespace planner

Q_DECLARE_METATYPE(planner::data::Gap)
Q_DECLARE_METATYPE(std::vector<planner::data::Gap>)
