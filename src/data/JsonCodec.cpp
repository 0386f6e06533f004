#include "planner/data/JsonCodec.hpp"

#include "planner/core/Logging.hpp"
#include "planner/core/TimeUtils.hpp"

namespace planner {
namespace data {

namespace {
constexpr auto kDateFormat = Qt::ISODate;

QString prepareUid(const QUuid &id)
{
    return id.isNull() ? QString() : id.toString(QUuid::WithoutBraces);
}

QUuid parseUid(const QString &value)
{
    const QString trimmed = value.trimmed();
    if (trimmed.isEmpty()) {
        return {};
    }
    if (trimmed.startsWith('{')) {
        return QUuid(trimmed);
    }
    return QUuid(QStringLiteral("{%1}").arg(trimmed));
}

QString formatTimestamp(const QDateTime &dt)
{
    return dt.isValid() ? dt.toUTC().toString(Qt::ISODateWithMs) : QString();
}

QDateTime parseTimestamp(const QJsonValue &value)
{
    if (!value.isString()) {
        return {};
    }
    QDateTime dt = QDateTime::fromString(value.toString(), Qt::ISODateWithMs);
    if (!dt.isValid()) {
        dt = QDateTime::fromString(value.toString(), Qt::ISODate);
    }
    return dt;
}

std::optional<int> timeValue(const QJsonValue &value)
{
    if (value.isDouble()) {
        const int minutes = value.toInt(-1);
        if (minutes < 0 || minutes > core::kMinutesPerDay) {
            return std::nullopt;
        }
        return minutes;
    }
    if (value.isString()) {
        return core::parseTimeOfDay(value.toString());
    }
    return std::nullopt;
}

std::optional<int> durationValue(const QJsonValue &value)
{
    if (value.isDouble()) {
        return value.toInt();
    }
    if (value.isString()) {
        return core::parseDurationMinutes(value.toString());
    }
    return std::nullopt;
}

int intValue(const QJsonValue &value, int fallback)
{
    const auto parsed = durationValue(value);
    return parsed ? *parsed : fallback;
}

bool truthy(const QJsonValue &value)
{
    switch (value.type()) {
    case QJsonValue::Bool:
        return value.toBool();
    case QJsonValue::Double:
        return value.toDouble() != 0.0;
    case QJsonValue::String: {
        const QString text = value.toString().trimmed().toLower();
        return text == QLatin1String("true") || text == QLatin1String("1") || text == QLatin1String("yes");
    }
    default:
        return false;
    }
}

std::optional<int> dayFromName(const QString &name)
{
    static const char *const kPrefixes[] = { "mon", "tue", "wed", "thu", "fri", "sat", "sun" };
    const QString normalized = name.trimmed().toLower();
    if (normalized.isEmpty()) {
        return std::nullopt;
    }
    bool numeric = false;
    const int number = normalized.toInt(&numeric);
    if (numeric) {
        if (number == 0 || number == 7) {
            return Qt::Sunday;
        }
        if (number >= 1 && number <= 6) {
            return number;
        }
        return std::nullopt;
    }
    for (int i = 0; i < 7; ++i) {
        if (normalized.startsWith(QLatin1String(kPrefixes[i]))) {
            return i + 1;
        }
    }
    return std::nullopt;
}

std::optional<int> dayFromValue(const QJsonValue &value)
{
    if (value.isDouble()) {
        return dayFromName(QString::number(value.toInt(-1)));
    }
    if (value.isString()) {
        return dayFromName(value.toString());
    }
    return std::nullopt;
}
} // namespace

QString toString(TaskStatus status)
{
    switch (status) {
    case TaskStatus::Draft:
        return QStringLiteral("draft");
    case TaskStatus::Overdue:
        return QStringLiteral("overdue");
    case TaskStatus::Completed:
        return QStringLiteral("completed");
    case TaskStatus::Scheduled:
    default:
        return QStringLiteral("scheduled");
    }
}

std::optional<TaskStatus> taskStatusFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("draft")) {
        return TaskStatus::Draft;
    }
    if (normalized == QLatin1String("scheduled")) {
        return TaskStatus::Scheduled;
    }
    if (normalized == QLatin1String("overdue")) {
        return TaskStatus::Overdue;
    }
    if (normalized == QLatin1String("completed")) {
        return TaskStatus::Completed;
    }
    return std::nullopt;
}

QString toString(GapModifier modifier)
{
    switch (modifier) {
    case GapModifier::User:
        return QStringLiteral("user");
    case GapModifier::CalendarSync:
        return QStringLiteral("calendar_sync");
    case GapModifier::System:
    default:
        return QStringLiteral("system");
    }
}

std::optional<GapModifier> gapModifierFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("system")) {
        return GapModifier::System;
    }
    if (normalized == QLatin1String("user")) {
        return GapModifier::User;
    }
    if (normalized == QLatin1String("calendar_sync")) {
        return GapModifier::CalendarSync;
    }
    return std::nullopt;
}

namespace json {

QJsonObject toJson(const Task &task)
{
    QJsonObject object;
    object.insert(QStringLiteral("id"), prepareUid(task.id));
    object.insert(QStringLiteral("title"), task.title);
    object.insert(QStringLiteral("dueDate"), task.dueDate.isValid() ? QJsonValue(task.dueDate.toString(kDateFormat)) : QJsonValue());
    object.insert(QStringLiteral("dueTime"), task.dueTime ? QJsonValue(core::formatTimeOfDay(*task.dueTime)) : QJsonValue());
    object.insert(QStringLiteral("duration"), task.durationMinutes ? QJsonValue(*task.durationMinutes) : QJsonValue());
    object.insert(QStringLiteral("status"), toString(task.status));
    object.insert(QStringLiteral("updated_at"), formatTimestamp(task.updatedAt));
    return object;
}

std::optional<Task> taskFromJson(const QJsonObject &object)
{
    Task task;
    task.id = parseUid(object.value(QStringLiteral("id")).toString());
    if (task.id.isNull()) {
        qCWarning(lcPlannerData) << "Skipping task without id" << object;
        return std::nullopt;
    }
    task.title = object.value(QStringLiteral("title")).toString();

    const QJsonValue dueDate = object.value(QStringLiteral("dueDate"));
    if (dueDate.isString() && !dueDate.toString().isEmpty()) {
        task.dueDate = QDate::fromString(dueDate.toString().left(10), kDateFormat);
        if (!task.dueDate.isValid()) {
            qCWarning(lcPlannerData) << "Task" << task.id << "has malformed due date" << dueDate.toString();
        }
    }

    const QJsonValue dueTime = object.value(QStringLiteral("dueTime"));
    if (!dueTime.isNull() && !dueTime.isUndefined()) {
        task.dueTime = timeValue(dueTime);
        if (!task.dueTime) {
            qCWarning(lcPlannerData) << "Task" << task.id << "has malformed due time" << dueTime;
        }
    }

    const QJsonValue duration = object.value(QStringLiteral("duration"));
    if (!duration.isNull() && !duration.isUndefined()) {
        task.durationMinutes = durationValue(duration);
        if (!task.durationMinutes) {
            qCWarning(lcPlannerData) << "Task" << task.id << "has malformed duration" << duration;
        }
    }

    task.status = taskStatusFromString(object.value(QStringLiteral("status")).toString())
                      .value_or(TaskStatus::Scheduled);
    task.updatedAt = parseTimestamp(object.value(QStringLiteral("updated_at")));
    return task;
}

QJsonObject toJson(const Gap &gap)
{
    QJsonObject object;
    object.insert(QStringLiteral("id"), prepareUid(gap.id));
    object.insert(QStringLiteral("date"), gap.date.toString(kDateFormat));
    object.insert(QStringLiteral("start_time"), core::formatTimeOfDay(gap.start));
    object.insert(QStringLiteral("end_time"), core::formatTimeOfDay(gap.end));
    object.insert(QStringLiteral("duration_minutes"), gap.durationMinutes);
    object.insert(QStringLiteral("parent_gap_id"), gap.parentGapId.isNull() ? QJsonValue() : QJsonValue(prepareUid(gap.parentGapId)));
    object.insert(QStringLiteral("original_gap_id"), gap.originGapId.isNull() ? QJsonValue() : QJsonValue(prepareUid(gap.originGapId)));
    object.insert(QStringLiteral("modified_by"), toString(gap.modifiedBy));
    object.insert(QStringLiteral("created_at"), formatTimestamp(gap.createdAt));
    object.insert(QStringLiteral("updated_at"), formatTimestamp(gap.updatedAt));
    return object;
}

std::optional<Gap> gapFromJson(const QJsonObject &object)
{
    Gap gap;
    gap.id = parseUid(object.value(QStringLiteral("id")).toString());
    gap.date = QDate::fromString(object.value(QStringLiteral("date")).toString(), kDateFormat);
    const auto start = timeValue(object.value(QStringLiteral("start_time")));
    const auto end = timeValue(object.value(QStringLiteral("end_time")));
    if (gap.id.isNull() || !gap.date.isValid() || !start || !end || *start >= *end) {
        qCWarning(lcPlannerData) << "Skipping malformed gap" << object;
        return std::nullopt;
    }
    gap.start = *start;
    gap.end = *end;
    // Stored durations are not trusted; the interval is authoritative.
    gap.durationMinutes = gap.end - gap.start;
    gap.parentGapId = parseUid(object.value(QStringLiteral("parent_gap_id")).toString());
    gap.originGapId = parseUid(object.value(QStringLiteral("original_gap_id")).toString());
    gap.modifiedBy = gapModifierFromString(object.value(QStringLiteral("modified_by")).toString())
                         .value_or(GapModifier::System);
    gap.createdAt = parseTimestamp(object.value(QStringLiteral("created_at")));
    gap.updatedAt = parseTimestamp(object.value(QStringLiteral("updated_at")));
    return gap;
}

QJsonObject toJson(const WorkPreferences &prefs)
{
    QJsonObject object;
    object.insert(QStringLiteral("calendar_work_start"),
                  prefs.workStart ? QJsonValue(core::formatTimeOfDay(*prefs.workStart)) : QJsonValue());
    object.insert(QStringLiteral("calendar_work_end"),
                  prefs.workEnd ? QJsonValue(core::formatTimeOfDay(*prefs.workEnd)) : QJsonValue());
    object.insert(QStringLiteral("calendar_working_days"), toJson(prefs.workingDays));
    object.insert(QStringLiteral("calendar_min_gap"), prefs.minGapMinutes);
    object.insert(QStringLiteral("calendar_buffer_time"), prefs.bufferMinutes);
    object.insert(QStringLiteral("show_device_calendar_busy"), prefs.subtractCalendarBusy);
    object.insert(QStringLiteral("device_calendar_included_ids"), QJsonArray::fromStringList(prefs.includedCalendarIds));
    object.insert(QStringLiteral("calendar_all_day_block_mode"), toString(prefs.allDayBlockMode));
    object.insert(QStringLiteral("calendar_all_day_fixed_block_minutes"), prefs.allDayBlockMinutes);
    object.insert(QStringLiteral("calendar_all_day_fixed_block_start"), toString(prefs.allDayBlockPosition));
    object.insert(QStringLiteral("calendar_block_tentative"), prefs.blockTentative);
    object.insert(QStringLiteral("calendar_dedupe_strategy"), toString(prefs.dedupeStrategy));
    object.insert(QStringLiteral("show_device_calendar_titles"), prefs.showCalendarTitles);
    object.insert(QStringLiteral("gap_sync_frequency"), prefs.gapSyncFrequencyMinutes);
    object.insert(QStringLiteral("updated_at"), formatTimestamp(prefs.updatedAt));
    return object;
}

WorkPreferences preferencesFromJson(const QJsonObject &object)
{
    WorkPreferences prefs;

    const QJsonValue workStart = object.value(QStringLiteral("calendar_work_start"));
    if (!workStart.isNull() && !workStart.isUndefined()) {
        prefs.workStart = timeValue(workStart);
        if (!prefs.workStart) {
            qCWarning(lcPlannerData) << "Ignoring malformed work start" << workStart;
        }
    }
    const QJsonValue workEnd = object.value(QStringLiteral("calendar_work_end"));
    if (!workEnd.isNull() && !workEnd.isUndefined()) {
        prefs.workEnd = timeValue(workEnd);
        if (!prefs.workEnd) {
            qCWarning(lcPlannerData) << "Ignoring malformed work end" << workEnd;
        }
    }

    prefs.workingDays = weekdaysFromJson(object.value(QStringLiteral("calendar_working_days")));
    prefs.minGapMinutes = intValue(object.value(QStringLiteral("calendar_min_gap")), kDefaultMinGapMinutes);
    prefs.bufferMinutes = intValue(object.value(QStringLiteral("calendar_buffer_time")), kDefaultBufferMinutes);
    prefs.subtractCalendarBusy = truthy(object.value(QStringLiteral("show_device_calendar_busy")));

    const QJsonArray ids = object.value(QStringLiteral("device_calendar_included_ids")).toArray();
    for (const QJsonValue &id : ids) {
        if (id.isString() && !id.toString().isEmpty()) {
            prefs.includedCalendarIds << id.toString();
        }
    }

    prefs.allDayBlockMode = allDayBlockModeFromString(object.value(QStringLiteral("calendar_all_day_block_mode")).toString())
                                .value_or(AllDayBlockMode::Workday);
    prefs.allDayBlockMinutes = intValue(object.value(QStringLiteral("calendar_all_day_fixed_block_minutes")),
                                        kDefaultAllDayBlockMinutes);
    prefs.allDayBlockPosition = allDayBlockPositionFromString(
                                    object.value(QStringLiteral("calendar_all_day_fixed_block_start")).toString())
                                    .value_or(AllDayBlockPosition::Start);
    prefs.blockTentative = truthy(object.value(QStringLiteral("calendar_block_tentative")));
    prefs.dedupeStrategy = dedupeStrategyFromString(object.value(QStringLiteral("calendar_dedupe_strategy")).toString())
                               .value_or(DedupeStrategy::Auto);
    prefs.showCalendarTitles = truthy(object.value(QStringLiteral("show_device_calendar_titles")));
    prefs.gapSyncFrequencyMinutes = intValue(object.value(QStringLiteral("gap_sync_frequency")),
                                             kDefaultGapSyncFrequencyMinutes);
    prefs.updatedAt = parseTimestamp(object.value(QStringLiteral("updated_at")));
    return prefs;
}

QJsonObject toJson(const calendar::BusyBlock &block)
{
    QJsonObject object;
    object.insert(QStringLiteral("date"), block.date.toString(kDateFormat));
    object.insert(QStringLiteral("start_time"), core::formatTimeOfDay(block.start));
    object.insert(QStringLiteral("end_time"), core::formatTimeOfDay(block.end));
    object.insert(QStringLiteral("source"), calendar::toString(block.source));
    object.insert(QStringLiteral("calendarId"), block.calendarId);
    if (!block.title.isEmpty()) {
        object.insert(QStringLiteral("title"), block.title);
    }
    object.insert(QStringLiteral("transparency"), calendar::toString(block.transparency));
    object.insert(QStringLiteral("status"), calendar::toString(block.status));
    object.insert(QStringLiteral("isAllDay"), block.isAllDay);
    object.insert(QStringLiteral("uid"), block.uid);
    object.insert(QStringLiteral("lastSyncedAt"), formatTimestamp(block.lastSyncedAt));
    return object;
}

std::optional<calendar::BusyBlock> busyBlockFromJson(const QJsonObject &object)
{
    calendar::BusyBlock block;
    block.date = QDate::fromString(object.value(QStringLiteral("date")).toString(), kDateFormat);
    const auto start = timeValue(object.value(QStringLiteral("start_time")));
    const auto end = timeValue(object.value(QStringLiteral("end_time")));
    const auto source = calendar::calendarSourceFromString(object.value(QStringLiteral("source")).toString());
    if (!block.date.isValid() || !start || !end || *start >= *end || !source) {
        return std::nullopt;
    }
    block.start = *start;
    block.end = *end;
    block.source = *source;
    block.calendarId = object.value(QStringLiteral("calendarId")).toString();
    block.title = object.value(QStringLiteral("title")).toString();
    block.transparency = calendar::transparencyFromString(object.value(QStringLiteral("transparency")).toString())
                             .value_or(calendar::Transparency::Busy);
    block.status = calendar::eventStatusFromString(object.value(QStringLiteral("status")).toString())
                       .value_or(calendar::EventStatus::Confirmed);
    block.isAllDay = object.value(QStringLiteral("isAllDay")).toBool();
    block.uid = object.value(QStringLiteral("uid")).toString();
    block.lastSyncedAt = parseTimestamp(object.value(QStringLiteral("lastSyncedAt")));
    return block;
}

WeekdaySet weekdaysFromJson(const QJsonValue &value)
{
    if (value.isNull() || value.isUndefined()) {
        return WeekdaySet::workWeek();
    }

    WeekdaySet days;
    if (value.isArray()) {
        const QJsonArray array = value.toArray();
        for (const QJsonValue &entry : array) {
            if (const auto day = dayFromValue(entry)) {
                days.insert(*day);
            } else {
                qCWarning(lcPlannerData) << "Ignoring unknown working day" << entry;
            }
        }
        return days;
    }

    if (value.isObject()) {
        const QJsonObject map = value.toObject();
        if (map.isEmpty()) {
            return WeekdaySet::workWeek();
        }
        for (auto it = map.constBegin(); it != map.constEnd(); ++it) {
            if (!truthy(it.value())) {
                continue;
            }
            if (const auto day = dayFromName(it.key())) {
                days.insert(*day);
            } else {
                qCWarning(lcPlannerData) << "Ignoring unknown working day" << it.key();
            }
        }
        return days;
    }

    if (value.isString()) {
        const QStringList names = value.toString().split(',', Qt::SkipEmptyParts);
        for (const QString &name : names) {
            if (const auto day = dayFromName(name)) {
                days.insert(*day);
            }
        }
        return days;
    }

    qCWarning(lcPlannerData) << "Unsupported working day representation" << value;
    return WeekdaySet::workWeek();
}

QJsonArray toJson(const WeekdaySet &days)
{
    return QJsonArray::fromStringList(days.names());
}

QJsonArray tasksToJson(const std::vector<Task> &tasks)
{
    QJsonArray array;
    for (const auto &task : tasks) {
        array.append(toJson(task));
    }
    return array;
}

std::vector<Task> tasksFromJson(const QJsonArray &array)
{
    std::vector<Task> tasks;
    tasks.reserve(static_cast<size_t>(array.size()));
    for (const QJsonValue &value : array) {
        if (auto task = taskFromJson(value.toObject())) {
            tasks.push_back(*task);
        }
    }
    return tasks;
}

QJsonArray gapsToJson(const std::vector<Gap> &gaps)
{
    QJsonArray array;
    for (const auto &gap : gaps) {
        array.append(toJson(gap));
    }
    return array;
}

std::vector<Gap> gapsFromJson(const QJsonArray &array)
{
    std::vector<Gap> gaps;
    gaps.reserve(static_cast<size_t>(array.size()));
    for (const QJsonValue &value : array) {
        if (auto gap = gapFromJson(value.toObject())) {
            gaps.push_back(*gap);
        }
    }
    return gaps;
}

QJsonArray busyBlocksToJson(const std::vector<calendar::BusyBlock> &blocks)
{
    QJsonArray array;
    for (const auto &block : blocks) {
        array.append(toJson(block));
    }
    return array;
}

std::optional<std::vector<calendar::BusyBlock>> busyBlocksFromJson(const QJsonArray &array)
{
    std::vector<calendar::BusyBlock> blocks;
    blocks.reserve(static_cast<size_t>(array.size()));
    for (const QJsonValue &value : array) {
        if (!value.isObject()) {
            return std::nullopt;
        }
        auto block = busyBlockFromJson(value.toObject());
        if (!block) {
            return std::nullopt;
        }
        blocks.push_back(*block);
    }
    return blocks;
}

} // namespace json
} // namespace data
} // namespace planner
