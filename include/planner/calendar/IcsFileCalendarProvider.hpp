#pragma once

#include <QStringList>

#include "planner/calendar/CalendarProvider.hpp"

namespace planner {
namespace calendar {

class IcsFileCalendarProvider : public CalendarProvider
{
public:
    explicit IcsFileCalendarProvider(QStringList filePaths, CalendarSource source = CalendarSource::Device);
    ~IcsFileCalendarProvider() override = default;

    CalendarSource source() const override;
    bool requestPermission() override;
    std::optional<QStringList> listCalendars() override;
    std::optional<std::vector<RawEvent>> listEvents(const core::DateRange &range,
                                                    const QStringList &calendarIds) override;

    static QString calendarIdFor(const QString &filePath);
    static std::optional<std::vector<RawEvent>> parseFile(const QString &filePath);

private:
    static QString decodeText(const QString &text);
    static QDateTime parseDateTime(const QString &value, bool *dateOnly);

    QStringList m_filePaths;
    CalendarSource m_source;
};

} // namespace calendar
} // namespace planner
