#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSettings>
#include <QString>
#include <QTextStream>

#include "planner/calendar/IcsFileCalendarProvider.hpp"
#include "planner/core/AppContext.hpp"
#include "planner/core/EngineConfig.hpp"
#include "planner/core/GapScheduler.hpp"
#include "planner/core/TimeUtils.hpp"
#include "planner/data/GapRepository.hpp"
#include "planner/data/JsonCodec.hpp"
#include "planner/data/PreferenceRepository.hpp"

namespace {
std::optional<QDate> dateOption(const QCommandLineParser &parser, const QString &name, const QDate &fallback)
{
    if (!parser.isSet(name)) {
        return fallback;
    }
    const QDate date = QDate::fromString(parser.value(name), Qt::ISODate);
    if (!date.isValid()) {
        return std::nullopt;
    }
    return date;
}
} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("GapPlanner"));
    QCoreApplication::setApplicationName(QStringLiteral("gapplanner"));
    QCoreApplication::setApplicationVersion(QStringLiteral(PLANNER_VERSION));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Prints the free gaps of a working day."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOptions({
        { QStringLiteral("date"), QStringLiteral("Day to print (yyyy-MM-dd, default today)."), QStringLiteral("date") },
        { QStringLiteral("today"), QStringLiteral("Centre of the rolling window (yyyy-MM-dd)."), QStringLiteral("date") },
        { QStringLiteral("ics"), QStringLiteral("Subtract busy time from an iCalendar file; repeatable."), QStringLiteral("file") },
        { QStringLiteral("data-dir"), QStringLiteral("Directory of the local store."), QStringLiteral("dir") },
        { QStringLiteral("work-start"), QStringLiteral("Start of the working day (HH:MM)."), QStringLiteral("time") },
        { QStringLiteral("work-end"), QStringLiteral("End of the working day (HH:MM)."), QStringLiteral("time") },
        { QStringLiteral("sync-settings"), QStringLiteral("Write the effective engine settings back to the settings file.") },
    });
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    const auto today = dateOption(parser, QStringLiteral("today"), QDate::currentDate());
    if (!today) {
        err << "Invalid --today value: " << parser.value(QStringLiteral("today")) << '\n';
        return 1;
    }
    const auto date = dateOption(parser, QStringLiteral("date"), *today);
    if (!date) {
        err << "Invalid --date value: " << parser.value(QStringLiteral("date")) << '\n';
        return 1;
    }

    QSettings settings;
    planner::core::EngineConfig config = planner::core::EngineConfig::fromSettings(settings);
    if (parser.isSet(QStringLiteral("data-dir"))) {
        config.storageDirectory = parser.value(QStringLiteral("data-dir"));
    }
    if (parser.isSet(QStringLiteral("sync-settings"))) {
        config.save(settings);
        settings.sync();
        if (settings.status() != QSettings::NoError) {
            err << "Could not write settings to " << settings.fileName() << '\n';
        }
    }

    const QStringList icsFiles = parser.values(QStringLiteral("ics"));
    std::shared_ptr<planner::calendar::CalendarProvider> provider;
    if (!icsFiles.isEmpty()) {
        provider = std::make_shared<planner::calendar::IcsFileCalendarProvider>(icsFiles);
    }

    planner::core::AppContext context(config, provider, {}, *today);

    planner::data::WorkPreferences prefs = context.preferenceRepository().preferences().value_or(
        planner::data::WorkPreferences{});
    const QJsonObject storedPrefs = planner::data::json::toJson(prefs);
    for (const QString &name : { QStringLiteral("work-start"), QStringLiteral("work-end") }) {
        if (!parser.isSet(name)) {
            continue;
        }
        const auto minutes = planner::core::parseTimeOfDay(parser.value(name));
        if (!minutes) {
            err << "Invalid --" << name << " value: " << parser.value(name) << '\n';
            return 1;
        }
        (name == QLatin1String("work-start") ? prefs.workStart : prefs.workEnd) = *minutes;
    }
    if (provider) {
        prefs.subtractCalendarBusy = true;
    }
    if (planner::data::json::toJson(prefs) != storedPrefs
        && !context.preferenceRepository().savePreferences(prefs)) {
        err << "Could not store preferences\n";
        return 1;
    }

    auto &scheduler = context.scheduler();
    if (!scheduler.window().contains(*date)) {
        err << date->toString(Qt::ISODate) << " is outside the rolling window "
            << scheduler.window().start().toString(Qt::ISODate) << " .. "
            << scheduler.window().end().toString(Qt::ISODate) << '\n';
        return 1;
    }

    scheduler.preloadWindow();
    scheduler.waitForDone();
    scheduler.enforceLimits();

    if (!prefs.workInterval()) {
        err << "No working hours configured; use --work-start and --work-end\n";
    }

    const auto gaps = context.gapRepository().gapsForDate(*date);
    out << date->toString(Qt::ISODate) << ": " << gaps.size() << " gaps\n";
    for (const auto &gap : gaps) {
        out << planner::core::formatTimeOfDay(gap.start) << '-' << planner::core::formatTimeOfDay(gap.end) << "  "
            << gap.durationMinutes << " min  " << planner::data::toString(gap.modifiedBy) << '\n';
    }
    return 0;
}
