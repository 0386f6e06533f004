#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcPlannerEngine)
Q_DECLARE_LOGGING_CATEGORY(lcPlannerCalendar)
Q_DECLARE_LOGGING_CATEGORY(lcPlannerCache)
Q_DECLARE_LOGGING_CATEGORY(lcPlannerSync)
Q_DECLARE_LOGGING_CATEGORY(lcPlannerData)
