#include "planner/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcPlannerEngine, "planner.engine", QtInfoMsg)
Q_LOGGING_CATEGORY(lcPlannerCalendar, "planner.calendar", QtInfoMsg)
Q_LOGGING_CATEGORY(lcPlannerCache, "planner.cache", QtInfoMsg)
Q_LOGGING_CATEGORY(lcPlannerSync, "planner.sync", QtInfoMsg)
Q_LOGGING_CATEGORY(lcPlannerData, "planner.data", QtInfoMsg)
