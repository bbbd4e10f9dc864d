#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(pmCore, "partmatch.core")
Q_LOGGING_CATEGORY(pmStore, "partmatch.store")
Q_LOGGING_CATEGORY(pmMatch, "partmatch.match")
Q_LOGGING_CATEGORY(pmFeedback, "partmatch.feedback")
Q_LOGGING_CATEGORY(pmIpc, "partmatch.ipc")
