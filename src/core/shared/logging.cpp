#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(crCore, "citerag.core")
Q_LOGGING_CATEGORY(crIndex, "citerag.index")
Q_LOGGING_CATEGORY(crRetrieval, "citerag.retrieval")
Q_LOGGING_CATEGORY(crAnswer, "citerag.answer")
