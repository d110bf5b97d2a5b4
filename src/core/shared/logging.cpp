#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(hrCore, "hr.core")
Q_LOGGING_CATEGORY(hrIndex, "hr.index")
Q_LOGGING_CATEGORY(hrEmbedding, "hr.embedding")
Q_LOGGING_CATEGORY(hrVector, "hr.vector")
Q_LOGGING_CATEGORY(hrRanking, "hr.ranking")
Q_LOGGING_CATEGORY(hrQuality, "hr.quality")
Q_LOGGING_CATEGORY(hrSync, "hr.sync")
