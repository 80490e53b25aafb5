#include "Logging.h"

// Filter with QT_LOGGING_RULES, e.g. "medvol.render.debug=true"
Q_LOGGING_CATEGORY(lcAssembler, "medvol.assembler")
Q_LOGGING_CATEGORY(lcRender, "medvol.render")
Q_LOGGING_CATEGORY(lcBackend, "medvol.backend")
Q_LOGGING_CATEGORY(lcWorker, "medvol.worker")
Q_LOGGING_CATEGORY(lcUi, "medvol.ui")
