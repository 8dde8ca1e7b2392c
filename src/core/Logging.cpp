#include "Logging.hpp"

// Warnings and above by default; "qrpass.*.debug=true" enables the rest.
Q_LOGGING_CATEGORY(lcKeyStore, "qrpass.keystore", QtWarningMsg)
Q_LOGGING_CATEGORY(lcSettings, "qrpass.settings", QtWarningMsg)
Q_LOGGING_CATEGORY(lcPipeline, "qrpass.pipeline", QtWarningMsg)
Q_LOGGING_CATEGORY(lcArtifact, "qrpass.artifact", QtWarningMsg)
