#ifndef QRPASS_CORE_LOGGING_HPP
#define QRPASS_CORE_LOGGING_HPP

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcKeyStore)
Q_DECLARE_LOGGING_CATEGORY(lcSettings)
Q_DECLARE_LOGGING_CATEGORY(lcPipeline)
Q_DECLARE_LOGGING_CATEGORY(lcArtifact)

#endif // QRPASS_CORE_LOGGING_HPP
