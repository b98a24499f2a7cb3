#ifndef LOGGING_H
#define LOGGING_H

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcParams)
Q_DECLARE_LOGGING_CATEGORY(lcWaveField)
Q_DECLARE_LOGGING_CATEGORY(lcAnimation)
Q_DECLARE_LOGGING_CATEGORY(lcConfig)
Q_DECLARE_LOGGING_CATEGORY(lcUi)

#endif // LOGGING_H
