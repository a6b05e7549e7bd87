#include "asset_validation_runner.h"

#include <QMetaObject>
#include <QObject>

Q_LOGGING_CATEGORY(reelplayValidation, "reelplay.playback.validation")

AssetValidationRunner::AssetValidationRunner(std::shared_ptr<rmp::MediaProbe> probe)
    : m_validator(std::make_shared<const rmp::Validator>(std::move(probe)))
{
}

AssetValidationRunner::~AssetValidationRunner()
{
    waitForIdle();
}

rmp::CancelToken AssetValidationRunner::validate(const rmp::ResourceLocator& locator,
                                                 rmp::Deadline deadline,
                                                 QObject* context,
                                                 Completion completion)
{
    Q_ASSERT(context);
    rmp::CancelToken token;

    qCDebug(reelplayValidation, "Validating %s", locator.path().c_str());

    std::shared_ptr<const rmp::Validator> validator = m_validator;
    m_pool.start([validator, locator, deadline, token, context, completion]() {
        rmp::Result<rmp::ValidatedHandle> result = validator->Validate(locator, deadline, token);

        if (token.is_cancelled() || (result.is_error() && result.error().is_cancelled())) {
            qCDebug(reelplayValidation, "Validation of %s cancelled", locator.path().c_str());
            return;
        }

        // Hop onto the context's thread; the token is re-checked there because
        // cancellation is only ever requested from that thread.
        QMetaObject::invokeMethod(context, [token, completion, result]() {
            if (token.is_cancelled()) {
                return;
            }
            completion(result);
        }, Qt::QueuedConnection);
    });

    return token;
}

void AssetValidationRunner::waitForIdle()
{
    m_pool.waitForDone();
}
