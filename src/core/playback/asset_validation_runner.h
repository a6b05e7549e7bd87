#pragma once

#include <QLoggingCategory>
#include <QThreadPool>

#include <reel_media_platform/rmp_cancel_token.h>
#include <reel_media_platform/rmp_validator.h>

#include <functional>
#include <memory>

Q_DECLARE_LOGGING_CATEGORY(reelplayValidation)

class QObject;

/**
 * Runs rmp::Validator off the calling thread
 *
 * Results are marshalled back onto the thread of the supplied context
 * object with a queued call. A run whose token is cancelled before
 * delivery never invokes its completion.
 */
class AssetValidationRunner
{
public:
    using Completion = std::function<void(rmp::Result<rmp::ValidatedHandle>)>;

    explicit AssetValidationRunner(std::shared_ptr<rmp::MediaProbe> probe);

    // Waits for in-flight runs; cancel their tokens first for a prompt return
    ~AssetValidationRunner();

    AssetValidationRunner(const AssetValidationRunner&) = delete;
    AssetValidationRunner& operator=(const AssetValidationRunner&) = delete;

    /**
     * Start validating locator in the background.
     * completion runs on context's thread, at most once.
     * Returns the run's token; cancel() silences the run.
     */
    rmp::CancelToken validate(const rmp::ResourceLocator& locator,
                              rmp::Deadline deadline,
                              QObject* context,
                              Completion completion);

    // Blocks until every started run has returned
    void waitForIdle();

private:
    std::shared_ptr<const rmp::Validator> m_validator;
    QThreadPool m_pool;
};
