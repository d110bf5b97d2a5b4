#include "core/sync/sync_worker.h"
#include "core/shared/logging.h"

namespace hr {

SyncWorker::SyncWorker(VectorIndexSync* sync, QObject* parent)
    : QObject(parent)
    , m_sync(sync)
{
}

SyncWorker::~SyncWorker()
{
    wait();
}

bool SyncWorker::start(bool force)
{
    if (m_sync == nullptr) {
        emit error(QStringLiteral("SyncWorker start failed: missing dependency"));
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (m_active) {
            m_rerunRequested = true;
            m_rerunForce = m_rerunForce || force;
            LOG_DEBUG(hrSync, "Sync pass running; another pass queued");
            return false;
        }
        m_active = true;
    }

    // Reap a finished thread from the previous pass.
    wait();

    m_workerThread.reset(QThread::create([this, force]() {
        run(force);
    }));
    m_workerThread->start(QThread::LowPriority);
    return true;
}

void SyncWorker::wait()
{
    if (m_workerThread && m_workerThread->isRunning()) {
        m_workerThread->wait();
    }
    m_workerThread.reset();
}

bool SyncWorker::isRunning() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_active;
}

SyncReport SyncWorker::lastReport() const
{
    std::lock_guard<std::mutex> lock(m_reportMutex);
    return m_lastReport;
}

void SyncWorker::run(bool force)
{
    SyncOptions options;
    options.force = force;
    options.onProgress = [this](int64_t processed, int64_t total) {
        emit progressUpdated(static_cast<qint64>(processed), static_cast<qint64>(total));
    };

    while (true) {
        const SyncReport report = m_sync->run(options);
        {
            std::lock_guard<std::mutex> lock(m_reportMutex);
            m_lastReport = report;
        }

        if (!report.error.isEmpty()) {
            LOG_WARN(hrSync, "Background sync failed: %s", qUtf8Printable(report.error));
            emit error(report.error);
        }

        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (!m_rerunRequested) {
            m_active = false;
            break;
        }
        options.force = m_rerunForce;
        m_rerunRequested = false;
        m_rerunForce = false;
    }
    emit finished();
}

} // namespace hr
