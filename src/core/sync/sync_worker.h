#pragma once

#include "core/sync/vector_index_sync.h"

#include <QObject>
#include <QString>
#include <QThread>

#include <atomic>
#include <memory>
#include <mutex>

namespace hr {

// Runs VectorIndexSync passes on a background thread. A start request that
// arrives while a pass runs queues one more pass behind it.
class SyncWorker : public QObject {
    Q_OBJECT

public:
    explicit SyncWorker(VectorIndexSync* sync, QObject* parent = nullptr);
    ~SyncWorker() override;

    SyncWorker(const SyncWorker&) = delete;
    SyncWorker& operator=(const SyncWorker&) = delete;
    SyncWorker(SyncWorker&&) = delete;
    SyncWorker& operator=(SyncWorker&&) = delete;

    // Returns false when a pass is already running on this worker; the
    // request then runs as soon as that pass ends.
    bool start(bool force = false);

    // Blocks until the current pass and any queued pass complete.
    void wait();

    bool isRunning() const;
    SyncReport lastReport() const;

signals:
    void progressUpdated(qint64 processed, qint64 total);
    void finished();
    void error(const QString& message);

private:
    void run(bool force);

    VectorIndexSync* m_sync = nullptr;
    std::unique_ptr<QThread> m_workerThread;

    mutable std::mutex m_stateMutex;
    bool m_active = false;
    bool m_rerunRequested = false;
    bool m_rerunForce = false;

    mutable std::mutex m_reportMutex;
    SyncReport m_lastReport;
};

} // namespace hr
