#include "TransferManager.hpp"
#include "TransferHistory.hpp"
#include "TransferQueue.hpp"
#include "remotebridge/Log.hpp"
#include <QSet>
#include <algorithm>

TransferManager::TransferManager(TransferQueue* queue, TransferHistory* history, QObject* parent)
    : QObject(parent), queue_(queue), history_(history) {
    queue_->reserveIds(history_->maxId());
    // Queue signals come from worker threads; `this` makes them queued.
    connect(queue_, &TransferQueue::transferFinished, this, &TransferManager::onTransferFinished);
    connect(queue_, &TransferQueue::transferChanged, this, &TransferManager::recordChanged);
    connect(queue_, &TransferQueue::transfersChanged, this, &TransferManager::listChanged);
}

void TransferManager::onTransferFinished(quint64 id) {
    auto r = queue_->record(id);
    if (!r || !r->isTerminal()) return;
    QString err;
    if (!history_->upsert(*r, &err)) LOGW("History: %s", qPrintable(err));
    emit recordChanged(id);
}

QVector<TransferRecord> TransferManager::list(Filter f) const {
    const QVector<TransferRecord> live = queue_->records();
    QVector<TransferRecord> out;
    if (f == Filter::Active || f == Filter::All) {
        for (const auto& r : live) {
            if (!r.isTerminal()) out.push_back(r);
        }
        if (f == Filter::Active) return out;
    }
    QVector<TransferRecord> finished;
    QSet<quint64> liveIds;
    for (const auto& r : live) {
        liveIds.insert(r.id);
        if (r.isTerminal()) finished.push_back(r);
    }
    for (const auto& r : history_->records()) {
        if (!liveIds.contains(r.id)) finished.push_back(r);
    }
    std::stable_sort(finished.begin(), finished.end(),
                     [](const TransferRecord& a, const TransferRecord& b) { return a.updated > b.updated; });
    out += finished;
    return out;
}

std::optional<TransferRecord> TransferManager::find(quint64 id) const {
    if (auto r = queue_->record(id)) return r;
    return history_->find(id);
}

quint64 TransferManager::retry(quint64 id) {
    if (queue_->record(id)) return queue_->retry(id) ? id : 0;

    auto h = history_->find(id);
    if (!h || !h->retryable()) return 0;
    auto requestFor = [](const TransferRecord& r) {
        TransferRequest req;
        req.direction = r.direction;
        req.sessionId = r.sessionId;
        req.src = r.src;
        req.dst = r.dst;
        req.bulkSync = r.bulkSync;
        req.retryCount = r.retryCount + 1;
        return req;
    };
    if (!h->isDirectoryJob) {
        const quint64 nid = queue_->enqueue(requestFor(*h));
        LOGI("History: #%llu re-enqueued as #%llu", (unsigned long long)id, (unsigned long long)nid);
        return nid;
    }
    // Only the files that did not make it last time.
    QVector<TransferRequest> kids;
    for (const auto& c : history_->records()) {
        if (c.parentId == id && c.status != TransferRecord::Status::Succeeded) kids.push_back(requestFor(c));
    }
    if (kids.isEmpty()) return 0;
    return queue_->enqueueDirectoryJob(requestFor(*h), kids);
}

bool TransferManager::cancel(quint64 id) {
    return queue_->cancel(id);
}

int TransferManager::clearHistory(const QDateTime& olderThan) {
    queue_->clearFinished(olderThan);
    QString err;
    const int n = history_->clear(olderThan, &err);
    if (!err.isEmpty()) LOGW("History: %s", qPrintable(err));
    emit listChanged();
    return n;
}
