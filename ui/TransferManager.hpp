// Observable ledger over the live queue and the persisted history.
#pragma once
#include <QDateTime>
#include <QObject>
#include <QVector>
#include <optional>
#include "TransferTypes.hpp"

class TransferQueue;
class TransferHistory;

class TransferManager : public QObject {
    Q_OBJECT
public:
    enum class Filter { Active, History, All };

    // Neither queue nor history is owned.
    TransferManager(TransferQueue* queue, TransferHistory* history, QObject* parent = nullptr);

    // Active: non-terminal live records (enqueue order).
    // History: terminal records, live or persisted (newest first).
    QVector<TransferRecord> list(Filter f) const;
    std::optional<TransferRecord> find(quint64 id) const;

    // Live records are requeued in place. Records known only from history are
    // enqueued again as new transfers. Returns the id that will run, 0 if none.
    quint64 retry(quint64 id);
    bool cancel(quint64 id);
    // Drops finished records from the queue and the history. Returns the count removed from history.
    int clearHistory(const QDateTime& olderThan = QDateTime());

signals:
    void recordChanged(quint64 id);
    void listChanged();

private slots:
    void onTransferFinished(quint64 id);

private:
    TransferQueue* queue_;
    TransferHistory* history_;
};
