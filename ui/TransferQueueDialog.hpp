// Dialog to visualize and manage transfers (live and history).
#pragma once
#include <QDialog>
#include <QHash>
#include <QTableWidget>
#include "TransferManager.hpp"

class BridgeEngine;
class QComboBox;
class QLabel;
class QPushButton;

// Monitor and control transfers. Local files dropped on the table are
// uploaded into the session's current remote directory.
class TransferQueueDialog : public QDialog {
    Q_OBJECT
public:
    TransferQueueDialog(BridgeEngine* engine, const QString& sessionId, QWidget* parent = nullptr);

protected:
    void dragEnterEvent(QDragEnterEvent* e) override;
    void dropEvent(QDropEvent* e) override;

private slots:
    void refresh();           // rebuild table from the manager
    void onProgress(quint64 id, quint64 done, qint64 total);
    void onPause();           // pause the whole queue
    void onResume();          // resume the queue (and paused records)
    void onRetrySelected();
    void onClearDone();
    void onPauseSelected();
    void onResumeSelected();
    void onApplyGlobalSpeed();
    void onLimitSelected();
    void onStopSelected();
    void onStopAll();
    void showContextMenu(const QPoint& pos);

private:
    QVector<quint64> selectedIds() const;
    void updateSummary();

    BridgeEngine* engine_;
    TransferManager* mgr_;
    QString sessionId_;
    QVector<TransferRecord> rows_;
    QHash<quint64, int> rowOf_;
    QTableWidget* table_;
    QComboBox* filter_ = nullptr;
    QLabel* summaryLabel_ = nullptr;
    QPushButton* pauseBtn_ = nullptr;
    QPushButton* resumeBtn_ = nullptr;
    QPushButton* retryBtn_ = nullptr;
    QPushButton* clearBtn_ = nullptr;
    QPushButton* closeBtn_ = nullptr;
    QPushButton* pauseSelBtn_ = nullptr;
    QPushButton* resumeSelBtn_ = nullptr;
    QPushButton* limitSelBtn_ = nullptr;
    QPushButton* stopSelBtn_ = nullptr;
    QPushButton* stopAllBtn_ = nullptr;
    class QSpinBox* speedSpin_ = nullptr;
    QPushButton* applySpeedBtn_ = nullptr;
};
