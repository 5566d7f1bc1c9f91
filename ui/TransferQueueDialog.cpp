// Table with per-record state and actions (pause/resume/retry/cancel/clear).
#include "TransferQueueDialog.hpp"
#include "BridgeEngine.hpp"
#include "DropIngest.hpp"
#include "TransferQueue.hpp"
#include <QAbstractItemView>
#include <QComboBox>
#include <QDragEnterEvent>
#include <QDropEvent>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QInputDialog>
#include <QLabel>
#include <QMenu>
#include <QMessageBox>
#include <QMimeData>
#include <QPushButton>
#include <QSet>
#include <QSpinBox>
#include <QTableWidgetItem>
#include <QUrl>
#include <QVBoxLayout>

TransferQueueDialog::TransferQueueDialog(BridgeEngine* engine, const QString& sessionId, QWidget* parent)
  : QDialog(parent), engine_(engine), mgr_(engine->manager()), sessionId_(sessionId) {
  setWindowTitle(tr("Transfers - %1").arg(sessionId));
  resize(900, 420);
  setSizeGripEnabled(true);
  setAcceptDrops(true);

  auto* lay = new QVBoxLayout(this);

  auto* top = new QHBoxLayout();
  top->addWidget(new QLabel(tr("Show:"), this));
  filter_ = new QComboBox(this);
  filter_->addItem(tr("All"), (int)TransferManager::Filter::All);
  filter_->addItem(tr("Active"), (int)TransferManager::Filter::Active);
  filter_->addItem(tr("History"), (int)TransferManager::Filter::History);
  top->addWidget(filter_);
  top->addStretch();
  lay->addLayout(top);

  table_ = new QTableWidget(this);
  table_->setColumnCount(10);
  table_->setHorizontalHeaderLabels({ tr("Id"), tr("Type"), tr("Source"), tr("Destination"), tr("Status"),
                                      tr("Progress"), tr("Speed"), tr("Duration"), tr("Attempts"), tr("Error") });
  table_->horizontalHeader()->setStretchLastSection(true);
  table_->verticalHeader()->setVisible(false);
  table_->setSelectionBehavior(QAbstractItemView::SelectRows);
  table_->setSelectionMode(QAbstractItemView::ExtendedSelection);
  table_->setEditTriggers(QAbstractItemView::NoEditTriggers);
  table_->setAlternatingRowColors(true);
  table_->setContextMenuPolicy(Qt::CustomContextMenu);
  lay->addWidget(table_);

  // Row 1: controls
  auto* controls = new QWidget(this);
  auto* hb = new QHBoxLayout(controls);
  hb->setContentsMargins(0,0,0,0);
  pauseBtn_  = new QPushButton(tr("Pause"), controls);
  resumeBtn_ = new QPushButton(tr("Resume"), controls);
  pauseSelBtn_  = new QPushButton(tr("Pause sel."), controls);
  resumeSelBtn_ = new QPushButton(tr("Resume sel."), controls);
  stopSelBtn_   = new QPushButton(tr("Cancel sel."), controls);
  stopAllBtn_   = new QPushButton(tr("Cancel all"), controls);
  retryBtn_  = new QPushButton(tr("Retry sel."), controls);
  clearBtn_  = new QPushButton(tr("Clear finished"), controls);
  closeBtn_  = new QPushButton(tr("Close"), controls);
  hb->addWidget(pauseBtn_);
  hb->addWidget(resumeBtn_);
  hb->addWidget(pauseSelBtn_);
  hb->addWidget(resumeSelBtn_);
  hb->addWidget(stopAllBtn_);
  hb->addWidget(stopSelBtn_);
  hb->addWidget(retryBtn_);
  hb->addWidget(clearBtn_);
  hb->addWidget(closeBtn_);
  hb->addStretch();
  lay->addWidget(controls);

  // Row 2: speed limits
  auto* speedRow = new QWidget(this);
  auto* hs2 = new QHBoxLayout(speedRow);
  hs2->setContentsMargins(0,0,0,0);
  speedSpin_ = new QSpinBox(speedRow);
  speedSpin_->setRange(0, 1'000'000);
  speedSpin_->setValue(engine_->queue()->globalSpeedLimitKBps());
  speedSpin_->setSuffix(" KB/s");
  applySpeedBtn_ = new QPushButton(tr("Apply speed"), speedRow);
  limitSelBtn_  = new QPushButton(tr("Limit sel."), speedRow);
  hs2->addWidget(new QLabel(tr("Speed:"), speedRow));
  hs2->addWidget(speedSpin_);
  hs2->addWidget(applySpeedBtn_);
  hs2->addWidget(limitSelBtn_);
  hs2->addStretch();
  lay->addWidget(speedRow);

  summaryLabel_ = new QLabel(this);
  summaryLabel_->setWordWrap(true);
  lay->addWidget(summaryLabel_);

  connect(filter_, QOverload<int>::of(&QComboBox::currentIndexChanged), this, &TransferQueueDialog::refresh);
  connect(applySpeedBtn_, &QPushButton::clicked, this, &TransferQueueDialog::onApplyGlobalSpeed);
  connect(pauseBtn_,  &QPushButton::clicked, this, &TransferQueueDialog::onPause);
  connect(resumeBtn_, &QPushButton::clicked, this, &TransferQueueDialog::onResume);
  connect(pauseSelBtn_, &QPushButton::clicked, this, &TransferQueueDialog::onPauseSelected);
  connect(resumeSelBtn_, &QPushButton::clicked, this, &TransferQueueDialog::onResumeSelected);
  connect(limitSelBtn_, &QPushButton::clicked, this, &TransferQueueDialog::onLimitSelected);
  connect(stopSelBtn_, &QPushButton::clicked, this, &TransferQueueDialog::onStopSelected);
  connect(stopAllBtn_, &QPushButton::clicked, this, &TransferQueueDialog::onStopAll);
  connect(retryBtn_,  &QPushButton::clicked, this, &TransferQueueDialog::onRetrySelected);
  connect(clearBtn_,  &QPushButton::clicked, this, &TransferQueueDialog::onClearDone);
  connect(closeBtn_,  &QPushButton::clicked, this, &QDialog::reject);

  connect(mgr_, &TransferManager::listChanged, this, &TransferQueueDialog::refresh);
  connect(mgr_, &TransferManager::recordChanged, this, &TransferQueueDialog::refresh);
  connect(engine_->queue(), &TransferQueue::transferProgress, this, &TransferQueueDialog::onProgress);
  connect(table_->selectionModel(), &QItemSelectionModel::selectionChanged, this, &TransferQueueDialog::updateSummary);
  connect(table_, &QTableWidget::customContextMenuRequested, this, &TransferQueueDialog::showContextMenu);

  // Batch collision prompt: asked once per drop.
  engine_->drops()->setBatchPrompt([this](const DropPlan&, int collisions) {
    QMessageBox box(QMessageBox::Question, tr("Files exist"),
                    tr("%1 item(s) already exist at the destination.").arg(collisions), QMessageBox::NoButton, this);
    auto* over = box.addButton(tr("Overwrite"), QMessageBox::AcceptRole);
    auto* ren = box.addButton(tr("Keep both"), QMessageBox::ActionRole);
    box.addButton(tr("Skip"), QMessageBox::RejectRole);
    box.exec();
    if (box.clickedButton() == over) return CollisionPolicy::Overwrite;
    if (box.clickedButton() == ren) return CollisionPolicy::AutoRename;
    return CollisionPolicy::Skip;
  });
  engine_->drops()->setFilePrompt([this](const PlannedTransfer& f) {
    const auto ans = QMessageBox::question(this, tr("File exists"), tr("Overwrite %1?").arg(f.dst),
                                           QMessageBox::Yes | QMessageBox::No, QMessageBox::No);
    return ans == QMessageBox::Yes ? CollisionPolicy::Overwrite : CollisionPolicy::Skip;
  });
  refresh();
}

static QString statusText(TransferRecord::Status s) {
  switch (s) {
    case TransferRecord::Status::Queued: return TransferQueueDialog::tr("Queued");
    case TransferRecord::Status::Running: return TransferQueueDialog::tr("Running");
    case TransferRecord::Status::Paused: return TransferQueueDialog::tr("Paused");
    case TransferRecord::Status::Succeeded: return TransferQueueDialog::tr("Done");
    case TransferRecord::Status::Failed: return TransferQueueDialog::tr("Failed");
    case TransferRecord::Status::Cancelled: return TransferQueueDialog::tr("Cancelled");
  }
  return {};
}

static QString progressText(const TransferRecord& r) {
  if (r.isDirectoryJob)
    return QStringLiteral("%1/%2 (%3%)").arg(r.childSucceeded).arg(r.childCount).arg(r.progressPercent());
  return QString::number(r.progressPercent()) + "%";
}

void TransferQueueDialog::refresh() {
  rows_ = mgr_->list((TransferManager::Filter)filter_->currentData().toInt());
  rowOf_.clear();
  table_->setRowCount(rows_.size());
  for (int i = 0; i < rows_.size(); ++i) {
    const auto& t = rows_[i];
    rowOf_.insert(t.id, i);
    QString type = t.direction == TransferRecord::Direction::Upload ? tr("Upload") : tr("Download");
    if (t.isDirectoryJob) type += tr(" (folder)");
    else if (t.bulkSync) type += tr(" (rsync)");
    const QString src = t.parentId ? QStringLiteral("  ") + t.src : t.src;
    table_->setItem(i, 0, new QTableWidgetItem(QString::number(t.id)));
    table_->setItem(i, 1, new QTableWidgetItem(type));
    table_->setItem(i, 2, new QTableWidgetItem(src));
    table_->setItem(i, 3, new QTableWidgetItem(t.dst));
    table_->setItem(i, 4, new QTableWidgetItem(statusText(t.status)));
    table_->setItem(i, 5, new QTableWidgetItem(progressText(t)));
    table_->setItem(i, 6, new QTableWidgetItem(formatTransferSpeed(t.bytesPerSecond())));
    table_->setItem(i, 7, new QTableWidgetItem(formatTransferDuration(t.durationMs())));
    table_->setItem(i, 8, new QTableWidgetItem(QString::number(t.attempts)));
    table_->setItem(i, 9, new QTableWidgetItem(t.error));
  }
  updateSummary();
}

void TransferQueueDialog::onProgress(quint64 id, quint64 done, qint64 total) {
  const int row = rowOf_.value(id, -1);
  if (row < 0) return;
  TransferRecord& r = rows_[row];
  r.bytesTransferred = done;
  r.totalBytes = total;
  if (auto* it = table_->item(row, 5)) it->setText(progressText(r));
  if (auto* it = table_->item(row, 6)) it->setText(formatTransferSpeed(r.bytesPerSecond()));
  if (auto* it = table_->item(row, 7)) it->setText(formatTransferDuration(r.durationMs()));
}

QVector<quint64> TransferQueueDialog::selectedIds() const {
  QVector<quint64> out;
  auto sel = table_->selectionModel();
  if (!sel || !sel->hasSelection()) return out;
  for (const QModelIndex& r : sel->selectedRows()) {
    const int row = r.row();
    if (row >= 0 && row < rows_.size()) out.push_back(rows_[row].id);
  }
  return out;
}

void TransferQueueDialog::onPause() { engine_->queue()->pauseAll(); updateSummary(); }
void TransferQueueDialog::onResume() { engine_->queue()->resumeAll(); updateSummary(); }
void TransferQueueDialog::onClearDone() { mgr_->clearHistory(); }

void TransferQueueDialog::onRetrySelected() {
  for (quint64 id : selectedIds()) mgr_->retry(id);
}
void TransferQueueDialog::onPauseSelected() {
  for (quint64 id : selectedIds()) engine_->queue()->pause(id);
}
void TransferQueueDialog::onResumeSelected() {
  for (quint64 id : selectedIds()) engine_->queue()->resume(id);
}
void TransferQueueDialog::onStopSelected() {
  for (quint64 id : selectedIds()) mgr_->cancel(id);
}
void TransferQueueDialog::onStopAll() {
  engine_->queue()->cancelAll();
}
void TransferQueueDialog::onApplyGlobalSpeed() {
  engine_->queue()->setGlobalSpeedLimitKBps(speedSpin_->value());
  updateSummary();
}
void TransferQueueDialog::onLimitSelected() {
  const auto ids = selectedIds();
  if (ids.isEmpty()) return;
  bool ok=false; int v = QInputDialog::getInt(this, tr("Limit for transfer(s)"), tr("KB/s (0 = unlimited)"), 0, 0, 1'000'000, 1, &ok);
  if (!ok) return;
  for (quint64 id : ids) engine_->queue()->setSpeedLimit(id, v);
}

void TransferQueueDialog::updateSummary() {
  int queued = 0, running = 0, paused = 0, done = 0, failed = 0, cancelled = 0;
  for (const auto& t : rows_) {
    if (t.parentId) continue; // counted through their job
    switch (t.status) {
      case TransferRecord::Status::Queued: queued++; break;
      case TransferRecord::Status::Running: running++; break;
      case TransferRecord::Status::Paused: paused++; break;
      case TransferRecord::Status::Succeeded: done++; break;
      case TransferRecord::Status::Failed: failed++; break;
      case TransferRecord::Status::Cancelled: cancelled++; break;
    }
  }
  QString summary = tr("Queued: %1  |  Running: %2  |  Paused: %3  |  Failed: %4  |  Done: %5")
                    .arg(queued).arg(running).arg(paused).arg(failed).arg(done);
  const int gkb = engine_->queue()->globalSpeedLimitKBps();
  if (gkb > 0) summary += tr("  |  Global limit: %1 KB/s").arg(gkb);
  if (engine_->queue()->isPaused()) summary += tr("  |  Queue paused");
  summaryLabel_->setText(summary);

  const bool hasSel = table_->selectionModel() && table_->selectionModel()->hasSelection();
  if (pauseBtn_)  pauseBtn_->setEnabled(!engine_->queue()->isPaused());
  if (resumeBtn_) resumeBtn_->setEnabled(engine_->queue()->isPaused() || paused > 0);
  if (retryBtn_)  retryBtn_->setEnabled(hasSel && (failed + cancelled) > 0);
  if (clearBtn_)  clearBtn_->setEnabled((done + failed + cancelled) > 0);
  if (pauseSelBtn_) pauseSelBtn_->setEnabled(hasSel);
  if (resumeSelBtn_) resumeSelBtn_->setEnabled(hasSel);
  if (limitSelBtn_) limitSelBtn_->setEnabled(hasSel);
  if (stopSelBtn_)  stopSelBtn_->setEnabled(hasSel);
  if (stopAllBtn_)  stopAllBtn_->setEnabled(running + queued + paused > 0);
}

void TransferQueueDialog::dragEnterEvent(QDragEnterEvent* e) {
  if (e->mimeData()->hasUrls()) e->acceptProposedAction();
}

void TransferQueueDialog::dropEvent(QDropEvent* e) {
  QStringList paths;
  for (const QUrl& u : e->mimeData()->urls()) {
    if (u.isLocalFile()) paths << u.toLocalFile();
  }
  if (paths.isEmpty()) return;
  auto* res = engine_->resolver(sessionId_);
  const QString remoteDir = res ? QString::fromStdString(res->cwd()) : QStringLiteral("/");

  DropPlan plan;
  DropResult result;
  remotebridge::Error err;
  if (!engine_->drops()->planUpload(sessionId_, paths, remoteDir, plan, err) ||
      !engine_->drops()->submit(plan, result, err)) {
    QMessageBox::warning(this, tr("Upload"), QString::fromStdString(err.describe()));
    return;
  }
  e->acceptProposedAction();
  if (!plan.unreadable.isEmpty())
    QMessageBox::information(this, tr("Upload"), tr("Skipped unreadable items:\n%1").arg(plan.unreadable.join('\n')));
}

void TransferQueueDialog::showContextMenu(const QPoint& pos) {
  QModelIndex idx = table_->indexAt(pos);
  if (!idx.isValid()) return;
  if (!table_->selectionModel()->isSelected(idx)) {
    table_->clearSelection();
    table_->selectRow(idx.row());
  }

  QMenu menu(this);
  QAction* actPauseSel  = menu.addAction(tr("Pause"));
  QAction* actResumeSel = menu.addAction(tr("Resume"));
  QAction* actRetrySel  = menu.addAction(tr("Retry"));
  QAction* actLimitSel  = menu.addAction(tr("Limit speed"));
  QAction* actCancelSel = menu.addAction(tr("Cancel"));

  QAction* chosen = menu.exec(table_->viewport()->mapToGlobal(pos));
  if (!chosen) return;
  if (chosen == actPauseSel) onPauseSelected();
  else if (chosen == actResumeSel) onResumeSelected();
  else if (chosen == actRetrySel) onRetrySelected();
  else if (chosen == actLimitSel) onLimitSelected();
  else if (chosen == actCancelSel) onStopSelected();
}
