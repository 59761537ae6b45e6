#include "MainWindow.hpp"
#include "ScreenerWorker.hpp"

#include <QComboBox>
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileDialog>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QJsonDocument>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QScrollArea>
#include <QSpinBox>
#include <QStackedWidget>
#include <QStatusBar>
#include <QTabWidget>
#include <QTableWidget>
#include <QTableWidgetItem>
#include <QVBoxLayout>
#include <QPen>
#include <QShortcut>
#include <QSignalBlocker>
#include <QKeySequence>

#include <algorithm>
#include <cmath>

namespace {
const QColor C_HV (65,105,225);  // royalblue
const QColor C_IV (220,20,60);   // rouge

inline qreal toMsecs(const vs::core::Date& d) {
  const QDate qd(d.year(), d.month(), d.day());
  return static_cast<qreal>(QDateTime(qd, QTime(0,0), Qt::UTC).toMSecsSinceEpoch());
}

// Cellule numérique triable (valeur brute en EditRole, texte formaté à l'affichage)
QTableWidgetItem* numItem(double v, const QString& text) {
  auto* it = new QTableWidgetItem();
  it->setData(Qt::EditRole, v);
  it->setData(Qt::DisplayRole, text);
  it->setTextAlignment(Qt::AlignRight | Qt::AlignVCenter);
  return it;
}
} // namespace

MainWindow::MainWindow(QWidget* parent) : QMainWindow(parent) {
  setupUi_();
  wireWorker_();
  loadSession_();

  auto* sc = new QShortcut(QKeySequence::Save, this);
  connect(sc, &QShortcut::activated, this, &MainWindow::onSaveSession);

  statusBar()->showMessage("Prêt.");
}

MainWindow::~MainWindow() {
  onSaveSession();
  if (worker_) worker_->requestStop();
  if (workerThread_) {
    workerThread_->quit();
    workerThread_->wait();
  }
}

// ---------------------------------------------------------------------------
// UI

void MainWindow::setupUi_() {
  setWindowTitle("Volatility Screener");
  resize(1100, 900);

  auto* central = new QWidget(this);
  auto* root = new QVBoxLayout(central);

  // barre de paramètres
  auto* bar = new QHBoxLayout();
  dirEdit_ = new QLineEdit(central);
  dirEdit_->setPlaceholderText("Répertoire du cache (<TICKER>.csv)");
  auto* browse = new QPushButton("…", central);
  minObsSpin_ = new QSpinBox(central);
  minObsSpin_->setRange(2, 1000);
  minObsSpin_->setValue(20);
  minObsSpin_->setPrefix("min obs ");
  ytdCombo_ = new QComboBox(central);
  ytdCombo_->addItem("YTD: last date", "last");
  ytdCombo_->addItem("YTD: wall clock", "wall");
  threadsSpin_ = new QSpinBox(central);
  threadsSpin_->setRange(1, 64);
  threadsSpin_->setPrefix("threads ");
  refreshBtn_ = new QPushButton("Refresh", central);
  stopBtn_    = new QPushButton("Stop", central);
  stopBtn_->setEnabled(false);

  bar->addWidget(dirEdit_, 1);
  bar->addWidget(browse);
  bar->addWidget(minObsSpin_);
  bar->addWidget(ytdCombo_);
  bar->addWidget(threadsSpin_);
  bar->addWidget(refreshBtn_);
  bar->addWidget(stopBtn_);
  root->addLayout(bar);

  tabs_ = new QTabWidget(central);

  // --- onglet Screener ---
  auto* scrTab = new QWidget(tabs_);
  auto* scrLay = new QVBoxLayout(scrTab);
  table_ = new QTableWidget(0, 4, scrTab);
  table_->setHorizontalHeaderLabels({"Ticker", "Current IV", "IV Rank (1Y)", "IV/HV Ratio"});
  table_->horizontalHeader()->setSectionResizeMode(QHeaderView::Stretch);
  table_->setEditTriggers(QAbstractItemView::NoEditTriggers);
  table_->setSelectionBehavior(QAbstractItemView::SelectRows);
  summaryLabel_ = new QLabel("Aucune donnée.", scrTab);
  scrLay->addWidget(table_, 1);
  scrLay->addWidget(summaryLabel_);
  tabs_->addTab(scrTab, "Screener");

  // --- onglet Volatilité ---
  auto* volTab = new QWidget(tabs_);
  auto* volLay = new QVBoxLayout(volTab);
  auto* pick = new QHBoxLayout();
  tickerCombo_ = new QComboBox(volTab);
  tickerCombo_->setMinimumWidth(140);
  plotTitle_ = new QLabel(volTab);
  pick->addWidget(new QLabel("Ticker:", volTab));
  pick->addWidget(tickerCombo_);
  pick->addWidget(plotTitle_, 1);
  volLay->addLayout(pick);

  auto* scroll = new QScrollArea(volTab);
  scroll->setWidgetResizable(true);
  auto* host = new QWidget(scroll);
  setupPanels_(host);
  scroll->setWidget(host);
  volLay->addWidget(scroll, 1);
  tabs_->addTab(volTab, "Volatility");

  root->addWidget(tabs_, 1);
  setCentralWidget(central);

  connect(browse,      &QPushButton::clicked, this, &MainWindow::onBrowseDir);
  connect(refreshBtn_, &QPushButton::clicked, this, &MainWindow::onRefresh);
  connect(stopBtn_,    &QPushButton::clicked, this, &MainWindow::onStop);
  connect(tickerCombo_, QOverload<int>::of(&QComboBox::currentIndexChanged),
          this, &MainWindow::onTickerSelected);
  connect(table_, &QTableWidget::cellDoubleClicked, this, &MainWindow::onTableDoubleClicked);
  connect(ytdCombo_, QOverload<int>::of(&QComboBox::currentIndexChanged),
          this, [this](int){ onTickerSelected(tickerCombo_->currentIndex()); });
}

void MainWindow::setupPanels_(QWidget* host) {
  using namespace QtCharts;
  auto* lay = new QVBoxLayout(host);

  for (std::size_t i = 0; i < panels_.size(); ++i) {
    auto& p = panels_[i];
    const QString label = QString::fromUtf8(vs::plot::kStandardPanels[i].label);

    p.chart = new QChart();
    p.chart->setTitle(label);
    p.chart->setMargins(QMargins(8,8,18,12));
    p.chart->legend()->setVisible(true);
    p.chart->legend()->setAlignment(Qt::AlignTop);

    p.axX = new QDateTimeAxis();
    p.axX->setFormat("yyyy-MM-dd");
    p.axX->setTickCount(6);
    p.axY = new QValueAxis();
    p.axY->setTitleText("Annualized Volatility");
    p.axY->setLabelFormat("%.0f%%"); // valeurs tracées en points de %
    p.chart->addAxis(p.axX, Qt::AlignBottom);
    p.chart->addAxis(p.axY, Qt::AlignLeft);

    p.view = new QChartView(p.chart);
    p.view->setRenderHint(QPainter::Antialiasing);
    p.view->setMinimumHeight(260);

    p.noData = new QLabel(QString("%1\n\nNo Data Available for this Timeframe").arg(label));
    p.noData->setAlignment(Qt::AlignCenter);
    p.noData->setMinimumHeight(260);
    p.noData->setStyleSheet("QLabel { border: 1px dashed #999; color: #666; }");

    p.stack = new QStackedWidget(host);
    p.stack->addWidget(p.view);
    p.stack->addWidget(p.noData);
    p.stack->setCurrentWidget(p.noData);
    lay->addWidget(p.stack);
  }
}

void MainWindow::wireWorker_() {
  qRegisterMetaType<vs::screener::ScreenerReport>("vs::screener::ScreenerReport");
  qRegisterMetaType<vs::plot::PlotData>("vs::plot::PlotData");

  workerThread_ = new QThread(this);
  worker_ = new gui::ScreenerWorker();
  worker_->moveToThread(workerThread_);
  connect(workerThread_, &QThread::finished, worker_, &QObject::deleteLater);

  connect(this, &MainWindow::requestScreener, worker_, &gui::ScreenerWorker::runScreener);
  connect(this, &MainWindow::requestTicker,   worker_, &gui::ScreenerWorker::loadTicker);

  connect(worker_, &gui::ScreenerWorker::tickersListed, this, &MainWindow::onTickersListed);
  connect(worker_, &gui::ScreenerWorker::screenerDone,  this, &MainWindow::onScreenerDone);
  connect(worker_, &gui::ScreenerWorker::plotReady,     this, &MainWindow::onPlotReady);
  connect(worker_, &gui::ScreenerWorker::message,       this, &MainWindow::onWorkerMessage);
  connect(worker_, &gui::ScreenerWorker::failed,        this, &MainWindow::onWorkerFailed);

  workerThread_->start();
}

bool MainWindow::ytdWall_() const {
  return ytdCombo_ && ytdCombo_->currentData().toString() == "wall";
}

// ---------------------------------------------------------------------------
// Actions

void MainWindow::onBrowseDir() {
  const QString d = QFileDialog::getExistingDirectory(this, "Répertoire du cache", dirEdit_->text());
  if (d.isEmpty()) return;
  dirEdit_->setText(d);
  onRefresh();
}

void MainWindow::onRefresh() {
  const QString dir = dirEdit_->text().trimmed();
  if (dir.isEmpty()) { statusBar()->showMessage("Choisir un répertoire de données."); return; }

  qDebug() << "[UI] refresh dir=" << dir;
  refreshBtn_->setEnabled(false);
  stopBtn_->setEnabled(true);
  statusBar()->showMessage("Screener en cours…");
  emit requestScreener(dir, minObsSpin_->value(), ytdWall_(), threadsSpin_->value());
}

void MainWindow::onStop() {
  if (worker_) worker_->requestStop();
  stopBtn_->setEnabled(false);
}

void MainWindow::onTickerSelected(int idx) {
  if (idx < 0 || !tickerCombo_) return;
  const QString t = tickerCombo_->itemText(idx);
  const QString dir = dirEdit_->text().trimmed();
  if (t.isEmpty() || dir.isEmpty()) return;
  plotTitle_->setText(QString("Historical vs. Implied Volatility for %1").arg(t));
  emit requestTicker(dir, t, ytdWall_());
}

void MainWindow::onTableDoubleClicked(int row, int /*col*/) {
  auto* it = table_->item(row, 0);
  if (!it) return;
  const int idx = tickerCombo_->findText(it->text());
  if (idx >= 0) {
    if (idx == tickerCombo_->currentIndex()) onTickerSelected(idx);
    else tickerCombo_->setCurrentIndex(idx);
  }
  tabs_->setCurrentIndex(1);
}

// ---------------------------------------------------------------------------
// Retours worker

void MainWindow::onTickersListed(const QStringList& tickers) {
  const QString keep = pendingTicker_.isEmpty() ? tickerCombo_->currentText() : pendingTicker_;
  {
    QSignalBlocker block(tickerCombo_);
    tickerCombo_->clear();
    tickerCombo_->addItems(tickers);
  }
  pendingTicker_.clear();
  const int idx = tickerCombo_->findText(keep);
  if (idx >= 0) tickerCombo_->setCurrentIndex(idx);
  if (tickerCombo_->count() > 0) onTickerSelected(tickerCombo_->currentIndex());
  else clearPanels_("Aucun ticker.");
}

void MainWindow::onScreenerDone(const vs::screener::ScreenerReport& rep, bool fromCache) {
  refreshBtn_->setEnabled(true);
  stopBtn_->setEnabled(false);
  fillScreenerTable_(rep);

  using vs::screener::Reason;
  if (rep.empty()) {
    summaryLabel_->setText("No data: aucun ticker éligible.");
  } else {
    summaryLabel_->setText(QString("%1 éligibles / %2 tickers; exclus: historique insuffisant %3, "
                                   "métrique dégénérée %4, colonnes manquantes %5, erreurs %6")
                           .arg(rep.rows.size()).arg(rep.outcomes.size())
                           .arg(rep.count(Reason::InsufficientHistory))
                           .arg(rep.count(Reason::DegenerateMetric))
                           .arg(rep.count(Reason::MissingColumns))
                           .arg(rep.count(Reason::LoadFailed) + rep.count(Reason::NotFound)));
  }
  statusBar()->showMessage(fromCache ? "Screener (cache)." : "Screener terminé.", 5000);
}

void MainWindow::onPlotReady(const vs::plot::PlotData& pd) {
  if (pd.ticker != tickerCombo_->currentText().toStdString()) return; // réponse périmée
  if (!pd.available) {
    clearPanels_(QString::fromStdString(pd.message));
    statusBar()->showMessage(QString::fromStdString(pd.message), 5000);
    return;
  }
  for (std::size_t i = 0; i < pd.panels.size() && i < panels_.size(); ++i) {
    updatePanel_(i, pd.panels[i]);
  }
}

void MainWindow::onWorkerMessage(const QString& m) {
  statusBar()->showMessage(m, 5000);
}

void MainWindow::onWorkerFailed(const QString& why) {
  qWarning() << "[UI] worker failed:" << why;
  refreshBtn_->setEnabled(true);
  stopBtn_->setEnabled(false);
  statusBar()->showMessage(why);
}

// ---------------------------------------------------------------------------
// Rendu

void MainWindow::fillScreenerTable_(const vs::screener::ScreenerReport& rep) {
  table_->setSortingEnabled(false);
  table_->setRowCount(static_cast<int>(rep.rows.size()));
  int r = 0;
  for (const auto& row : rep.rows) {
    table_->setItem(r, 0, new QTableWidgetItem(QString::fromStdString(row.ticker)));
    table_->setItem(r, 1, numItem(row.current_iv,  QString::number(100.0*row.current_iv, 'f', 2) + "%"));
    table_->setItem(r, 2, numItem(row.iv_rank,     QString::number(100.0*row.iv_rank, 'f', 2) + "%"));
    table_->setItem(r, 3, numItem(row.iv_hv_ratio, QString::number(row.iv_hv_ratio, 'f', 2)));
    ++r;
  }
  table_->setSortingEnabled(true);
}

void MainWindow::updatePanel_(std::size_t i, const vs::plot::NamedWindow& w) {
  using namespace QtCharts;
  auto& p = panels_[i];
  p.chart->removeAllSeries();

  if (!w.has_data()) {
    p.stack->setCurrentWidget(p.noData);
    return;
  }

  auto addLine = [&](const QString& name, const QColor& color, bool iv) {
    auto* s = new QLineSeries();
    s->setName(name);
    s->setPen(QPen(color, 1.6));
    for (const auto& o : w.rows) {
      const double v = iv ? o.iv_30d : o.hv_30d;
      if (std::isfinite(v)) s->append(toMsecs(o.date), 100.0*v);
    }
    p.chart->addSeries(s);
    s->attachAxis(p.axX);
    s->attachAxis(p.axY);
  };

  if (w.plot_hv) addLine("30-Day Historical Vol (HV)", C_HV, false);
  if (w.plot_iv) addLine("30-Day Implied Vol (IV)",    C_IV, true);

  const QDate d0(w.rows.front().date.year(), w.rows.front().date.month(), w.rows.front().date.day());
  const QDate d1(w.rows.back().date.year(),  w.rows.back().date.month(),  w.rows.back().date.day());
  p.axX->setRange(QDateTime(d0, QTime(0,0), Qt::UTC), QDateTime(d1, QTime(0,0), Qt::UTC));

  if (std::isfinite(w.y_min) && std::isfinite(w.y_max)) {
    const double lo = 100.0*w.y_min, hi = 100.0*w.y_max;
    const double pad = std::max(1.0, 0.05*(hi - lo));
    p.axY->setRange(std::max(0.0, lo - pad), hi + pad);
  }
  p.stack->setCurrentWidget(p.view);
}

void MainWindow::clearPanels_(const QString& why) {
  for (auto& p : panels_) {
    p.chart->removeAllSeries();
    p.stack->setCurrentWidget(p.noData);
  }
  plotTitle_->setText(why);
}

// ---------------------------------------------------------------------------
// Session JSON

QString MainWindow::sessionPath() const {
  QDir dir("data");
  dir.mkpath(".");
  return dir.absoluteFilePath("volscreen_session.json");
}

QJsonObject MainWindow::makeSessionJson() const {
  QJsonObject screener{
    {"min_observations", minObsSpin_->value()},
    {"ytd_policy",       ytdCombo_->currentData().toString()},
    {"threads",          threadsSpin_->value()}
  };
  QJsonObject root;
  root["version"]     = 1;
  root["data_dir"]    = dirEdit_->text();
  root["screener"]    = screener;
  root["last_ticker"] = tickerCombo_->currentText();
  root["last_tab"]    = tabs_->currentIndex();
  root["saved_at"]    = QDateTime::currentDateTime().toString(Qt::ISODate);
  return root;
}

void MainWindow::loadSessionJson(const QJsonObject& obj) {
  dirEdit_->setText(obj.value("data_dir").toString());
  const QJsonObject s = obj.value("screener").toObject();
  minObsSpin_->setValue(s.value("min_observations").toInt(20));
  threadsSpin_->setValue(s.value("threads").toInt(1));
  const int ytd = ytdCombo_->findData(s.value("ytd_policy").toString("last"));
  if (ytd >= 0) ytdCombo_->setCurrentIndex(ytd);
  pendingTicker_ = obj.value("last_ticker").toString();
  tabs_->setCurrentIndex(obj.value("last_tab").toInt(0));
}

void MainWindow::loadSession_() {
  QFile f(sessionPath());
  if (!f.exists()) return;
  if (!f.open(QIODevice::ReadOnly)) {
    qWarning() << "[UI] session illisible:" << f.fileName();
    return;
  }
  QJsonParseError err{};
  const auto doc = QJsonDocument::fromJson(f.readAll(), &err);
  if (err.error != QJsonParseError::NoError || !doc.isObject()) {
    qWarning() << "[UI] session JSON invalide:" << err.errorString();
    return;
  }
  loadSessionJson(doc.object());
  if (!dirEdit_->text().isEmpty()) onRefresh();
}

void MainWindow::onSaveSession() {
  QFile f(sessionPath());
  if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
    qWarning() << "[UI] impossible d'écrire la session:" << f.fileName();
    return;
  }
  f.write(QJsonDocument(makeSessionJson()).toJson(QJsonDocument::Indented));
  statusBar()->showMessage(QString("Session enregistrée: %1").arg(f.fileName()), 3000);
}
