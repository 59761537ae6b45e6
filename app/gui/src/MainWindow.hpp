#pragma once
#include <QMainWindow>
#include <QThread>
#include <QJsonObject>
#include <QStringList>
#include <array>
#include <cstddef>

#include <QtCharts/QChartView>
#include <QtCharts/QChart>
#include <QtCharts/QLineSeries>
#include <QtCharts/QDateTimeAxis>
#include <QtCharts/QValueAxis>

#include <vs/plot/plot_data.hpp>
#include <vs/screener/screener.hpp>

namespace gui { class ScreenerWorker; }

class QTableWidget;
class QComboBox;
class QSpinBox;
class QLineEdit;
class QLabel;
class QPushButton;
class QTabWidget;
class QStackedWidget;

class MainWindow : public QMainWindow {
  Q_OBJECT
public:
  explicit MainWindow(QWidget* parent = nullptr);
  ~MainWindow() override;

signals:
  // vers le worker (thread dédié)
  void requestScreener(const QString& dataDir, int minObs, bool ytdWall, int threads);
  void requestTicker(const QString& dataDir, const QString& ticker, bool ytdWall);

private slots:
  void onBrowseDir();
  void onRefresh();
  void onStop();
  void onTickerSelected(int idx);
  void onTableDoubleClicked(int row, int col);

  // retours worker
  void onTickersListed(const QStringList& tickers);
  void onScreenerDone(const vs::screener::ScreenerReport& rep, bool fromCache);
  void onPlotReady(const vs::plot::PlotData& pd);
  void onWorkerMessage(const QString& m);
  void onWorkerFailed(const QString& why);

  void onSaveSession();

private:
  void setupUi_();
  void setupPanels_(QWidget* host);
  void wireWorker_();

  void fillScreenerTable_(const vs::screener::ScreenerReport& rep);
  void updatePanel_(std::size_t i, const vs::plot::NamedWindow& w);
  void clearPanels_(const QString& why);

  bool ytdWall_() const;

  // --- Session (JSON) ---
  QJsonObject makeSessionJson() const;
  void        loadSessionJson(const QJsonObject& obj);
  QString     sessionPath() const;   // data/volscreen_session.json
  void        loadSession_();

  // widgets
  QLineEdit*    dirEdit_{nullptr};
  QSpinBox*     minObsSpin_{nullptr};
  QComboBox*    ytdCombo_{nullptr};
  QSpinBox*     threadsSpin_{nullptr};
  QPushButton*  refreshBtn_{nullptr};
  QPushButton*  stopBtn_{nullptr};
  QTabWidget*   tabs_{nullptr};
  QTableWidget* table_{nullptr};
  QLabel*       summaryLabel_{nullptr};
  QComboBox*    tickerCombo_{nullptr};
  QLabel*       plotTitle_{nullptr};

  // Un panneau = graphique OU message "No Data"
  struct Panel {
    QStackedWidget*        stack{nullptr};
    QtCharts::QChartView*  view{nullptr};
    QtCharts::QChart*      chart{nullptr};
    QtCharts::QDateTimeAxis* axX{nullptr};
    QtCharts::QValueAxis*  axY{nullptr};
    QLabel*                noData{nullptr};
  };
  std::array<Panel, vs::plot::kNumPanels> panels_;

  // worker
  QThread* workerThread_{nullptr};
  gui::ScreenerWorker* worker_{nullptr};

  QString pendingTicker_;   // ticker à recharger après listing
};
