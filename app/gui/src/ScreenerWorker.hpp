#pragma once
#include <QObject>
#include <QString>
#include <QStringList>
#include <QMetaType>
#include <atomic>
#include <memory>

#include <vs/config/screener_config.hpp>
#include <vs/io/series_source.hpp>
#include <vs/plot/plot_data.hpp>
#include <vs/screener/screener.hpp>
#include <vs/screener/screener_cache.hpp>

Q_DECLARE_METATYPE(vs::screener::ScreenerReport)
Q_DECLARE_METATYPE(vs::plot::PlotData)

namespace gui {

// Exécute screener et construction des panneaux hors du thread UI.
// Possède le cache du screener (clé : snapshot du répertoire + config).
class ScreenerWorker : public QObject {
  Q_OBJECT
public:
  explicit ScreenerWorker(QObject* parent=nullptr);

  // Demande d'arrêt asynchrone (tickers restants marqués Aborted)
  void requestStop();

public slots:
  void runScreener(const QString& dataDir, int minObs, bool ytdWall, int threads);
  void loadTicker(const QString& dataDir, const QString& ticker, bool ytdWall);
  void clearCache();

signals:
  void message(const QString& text);
  void tickersListed(const QStringList& tickers);
  void screenerDone(const vs::screener::ScreenerReport& report, bool fromCache);
  void plotReady(const vs::plot::PlotData& data);
  void failed(const QString& why);

private:
  vs::io::CsvDirectorySource& sourceFor_(const QString& dataDir);

  std::unique_ptr<vs::io::CsvDirectorySource> source_;
  vs::screener::ScreenerCache cache_;
  std::atomic<bool> stop_{false};
};

} // namespace gui
