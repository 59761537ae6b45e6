#include "ScreenerWorker.hpp"

#include <QDebug>
#include <algorithm>
#include <exception>

using gui::ScreenerWorker;

ScreenerWorker::ScreenerWorker(QObject* parent): QObject(parent) {}

void ScreenerWorker::requestStop() { stop_.store(true, std::memory_order_relaxed); }

vs::io::CsvDirectorySource& ScreenerWorker::sourceFor_(const QString& dataDir) {
  const std::string dir = dataDir.toStdString();
  if (!source_ || source_->directory() != dir) {
    source_ = std::make_unique<vs::io::CsvDirectorySource>(dir);
    cache_.invalidate();
  }
  return *source_;
}

void ScreenerWorker::clearCache() {
  cache_.invalidate();
  emit message("Cache du screener vidé.");
}

void ScreenerWorker::runScreener(const QString& dataDir, int minObs, bool ytdWall, int threads) {
  stop_.store(false, std::memory_order_relaxed);
  try {
    auto& src = sourceFor_(dataDir);

    const auto tickers = src.list_tickers();
    QStringList names;
    for (const auto& t : tickers) names << QString::fromStdString(t);
    emit tickersListed(names);

    if (tickers.empty()) {
      // rapport vide : l'affichage du répertoire précédent est effacé
      qWarning() << "[Screener] aucun fichier de série dans" << dataDir;
      emit screenerDone(vs::screener::ScreenerReport{}, false);
      emit message(QString("Aucun fichier de série dans %1").arg(dataDir));
      return;
    }

    vs::config::ScreenerConfig cfg;
    cfg.min_observations = static_cast<std::size_t>(std::max(1, minObs));
    cfg.n_threads        = static_cast<std::size_t>(std::max(1, threads));
    cfg.window.ytd_policy = ytdWall ? vs::config::YtdPolicy::WallClockYear
                                    : vs::config::YtdPolicy::LastObservationYear;

    qDebug() << "[Screener] run: dir=" << dataDir << " tickers=" << names.size()
             << " minObs=" << minObs << " threads=" << threads;

    const auto hitsBefore = cache_.hits();
    const auto& rep = cache_.get_or_build({}, src, cfg, &stop_);
    const bool fromCache = cache_.hits() > hitsBefore;

    const auto aborted = rep.count(vs::screener::Reason::Aborted);
    if (aborted > 0) emit message(QString("Screener interrompu (%1 tickers non traités).").arg(aborted));
    qDebug() << "[Screener] done: eligible=" << rep.rows.size()
             << " outcomes=" << rep.outcomes.size() << " cached=" << fromCache;
    emit screenerDone(rep, fromCache);
  } catch (const std::exception& e) {
    emit failed(QString("runScreener: %1").arg(e.what()));
  } catch (...) {
    emit failed("runScreener: exception inconnue");
  }
}

void ScreenerWorker::loadTicker(const QString& dataDir, const QString& ticker, bool ytdWall) {
  try {
    auto& src = sourceFor_(dataDir);
    vs::config::WindowOptions opts;
    opts.ytd_policy = ytdWall ? vs::config::YtdPolicy::WallClockYear
                              : vs::config::YtdPolicy::LastObservationYear;
    const auto pd = vs::plot::build_plot_data(src, ticker.toStdString(), opts);
    if (!pd.available) {
      qWarning() << "[Screener] loadTicker:" << ticker << QString::fromStdString(pd.message);
    }
    emit plotReady(pd);
  } catch (const std::exception& e) {
    emit failed(QString("loadTicker: %1").arg(e.what()));
  } catch (...) {
    emit failed("loadTicker: exception inconnue");
  }
}
