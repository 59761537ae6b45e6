#include "vs/screener/screener.hpp"
#include "vs/screener/screener_cache.hpp"
#include <atomic>
#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using vs::core::Date;
using vs::market::Observation;
using vs::market::TickerSeries;
using vs::screener::Reason;

// 60 points quotidiens : IV de 0.10 à 0.40 puis valeur finale `last_iv`, HV finale `last_hv`.
// rang attendu = (last_iv - 0.10) / 0.30
static TickerSeries make(const std::string& ticker, double last_iv, double last_hv = 0.20,
                         std::size_t n = 60) {
  const Date last = Date::from_ymd(2024, 6, 28);
  std::vector<Observation> obs;
  for (std::size_t i = 0; i < n; ++i) {
    Observation o;
    o.date = last - static_cast<long>(n - 1 - i);
    o.iv_30d = (i == 0) ? 0.10 : (i == 1 ? 0.40 : 0.25);
    o.hv_30d = 0.20;
    obs.push_back(o);
  }
  obs.back().iv_30d = last_iv;
  obs.back().hv_30d = last_hv;
  return TickerSeries(ticker, std::move(obs));
}

// Source qui lève pour un ticker donné.
class FaultySource : public vs::io::TickerSeriesSource {
public:
  FaultySource(const vs::io::TickerSeriesSource& inner, std::string bad)
    : inner_(inner), bad_(std::move(bad)) {}

  vs::io::FetchResult fetch(const std::string& t) const override {
    if (t == bad_) throw std::runtime_error("disk error on " + t);
    return inner_.fetch(t);
  }
  std::vector<std::string> list_tickers() const override { return inner_.list_tickers(); }
  std::string snapshot_id() const override { return "faulty|" + inner_.snapshot_id(); }

private:
  const vs::io::TickerSeriesSource& inner_;
  std::string bad_;
};

// Source qui lève une valeur hors std::exception (bibliothèque tierce, code C...).
class IntThrowingSource : public vs::io::TickerSeriesSource {
public:
  IntThrowingSource(const vs::io::TickerSeriesSource& inner, std::string bad, bool bad_listing = false)
    : inner_(inner), bad_(std::move(bad)), bad_listing_(bad_listing) {}

  vs::io::FetchResult fetch(const std::string& t) const override {
    if (t == bad_) throw 42;
    return inner_.fetch(t);
  }
  std::vector<std::string> list_tickers() const override {
    if (bad_listing_) throw 7;
    return inner_.list_tickers();
  }
  std::string snapshot_id() const override { return "int|" + inner_.snapshot_id(); }

private:
  const vs::io::TickerSeriesSource& inner_;
  std::string bad_;
  bool bad_listing_;
};

int main() {
  vs::io::InMemorySource src;
  src.put(make("AAA", 0.16));          // rang 0.2
  src.put(make("BBB", 0.34));          // rang 0.8
  src.put(make("CCC", 0.25));          // rang 0.5
  src.put(make("DDD", 0.34));          // rang 0.8 (égalité avec BBB)
  {
    // IV plate sur toute la fenêtre
    std::vector<Observation> obs = make("FLAT", 0.25).observations();
    for (auto& o : obs) o.iv_30d = 0.25;
    src.put(TickerSeries("FLAT", std::move(obs)));
  }
  src.put(make("SHORT", 0.30, 0.20, 10)); // historique insuffisant
  src.put(make("HVZERO", 0.30, 0.0));     // ratio indéfini

  const std::vector<std::string> req = {"AAA", "BBB", "MISSING", "CCC", "FLAT", "DDD",
                                        "SHORT", "HVZERO", "BBB"};

  // 1) tri décroissant, égalités dans l'ordre d'entrée, exclusions explicites
  {
    auto rep = vs::screener::build_screener(req, src);
    assert(rep.rows.size() == 4);
    assert(rep.rows[0].ticker == "BBB");
    assert(rep.rows[1].ticker == "DDD");
    assert(rep.rows[2].ticker == "CCC");
    assert(rep.rows[3].ticker == "AAA");
    for (std::size_t i = 1; i < rep.rows.size(); ++i) assert(rep.rows[i-1].iv_rank >= rep.rows[i].iv_rank);
    assert(std::abs(rep.rows[0].iv_rank - 0.8) < 1e-9);
    assert(std::abs(rep.rows[0].iv_hv_ratio - 1.7) < 1e-9);
    assert(std::abs(rep.rows[0].current_iv - 0.34) < 1e-12);

    assert(rep.outcomes.size() == 8); // doublon BBB retiré
    assert(rep.outcomes[2].ticker == "MISSING" && rep.outcomes[2].reason == Reason::NotFound);
    assert(rep.count(Reason::None) == 4);
    assert(rep.count(Reason::NotFound) == 1);
    assert(rep.count(Reason::DegenerateMetric) == 2); // FLAT, HVZERO
    assert(rep.count(Reason::InsufficientHistory) == 1);
  }

  // 2) l'ordre de la requête ne change pas l'ensemble éligible
  {
    const std::vector<std::string> rev = {"HVZERO", "DDD", "CCC", "BBB", "AAA"};
    auto rep = vs::screener::build_screener(rev, src);
    assert(rep.rows.size() == 4);
    assert(rep.rows[0].ticker == "DDD"); // égalité : ordre d'entrée
    assert(rep.rows[1].ticker == "BBB");
    assert(rep.rows[3].ticker == "AAA");
  }

  // 3) une exception sur un ticker n'interrompt pas le lot
  {
    FaultySource faulty(src, "CCC");
    auto rep = vs::screener::build_screener(req, faulty);
    assert(rep.rows.size() == 3);
    assert(rep.count(Reason::LoadFailed) == 1);
    assert(rep.outcomes[3].ticker == "CCC");
    assert(rep.outcomes[3].message.find("disk error") != std::string::npos);
  }

  // 3b) exception hors std::exception : ticker LoadFailed, les autres restent
  {
    IntThrowingSource odd(src, "BAD");
    auto rep = vs::screener::build_screener({"BAD", "AAA"}, odd);
    assert(rep.rows.size() == 1 && rep.rows[0].ticker == "AAA");
    assert(rep.outcomes[0].ticker == "BAD" && rep.outcomes[0].reason == Reason::LoadFailed);
    assert(rep.outcomes[0].message == "exception inconnue");

    vs::config::ScreenerConfig par;
    par.n_threads = 2;
    auto prep = vs::screener::build_screener({"BAD", "AAA", "BBB", "CCC"}, odd, par);
    assert(prep.rows.size() == 3);
    assert(prep.count(Reason::LoadFailed) == 1);

    IntThrowingSource no_list(src, "", true);
    auto lrep = vs::screener::build_screener(no_list);
    assert(lrep.empty() && lrep.outcomes.empty());
    assert(lrep.source_error == "exception inconnue");
  }

  // 4) parallèle == séquentiel
  {
    vs::config::ScreenerConfig par;
    par.n_threads = 3;
    auto a = vs::screener::build_screener(req, src);
    auto b = vs::screener::build_screener(req, src, par);
    assert(a.rows.size() == b.rows.size());
    for (std::size_t i = 0; i < a.rows.size(); ++i) {
      assert(a.rows[i].ticker == b.rows[i].ticker);
      assert(a.rows[i].iv_rank == b.rows[i].iv_rank);
    }
    for (std::size_t i = 0; i < a.outcomes.size(); ++i) {
      assert(a.outcomes[i].ticker == b.outcomes[i].ticker);
      assert(a.outcomes[i].reason == b.outcomes[i].reason);
    }
  }

  // 5) arrêt demandé : rien n'est traité
  {
    std::atomic<bool> stop{true};
    auto rep = vs::screener::build_screener(req, src, {}, &stop);
    assert(rep.rows.empty());
    assert(rep.count(Reason::Aborted) == rep.outcomes.size());
  }

  // 6) aucun ticker éligible : résultat vide, pas d'erreur
  {
    vs::io::InMemorySource none;
    assert(vs::screener::build_screener(none).empty());
    auto rep = vs::screener::build_screener({"X", "Y"}, none);
    assert(rep.empty() && rep.count(Reason::NotFound) == 2);
  }

  // 7) toute la source (list_tickers)
  {
    auto rep = vs::screener::build_screener(src);
    assert(rep.outcomes.size() == 7);
    assert(rep.rows.size() == 4);
  }

  // 8) cache : même snapshot/config -> hit ; modification de la source -> rebuild
  {
    vs::screener::ScreenerCache cache;
    const auto& r1 = cache.get_or_build({}, src);
    assert(r1.rows.size() == 4 && cache.misses() == 1 && cache.hits() == 0);
    cache.get_or_build({}, src);
    assert(cache.hits() == 1);

    vs::config::ScreenerConfig strict;
    strict.min_observations = 100;
    const auto& r2 = cache.get_or_build({}, src, strict);
    assert(r2.rows.empty() && cache.misses() == 2);

    src.put(make("EEE", 0.40)); // rang 1.0
    const auto& r3 = cache.get_or_build({}, src);
    assert(cache.misses() == 3);
    assert(r3.rows.size() == 5 && r3.rows.front().ticker == "EEE");

    cache.invalidate();
    cache.get_or_build({}, src);
    assert(cache.misses() == 4 && cache.has_value());

    // passe interrompue : pas mémorisée
    std::atomic<bool> stop{true};
    cache.invalidate();
    const auto& r4 = cache.get_or_build({}, src, {}, &stop);
    assert(r4.rows.empty() && !cache.has_value());
    cache.get_or_build({}, src);
    assert(cache.misses() == 6 && cache.has_value());
  }

  std::cout << "ScreenerAggregator OK.\n";
  return 0;
}
