#pragma once
#include <QMainWindow>
#include <QJsonObject>
#include <QString>

#include <QtCharts/QChartView>
#include <QtCharts/QChart>
#include <QtCharts/QLineSeries>
#include <QtCharts/QScatterSeries>
#include <QtCharts/QValueAxis>

#include <bse/market/option_params.hpp>
#include <bse/pricing/analytic_bs.hpp>

QT_BEGIN_NAMESPACE
namespace Ui { class MainWindow; }
QT_END_NAMESPACE

class QLabel;

class MainWindow : public QMainWindow {
  Q_OBJECT
public:
  explicit MainWindow(QWidget* parent = nullptr);
  ~MainWindow() override;

private slots:
  void onParamsChanged();
  void onLoadDefaults();
  void onReset();
  void onSaveParams();
  void onLoadParams();

private:
  Ui::MainWindow* ui;

  void wireSignals();

  bse::market::OptionParams currentParams() const;
  void setParams(const bse::market::OptionParams& p);

  // Recalcule tout (résultats + courbes) ; valide d’abord les entrées.
  void recompute();
  void setResults(const bse::pricing::BsReport& rep, double parityGap);
  void clearResults();

  // ===== Charts prix(S) et delta(S) =====
  struct CurveChart {
    QtCharts::QChartView*     view{nullptr};
    QtCharts::QLineSeries*    call{nullptr};
    QtCharts::QLineSeries*    put{nullptr};
    QtCharts::QScatterSeries* spot{nullptr};   // marqueurs au spot courant
    QtCharts::QValueAxis*     xAxis{nullptr};
    QtCharts::QValueAxis*     yAxis{nullptr};
  };
  CurveChart priceChart_;
  CurveChart deltaChart_;

  void setupCurveChart(CurveChart& c, QWidget* placeholder,
                       const QString& title, const QString& yTitle);
  void updateCharts(const bse::market::OptionParams& p);
  void clearCharts();

  // ===== Fichiers de paramètres (JSON) =====
  QJsonObject makeParamsJson() const;
  bool        loadParamsJson(const QJsonObject& root);
  QString     currentFile_;
  bool        dirty_{false};
  QLabel*     fileLabel_{nullptr};

  void setCurrentFile(const QString& path, bool dirty = false);
  void markDirty();
  QString fileDisplayName() const;
};
