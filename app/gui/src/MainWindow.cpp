#include "MainWindow.hpp"
#include "ui_MainWindow.h"

#include <QMessageBox>
#include <QStatusBar>
#include <QSignalBlocker>
#include <QDebug>
#include <QLabel>
#include <QPushButton>
#include <QDoubleSpinBox>
#include <QVBoxLayout>
#include <QPainter>
#include <QPen>

#include <QFileDialog>
#include <QFile>
#include <QFileInfo>
#include <QDir>
#include <QJsonDocument>
#include <QJsonObject>

#include <algorithm>
#include <cmath>
#include <limits>

#include <bse/core/errors.hpp>

namespace {
const QColor C_CALL (33,150,243);    // call (bleu)
const QColor C_PUT  (244,67,54);     // put (rouge)
const QColor C_SPOT (156,39,176);    // spot courant (violet)

constexpr int    N_CURVE_POINTS = 200;
constexpr double S_MIN_REL = 0.25;   // grille en S : [0.25 K, 2 K]
constexpr double S_MAX_REL = 2.0;

QString fmtValue(double x, int prec = 4) {
  return std::isfinite(x) ? QString::number(x, 'f', prec) : QString("-");
}
} // namespace

MainWindow::MainWindow(QWidget* parent)
  : QMainWindow(parent), ui(new Ui::MainWindow) {
  ui->setupUi(this);

  // Label "fichier" en barre d’état
  fileLabel_ = new QLabel(this);
  fileLabel_->setObjectName("lblFileName");
  statusBar()->addPermanentWidget(fileLabel_, /*stretch*/1);

  setupCurveChart(priceChart_, ui->chartPriceContainer, "Price vs spot", "Price");
  setupCurveChart(deltaChart_, ui->chartDeltaContainer, "Delta vs spot", "Delta");

  onLoadDefaults();
  wireSignals();
  setCurrentFile(QString(), false);
}

MainWindow::~MainWindow() {
  // Les QChart sont détruits par leurs vues
  delete priceChart_.view; priceChart_.view = nullptr;
  delete deltaChart_.view; deltaChart_.view = nullptr;
  delete ui;
}

void MainWindow::wireSignals() {
  connect(ui->btnLoadDefaults, &QPushButton::clicked, this, &MainWindow::onLoadDefaults);
  connect(ui->btnReset,        &QPushButton::clicked, this, &MainWindow::onReset);
  connect(ui->btnSaveParams,   &QPushButton::clicked, this, &MainWindow::onSaveParams);
  connect(ui->btnLoadParams,   &QPushButton::clicked, this, &MainWindow::onLoadParams);

  for (QDoubleSpinBox* w : {ui->sbS, ui->sbK, ui->sbR, ui->sbSigma, ui->sbT}) {
    connect(w, qOverload<double>(&QDoubleSpinBox::valueChanged),
            this, &MainWindow::onParamsChanged);
  }
}

bse::market::OptionParams MainWindow::currentParams() const {
  return bse::market::OptionParams{
    ui->sbS->value(), ui->sbK->value(), ui->sbR->value(),
    ui->sbSigma->value(), ui->sbT->value()
  };
}

void MainWindow::setParams(const bse::market::OptionParams& p) {
  // Un seul recompute à la fin plutôt qu’un par spin box
  {
    const QSignalBlocker b1(ui->sbS), b2(ui->sbK), b3(ui->sbR), b4(ui->sbSigma), b5(ui->sbT);
    ui->sbS    ->setValue(p.S);
    ui->sbK    ->setValue(p.K);
    ui->sbR    ->setValue(p.r);
    ui->sbSigma->setValue(p.sigma);
    ui->sbT    ->setValue(p.T);
  }
  recompute();
}

void MainWindow::onParamsChanged() {
  recompute();
  markDirty();
}

void MainWindow::onLoadDefaults() {
  setParams(bse::market::default_params());
}

void MainWindow::onReset() {
  clearResults();
  clearCharts();
  statusBar()->showMessage("Results cleared.", 1500);
}

void MainWindow::recompute() {
  const bse::market::OptionParams p = currentParams();
  try {
    bse::market::validate(p);
  } catch (const bse::core::InvalidParameter& e) {
    qWarning() << "[UI] invalid input:" << e.what();
    clearResults();
    clearCharts();
    statusBar()->showMessage(QString::fromStdString(e.what()));
    return;
  }

  const bse::pricing::BsReport rep = bse::pricing::evaluate_bs(p);
  const double gap = bse::pricing::put_call_parity_gap(rep.call_price, rep.put_price,
                                                       p.S, p.K, p.r, p.T);
  setResults(rep, gap);
  updateCharts(p);
  statusBar()->clearMessage();
}

void MainWindow::setResults(const bse::pricing::BsReport& rep, double parityGap) {
  ui->lblCallPrice->setText(fmtValue(rep.call_price));
  ui->lblPutPrice ->setText(fmtValue(rep.put_price));
  ui->lblCallDelta->setText(fmtValue(rep.call_delta));
  ui->lblPutDelta ->setText(fmtValue(rep.put_delta));
  ui->lblParityGap->setText(std::isfinite(parityGap) ? QString::number(parityGap, 'e', 2) : "-");
}

void MainWindow::clearResults() {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  setResults(bse::pricing::BsReport{nan, nan, nan, nan}, nan);
}

// ================= Charts =================

void MainWindow::setupCurveChart(CurveChart& c, QWidget* placeholder,
                                 const QString& title, const QString& yTitle) {
  using namespace QtCharts;

  auto* chart = new QChart();
  chart->setTitle(title);
  chart->legend()->setVisible(true);
  chart->legend()->setAlignment(Qt::AlignBottom);

  // Axes (parent = chart)
  c.xAxis = new QValueAxis(chart);
  c.yAxis = new QValueAxis(chart);
  c.xAxis->setTitleText("Spot S");
  c.yAxis->setTitleText(yTitle);
  c.xAxis->setLabelFormat("%.0f");
  c.yAxis->setLabelFormat("%.2f");
  chart->addAxis(c.xAxis, Qt::AlignBottom);
  chart->addAxis(c.yAxis, Qt::AlignLeft);

  c.call = new QLineSeries(chart);    c.call->setName("Call");
  c.put  = new QLineSeries(chart);    c.put ->setName("Put");
  c.spot = new QScatterSeries(chart); c.spot->setName("Current spot");

  c.call->setPen(QPen(C_CALL, 2));
  c.put ->setPen(QPen(C_PUT, 2));
  c.spot->setMarkerShape(QScatterSeries::MarkerShapeCircle);
  c.spot->setMarkerSize(9.0);
  c.spot->setColor(C_SPOT);
  c.spot->setBorderColor(C_SPOT);

  for (QXYSeries* s : {static_cast<QXYSeries*>(c.call), static_cast<QXYSeries*>(c.put),
                       static_cast<QXYSeries*>(c.spot)}) {
    chart->addSeries(s);
    s->attachAxis(c.xAxis);
    s->attachAxis(c.yAxis);
  }

  c.view = new QChartView(chart, placeholder);
  c.view->setRenderHint(QPainter::Antialiasing);
  c.view->setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Expanding);

  auto* lay = new QVBoxLayout(placeholder);
  lay->setContentsMargins(0,0,0,0);
  lay->addWidget(c.view);
}

void MainWindow::updateCharts(const bse::market::OptionParams& p) {
  const double sLo = S_MIN_REL * p.K;
  const double sHi = std::max(S_MAX_REL * p.K, 1.1 * p.S);

  QVector<QPointF> callPx, putPx, callDl, putDl;
  callPx.reserve(N_CURVE_POINTS); putPx.reserve(N_CURVE_POINTS);
  callDl.reserve(N_CURVE_POINTS); putDl.reserve(N_CURVE_POINTS);

  double yMax = 0.0;
  for (int i = 0; i < N_CURVE_POINTS; ++i) {
    const double S = sLo + (sHi - sLo) * i / (N_CURVE_POINTS - 1);
    bse::market::OptionParams q = p;
    q.S = S;
    const auto rep = bse::pricing::evaluate_bs(q);
    callPx.append(QPointF(S, rep.call_price));
    putPx .append(QPointF(S, rep.put_price));
    callDl.append(QPointF(S, rep.call_delta));
    putDl .append(QPointF(S, rep.put_delta));
    yMax = std::max({yMax, rep.call_price, rep.put_price});
  }

  priceChart_.call->replace(callPx);
  priceChart_.put ->replace(putPx);
  deltaChart_.call->replace(callDl);
  deltaChart_.put ->replace(putDl);

  const auto rep = bse::pricing::evaluate_bs(p);
  priceChart_.spot->replace(QVector<QPointF>{{p.S, rep.call_price}, {p.S, rep.put_price}});
  deltaChart_.spot->replace(QVector<QPointF>{{p.S, rep.call_delta}, {p.S, rep.put_delta}});

  priceChart_.xAxis->setRange(sLo, sHi);
  priceChart_.yAxis->setRange(0.0, std::max(1.0, 1.05 * yMax));
  deltaChart_.xAxis->setRange(sLo, sHi);
  deltaChart_.yAxis->setRange(-1.0, 1.0);
}

void MainWindow::clearCharts() {
  for (CurveChart* c : {&priceChart_, &deltaChart_}) {
    if (c->call) c->call->clear();
    if (c->put)  c->put ->clear();
    if (c->spot) c->spot->clear();
  }
}

// ================= Paramètres JSON =================

QJsonObject MainWindow::makeParamsJson() const {
  const bse::market::OptionParams p = currentParams();
  QJsonObject params{
    {"S",     p.S},
    {"K",     p.K},
    {"r",     p.r},
    {"sigma", p.sigma},
    {"T",     p.T}
  };
  QJsonObject root;
  root["params"] = params;
  return root;
}

bool MainWindow::loadParamsJson(const QJsonObject& root) {
  const QJsonObject m = root["params"].toObject();
  if (m.isEmpty()) return false;

  // Clés absentes : on garde la valeur courante
  bse::market::OptionParams p = currentParams();
  p.S     = m["S"].toDouble(p.S);
  p.K     = m["K"].toDouble(p.K);
  p.r     = m["r"].toDouble(p.r);
  p.sigma = m["sigma"].toDouble(p.sigma);
  p.T     = m["T"].toDouble(p.T);
  setParams(p);
  return true;
}

void MainWindow::onSaveParams() {
  const QString suggested = currentFile_.isEmpty()
      ? QDir::current().absoluteFilePath("params.json") : currentFile_;
  const QString fn = QFileDialog::getSaveFileName(
      this, tr("Save parameters"), suggested, tr("JSON (*.json)"));
  if (fn.isEmpty()) return;

  QFile f(fn);
  if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
    QMessageBox::warning(this, tr("Save parameters"), f.errorString());
    return;
  }
  QJsonDocument doc(makeParamsJson());
  f.write(doc.toJson(QJsonDocument::Indented));
  f.close();
  setCurrentFile(fn, /*dirty*/false);
  qDebug() << "[UI] parameters saved to" << fn;
  statusBar()->showMessage(tr("Parameters saved to %1").arg(QDir::toNativeSeparators(fn)), 2000);
}

void MainWindow::onLoadParams() {
  const QString fn = QFileDialog::getOpenFileName(
      this, tr("Load parameters"), QDir::currentPath(), tr("JSON (*.json)"));
  if (fn.isEmpty()) return;

  QFile f(fn);
  if (!f.open(QIODevice::ReadOnly)) {
    QMessageBox::warning(this, tr("Load parameters"), f.errorString());
    return;
  }
  const QByteArray bytes = f.readAll(); f.close();
  const QJsonDocument doc = QJsonDocument::fromJson(bytes);
  if (!doc.isObject() || !loadParamsJson(doc.object())) {
    QMessageBox::warning(this, tr("Load parameters"), tr("Invalid parameter file."));
    return;
  }
  setCurrentFile(fn, /*dirty*/false);
  qDebug() << "[UI] parameters loaded from" << fn;
}

QString MainWindow::fileDisplayName() const {
  if (currentFile_.isEmpty()) return "No file";
  return QFileInfo(currentFile_).fileName() + (dirty_ ? " *" : "");
}

void MainWindow::setCurrentFile(const QString& path, bool dirty) {
  currentFile_ = path;
  dirty_ = dirty;
  if (fileLabel_) fileLabel_->setText(fileDisplayName());

  QString base = "BSE Calculator";
  if (!currentFile_.isEmpty())
    base += " — " + fileDisplayName();
  setWindowTitle(base);
}

void MainWindow::markDirty() {
  if (dirty_ || currentFile_.isEmpty()) return;
  setCurrentFile(currentFile_, true);
}
