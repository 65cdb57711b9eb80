#include <QApplication>

#include "MainWindow.hpp"

int main(int argc, char** argv) {
  QApplication app(argc, argv);
  QApplication::setApplicationName("BSE Calculator");

  MainWindow w;
  w.resize(1100, 640);
  w.show();
  return app.exec();
}
