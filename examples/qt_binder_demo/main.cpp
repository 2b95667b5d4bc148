
#include <QApplication>
#include <QLineEdit>
#include <QLabel>
#include <QVBoxLayout>
#include <QWidget>

#include <ripple/ripple.hpp>
#include <ripple/adapters/qt.hpp>

#include <memory>
#include <string>

using namespace ripple;

int main(int argc, char** argv) {
  QApplication app(argc, argv);

  // The Qt event loop is the main context for every binder below.
  set_default_main_scheduler(std::make_shared<ripple::qt::qt_scheduler>(&app));

  // ----- UI -----
  QWidget window;
  window.setWindowTitle("ripple × Qt | Binder Demo");

  auto* input  = new QLineEdit;
  auto* echo   = new QLabel("type something…");
  auto* length = new QLabel("length: 0");

  auto* layout = new QVBoxLayout;
  layout->addWidget(new QLabel("Text:"));
  layout->addWidget(input);
  layout->addSpacing(8);
  layout->addWidget(echo);
  layout->addWidget(length);
  window.setLayout(layout);
  window.resize(360, 160);
  window.show();

  // ----- Reactive: signal -> control property -> binders on the UI thread -----
  control_property<std::string> text("");

  dispose_bag bag;

  auto texts = ripple::qt::from_signal1(input, &QLineEdit::textChanged);
  auto strings = observable<std::string>::create([texts](observer_ptr<std::string> o){
    return texts.subscribe([o](const QString& s){ o->on_next(s.trimmed().toStdString()); });
  });
  text.bind(strings) | disposed_by(bag);

  text.changes().subscribe(make_binder<std::string>([echo](const std::string& s){
    echo->setText(QString::fromStdString("[echo] " + s));
  })) | disposed_by(bag);

  text.changes().subscribe(make_binder<std::string>([length](const std::string& s){
    length->setText(QString("length: %1").arg(static_cast<int>(s.size())));
  })) | disposed_by(bag);

  return app.exec();
}
