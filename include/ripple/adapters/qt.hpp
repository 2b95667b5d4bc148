#pragma once

#include <QObject>
#include <QCoreApplication>
#include <QPointer>
#include <QMetaObject>
#include <QTimer>

#include <functional>
#include <memory>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

#include <ripple/core/scheduler.hpp>
#include <ripple/core/observable.hpp>
#include <ripple/core/disposable.hpp>
#include <ripple/core/pipeline.hpp>
#include <ripple/ops/observe_on.hpp>

namespace ripple {
namespace qt {

// ====================================================================================
// 1) qt_scheduler - runs work on the thread of a QObject via QMetaObject::invokeMethod.
//    Built on the application object it is the UI main scheduler:
//    ripple::set_default_main_scheduler(std::make_shared<ripple::qt::qt_scheduler>());
// ====================================================================================
class qt_scheduler : public scheduler {
public:
  explicit qt_scheduler(QObject* target = QCoreApplication::instance(), std::string name = "qt-main")
  : scheduler(std::move(name)), target_(target ? target : QCoreApplication::instance()) {}

  QObject* target() const { return target_; }

protected:
  void post(std::function<void()> f) override {
    QObject* tgt = target_;
    if (!tgt) { f(); return; }

    auto task = [this, fn = std::move(f)]() mutable {
      detail::context_scope scope(this);
      fn();
    };
#if QT_VERSION >= QT_VERSION_CHECK(5, 10, 0)
    QMetaObject::invokeMethod(tgt, std::move(task), Qt::QueuedConnection);
#else
    QTimer::singleShot(0, tgt, std::move(task));
#endif
  }

private:
  QPointer<QObject> target_;
};

// ====================================================================================
// 2) from_signal / from_signal1 - Qt signal -> observable.
//    Destruction of the sender completes the stream.
// ====================================================================================
template <typename Sender, typename... Args>
inline observable<std::tuple<std::decay_t<Args>...>>
from_signal(Sender* sender, void (Sender::*signal)(Args...)) {
  using value_type = std::tuple<std::decay_t<Args>...>;
  return observable<value_type>::create([sender, signal](observer_ptr<value_type> o) {
    QPointer<Sender> guard(sender);
    if (!guard) {
      o->on_completed();
      return disposable{};
    }

    auto connection = std::make_shared<QMetaObject::Connection>();
    auto destroyed = std::make_shared<QMetaObject::Connection>();

    *connection = QObject::connect(
      sender, signal, sender,
      [o](Args... args){
        o->on_next(value_type(std::forward<Args>(args)...));
      },
      Qt::QueuedConnection
    );

    *destroyed = QObject::connect(sender, &QObject::destroyed, [o]{ o->on_completed(); });

    return disposable([connection, destroyed]{
      QObject::disconnect(*connection);
      QObject::disconnect(*destroyed);
    });
  });
}

// Signal with one argument -> observable<T>
template <typename Sender, typename T>
inline observable<std::decay_t<T>>
from_signal1(Sender* sender, void (Sender::*signal)(T)) {
  using U = std::decay_t<T>;
  auto tuples = from_signal(sender, signal);
  return observable<U>::create([tuples](observer_ptr<U> o) {
    return tuples.subscribe(
      [o](const std::tuple<U>& tup){ o->on_next(std::get<0>(tup)); },
      [o](std::exception_ptr e){ o->on_error(e); },
      [o]{ o->on_completed(); });
  });
}

// ====================================================================================
// 3) observe_on(QObject*) - sugar over observe_on(shared_ptr<scheduler>)
// ====================================================================================
inline auto observe_on(QObject* target) {
  return [target](const auto& src){
    auto sched = std::make_shared<qt_scheduler>(target);
    return src | ::ripple::observe_on(sched);
  };
}

} // namespace qt
} // namespace ripple
