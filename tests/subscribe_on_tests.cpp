#include <cassert>
#include <iostream>
#include <thread>
#include <latch>
#include <stdexcept>
#include <string>
#include <vector>

#include <ripple/ripple.hpp>

using namespace ripple;

// A synchronous observable that, when subscribed:
//    - emits the current thread_id,
//    - completes
static observable<std::thread::id> emit_current_thread_then_done() {
  return observable<std::thread::id>::create([](observer_ptr<std::thread::id> o){
    o->on_next(std::this_thread::get_id());
    o->on_completed();
    return disposable{};
  });
}

static std::thread::id worker_id(scheduler& s) {
  std::thread::id id{};
  std::latch done(1);
  s.schedule([&]{ id = std::this_thread::get_id(); done.count_down(); });
  done.wait();
  return id;
}

int main() {
  // 1) The subscription is actually executed in the scheduler thread
  {
    auto bg = std::make_shared<serial_scheduler>("subscribe-queue");
    std::thread::id got{};
    std::latch completed(1);

    auto sub = (emit_current_thread_then_done()
      | subscribe_on(bg)
    ).subscribe(
      [&](const std::thread::id& id){ got = id; },
      nullptr,
      [&]{ completed.count_down(); }
    );

    completed.wait();
    assert(got == worker_id(*bg) && "subscribe_on: emissions during subscribe must run on scheduler thread");
  }

  // 2) Unsubscribe before actually subscribing - nothing should fly in
  {
    main_scheduler ui;
    bool subscribed = false;
    bool got = false;

    auto src = observable<int>::create([&](observer_ptr<int> o){
      subscribed = true;
      o->on_next(42);
      return disposable{};
    });

    disposable sub = (src | subscribe_on(ui)).subscribe([&](const int&){ got = true; });
    // We unsubscribe before the queue was served
    sub.dispose();
    ui.drain();

    assert(!subscribed && "the producer must not be started after an early unsubscribe");
    assert(!got && "no emissions expected after early unsubscribe");
  }

  // 3) Errors from the relocated subscribe context
  {
    serial_scheduler bg;
    std::thread::id tid_emit{};
    std::string reason;
    std::latch failed(1);

    auto src = observable<int>::create([](observer_ptr<int> o){
      o->on_next(1);
      o->on_error(std::make_exception_ptr(std::runtime_error("boom")));
      return disposable{};
    });

    auto sub = (src | subscribe_on(bg)).subscribe(
      [&](const int&){ tid_emit = std::this_thread::get_id(); },
      [&](std::exception_ptr e){ reason = describe(e); failed.count_down(); }
    );

    failed.wait();
    assert(tid_emit == worker_id(bg) && "on_next should run on scheduler thread (since it happens during subscribe)");
    assert(reason == "boom");
  }

  // 4) Only subscription moves: later emissions stay on the producer's context
  {
    main_scheduler ui("ui");
    publish_subject<int> subj;
    std::vector<std::string> contexts;

    auto sub = (subj.as_observable() | subscribe_on(ui)).subscribe([&](const int&){
      contexts.push_back(current_scheduler_name());
    });
    assert(!subj.has_observers() && "registration waits for the main context");
    ui.drain();
    assert(subj.has_observers());

    subj.on_next(1);
    assert((contexts == std::vector<std::string>{""}));
  }

  // 5) Disposing after subscribe happened releases the upstream
  {
    main_scheduler ui;
    publish_subject<int> subj;
    auto sub = (subj.as_observable() | subscribe_on(ui)).subscribe([](const int&){});
    ui.drain();
    assert(subj.has_observers());
    sub.dispose();
    assert(!subj.has_observers());
  }

  std::cout << "[subscribe_on_tests] OK\n";
  return 0;
}
