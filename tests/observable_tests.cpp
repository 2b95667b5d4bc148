#include <atomic>
#include <cassert>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <ripple/ripple.hpp>

using namespace ripple;

int main() {
  set_violation_policy(violation_policy::log_and_ignore);

  // 1) just: values in order, then completed
  {
    std::vector<std::string> seen;
    auto sub = just<int>(1, 2, 3).subscribe(make_event_observer<int>([&](const event<int>& e){
      seen.push_back(to_string(e));
    }));
    assert((seen == std::vector<std::string>{"next(1)", "next(2)", "next(3)", "completed"}));
  }

  // 2) empty / never / error
  {
    bool done = false, got_err = false, got_next = false;
    auto s1 = empty<int>().subscribe([&](const int&){ got_next = true; }, nullptr, [&]{ done = true; });
    auto s2 = never<int>().subscribe([&](const int&){ got_next = true; });
    auto s3 = error<int>(std::make_exception_ptr(std::runtime_error("x")))
      .subscribe([&](const int&){ got_next = true; }, [&](std::exception_ptr){ got_err = true; });
    assert(done && got_err && !got_next);
  }

  // 3) Grammar: nothing after a terminal event reaches the observer
  {
    std::vector<std::string> warnings;
    set_log_sink([&](log_level lvl, std::string_view msg){
      if (lvl == log_level::warn) warnings.emplace_back(msg);
    });

    auto rogue = observable<int>::create([](observer_ptr<int> o){
      o->on_next(1);
      o->on_completed();
      o->on_next(2);
      o->on_completed();
      return disposable{};
    });

    std::vector<std::string> seen;
    auto sub = rogue.subscribe(make_event_observer<int>([&](const event<int>& e){
      seen.push_back(to_string(e));
    }));

    set_log_sink({});
    assert((seen == std::vector<std::string>{"next(1)", "completed"}));
    assert(warnings.size() == 2 && "each violating event is reported");
  }

  // 4) Dispose stops delivery and runs the producer's teardown once
  {
    observer_ptr<int> captured;
    int teardowns = 0;
    auto src = observable<int>::create([&](observer_ptr<int> o){
      captured = o;
      return disposable([&]{ ++teardowns; });
    });

    std::vector<int> got;
    auto sub = src.subscribe([&](const int& v){ got.push_back(v); });
    captured->on_next(1);
    sub.dispose();
    sub.dispose();
    captured->on_next(2);
    assert((got == std::vector<int>{1}));
    assert(teardowns == 1);
  }

  // 5) Terminal event releases the producer
  {
    observer_ptr<int> captured;
    int teardowns = 0;
    auto src = observable<int>::create([&](observer_ptr<int> o){
      captured = o;
      return disposable([&]{ ++teardowns; });
    });
    auto sub = src.subscribe([](const int&){});
    captured->on_completed();
    assert(teardowns == 1);
    sub.dispose();
    assert(teardowns == 1);
  }

  // 6) Emission from several threads is serialized per subscription
  {
    observer_ptr<int> captured;
    auto src = observable<int>::create([&](observer_ptr<int> o){
      captured = o;
      return disposable{};
    });

    std::atomic<int> in_flight{0};
    std::atomic<bool> overlap{false};
    int count = 0; // guarded by the serialization under test
    auto sub = src.subscribe([&](const int&){
      if (in_flight.fetch_add(1) != 0) overlap = true;
      ++count;
      std::this_thread::yield();
      in_flight.fetch_sub(1);
    });

    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
      producers.emplace_back([&]{
        for (int i = 0; i < 500; ++i) captured->on_next(i);
      });
    }
    for (auto& t : producers) t.join();

    assert(!overlap && "deliveries to one observer must not overlap");
    assert(count == 2000);
  }

  // 7) Early teardown: a synchronous producer that completes before returning
  {
    int teardowns = 0;
    auto src = observable<int>::create([&](observer_ptr<int> o){
      o->on_completed();
      return disposable([&]{ ++teardowns; });
    });
    bool done = false;
    auto sub = src.subscribe([](const int&){}, nullptr, [&]{ done = true; });
    assert(done);
    assert(teardowns == 1 && "teardown returned after completion runs at once");
  }

  std::cout << "[observable_tests] OK\n";
  return 0;
}
