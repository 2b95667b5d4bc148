#include <cassert>
#include <iostream>
#include <ripple/ripple.hpp>
#include <stdexcept>
#include <string>

using namespace ripple;

int main() {
  // A source that emits 1 and then fails
  auto src = observable<int>::create([](observer_ptr<int> o) {
    o->on_next(1);
    o->on_error(std::make_exception_ptr(std::runtime_error("boom")));
    return disposable{};
  });

  int sum = 0;
  std::string reason;
  auto sub = src.subscribe([&](const int& v) { sum += v; },
                           [&](std::exception_ptr e) { reason = describe(e); });

  sub.dispose();
  assert(sum == 1 && "Only the first on_next should pass");
  assert(reason == "boom" && "on_error must carry the producer failure");

  // The failure travels through a subject to every subscriber
  publish_subject<int> subj;
  int errors = 0;
  auto a = subj.as_observable().subscribe([](const int&){}, [&](std::exception_ptr){ ++errors; });
  auto b = subj.as_observable().subscribe([](const int&){}, [&](std::exception_ptr){ ++errors; });
  auto link = src.subscribe(subj.as_observer());
  assert(errors == 2);
  assert(subj.is_closed());

  std::cout << "[error_propagation_tests] OK\n";
  return 0;
}
