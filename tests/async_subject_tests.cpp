#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <ripple/ripple.hpp>

using namespace ripple;

using trace = std::vector<std::string>;

static observer_ptr<std::string> recorder(trace& out) {
  return make_event_observer<std::string>([&out](const event<std::string>& e){
    out.push_back(to_string(e));
  });
}

int main() {
  // 1) a, b, c, completed: early and late subscribers both see only c, completed
  {
    async_subject<std::string> subj;
    trace early, middle, late;

    auto d1 = subj.as_observable().subscribe(recorder(early));
    subj.on_next("a");
    subj.on_next("b");
    auto d2 = subj.as_observable().subscribe(recorder(middle));
    subj.on_next("c");
    assert(early.empty() && middle.empty() && "nothing is forwarded before completion");

    subj.on_completed();
    auto d3 = subj.as_observable().subscribe(recorder(late));

    const trace expected{"next(c)", "completed"};
    assert(early == expected);
    assert(middle == expected);
    assert(late == expected);
  }

  // 2) no value, completed: completed only
  {
    async_subject<std::string> subj;
    trace early, late;
    auto d1 = subj.as_observable().subscribe(recorder(early));
    subj.on_completed();
    auto d2 = subj.as_observable().subscribe(recorder(late));
    assert((early == trace{"completed"}));
    assert((late == trace{"completed"}));
  }

  // 3) a, error: error only, now and later
  {
    async_subject<std::string> subj;
    trace early, late;
    auto d1 = subj.as_observable().subscribe(recorder(early));
    subj.on_next("a");
    subj.on_error(std::make_exception_ptr(std::runtime_error("e")));
    subj.on_completed();
    auto d2 = subj.as_observable().subscribe(recorder(late));
    assert((early == trace{"error(e)"}));
    assert((late == trace{"error(e)"}));
  }

  // 4) a subscriber disposed before completion gets nothing
  {
    async_subject<std::string> subj;
    trace gone;
    auto d = subj.as_observable().subscribe(recorder(gone));
    subj.on_next("a");
    d.dispose();
    subj.on_completed();
    assert(gone.empty());
  }

  std::cout << "[async_subject_tests] OK\n";
  return 0;
}
