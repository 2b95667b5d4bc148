#include <ripple/ripple.hpp>
#include <iostream>
#include <string>

using namespace ripple;

static observer_ptr<std::string> printer(const std::string& tag) {
  return make_event_observer<std::string>([tag](const event<std::string>& e){
    std::cout << tag << " " << to_string(e) << "\n";
  });
}

int main() {
  dispose_bag bag;

  std::cout << "-- publish_subject\n";
  publish_subject<std::string> pub;
  pub.as_observable().subscribe(printer("1:")) | disposed_by(bag);
  pub.on_next("x");
  pub.on_next("y");
  pub.as_observable().subscribe(printer("2:")) | disposed_by(bag);
  pub.on_next("z");
  pub.on_completed();

  std::cout << "-- replay_subject(1)\n";
  auto rep = replay_subject<std::string>::create(1);
  rep.as_observable().subscribe(printer("1:")) | disposed_by(bag);
  rep.on_next("x");
  rep.on_next("y");
  rep.as_observable().subscribe(printer("2:")) | disposed_by(bag);
  rep.on_next("z");

  std::cout << "-- behavior_subject\n";
  behavior_subject<std::string> beh("initial");
  beh.as_observable().subscribe(printer("1:")) | disposed_by(bag);
  beh.on_next("x");
  beh.as_observable().subscribe(printer("2:")) | disposed_by(bag);
  beh.on_next("y");

  std::cout << "-- async_subject\n";
  async_subject<std::string> asy;
  asy.as_observable().subscribe(printer("1:")) | disposed_by(bag);
  asy.on_next("a");
  asy.on_next("b");
  asy.on_next("c");
  asy.on_completed();
  asy.as_observable().subscribe(printer("2:")) | disposed_by(bag);

  return 0;
}
