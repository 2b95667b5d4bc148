#include <ripple/ripple.hpp>
#include <chrono>
#include <iostream>
#include <latch>
#include <mutex>
#include <string>
#include <thread>

using namespace ripple;
using namespace std::chrono_literals;

static std::mutex out_m;

static std::string context_name() {
  auto name = current_scheduler_name();
  return name.empty() ? "<caller>" : name;
}

// Emits one value where it is subscribed, and a second one from the main context.
static observable<std::string> make_source(std::shared_ptr<main_scheduler> ui) {
  return observable<std::string>::create([ui](observer_ptr<std::string> o){
    {
      std::lock_guard<std::mutex> lock(out_m);
      std::cout << "Observable context is: " << context_name() << "\n";
    }
    o->on_next("Test 1");
    ui->schedule([o]{ o->on_next("Test 2"); });
    return disposable{};
  });
}

static observer_ptr<std::string> make_printer() {
  return make_event_observer<std::string>([](const event<std::string>& e){
    std::lock_guard<std::mutex> lock(out_m);
    std::cout << "Observer context is: " << context_name() << "\n\t\t" << to_string(e) << "\n";
  });
}

int main() {
  // Schedulers outlive the bag so they are torn down here, not on their own threads.
  auto ui = main_scheduler::instance();
  auto subscribe_queue = std::make_shared<serial_scheduler>("subscribe-queue");
  auto observe_queue = std::make_shared<concurrent_scheduler>(2, "observe-queue");
  dispose_bag bag;

  std::cout << "-- subscribe_on\n";
  {
    std::latch subscribed(1);
    (make_source(ui) | subscribe_on(subscribe_queue))
      .subscribe(make_printer()) | disposed_by(bag);
    subscribe_queue->schedule([&]{ subscribed.count_down(); });
    subscribed.wait();
    ui->drain();
  }

  std::cout << "-- observe_on\n";
  {
    (make_source(ui) | observe_on(observe_queue))
      .subscribe(make_printer()) | disposed_by(bag);
    ui->drain();
    std::this_thread::sleep_for(50ms);
  }

  bag.dispose();
  return 0;
}
