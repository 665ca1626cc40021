#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/subscription/event_queue.hpp"
#include "internal/subscription/router_event_hub.hpp"
#include "support/fake_service_browser.hpp"
#include "support/test_vectors.hpp"

namespace {

using threadnet::discovery::RouterEvent;
using threadnet::subscription::EventQueue;
using threadnet::subscription::RouterEventHub;
using threadnet::testing::FakeServiceBrowser;
using threadnet::testing::GoogleRouter;
using threadnet::testing::HassRouter;

constexpr auto kNoWait = std::chrono::milliseconds(0);

const std::string kHassName   = "HomeAssistant OpenThreadBorderRouter #0BBF._meshcop._udp.local.";
const std::string kGoogleName = "Google-Nest-Hub-#ABED._meshcop._udp.local.";

std::vector<RouterEvent> Drain(EventQueue& queue) {
  std::vector<RouterEvent> events;
  RouterEvent              event;
  while (queue.Pop(&event, kNoWait) == EventQueue::PopStatus::kEvent) {
    events.push_back(event);
  }
  return events;
}

void TestQueueOverflowClosesAfterDraining() {
  EventQueue queue(2);
  assert(queue.Push(RouterEvent::Removed("a")));
  assert(queue.Push(RouterEvent::Removed("b")));
  assert(!queue.Push(RouterEvent::Removed("c")));
  assert(queue.Overflowed());
  assert(queue.Closed());
  assert(!queue.Push(RouterEvent::Removed("d")));

  RouterEvent event;
  assert(queue.Pop(&event, kNoWait) == EventQueue::PopStatus::kEvent && event.key == "a");
  assert(queue.Pop(&event, kNoWait) == EventQueue::PopStatus::kEvent && event.key == "b");
  assert(queue.Pop(&event, kNoWait) == EventQueue::PopStatus::kClosed);
}

void TestQueuePopTimesOutAndWakesOnPush() {
  EventQueue  queue(4);
  RouterEvent event;
  assert(queue.Pop(&event, std::chrono::milliseconds(10)) == EventQueue::PopStatus::kTimeout);

  std::thread producer([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.Push(RouterEvent::Removed("late"));
  });
  assert(queue.Pop(&event, std::chrono::seconds(5)) == EventQueue::PopStatus::kEvent);
  assert(event.key == "late");
  producer.join();

  queue.Close();
  assert(queue.Pop(&event, std::chrono::seconds(5)) == EventQueue::PopStatus::kClosed);
  assert(!queue.Overflowed());
}

void TestFirstSubscriberStartsAndLastStopsDiscovery() {
  auto browser = std::make_shared<FakeServiceBrowser>();
  auto hub     = RouterEventHub::Create(browser, {}, 16);
  assert(!hub->controller()->IsSubscribed());

  auto first  = hub->Subscribe();
  auto second = hub->Subscribe();
  assert(first.id != second.id);
  assert(hub->controller()->IsSubscribed());
  assert(browser->AddCalls() == 1);

  hub->Unsubscribe(first.id);
  assert(first.queue->Closed());
  assert(hub->controller()->IsSubscribed());

  hub->Unsubscribe(second.id);
  assert(!hub->controller()->IsSubscribed());
  assert(browser->RemoveCalls() == 1);
  assert(hub->SubscriberCount() == 0);

  hub->Unsubscribe(second.id);
  assert(browser->RemoveCalls() == 1);
}

void TestEventsFanOutToEverySubscriber() {
  auto browser = std::make_shared<FakeServiceBrowser>();
  auto hub     = RouterEventHub::Create(browser, {}, 16);
  auto a       = hub->Subscribe();
  auto b       = hub->Subscribe();

  browser->Add(kHassName);
  browser->CompleteFor(kHassName, HassRouter());
  browser->Remove(kHassName);

  for (auto* queue : {a.queue.get(), b.queue.get()}) {
    auto events = Drain(*queue);
    assert(events.size() == 2);
    assert(events[0].kind == RouterEvent::Kind::kDiscovered);
    assert(events[0].key == "e60fc7c186212ce5");
    assert(events[1].kind == RouterEvent::Kind::kRemoved);
  }
  assert(hub->KnownRouters().empty());
}

void TestLateSubscriberReceivesKnownRouters() {
  auto browser = std::make_shared<FakeServiceBrowser>();
  auto hub     = RouterEventHub::Create(browser, {}, 16);
  auto early   = hub->Subscribe();

  browser->Add(kHassName);
  browser->CompleteFor(kHassName, HassRouter());
  browser->Add(kGoogleName);
  browser->CompleteFor(kGoogleName, GoogleRouter());
  assert(hub->KnownRouters().size() == 2);

  auto late   = hub->Subscribe();
  auto events = Drain(*late.queue);
  assert(events.size() == 2);
  assert(events[0].kind == RouterEvent::Kind::kDiscovered && events[0].key == "e60fc7c186212ce5");
  assert(events[1].kind == RouterEvent::Kind::kDiscovered && events[1].key == "9e75e256f61409a3");
  assert(events[1].data.brand == std::optional<std::string>("google"));

  // The controller is not restarted for later subscribers.
  assert(browser->AddCalls() == 1);
}

void TestSlowSubscriberOverflowsAlone() {
  auto browser = std::make_shared<FakeServiceBrowser>();
  auto hub     = RouterEventHub::Create(browser, {}, 2);
  auto slow    = hub->Subscribe();

  for (int i = 0; i < 3; ++i) {
    browser->Update(kHassName);
    browser->CompleteFor(kHassName, HassRouter());
  }
  assert(slow.queue->Overflowed());
  assert(Drain(*slow.queue).size() == 2);

  // A subscriber that keeps up is unaffected by another's overflow.
  auto healthy = hub->Subscribe();
  Drain(*healthy.queue);
  browser->Update(kHassName);
  browser->CompleteFor(kHassName, HassRouter());
  assert(Drain(*healthy.queue).size() == 1);
  assert(!healthy.queue->Closed());

  hub->Unsubscribe(slow.id);
  assert(hub->controller()->IsSubscribed());
}

void TestFailedStartRollsBackSubscription() {
  auto browser               = std::make_shared<FakeServiceBrowser>();
  browser->fail_add_listener = true;
  auto hub                   = RouterEventHub::Create(browser, {}, 16);

  bool threw = false;
  try {
    hub->Subscribe();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(hub->SubscriberCount() == 0);

  browser->fail_add_listener = false;
  auto subscription          = hub->Subscribe();
  assert(hub->controller()->IsSubscribed());
  hub->Unsubscribe(subscription.id);
}

void TestShutdownClosesEverySubscription() {
  auto browser = std::make_shared<FakeServiceBrowser>();
  auto hub     = RouterEventHub::Create(browser, {}, 16);
  auto a       = hub->Subscribe();
  auto b       = hub->Subscribe();

  hub->Shutdown();
  assert(a.queue->Closed() && !a.queue->Overflowed());
  assert(b.queue->Closed());
  assert(hub->SubscriberCount() == 0);
  assert(!hub->controller()->IsSubscribed());
  assert(browser->ListenerCount() == 0);
}

} // namespace

int main() {
  TestQueueOverflowClosesAfterDraining();
  TestQueuePopTimesOutAndWakesOnPush();
  TestFirstSubscriberStartsAndLastStopsDiscovery();
  TestEventsFanOutToEverySubscriber();
  TestLateSubscriberReceivesKnownRouters();
  TestSlowSubscriberOverflowsAlone();
  TestFailedStartRollsBackSubscription();
  TestShutdownClosesEverySubscription();
  std::cout << "threadnet_manager_unit_router_event_hub: pass\n";
  return 0;
}
