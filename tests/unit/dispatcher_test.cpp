#include "internal/dispatch/dispatcher.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/store/repository_action_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using actions::dispatch::Dispatcher;
using actions::dispatch::DispatcherOptions;
using actions::dispatch::RunLoopState;
using actions::dispatch::RunLoopStateName;
using actions::model::Action;
using actions::model::ActionFields;
using actions::model::ActionId;
using actions::model::ActionKind;
using actions::model::ReminderExtra;
namespace util = actions::util;
using namespace std::chrono_literals;

constexpr auto kShortHorizon = 200ms;
constexpr auto kBackoff      = 50ms;

DispatcherOptions TestOptions() {
  DispatcherOptions options;
  options.short_horizon       = kShortHorizon;
  options.store_retry_backoff = kBackoff;
  return options;
}

Action MakeReminder(std::chrono::milliseconds due_in, const std::string& content) {
  ActionFields fields;
  fields.kind       = ActionKind::kReminder;
  fields.author_id  = 100;
  fields.channel_id = 200;
  fields.message_id = 300;
  fields.guild_id   = 400;
  fields.trigger_at = fields.created_at + due_in;
  fields.extra      = ReminderExtra{content};
  return Action(std::move(fields));
}

// Overdue action as found in the store after downtime.
Action MakeOverdue(std::chrono::milliseconds overdue_by, const std::string& content) {
  ActionFields fields;
  fields.kind       = ActionKind::kReminder;
  fields.author_id  = 100;
  fields.channel_id = 200;
  fields.message_id = 300;
  fields.created_at = util::Now() - overdue_by - 1min;
  fields.trigger_at = util::Now() - overdue_by;
  fields.extra      = ReminderExtra{content};
  return Action(std::move(fields));
}

std::string ContentOf(const Action& action) {
  return std::get<ReminderExtra>(action.Extra()).content;
}

bool WaitUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = 3s) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) return true;
    std::this_thread::sleep_for(5ms);
  }
  return predicate();
}

class RecordingNotifier final : public actions::notify::Notifier {
 public:
  void Notify(const Action& action) override {
    std::lock_guard lock(mutex_);
    fired_.push_back(action);
    if (throw_next_) {
      throw_next_ = false;
      throw std::runtime_error("downstream unavailable");
    }
  }

  std::vector<Action> Fired() {
    std::lock_guard lock(mutex_);
    return fired_;
  }

  std::vector<std::string> Contents() {
    std::vector<std::string> out;
    for (const auto& action : Fired()) out.push_back(ContentOf(action));
    return out;
  }

  std::size_t Count() {
    std::lock_guard lock(mutex_);
    return fired_.size();
  }

  void ThrowOnNext() {
    std::lock_guard lock(mutex_);
    throw_next_ = true;
  }

 private:
  std::mutex          mutex_;
  std::vector<Action> fired_;
  bool                throw_next_ = false;
};

// Memory-backed store that counts calls and can fail on demand.
class InstrumentedStore final : public actions::store::ActionStore {
 public:
  InstrumentedStore() : inner_(std::make_shared<actions::db::memory::MemoryRepository>()) {
  }

  std::optional<Action> FetchSoonest() override {
    ++fetches;
    if (fail_fetches > 0) {
      --fail_fetches;
      throw util::StoreUnavailable("fetch: injected outage");
    }
    return inner_.FetchSoonest();
  }

  Action Insert(const Action& action) override {
    if (fail_inserts > 0) {
      --fail_inserts;
      throw util::StoreUnavailable("insert: injected outage");
    }
    ++inserts;
    return inner_.Insert(action);
  }

  void Delete(ActionId id) override {
    if (fail_deletes > 0) {
      --fail_deletes;
      throw util::StoreUnavailable("delete: injected outage");
    }
    ++deletes;
    inner_.Delete(id);
  }

  std::vector<Action> List() override {
    return inner_.List();
  }

  std::atomic<int> fetches{0};
  std::atomic<int> inserts{0};
  std::atomic<int> deletes{0};
  std::atomic<int> fail_fetches{0};
  std::atomic<int> fail_inserts{0};
  std::atomic<int> fail_deletes{0};

 private:
  actions::store::RepositoryActionStore inner_;
};

// Blocks every delivery and records how late each one started.
class SlowNotifier final : public actions::notify::Notifier {
 public:
  explicit SlowNotifier(std::chrono::milliseconds delay) : delay_(delay) {
  }

  void Notify(const Action& action) override {
    {
      std::lock_guard lock(mutex_);
      lateness_.push_back(std::chrono::duration_cast<std::chrono::milliseconds>(util::Now() - action.TriggerAt()));
      contents_.insert(ContentOf(action));
    }
    std::this_thread::sleep_for(delay_);
  }

  std::vector<std::chrono::milliseconds> Lateness() {
    std::lock_guard lock(mutex_);
    return lateness_;
  }

  bool Entered(const std::string& content) {
    std::lock_guard lock(mutex_);
    return contents_.count(content) > 0;
  }

 private:
  std::chrono::milliseconds              delay_;
  std::mutex                             mutex_;
  std::vector<std::chrono::milliseconds> lateness_;
  std::set<std::string>                  contents_;
};

struct Fixture {
  explicit Fixture(DispatcherOptions options = TestOptions()) : dispatcher(store, notifier, options) {
  }

  std::shared_ptr<InstrumentedStore> store    = std::make_shared<InstrumentedStore>();
  std::shared_ptr<RecordingNotifier> notifier = std::make_shared<RecordingNotifier>();
  Dispatcher                         dispatcher;

  bool Quiescent() {
    const auto state = dispatcher.State();
    return state == RunLoopState::kSleeping || state == RunLoopState::kWaitingForSignal;
  }

  // Soonest stored action, as the active action must be once quiescent.
  std::optional<Action> Soonest() {
    auto pending = store->List();
    if (pending.empty()) return std::nullopt;
    return pending.front();
  }
};

void TestIdleLoopWaitsForSignal() {
  Fixture f;
  assert(f.dispatcher.State() == RunLoopState::kStopped);

  f.dispatcher.Start();
  assert(WaitUntil([&] { return f.dispatcher.State() == RunLoopState::kWaitingForSignal; }));
  assert(!f.dispatcher.Active().has_value());

  // an empty store never fires and never spins
  const int fetches = f.store->fetches.load();
  std::this_thread::sleep_for(100ms);
  assert(f.store->fetches.load() == fetches);
  assert(f.notifier->Count() == 0);

  f.dispatcher.Stop();
  assert(f.dispatcher.State() == RunLoopState::kStopped);
}

void TestFastPathBypassesStore() {
  Fixture f;
  f.dispatcher.Start();
  assert(WaitUntil([&] { return f.Quiescent(); }));
  const int fetches = f.store->fetches.load();

  const auto start    = std::chrono::steady_clock::now();
  auto       returned = f.dispatcher.CreateAction(MakeReminder(100ms, "fast"));
  assert(!returned.Id().has_value());
  assert(ContentOf(returned) == "fast");

  assert(WaitUntil([&] { return f.notifier->Count() == 1; }));
  assert(std::chrono::steady_clock::now() - start >= 90ms);

  assert(f.notifier->Contents() == std::vector<std::string>{"fast"});
  assert(f.store->inserts.load() == 0);
  assert(f.store->List().empty());
  // no reschedule: the run-loop never re-fetched
  assert(f.store->fetches.load() == fetches);

  f.dispatcher.Stop();
}

void TestOverdueCreateFiresImmediately() {
  Fixture f;
  f.dispatcher.Start();

  ActionFields fields;
  fields.kind       = ActionKind::kReminder;
  fields.author_id  = 1;
  fields.channel_id = 2;
  fields.message_id = 3;
  fields.created_at = util::Now() - 10s;
  fields.trigger_at = util::Now() - 5s;
  fields.extra      = ReminderExtra{"overdue"};

  auto returned = f.dispatcher.CreateAction(Action(fields));
  assert(!returned.Id().has_value());
  assert(WaitUntil([&] { return f.notifier->Count() == 1; }, 500ms));
  assert(f.store->List().empty());

  f.dispatcher.Stop();
}

void TestFastPathFiresBeforeFarStoredAction() {
  Fixture f;
  f.dispatcher.Start();

  auto stored = f.dispatcher.CreateAction(MakeReminder(10s, "stored"));
  assert(stored.Id().has_value());
  assert(WaitUntil([&] { return f.dispatcher.Active() == stored; }));

  f.dispatcher.CreateAction(MakeReminder(100ms, "fast"));
  assert(WaitUntil([&] { return f.notifier->Count() == 1; }));

  assert(f.notifier->Contents() == std::vector<std::string>{"fast"});
  assert(f.dispatcher.Active() == stored);
  assert(f.dispatcher.State() == RunLoopState::kSleeping);

  auto pending = f.dispatcher.PendingActions();
  assert(pending.size() == 1);
  assert(pending.front() == stored);

  f.dispatcher.Stop();
}

void TestEarlierInsertPreemptsActive() {
  Fixture f;
  f.dispatcher.Start();

  auto a = f.dispatcher.CreateAction(MakeReminder(1200ms, "A"));
  assert(WaitUntil([&] { return f.dispatcher.Active() == a; }));

  auto b = f.dispatcher.CreateAction(MakeReminder(800ms, "B"));
  assert(WaitUntil([&] { return f.dispatcher.Active() == b; }, 500ms));
  assert(f.notifier->Count() == 0);

  assert(WaitUntil([&] { return f.notifier->Count() == 2; }));
  assert((f.notifier->Contents() == std::vector<std::string>{"B", "A"}));

  const auto fired = f.notifier->Fired();
  assert(util::Now() >= fired[1].TriggerAt());
  assert(f.store->List().empty());
  assert(f.store->deletes.load() == 2);

  f.dispatcher.Stop();
}

void TestEqualTriggerAlsoReschedules() {
  Fixture f;
  f.dispatcher.Start();

  auto a = f.dispatcher.CreateAction(MakeReminder(5s, "A"));
  assert(WaitUntil([&] { return f.dispatcher.Active() == a; }));
  const int fetches = f.store->fetches.load();

  ActionFields fields;
  fields.kind       = ActionKind::kReminder;
  fields.author_id  = 100;
  fields.channel_id = 200;
  fields.message_id = 300;
  fields.created_at = a.CreatedAt();
  fields.trigger_at = a.TriggerAt();
  fields.extra      = ReminderExtra{"twin"};
  f.dispatcher.CreateAction(Action(fields));

  assert(WaitUntil([&] { return f.store->fetches.load() > fetches && f.Quiescent(); }));
  // ties resolve to the older id
  assert(f.dispatcher.Active() == a);

  f.dispatcher.Stop();
}

void TestLaterInsertDoesNotReschedule() {
  Fixture f;
  f.dispatcher.Start();

  auto a = f.dispatcher.CreateAction(MakeReminder(5s, "A"));
  assert(WaitUntil([&] { return f.dispatcher.Active() == a && f.Quiescent(); }));
  const int fetches = f.store->fetches.load();

  auto b = f.dispatcher.CreateAction(MakeReminder(10s, "B"));
  assert(b.Id().has_value());
  std::this_thread::sleep_for(100ms);

  assert(f.store->fetches.load() == fetches);
  assert(f.dispatcher.Active() == a);
  assert(f.store->List().size() == 2);

  f.dispatcher.Stop();
}

void TestActiveIsSoonestAtQuiescence() {
  Fixture f;
  f.dispatcher.Start();

  for (auto offset : {7s, 3s, 9s, 4s, 6s}) {
    f.dispatcher.CreateAction(MakeReminder(offset, "x"));
  }

  assert(WaitUntil([&] { return f.Quiescent() && f.dispatcher.Active() == f.Soonest(); }));
  assert(ContentOf(*f.dispatcher.Active()) == "x");
  assert(f.dispatcher.Active()->TriggerAt() == f.Soonest()->TriggerAt());

  f.dispatcher.Stop();
}

void TestRepeatedReschedulesConverge() {
  Fixture f;
  f.dispatcher.Start();

  auto a = f.dispatcher.CreateAction(MakeReminder(5s, "A"));
  f.dispatcher.CreateAction(MakeReminder(8s, "B"));
  assert(WaitUntil([&] { return f.dispatcher.Active() == a && f.Quiescent(); }));

  for (int i = 0; i < 20; ++i) f.dispatcher.Reschedule();

  assert(WaitUntil([&] { return f.Quiescent(); }));
  assert(f.dispatcher.Active() == a);
  assert(f.store->deletes.load() == 0);
  assert(f.store->List().size() == 2);
  assert(f.notifier->Count() == 0);

  f.dispatcher.Stop();
}

void TestEachFiringDeletesOnceAndNotifiesOnce() {
  Fixture f;
  f.dispatcher.Start();

  std::set<ActionId> ids;
  for (auto offset : {300ms, 400ms, 500ms}) {
    ids.insert(*f.dispatcher.CreateAction(MakeReminder(offset, "burst")).Id());
  }
  assert(ids.size() == 3);

  assert(WaitUntil([&] { return f.notifier->Count() == 3; }));
  std::this_thread::sleep_for(100ms);
  assert(f.notifier->Count() == 3);
  assert(f.store->deletes.load() == 3);
  assert(f.store->List().empty());

  std::set<ActionId> fired;
  for (const auto& action : f.notifier->Fired()) fired.insert(*action.Id());
  assert(fired == ids);

  assert(WaitUntil([&] { return f.dispatcher.State() == RunLoopState::kWaitingForSignal; }));
  assert(!f.dispatcher.Active().has_value());

  f.dispatcher.Stop();
}

void TestOverdueRowsFireOnStartInOrder() {
  // one delivery thread keeps back-to-back firings in order
  auto options             = TestOptions();
  options.delivery_threads = 1;
  Fixture f(options);
  f.store->Insert(MakeOverdue(1s, "second"));
  f.store->Insert(MakeOverdue(2s, "first"));

  f.dispatcher.Start();
  assert(WaitUntil([&] { return f.notifier->Count() == 2; }, 1s));
  assert((f.notifier->Contents() == std::vector<std::string>{"first", "second"}));
  assert(f.store->List().empty());

  f.dispatcher.Stop();
}

void TestCancelActiveAction() {
  Fixture f;
  f.dispatcher.Start();

  auto a = f.dispatcher.CreateAction(MakeReminder(400ms, "A"));
  auto b = f.dispatcher.CreateAction(MakeReminder(5s, "B"));
  assert(WaitUntil([&] { return f.dispatcher.Active() == a; }));

  f.dispatcher.CancelAction(*a.Id());
  assert(WaitUntil([&] { return f.dispatcher.Active() == b; }));

  std::this_thread::sleep_for(500ms);
  assert(f.notifier->Count() == 0);

  // cancelling a non-active or unknown id is harmless
  f.dispatcher.CancelAction(*a.Id());
  f.dispatcher.CancelAction(9999);
  assert(f.dispatcher.Active() == b);
  assert(f.store->List().size() == 1);

  f.dispatcher.CancelAction(*b.Id());
  assert(WaitUntil([&] { return f.dispatcher.State() == RunLoopState::kWaitingForSignal; }));
  assert(f.store->List().empty());

  f.dispatcher.Stop();
}

void TestFetchFailureBacksOffAndRecovers() {
  Fixture f;
  f.store->Insert(MakeReminder(300ms, "survivor"));
  f.store->fail_fetches = 3;

  f.dispatcher.Start();
  assert(WaitUntil([&] { return f.dispatcher.State() == RunLoopState::kBackoff; }, 1s));

  assert(WaitUntil([&] { return f.notifier->Count() == 1; }));
  assert(f.notifier->Contents() == std::vector<std::string>{"survivor"});
  assert(f.store->fetches.load() >= 4);
  assert(f.store->List().empty());

  f.dispatcher.Stop();
}

void TestDeleteFailureDoesNotNotify() {
  Fixture f;
  f.store->fail_deletes = 1;

  f.dispatcher.Start();
  f.dispatcher.CreateAction(MakeReminder(300ms, "retried"));

  assert(WaitUntil([&] { return f.dispatcher.State() == RunLoopState::kBackoff; }));
  assert(f.notifier->Count() == 0);
  assert(f.store->List().size() == 1);

  // the row is still stored and fires exactly once on the retry
  assert(WaitUntil([&] { return f.notifier->Count() == 1; }));
  std::this_thread::sleep_for(100ms);
  assert(f.notifier->Count() == 1);
  assert(f.store->deletes.load() == 1);
  assert(f.store->List().empty());

  f.dispatcher.Stop();
}

void TestCreateRejectsPersistedAction() {
  Fixture f;
  f.dispatcher.Start();

  auto persisted = f.dispatcher.CreateAction(MakeReminder(10s, "persisted"));
  assert(persisted.Id().has_value());

  bool threw = false;
  try {
    (void)f.dispatcher.CreateAction(persisted);
  } catch (const util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(f.store->inserts.load() == 1);

  f.dispatcher.Stop();
}

void TestInsertFailurePropagatesToCaller() {
  Fixture f;
  f.dispatcher.Start();
  assert(WaitUntil([&] { return f.Quiescent(); }));

  f.store->fail_inserts = 1;
  bool threw = false;
  try {
    (void)f.dispatcher.CreateAction(MakeReminder(5s, "lost"));
  } catch (const util::StoreUnavailable&) {
    threw = true;
  }
  assert(threw);
  assert(f.store->List().empty());
  assert(!f.dispatcher.Active().has_value());

  // the next insert goes through
  auto stored = f.dispatcher.CreateAction(MakeReminder(5s, "kept"));
  assert(WaitUntil([&] { return f.dispatcher.Active() == stored; }));

  f.dispatcher.Stop();
}

void TestNotifierFailureDoesNotStopLoop() {
  Fixture f;
  f.notifier->ThrowOnNext();
  f.dispatcher.Start();

  f.dispatcher.CreateAction(MakeReminder(300ms, "first"));
  f.dispatcher.CreateAction(MakeReminder(450ms, "second"));

  assert(WaitUntil([&] { return f.notifier->Count() == 2; }));
  assert((f.notifier->Contents() == std::vector<std::string>{"first", "second"}));

  // the fast path survives a throwing notifier too
  f.notifier->ThrowOnNext();
  f.dispatcher.CreateAction(MakeReminder(10ms, "fast-1"));
  f.dispatcher.CreateAction(MakeReminder(20ms, "fast-2"));
  assert(WaitUntil([&] { return f.notifier->Count() == 4; }));

  f.dispatcher.Stop();
}

void TestSlowNotifierDoesNotDelayLaterActions() {
  auto store    = std::make_shared<InstrumentedStore>();
  auto notifier = std::make_shared<SlowNotifier>(1500ms);
  Dispatcher dispatcher(store, notifier, TestOptions());
  dispatcher.Start();

  dispatcher.CreateAction(MakeReminder(300ms, "A"));
  dispatcher.CreateAction(MakeReminder(400ms, "B"));
  auto fast = dispatcher.CreateAction(MakeReminder(100ms, "C"));
  assert(!fast.Id().has_value());

  assert(WaitUntil([&] { return notifier->Entered("A") && notifier->Entered("B") && notifier->Entered("C"); }, 1s));

  // every handler is still blocked; the run-loop and timer thread are not
  auto late = dispatcher.CreateAction(MakeReminder(300ms, "D"));
  assert(WaitUntil([&] { return dispatcher.Active() == late; }, 200ms));
  assert(WaitUntil([&] { return notifier->Entered("D"); }, 1s));

  const auto lateness = notifier->Lateness();
  assert(lateness.size() == 4);
  for (const auto delay : lateness) {
    assert(delay < 200ms);
  }
  assert(store->List().empty());

  dispatcher.Stop();
}

void TestRunLoopStateNames() {
  assert(RunLoopStateName(RunLoopState::kFetching) == "fetching");
  assert(RunLoopStateName(RunLoopState::kWaitingForSignal) == "waiting_for_signal");
  assert(RunLoopStateName(RunLoopState::kSleeping) == "sleeping");
  assert(RunLoopStateName(RunLoopState::kFiring) == "firing");
  assert(RunLoopStateName(RunLoopState::kBackoff) == "backoff");
  assert(RunLoopStateName(RunLoopState::kStopped) == "stopped");
}

void TestStopAbandonsPendingWork() {
  Fixture f;
  f.dispatcher.Start();

  auto stored = f.dispatcher.CreateAction(MakeReminder(10s, "stored"));
  f.dispatcher.CreateAction(MakeReminder(150ms, "fast"));
  assert(WaitUntil([&] { return f.dispatcher.Active() == stored; }));

  const auto start = std::chrono::steady_clock::now();
  f.dispatcher.Stop();
  assert(std::chrono::steady_clock::now() - start < 1s);

  assert(f.dispatcher.State() == RunLoopState::kStopped);
  assert(!f.dispatcher.Active().has_value());

  std::this_thread::sleep_for(250ms);
  assert(f.notifier->Count() == 0);
  // the stored row outlives the process and is picked up on the next start
  assert(f.store->List().size() == 1);

  f.dispatcher.Start();
  assert(WaitUntil([&] { return f.dispatcher.Active() == stored; }));
  f.dispatcher.Stop();
}

} // namespace

int main() {
  TestIdleLoopWaitsForSignal();
  TestFastPathBypassesStore();
  TestOverdueCreateFiresImmediately();
  TestFastPathFiresBeforeFarStoredAction();
  TestEarlierInsertPreemptsActive();
  TestEqualTriggerAlsoReschedules();
  TestLaterInsertDoesNotReschedule();
  TestActiveIsSoonestAtQuiescence();
  TestRepeatedReschedulesConverge();
  TestEachFiringDeletesOnceAndNotifiesOnce();
  TestOverdueRowsFireOnStartInOrder();
  TestCancelActiveAction();
  TestFetchFailureBacksOffAndRecovers();
  TestDeleteFailureDoesNotNotify();
  TestCreateRejectsPersistedAction();
  TestInsertFailurePropagatesToCaller();
  TestNotifierFailureDoesNotStopLoop();
  TestSlowNotifierDoesNotDelayLaterActions();
  TestRunLoopStateNames();
  TestStopAbandonsPendingWork();

  std::cout << "action_dispatcher_unit_dispatcher: pass\n";
  return 0;
}
