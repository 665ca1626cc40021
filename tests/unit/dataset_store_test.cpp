#include <cassert>
#include <cctype>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/core/dataset_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "support/test_vectors.hpp"

namespace {

using threadnet::core::DatasetStore;
using threadnet::db::memory::MemoryRepository;
using namespace threadnet::testing;

class HookedTx final : public threadnet::db::Transaction {
 public:
  HookedTx(std::unique_ptr<threadnet::db::Transaction> inner, bool fail_commit) : inner_(std::move(inner)), fail_commit_(fail_commit) {
  }

  void Commit() override {
    if (fail_commit_) {
      throw std::runtime_error("disk full");
    }
    inner_->Commit();
  }
  void Rollback() override {
    inner_->Rollback();
  }
  bool IsCommitted() const override {
    return inner_->IsCommitted();
  }

  threadnet::db::Transaction& inner() {
    return *inner_;
  }

 private:
  std::unique_ptr<threadnet::db::Transaction> inner_;
  bool                                        fail_commit_;
};

// Forwards to a MemoryRepository and fails writes or commits on request.
class HookedRepository final : public threadnet::db::Repository {
 public:
  explicit HookedRepository(std::shared_ptr<MemoryRepository> inner) : inner_(std::move(inner)) {
  }

  bool fail_commit        = false;
  bool fail_set_preferred = false;

  std::unique_ptr<threadnet::db::Transaction> Begin() override {
    return std::make_unique<HookedTx>(inner_->Begin(), fail_commit);
  }

  threadnet::db::Result InsertDataset(threadnet::db::Transaction& t, const threadnet::db::model::DatasetRecord& r) override {
    return inner_->InsertDataset(Unwrap(t), r);
  }
  std::optional<threadnet::db::model::DatasetRecord> GetDataset(threadnet::db::Transaction& t, const std::string& id) override {
    return inner_->GetDataset(Unwrap(t), id);
  }
  std::vector<threadnet::db::model::DatasetRecord> ListDatasets(threadnet::db::Transaction& t) override {
    return inner_->ListDatasets(Unwrap(t));
  }
  threadnet::db::Result DeleteDataset(threadnet::db::Transaction& t, const std::string& id) override {
    return inner_->DeleteDataset(Unwrap(t), id);
  }
  std::optional<std::string> GetPreferredDatasetId(threadnet::db::Transaction& t) override {
    return inner_->GetPreferredDatasetId(Unwrap(t));
  }
  threadnet::db::Result SetPreferredDatasetId(threadnet::db::Transaction& t, const std::optional<std::string>& id) override {
    if (fail_set_preferred) {
      return threadnet::db::Result::Err(threadnet::db::ErrorCode::IOError, "injected");
    }
    return inner_->SetPreferredDatasetId(Unwrap(t), id);
  }

 private:
  static threadnet::db::Transaction& Unwrap(threadnet::db::Transaction& t) {
    return static_cast<HookedTx&>(t).inner();
  }

  std::shared_ptr<MemoryRepository> inner_;
};

std::shared_ptr<DatasetStore> NewStore(std::shared_ptr<threadnet::db::Repository> repository = nullptr) {
  if (!repository) repository = std::make_shared<MemoryRepository>();
  auto store = std::make_shared<DatasetStore>(std::move(repository));
  store->Load();
  return store;
}

template <typename Exception, typename Fn>
std::string ExpectThrows(Fn&& fn) {
  try {
    fn();
  } catch (const Exception& e) {
    return e.what();
  }
  assert(false && "expected exception");
  return "";
}

void TestFirstDatasetBecomesPreferred() {
  auto store = NewStore();
  assert(!store->Preferred().has_value());

  auto added = store->Add("Test", kDataset1);
  assert(added.preferred);
  assert(added.source == "Test");
  assert(added.tlv == kDataset1);
  assert(added.NetworkName() == std::optional<std::string>("OpenThreadDemo"));
  assert(added.ExtendedPanId() == std::optional<std::string>("1111111122222222"));
  assert(added.PanId() == std::optional<std::string>("1234"));
  assert(added.Channel() == std::optional<uint32_t>(15));
  assert(added.id.size() == 26);

  assert(store->PreferredId() == added.id);
  assert(store->Preferred()->tlv == kDataset1);
}

void TestDuplicateAddReturnsExistingEntry() {
  auto store = NewStore();
  auto first = store->Add("Test", kDataset1);

  std::string lowercase = kDataset1;
  for (auto& c : lowercase) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

  auto again = store->Add("Other", lowercase);
  assert(again.id == first.id);
  assert(again.source == "Test");
  assert(store->Size() == 1);
}

void TestListPreservesInsertionOrder() {
  auto store = NewStore();
  auto one   = store->Add("Test", kDataset1);
  auto two   = store->Add("Test", kDataset2);
  auto three = store->Add("Test", kDataset3);

  auto listed = store->List();
  assert(listed.size() == 3);
  assert(listed[0].id == one.id);
  assert(listed[1].id == two.id);
  assert(listed[2].id == three.id);
  assert(listed[0].preferred && !listed[1].preferred && !listed[2].preferred);
  assert(!two.preferred);
}

void TestInvalidTlvIsRejected() {
  auto store = NewStore();
  auto what  = ExpectThrows<threadnet::util::InvalidFormat>([&] { store->Add("Test", "DEADBEEF"); });
  assert(what == "unknown type 222");
  assert(store->Size() == 0);
}

void TestDeleteSemantics() {
  auto store = NewStore();
  auto one   = store->Add("Test", kDataset1);
  auto two   = store->Add("Test", kDataset2);

  auto what = ExpectThrows<threadnet::util::NotAllowed>([&] { store->Delete(one.id); });
  assert(what == "attempt to remove preferred dataset");
  assert(store->Size() == 2);

  what = ExpectThrows<threadnet::util::NotFound>([&] { store->Delete("01ARZ3NDEKTSV4RRFFQ69G5FAV"); });
  assert(what == "'01ARZ3NDEKTSV4RRFFQ69G5FAV'");

  store->Delete(two.id);
  assert(store->Size() == 1);
  assert(!store->Find(two.id).has_value());

  // The sole remaining dataset is preferred and may be removed.
  store->Delete(one.id);
  assert(store->Size() == 0);
  assert(!store->PreferredId().has_value());

  auto next = store->Add("Test", kDataset3);
  assert(next.preferred);
}

void TestSetPreferred() {
  auto store = NewStore();
  auto one   = store->Add("Test", kDataset1);
  auto two   = store->Add("Test", kDataset2);

  store->SetPreferred(two.id);
  assert(store->PreferredId() == two.id);
  assert(store->Get(two.id).preferred);
  assert(!store->Get(one.id).preferred);

  store->Delete(one.id);
  assert(store->Size() == 1);

  auto what = ExpectThrows<threadnet::util::NotFound>([&] { store->SetPreferred("missing"); });
  assert(what == "unknown dataset");
  ExpectThrows<threadnet::util::NotFound>([&] { (void)store->Get("missing"); });
}

void TestStateSurvivesReload() {
  auto repository = std::make_shared<MemoryRepository>();
  auto store      = NewStore(repository);
  auto one        = store->Add("Test", kDataset1);
  auto two        = store->Add("Thread", kDataset2);
  store->SetPreferred(two.id);

  auto reloaded = NewStore(repository);
  auto listed   = reloaded->List();
  assert(listed.size() == 2);
  assert(listed[0].id == one.id);
  assert(listed[1].source == "Thread");
  assert(reloaded->PreferredId() == two.id);
  assert(threadnet::util::ToUnixMicros(listed[0].created) == threadnet::util::ToUnixMicros(one.created));
}

void TestLoadRepairsDanglingPreferred() {
  auto repository = std::make_shared<MemoryRepository>();
  {
    auto tx = repository->Begin();
    threadnet::db::model::DatasetRecord record{"01H0000000000000000000000A", "Test", kDataset1, 1675330873746514};
    threadnet::db::model::DatasetRecord broken{"01H0000000000000000000000B", "Test", "DEADBEEF", 1675330873746515};
    const bool seeded = repository->InsertDataset(*tx, record) && repository->InsertDataset(*tx, broken) &&
                        repository->SetPreferredDatasetId(*tx, std::string("gone"));
    assert(seeded);
    tx->Commit();
  }

  auto store = NewStore(repository);
  assert(store->Size() == 1);
  assert(store->PreferredId() == std::optional<std::string>("01H0000000000000000000000A"));

  auto tx = repository->Begin();
  assert(repository->GetPreferredDatasetId(*tx) == std::optional<std::string>("01H0000000000000000000000A"));
  tx->Rollback();
}

void TestLoadDropsUndecodableRows() {
  auto repository = std::make_shared<MemoryRepository>();
  {
    auto tx = repository->Begin();
    threadnet::db::model::DatasetRecord record{"01H0000000000000000000000A", "Test", kDataset1, 1675330873746514};
    threadnet::db::model::DatasetRecord broken{"01H0000000000000000000000B", "Test", "DEADBEEF", 1675330873746515};
    const bool seeded = repository->InsertDataset(*tx, record) && repository->InsertDataset(*tx, broken) &&
                        repository->SetPreferredDatasetId(*tx, std::string("01H0000000000000000000000A"));
    assert(seeded);
    tx->Commit();
  }

  auto store = NewStore(repository);
  assert(store->Size() == 1);
  assert(!store->Find("01H0000000000000000000000B").has_value());

  auto tx = repository->Begin();
  assert(!repository->GetDataset(*tx, "01H0000000000000000000000B").has_value());
  assert(repository->ListDatasets(*tx).size() == 1);
  assert(repository->GetPreferredDatasetId(*tx) == std::optional<std::string>("01H0000000000000000000000A"));
  tx->Rollback();
}

void TestPersistenceFailureLeavesStoreUntouched() {
  auto inner  = std::make_shared<MemoryRepository>();
  auto hooked = std::make_shared<HookedRepository>(inner);
  auto store  = NewStore(hooked);

  hooked->fail_commit = true;
  ExpectThrows<threadnet::util::PersistenceError>([&] { store->Add("Test", kDataset1); });
  assert(store->Size() == 0);
  assert(!store->PreferredId().has_value());

  hooked->fail_commit = false;
  auto one = store->Add("Test", kDataset1);
  auto two = store->Add("Test", kDataset2);

  hooked->fail_set_preferred = true;
  auto what = ExpectThrows<threadnet::util::PersistenceError>([&] { store->SetPreferred(two.id); });
  assert(what.find("io_error") != std::string::npos);
  assert(store->PreferredId() == one.id);

  hooked->fail_set_preferred = false;
  hooked->fail_commit        = true;
  ExpectThrows<threadnet::util::PersistenceError>([&] { store->Delete(two.id); });
  assert(store->Size() == 2);

  hooked->fail_commit = false;
  auto reloaded = NewStore(hooked);
  assert(reloaded->Size() == 2);
  assert(reloaded->PreferredId() == one.id);
}

} // namespace

int main() {
  TestFirstDatasetBecomesPreferred();
  TestDuplicateAddReturnsExistingEntry();
  TestListPreservesInsertionOrder();
  TestInvalidTlvIsRejected();
  TestDeleteSemantics();
  TestSetPreferred();
  TestStateSurvivesReload();
  TestLoadRepairsDanglingPreferred();
  TestLoadDropsUndecodableRows();
  TestPersistenceFailureLeavesStoreUntouched();
  std::cout << "threadnet_manager_unit_dataset_store: pass\n";
  return 0;
}
