#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/sql_queries.hpp"

#if STAGING_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if STAGING_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using staging::db::ErrorCode;
using staging::db::Repository;
using staging::db::memory::MemoryRepository;
using staging::db::model::PerformanceSampleRecord;
using staging::db::model::ResourceDefinitionRecord;
using staging::model::CleanupPolicy;
using staging::model::CompressionLevel;
using staging::model::PartitionStrategy;
using staging::model::SampleKind;

constexpr uint64_t kHourMs = 3'600'000ULL;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

// Backends may share a database between runs; every name carries a run id.
std::string Unique(const std::string& backend, const std::string& label) {
  static const auto run = std::to_string(NowMs());
  return backend + "-" + label + "-" + run;
}

ResourceDefinitionRecord MakeDefinition(const std::string& id, const std::string& execution_id, uint64_t created_at_ms, uint32_t ttl_hours,
                                        CleanupPolicy policy = CleanupPolicy::kAutoDrop) {
  ResourceDefinitionRecord record;
  record.id                  = id;
  record.execution_id        = execution_id;
  record.transaction_type_id = 42;
  record.physical_name       = "STG_" + id;
  record.table_schema        = R"json({"columns":[{"name":"ACCOUNT_ID","type":"VARCHAR2(50)","indexed":true}]})json";
  record.partition_strategy  = PartitionStrategy::kHash;
  record.ttl_hours           = ttl_hours;
  record.compression_level   = CompressionLevel::kAdvanced;
  record.encryption_applied  = true;
  record.cleanup_policy      = policy;
  record.created_at_ms       = created_at_ms;
  record.last_access_at_ms   = created_at_ms;
  return record;
}

PerformanceSampleRecord MakeSample(const ResourceDefinitionRecord& definition, SampleKind kind, uint64_t measured_at_ms,
                                   std::optional<double> duration_ms) {
  PerformanceSampleRecord sample;
  sample.definition_id     = definition.id;
  sample.execution_id      = definition.execution_id;
  sample.kind              = kind;
  sample.measured_at_ms    = measured_at_ms;
  sample.duration_ms       = duration_ms;
  sample.monitoring_source = "PARITY_TEST";
  return sample;
}

bool ContainsName(const std::vector<ResourceDefinitionRecord>& records, const std::string& physical_name) {
  for (const auto& record : records) {
    if (record.physical_name == physical_name) {
      return true;
    }
  }
  return false;
}

void VerifyDefinitionLifecycle(Repository& repo, const std::string& backend) {
  const auto id       = Unique(backend, "life");
  const auto created  = NowMs();
  auto       original = MakeDefinition(id, Unique(backend, "exec-life"), created, 24);

  {
    auto tx = repo.Begin();
    assert(repo.SaveDefinition(*tx, original));
    tx->Commit();
  }

  {
    auto tx     = repo.Begin();
    auto stored = repo.FindDefinitionByName(*tx, original.physical_name);
    assert(stored.has_value());
    assert(stored->id == id);
    assert(stored->transaction_type_id == 42);
    assert(stored->table_schema == original.table_schema);
    assert(stored->partition_strategy == PartitionStrategy::kHash);
    assert(stored->compression_level == CompressionLevel::kAdvanced);
    assert(stored->encryption_applied);
    assert(stored->cleanup_policy == CleanupPolicy::kAutoDrop);
    assert(stored->created_at_ms == created);
    assert(stored->IsActive());

    stored->record_count         = 2'000'000;
    stored->table_size_mb        = 512.25;
    stored->optimization_applied = "INDEX_OPTIMIZATION";
    stored->dropped_at_ms        = created + 10;
    assert(repo.SaveDefinition(*tx, *stored));
    tx->Commit();
  }

  // a stored dropped timestamp survives later writes without one
  {
    auto tx             = repo.Begin();
    auto stale          = original;
    stale.dropped_at_ms = std::nullopt;
    assert(repo.SaveDefinition(*tx, stale));
    tx->Commit();
  }

  auto verify_tx = repo.Begin();
  auto dropped   = repo.FindDefinitionByName(*verify_tx, original.physical_name);
  assert(dropped.has_value());
  assert(dropped->dropped_at_ms.has_value());
  assert(*dropped->dropped_at_ms == created + 10);
  assert(!ContainsName(repo.FindActiveDefinitions(*verify_tx), original.physical_name));
  assert(!repo.FindDefinitionByName(*verify_tx, "STG_NOT_THERE").has_value());
  verify_tx->Commit();
}

void VerifyPhysicalNameIsUnique(Repository& repo, const std::string& backend) {
  const auto first = MakeDefinition(Unique(backend, "name-a"), Unique(backend, "exec-name"), NowMs(), 24);
  auto       clash = MakeDefinition(Unique(backend, "name-b"), first.execution_id, NowMs(), 24);
  clash.physical_name = first.physical_name;

  {
    auto tx = repo.Begin();
    assert(repo.SaveDefinition(*tx, first));
    tx->Commit();
  }

  auto tx     = repo.Begin();
  auto result = repo.SaveDefinition(*tx, clash);
  assert(!result);
  assert(result.code == ErrorCode::AlreadyExists);
  tx->Rollback();
}

void VerifyActiveAndExpiredQueries(Repository& repo, const std::string& backend) {
  const auto execution = Unique(backend, "exec-expiry");
  const auto now       = NowMs();

  const auto expired  = MakeDefinition(Unique(backend, "expired"), execution, now - 3 * kHourMs, 2);
  const auto boundary = MakeDefinition(Unique(backend, "boundary"), execution, now - 2 * kHourMs, 2);
  const auto fresh    = MakeDefinition(Unique(backend, "fresh"), execution, now - kHourMs, 2);
  const auto manual   = MakeDefinition(Unique(backend, "manual"), execution, now - 3 * kHourMs, 2, CleanupPolicy::kManual);
  const auto archive  = MakeDefinition(Unique(backend, "archive"), execution, now - 3 * kHourMs, 2, CleanupPolicy::kArchiveThenDrop);
  const auto forever  = MakeDefinition(Unique(backend, "no-ttl"), execution, now - 300 * kHourMs, 0);
  const auto gone     = [&] {
    auto record          = MakeDefinition(Unique(backend, "gone"), execution, now - 3 * kHourMs, 2);
    record.dropped_at_ms = now - kHourMs;
    return record;
  }();

  {
    auto tx = repo.Begin();
    for (const auto* record : {&expired, &boundary, &fresh, &manual, &archive, &forever, &gone}) {
      assert(repo.SaveDefinition(*tx, *record));
    }
    tx->Commit();
  }

  auto tx = repo.Begin();

  const auto by_execution = repo.FindActiveDefinitionsByExecution(*tx, execution);
  assert(by_execution.size() == 6);
  assert(!ContainsName(by_execution, gone.physical_name));

  const auto active = repo.FindActiveDefinitions(*tx);
  assert(ContainsName(active, fresh.physical_name));
  assert(ContainsName(active, manual.physical_name));
  assert(!ContainsName(active, gone.physical_name));

  const auto due = repo.FindExpiredDefinitions(*tx, now);
  assert(ContainsName(due, expired.physical_name));
  assert(ContainsName(due, boundary.physical_name));
  assert(ContainsName(due, archive.physical_name));
  assert(!ContainsName(due, fresh.physical_name));
  assert(!ContainsName(due, manual.physical_name));
  assert(!ContainsName(due, forever.physical_name));
  assert(!ContainsName(due, gone.physical_name));

  assert(repo.FindActiveDefinitionsByExecution(*tx, Unique(backend, "exec-unknown")).empty());
  tx->Commit();
}

void VerifySampleLedger(Repository& repo, const std::string& backend) {
  const auto now        = NowMs();
  const auto definition = MakeDefinition(Unique(backend, "ledger"), Unique(backend, "exec-ledger"), now - 30 * kHourMs, 48);

  std::vector<uint64_t> ids;
  {
    auto tx = repo.Begin();
    assert(repo.SaveDefinition(*tx, definition));

    auto creation = MakeSample(definition, SampleKind::kTableCreation, now - 30 * kHourMs, 120.0);
    auto baseline = MakeSample(definition, SampleKind::kQueryExecution, now - 10 * kHourMs, 9000.0);
    auto failed   = MakeSample(definition, SampleKind::kQueryExecution, now - 3 * kHourMs, std::nullopt);
    failed.error_message = "ORA-00054: resource busy";
    failed.memory_used_mb = 768.5;
    failed.cpu_percent    = 91.0;

    auto optimized                 = MakeSample(definition, SampleKind::kOptimizationApplied, now - 2 * kHourMs, std::nullopt);
    optimized.optimization_applied = "INDEX_OPTIMIZATION";
    optimized.improvement_percent  = 35.5;
    optimized.note                 = "Add missing indexes";

    auto recent         = MakeSample(definition, SampleKind::kQueryExecution, now - kHourMs, 4000.0);
    recent.io_read_mb   = 12.5;
    recent.io_write_mb  = 3.5;
    recent.records_processed = 10'000;

    for (auto* sample : {&creation, &baseline, &failed, &optimized, &recent}) {
      assert(repo.SavePerformanceSample(*tx, *sample));
      ids.push_back(sample->sample_id);
    }
    tx->Commit();
  }

  for (std::size_t i = 1; i < ids.size(); ++i) {
    assert(ids[i] > ids[i - 1]);
  }

  auto tx = repo.Begin();

  const auto ledger = repo.FindRecentSamples(*tx, definition.id, 0);
  assert(ledger.size() == 5);
  assert(ledger.front().measured_at_ms == now - kHourMs);
  assert(ledger.back().kind == SampleKind::kTableCreation);
  for (std::size_t i = 1; i < ledger.size(); ++i) {
    assert(ledger[i - 1].measured_at_ms >= ledger[i].measured_at_ms);
  }
  assert(ledger.front().io_read_mb == 12.5);
  assert(ledger.front().records_processed == 10'000);

  const auto recent = repo.FindRecentSamples(*tx, definition.id, now - 4 * kHourMs);
  assert(recent.size() == 3);
  bool saw_error = false;
  for (const auto& sample : recent) {
    if (sample.IsError()) {
      saw_error = true;
      assert(*sample.error_message == "ORA-00054: resource busy");
      assert(!sample.duration_ms.has_value());
      assert(sample.memory_used_mb == 768.5);
      assert(sample.cpu_percent == 91.0);
    }
  }
  assert(saw_error);

  const auto baseline = repo.FindSamplesInRange(*tx, definition.id, now - 24 * kHourMs, now - 2 * kHourMs);
  assert(baseline.size() == 3);
  assert(baseline.back().duration_ms.has_value() && *baseline.back().duration_ms == 9000.0);

  const auto latest = repo.FindLatestOptimization(*tx, definition.id);
  assert(latest.has_value());
  assert(latest->optimization_applied == "INDEX_OPTIMIZATION");
  assert(latest->improvement_percent.has_value() && *latest->improvement_percent == 35.5);
  assert(latest->note == "Add missing indexes");
  assert(latest->monitoring_source == "PARITY_TEST");

  assert(!repo.FindLatestOptimization(*tx, Unique(backend, "no-such-definition")).has_value());
  assert(repo.FindRecentSamples(*tx, Unique(backend, "no-such-definition"), 0).empty());
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& backend) {
  const auto definition = MakeDefinition(Unique(backend, "rollback"), Unique(backend, "exec-rollback"), NowMs(), 24);
  {
    auto tx = repo.Begin();
    assert(repo.SaveDefinition(*tx, definition));
    tx->Rollback();
  }
  {
    // destructor without commit rolls back too
    auto tx = repo.Begin();
    assert(repo.SaveDefinition(*tx, definition));
  }

  auto check_tx = repo.Begin();
  assert(!repo.FindDefinitionByName(*check_tx, definition.physical_name).has_value());
  check_tx->Commit();
}

void VerifyConcurrentTransactions(Repository& repo, const std::string& backend, bool supports_parallel_transactions) {
  if (!supports_parallel_transactions) {
    // one transaction per connection; a second Begin() would wait on the first
    return;
  }

  const auto execution = Unique(backend, "exec-parallel");
  const auto first     = MakeDefinition(Unique(backend, "parallel-a"), execution, NowMs(), 24);
  const auto second    = MakeDefinition(Unique(backend, "parallel-b"), execution, NowMs(), 24);

  auto tx1 = repo.Begin();
  auto tx2 = repo.Begin();

  assert(repo.SaveDefinition(*tx1, first));
  assert(repo.SaveDefinition(*tx2, second));

  // uncommitted writes stay private
  assert(!repo.FindDefinitionByName(*tx2, first.physical_name).has_value());

  tx1->Commit();
  tx2->Commit();

  auto verify_tx = repo.Begin();
  assert(repo.FindActiveDefinitionsByExecution(*verify_tx, execution).size() == 2);
  verify_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto       repo       = backend.make_repository();
  const auto definition = MakeDefinition(Unique(backend.name, "durable"), Unique(backend.name, "exec-durable"), NowMs(), 12);
  {
    auto tx     = repo->Begin();
    auto sample = MakeSample(definition, SampleKind::kTableCreation, definition.created_at_ms, 55.0);
    assert(repo->SaveDefinition(*tx, definition));
    assert(repo->SavePerformanceSample(*tx, sample));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx     = repo->Begin();
  auto stored = repo->FindDefinitionByName(*tx, definition.physical_name);
  assert(stored.has_value());
  assert(stored->ttl_hours == 12);
  assert(stored->IsActive());
  assert(ContainsName(repo->FindActiveDefinitions(*tx), definition.physical_name));

  auto samples = repo->FindRecentSamples(*tx, definition.id, 0);
  assert(samples.size() == 1);
  assert(samples[0].kind == SampleKind::kTableCreation);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if STAGING_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("staging_manager_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<staging::db::sqlite::SqliteDB>(db_path);
    db->Exec(staging::db::sql::CREATE_DEFINITIONS_SQLITE);
    db->Exec(staging::db::sql::CREATE_SAMPLES_SQLITE);
    return std::make_shared<staging::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      .supports_parallel_transactions = false,
  };
}
#endif

#if STAGING_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("STAGING_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("STAGING_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<staging::db::postgres::PgPool>(conninfo);
    {
      auto       conn = pool->Acquire();
      pqxx::work tx(*conn);
      tx.exec(staging::db::sql::CREATE_DEFINITIONS_POSTGRES);
      tx.exec(staging::db::sql::CREATE_SAMPLES_POSTGRES);
      tx.commit();
    }
    return std::make_shared<staging::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  VerifyDefinitionLifecycle(*repo, backend.name);
  VerifyPhysicalNameIsUnique(*repo, backend.name);
  VerifyActiveAndExpiredQueries(*repo, backend.name);
  VerifySampleLedger(*repo, backend.name);
  VerifyRollbackBehavior(*repo, backend.name);
  VerifyConcurrentTransactions(*repo, backend.name, backend.supports_parallel_transactions);

  repo.reset();
  VerifyRestartDurability(backend);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if STAGING_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if STAGING_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "staging_manager_integration_repository_parity: pass\n";
  return 0;
}
