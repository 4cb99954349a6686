#include <catch2/catch_test_macros.hpp>
#include "support/engine_fixture.hpp"
#include "support/hooked_provider.hpp"
#include "sync/sync_sweep.hpp"

#include <optional>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;
using namespace vaultsync;
using namespace vaultsync::sync;
using vaultsync::testing::Engine;
using vaultsync::testing::FakeProvider;
using vaultsync::testing::HookedProvider;

namespace {

class BrokenVaults final : public VaultRepository {
public:
    Result<std::vector<Vault>, Error> get_all_vaults() override {
        return Result<std::vector<Vault>, Error>::err(storage_error("database is locked", 5));
    }
    Result<std::optional<Vault>, Error> get_vault(const Uuid&) override {
        return Result<std::optional<Vault>, Error>::ok(std::nullopt);
    }
    Result<void, Error> update_last_synced(const Uuid&, Timestamp) override {
        return Result<void, Error>::ok();
    }
};

SyncSweep make_sweep(Engine& e, int workers = 1) {
    return SyncSweep(e.coordinator, e.vaults, e.notes, e.states, e.queue, e.clock, workers);
}

} // namespace

TEST_CASE("Sweep: an unavailable vault does not stop the others", "[integration][sweep]") {
    Engine e;
    const auto offline = e.vault;
    const auto online = e.add_vault("Online");
    const auto a1 = e.add_note("a1", offline);
    const auto a2 = e.add_note("a2", offline);
    const auto b1 = e.add_note("b1", online);
    const auto b2 = e.add_note("b2", online);
    e.provider->set_vault_offline(offline.id, true);

    auto sweep = make_sweep(e);
    CancellationToken cancel;

    auto summary = sweep.run_sweep(cancel).unwrap();
    REQUIRE(summary == SweepSummary{.total_synced = 2, .total_failed = 2, .total_conflicts = 0,
                                    .vaults_processed = 2, .cancelled = false});

    REQUIRE(e.state(b1.id).status == SyncStatus::Synced);
    REQUIRE(e.state(b2.id).status == SyncStatus::Synced);
    REQUIRE(e.state(a1.id).status == SyncStatus::Error);
    REQUIRE(e.queue.get_for_vault(offline.id).unwrap().size() == 2);
    REQUIRE(e.vaults.get_vault(online.id).unwrap()->last_synced_at == e.clock.now());

    SECTION("Queued notes wait for their schedule") {
        auto next = sweep.run_sweep(cancel).unwrap();
        REQUIRE(next.total_synced == 0);
        REQUIRE(next.total_failed == 0);
        REQUIRE(e.queue.get(a1.id).unwrap()->retry_count == 1);
    }

    SECTION("Queued notes are retried once due") {
        e.provider->set_vault_offline(offline.id, false);
        e.clock.advance(30s);

        auto next = sweep.run_sweep(cancel).unwrap();
        REQUIRE(next.total_synced == 2);
        REQUIRE(e.queue.queue_size().unwrap() == 0);
        REQUIRE(e.state(a2.id).status == SyncStatus::Synced);
    }
}

TEST_CASE("Sweep: dispatch order and de-duplication", "[integration][sweep]") {
    Engine e;
    const auto start = e.clock.now();

    const auto u_old = e.add_note("unsynced, older");
    auto pending = e.add_note("pending upload");
    REQUIRE(e.sync(pending.id).is_success());
    REQUIRE(e.coordinator.mark_local_change(e.note(pending.id)).is_ok());

    e.clock.advance(1s);
    const auto r1 = e.add_note("retry one");
    const auto r2 = e.add_note("retry two");
    e.provider->set_available(false);
    REQUIRE(e.sync(r2.id).is_failed());
    e.clock.advance(5s);
    REQUIRE(e.sync(r1.id).is_failed());
    e.provider->set_available(true);

    e.clock.advance(1s);
    const auto u_new = e.add_note("unsynced, newer");

    const auto pulled = Uuid::generate();
    e.provider->put_file(pulled, e.vault, "only in vault", start + 2s);
    REQUIRE(e.coordinator.mark_remote_change(pulled, e.vault.id, start + 2s).is_ok());

    e.clock.set(start + 40s);
    auto sweep = make_sweep(e);

    auto plan = sweep.plan(e.vault).unwrap();
    REQUIRE(plan == std::vector<Uuid>{r2.id, r1.id, u_old.id, u_new.id, pending.id, pulled});

    CancellationToken cancel;
    auto summary = sweep.run_sweep(cancel).unwrap();
    REQUIRE(summary.total_synced == 6);
    REQUIRE(summary.total_failed == 0);
    REQUIRE(e.note(pulled).content == "only in vault");
    REQUIRE(sweep.plan(e.vault).unwrap().empty());
}

TEST_CASE("Sweep: failed items are left for the operator", "[integration][sweep]") {
    Engine e;
    const auto note = e.add_note("stuck");
    e.provider->set_available(false);
    for (int i = 0; i < DEFAULT_MAX_RETRIES; ++i) {
        REQUIRE(e.sync(note.id).is_failed());
    }
    e.provider->set_available(true);
    e.clock.advance(24h);

    auto sweep = make_sweep(e);
    REQUIRE(sweep.plan(e.vault).unwrap().empty());

    SECTION("Until reset") {
        REQUIRE(e.queue.reset_retry_count(note.id, e.clock.now()).unwrap());
        e.clock.advance(storage::RetryQueueRepository::DEFAULT_RESET_DELAY);
        REQUIRE(sweep.plan(e.vault).unwrap() == std::vector<Uuid>{note.id});

        CancellationToken cancel;
        REQUIRE(sweep.run_sweep(cancel).unwrap().total_synced == 1);
        REQUIRE(e.queue.get_failed_items().unwrap().empty());
    }
}

TEST_CASE("Sweep: disabled vaults are skipped", "[integration][sweep]") {
    Engine e;
    const auto note = e.add_note("paused");
    auto paused = e.vault;
    paused.sync_enabled = false;
    REQUIRE(e.vaults.save(paused).is_ok());

    auto sweep = make_sweep(e);
    CancellationToken cancel;
    auto summary = sweep.run_sweep(cancel).unwrap();

    REQUIRE(summary.vaults_processed == 0);
    REQUIRE(summary.total_synced == 0);
    REQUIRE(e.state(note.id).status == SyncStatus::NeverSynced);
    REQUIRE_FALSE(e.vaults.get_vault(paused.id).unwrap()->last_synced_at.has_value());
}

TEST_CASE("Sweep: cancellation leaves unstarted notes untouched", "[integration][sweep]") {
    Engine e;
    CancellationToken cancel;

    SECTION("Cancelled before starting") {
        const auto note = e.add_note("never started");
        cancel.cancel();

        auto summary = make_sweep(e).run_sweep(cancel).unwrap();
        REQUIRE(summary.cancelled);
        REQUIRE(summary.vaults_processed == 0);
        REQUIRE(e.state(note.id).status == SyncStatus::NeverSynced);
        REQUIRE(e.provider->save_calls() == 0);
    }

    SECTION("Cancelled while a note is syncing") {
        auto hooked = std::make_shared<HookedProvider>(e.provider);
        hooked->before_save = [&](const Note&) { cancel.cancel(); };
        e.providers.register_provider(ProviderType::Local, hooked);

        std::vector<Note> notes;
        for (int i = 0; i < 3; ++i) {
            notes.push_back(e.add_note("note " + std::to_string(i)));
        }

        auto summary = make_sweep(e).run_sweep(cancel).unwrap();
        REQUIRE(summary.cancelled);
        REQUIRE(summary.total_synced == 1);
        REQUIRE(summary.vaults_processed == 0);
        REQUIRE(e.provider->save_calls() == 1);

        int untouched = 0;
        for (const auto& note : notes) {
            if (e.state(note.id).status == SyncStatus::NeverSynced) ++untouched;
        }
        REQUIRE(untouched == 2);
        REQUIRE(e.queue.queue_size().unwrap() == 0);
    }
}

TEST_CASE("Sweep: a throwing provider only fails its note", "[integration][sweep]") {
    Engine e;
    const auto bad = e.add_note("explodes");
    const auto good = e.add_note("fine");

    auto hooked = std::make_shared<HookedProvider>(e.provider);
    hooked->before_save = [&](const Note& note) {
        if (note.id == bad.id) throw std::runtime_error("provider bug");
    };
    e.providers.register_provider(ProviderType::Local, hooked);

    CancellationToken cancel;
    auto summary = make_sweep(e).run_sweep(cancel).unwrap();

    REQUIRE(summary.total_failed == 1);
    REQUIRE(summary.total_synced == 1);
    REQUIRE(summary.vaults_processed == 1);
    REQUIRE(e.state(good.id).status == SyncStatus::Synced);

    // The throw is recorded like any provider failure and retried later.
    const auto state = e.state(bad.id);
    REQUIRE(state.status == SyncStatus::Error);
    REQUIRE(state.retry_count == 1);
    REQUIRE(state.last_error == "provider threw: provider bug");

    auto item = e.queue.get(bad.id).unwrap();
    REQUIRE(item.has_value());
    REQUIRE(item->retry_count == 1);
    REQUIRE(item->next_retry_at == e.clock.now() + e.coordinator.backoff().delay(1));
    REQUIRE(item->last_error_message == "provider threw: provider bug");
    REQUIRE(e.coordinator.locks().size() == 0);
}

TEST_CASE("Sweep: parallel workers sync each note once", "[integration][sweep]") {
    Engine e;
    const auto second_vault = e.add_vault("Second");
    std::vector<Uuid> ids;
    for (int i = 0; i < 12; ++i) {
        ids.push_back(e.add_note("note " + std::to_string(i), i % 2 == 0 ? e.vault : second_vault).id);
    }
    e.provider->set_save_delay(5ms);

    auto sweep = make_sweep(e, 4);
    REQUIRE(sweep.worker_count() == 4);

    CancellationToken cancel;
    auto summary = sweep.run_sweep(cancel).unwrap();

    REQUIRE(summary.total_synced == 12);
    REQUIRE(summary.vaults_processed == 2);
    REQUIRE(e.provider->save_calls() == 12);
    REQUIRE_FALSE(e.provider->overlapping_saves());
    REQUIRE(e.coordinator.locks().size() == 0);
    for (const auto& id : ids) {
        REQUIRE(e.state(id).status == SyncStatus::Synced);
    }
}

TEST_CASE("Sweep: waits for a sync of the same note started elsewhere", "[integration][sweep]") {
    Engine e;
    const auto note = e.add_note("shared");
    auto sweep = make_sweep(e, 2);
    CancellationToken cancel;

    std::optional<Result<SweepSummary, Error>> result;
    std::thread runner;
    int saves_while_held = -1;
    {
        NoteLockTable::Guard held(e.coordinator.locks(), note.id);
        runner = std::thread([&] { result = sweep.run_sweep(cancel); });
        std::this_thread::sleep_for(100ms);
        saves_while_held = e.provider->save_calls();
    }
    runner.join();

    REQUIRE(saves_while_held == 0);
    REQUIRE(result.has_value());
    REQUIRE(result->is_ok());
    REQUIRE(result->unwrap().total_synced == 1);
    REQUIRE(e.provider->save_calls() == 1);
    REQUIRE(e.state(note.id).status == SyncStatus::Synced);
}

TEST_CASE("Sweep: files changed in the vault are found and pulled", "[integration][sweep]") {
    Engine e;
    auto note = e.add_note("first draft");
    CancellationToken cancel;
    REQUIRE(make_sweep(e).run_sweep(cancel).unwrap().total_synced == 1);

    SECTION("Our own uploads are not pulled back") {
        const int loads = e.provider->load_calls();
        auto summary = make_sweep(e).run_sweep(cancel).unwrap();
        REQUIRE(summary.total_synced == 0);
        REQUIRE(e.provider->load_calls() == loads);
        REQUIRE(e.state(note.id).status == SyncStatus::Synced);
    }

    SECTION("A note created by another program") {
        const auto stranger = Uuid::generate();
        e.provider->put_file(stranger, e.vault, "written elsewhere", e.clock.now() + 1s);

        auto summary = make_sweep(e).run_sweep(cancel).unwrap();
        REQUIRE(summary.total_synced == 1);
        REQUIRE(e.note(stranger).content == "written elsewhere");
        REQUIRE(e.note(stranger).vault_id == e.vault.id);
        REQUIRE(e.state(stranger).status == SyncStatus::Synced);
    }

    SECTION("A tracked note edited in the vault") {
        e.clock.advance(10s);
        e.provider->put_file(note.id, e.vault, "second draft", e.clock.now());

        auto summary = make_sweep(e).run_sweep(cancel).unwrap();
        REQUIRE(summary.total_synced == 1);
        REQUIRE(e.note(note.id).content == "second draft");
        REQUIRE(e.state(note.id).status == SyncStatus::Synced);
    }

    SECTION("A vault that cannot be listed is still swept") {
        const auto local = e.add_note("local only");
        e.provider->fail_metadata(true);

        auto summary = make_sweep(e).run_sweep(cancel).unwrap();
        REQUIRE(summary.vaults_processed == 1);
        REQUIRE(summary.total_failed == 1);
        REQUIRE(e.state(local.id).status == SyncStatus::Error);
    }
}

TEST_CASE("Sweep: failing to list vaults aborts", "[integration][sweep]") {
    Engine e;
    BrokenVaults broken;
    SyncSweep sweep(e.coordinator, broken, e.notes, e.states, e.queue, e.clock);

    CancellationToken cancel;
    auto result = sweep.run_sweep(cancel);
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == ErrorKind::Storage);
}

TEST_CASE("Sweep: worker count is at least one", "[integration][sweep]") {
    Engine e;
    REQUIRE(make_sweep(e, 0).worker_count() == 1);
}
