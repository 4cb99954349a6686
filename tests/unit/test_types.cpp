#include <catch2/catch_test_macros.hpp>
#include "core/content_hash.hpp"
#include "core/note.hpp"
#include "core/sync_types.hpp"
#include "core/types.hpp"
#include "core/vault.hpp"

using namespace vaultsync;

TEST_CASE("Uuid text form round-trips", "[types]") {
    const auto id = Uuid::generate();
    const auto text = id.to_string();

    REQUIRE(text.size() == 36);
    REQUIRE(text[8] == '-');
    REQUIRE(text[14] == '4');

    auto parsed = Uuid::parse(text);
    REQUIRE(parsed.has_value());
    REQUIRE(*parsed == id);

    SECTION("plain hex is accepted") {
        std::string plain;
        for (char c : text) {
            if (c != '-') plain += c;
        }
        REQUIRE(Uuid::parse(plain) == id);
    }

    SECTION("malformed input is rejected") {
        REQUIRE_FALSE(Uuid::parse("").has_value());
        REQUIRE_FALSE(Uuid::parse("not-a-uuid").has_value());
        REQUIRE_FALSE(Uuid::parse("zz345678-1234-4234-8234-123456789abc").has_value());
    }

    REQUIRE(Uuid{}.is_nil());
    REQUIRE_FALSE(id.is_nil());
}

TEST_CASE("Timestamp arithmetic is exact in milliseconds", "[types]") {
    const Timestamp t(1'700'000'000'000);

    REQUIRE((t + std::chrono::seconds(30)).millis() == 1'700'000'030'000);
    REQUIRE((t - std::chrono::milliseconds(1)).millis() == 1'699'999'999'999);
    REQUIRE((t + std::chrono::seconds(5)) - t == std::chrono::milliseconds(5000));
    REQUIRE(t < t + std::chrono::milliseconds(1));
    REQUIRE(Timestamp(0).to_iso_string() == "1970-01-01T00:00:00.000Z");
    REQUIRE(Timestamp(1'500).to_iso_string() == "1970-01-01T00:00:01.500Z");
}

TEST_CASE("content_hash is BLAKE2b-256 hex", "[types]") {
    REQUIRE(init_hashing().is_ok());

    const auto empty = content_hash("");
    REQUIRE(empty.size() == CONTENT_HASH_HEX_SIZE);
    REQUIRE(empty == "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8");

    REQUIRE(content_hash("hello") == content_hash(std::string("hello")));
    REQUIRE(content_hash("hello") != content_hash("hello\n"));
}

TEST_CASE("Note helpers keep versions consistent", "[types]") {
    const Timestamp t0(1'000);
    const Timestamp t1(2'000);
    auto note = create_note(Uuid::generate(), Uuid::generate(), "draft", "Title", t0);

    REQUIRE(note.created_at == t0);
    REQUIRE(note.updated_at == t0);
    REQUIRE_FALSE(note.is_synced);

    note.is_synced = true;
    auto edited = with_content(note, "final", t1);
    REQUIRE(edited.content == "final");
    REQUIRE(edited.updated_at == t1);
    REQUIRE(edited.created_at == t0);
    REQUIRE_FALSE(edited.is_synced);

    auto version = local_version(edited);
    REQUIRE(version.note_id == edited.id);
    REQUIRE(version.modified_at == t1);
    REQUIRE(version.content_hash == content_hash("final"));
}

TEST_CASE("Enum text forms parse back", "[types]") {
    for (auto status : {SyncStatus::NeverSynced, SyncStatus::PendingUpload,
                        SyncStatus::PendingDownload, SyncStatus::Synced,
                        SyncStatus::Conflict, SyncStatus::Error}) {
        REQUIRE(parse_sync_status(to_string(status)) == status);
    }
    REQUIRE(to_string(SyncStatus::PendingUpload) == "pending_upload");
    REQUIRE_FALSE(parse_sync_status("bogus").has_value());

    REQUIRE(parse_provider_type("obsidian") == ProviderType::Obsidian);
    REQUIRE_FALSE(parse_provider_type("dropbox").has_value());
    REQUIRE(parse_conflict_strategy("merge") == ConflictStrategy::Merge);
    REQUIRE(to_string(ConflictStrategy::LastWriteWins) == "last_write_wins");
}

TEST_CASE("RetryQueueItem readiness and exhaustion", "[types]") {
    RetryQueueItem item{
        .note_id = Uuid::generate(),
        .vault_id = Uuid::generate(),
        .retry_count = 4,
        .last_attempt_at = Timestamp(1'000),
        .next_retry_at = Timestamp(5'000),
        .last_error_message = std::nullopt,
        .created_at = Timestamp(1'000)
    };

    REQUIRE_FALSE(item.is_ready(Timestamp(4'999)));
    REQUIRE(item.is_ready(Timestamp(5'000)));
    REQUIRE_FALSE(item.has_exceeded(DEFAULT_MAX_RETRIES));
    item.retry_count = DEFAULT_MAX_RETRIES;
    REQUIRE(item.has_exceeded(DEFAULT_MAX_RETRIES));
}
