#pragma once
#include <cstdint>
#include <string>

namespace netstash {

// Tag-based event dispatch, no RTTI. Events are stack-allocated structs
// and never deleted through a base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* ConnectivityChanged = "ConnectivityChanged";
    constexpr const char* GenerationActivated = "GenerationActivated";
    constexpr const char* EntryStored         = "EntryStored";
    constexpr const char* PartitionCleared    = "PartitionCleared";
    constexpr const char* SubmissionQueued    = "SubmissionQueued";
    constexpr const char* QueueReplayed       = "QueueReplayed";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

// The host's online signal flipped.
struct ConnectivityChangedEvent : Event {
    static constexpr const char* TAG = event_tags::ConnectivityChanged;
    bool online = true;

    ConnectivityChangedEvent() { type_tag = TAG; }
};

struct GenerationActivatedEvent : Event {
    static constexpr const char* TAG = event_tags::GenerationActivated;
    uint32_t generation = 0;
    size_t storages_deleted = 0;

    GenerationActivatedEvent() { type_tag = TAG; }
};

// A warm or precache pass stored an entry.
struct EntryStoredEvent : Event {
    static constexpr const char* TAG = event_tags::EntryStored;
    std::string storage;
    std::string url;

    EntryStoredEvent() { type_tag = TAG; }
};

struct PartitionClearedEvent : Event {
    static constexpr const char* TAG = event_tags::PartitionCleared;
    std::string storage;

    PartitionClearedEvent() { type_tag = TAG; }
};

struct SubmissionQueuedEvent : Event {
    static constexpr const char* TAG = event_tags::SubmissionQueued;
    uint64_t submission_id = 0;
    std::string url;

    SubmissionQueuedEvent() { type_tag = TAG; }
};

struct QueueReplayedEvent : Event {
    static constexpr const char* TAG = event_tags::QueueReplayed;
    size_t delivered = 0;
    size_t remaining = 0;
    bool rejected = false;

    QueueReplayedEvent() { type_tag = TAG; }
};

} // namespace netstash
