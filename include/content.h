#pragma once

#include <string>
#include <vector>

#include "effect_bundle.h"

enum class EventKind {
    Automatic,
    Interactive
};

struct EventChoice {
    std::string text;
    EffectBundle effects;
};

struct EventRecord {
    std::string id;
    std::string name;
    std::string text;
    int minTick = 0; // inclusive
    int maxTick = 0; // inclusive
    int weight = 1;  // Selection weight inside [minTick, maxTick].
    EventKind kind = EventKind::Automatic;
    EffectBundle effects;             // Applied directly for automatic events.
    std::vector<EventChoice> choices; // Interactive only, at most kMaxEventChoices.

    static constexpr int kMaxEventChoices = 3;

    bool isInteractive() const { return kind == EventKind::Interactive; }
    bool activeAt(int tick) const { return tick >= minTick && tick <= maxTick; }
};

// Authored per action so the report layer never has to inspect display names.
enum class NarrativeKey {
    None,
    PlasticBan,
    Cleanup,
    Interception,
    Awareness,
    ProducerResponsibility,
    WasteInfrastructure,
    MaterialsResearch,
    Treaty,
    CircularEconomy,
    FishingIndustry,
    FishingLimits,
    Fiscal,
    Restoration,
    Protection,
    Greenwash
};

struct ActionRecord {
    std::string id;
    std::string name;
    std::string description;
    int unlockTick = 0;
    int minTrust = 0;
    int cost = 0; // Deducted from treasury when chosen; may be 0.
    EffectBundle effects; // incomeBase carries the action's income delta.
    bool repeatable = false;
    NarrativeKey narrative = NarrativeKey::None;
};

// Loaded once at session start and shared read-only for the whole run.
struct ContentCatalog {
    std::vector<EventRecord> events;
    std::vector<ActionRecord> actions;

    const EventRecord* findEvent(const std::string& id) const;
    const ActionRecord* findAction(const std::string& id) const;
};

const char* eventKindName(EventKind kind);
const char* narrativeKeyName(NarrativeKey key);
bool parseEventKind(const std::string& value, EventKind& out);
bool parseNarrativeKey(const std::string& value, NarrativeKey& out);
