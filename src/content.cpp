#include "content.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace {

std::string toLowerAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

constexpr std::array<std::pair<NarrativeKey, const char*>, 16> kNarrativeNames = {{
    {NarrativeKey::None, "none"},
    {NarrativeKey::PlasticBan, "plastic_ban"},
    {NarrativeKey::Cleanup, "cleanup"},
    {NarrativeKey::Interception, "interception"},
    {NarrativeKey::Awareness, "awareness"},
    {NarrativeKey::ProducerResponsibility, "producer_responsibility"},
    {NarrativeKey::WasteInfrastructure, "waste_infrastructure"},
    {NarrativeKey::MaterialsResearch, "materials_research"},
    {NarrativeKey::Treaty, "treaty"},
    {NarrativeKey::CircularEconomy, "circular_economy"},
    {NarrativeKey::FishingIndustry, "fishing_industry"},
    {NarrativeKey::FishingLimits, "fishing_limits"},
    {NarrativeKey::Fiscal, "fiscal"},
    {NarrativeKey::Restoration, "restoration"},
    {NarrativeKey::Protection, "protection"},
    {NarrativeKey::Greenwash, "greenwash"},
}};

} // namespace

const EventRecord* ContentCatalog::findEvent(const std::string& id) const {
    for (const EventRecord& e : events) {
        if (e.id == id) return &e;
    }
    return nullptr;
}

const ActionRecord* ContentCatalog::findAction(const std::string& id) const {
    for (const ActionRecord& a : actions) {
        if (a.id == id) return &a;
    }
    return nullptr;
}

const char* eventKindName(EventKind kind) {
    switch (kind) {
        case EventKind::Automatic: return "automatic";
        case EventKind::Interactive: return "interactive";
    }
    return "unknown";
}

const char* narrativeKeyName(NarrativeKey key) {
    for (const auto& entry : kNarrativeNames) {
        if (entry.first == key) return entry.second;
    }
    return "unknown";
}

bool parseEventKind(const std::string& value, EventKind& out) {
    const std::string v = toLowerAscii(value);
    // "auto" is the spelling older content files used.
    if (v == "automatic" || v == "auto") {
        out = EventKind::Automatic;
        return true;
    }
    if (v == "interactive") {
        out = EventKind::Interactive;
        return true;
    }
    return false;
}

bool parseNarrativeKey(const std::string& value, NarrativeKey& out) {
    const std::string v = toLowerAscii(value);
    for (const auto& entry : kNarrativeNames) {
        if (v == entry.second) {
            out = entry.first;
            return true;
        }
    }
    return false;
}
