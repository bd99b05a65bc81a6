#include "content_loader.h"

#include <cmath>
#include <filesystem>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <unordered_set>

#include <toml++/toml.hpp>

namespace {

struct RecordScope {
    const std::string& source;
    const char* arrayName;
    std::size_t index;
    std::string id;

    std::string describe() const {
        std::ostringstream oss;
        oss << source << ": " << arrayName << "[" << index << "]";
        if (!id.empty()) {
            oss << " (" << id << ")";
        }
        return oss.str();
    }
};

void setError(std::string* errorMessage, const RecordScope& scope, const std::string& problem) {
    if (errorMessage) {
        *errorMessage = scope.describe() + ": " + problem;
    }
}

void warnMalformed(const RecordScope& scope, const std::string& where, std::string_view key) {
    std::cerr << "[Content] " << scope.describe() << ": " << where << "." << key
              << " is not numeric; treating it as absent.\n";
}

std::optional<int> numericAsInt(const toml::node& node) {
    if (const auto* i = node.as_integer()) {
        const std::int64_t v = i->get();
        if (v > std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
        if (v < std::numeric_limits<int>::min()) return std::numeric_limits<int>::min();
        return static_cast<int>(v);
    }
    if (const auto* f = node.as_floating_point()) {
        const double v = f->get();
        if (!std::isfinite(v)) return std::nullopt;
        if (v >= static_cast<double>(std::numeric_limits<int>::max())) return std::numeric_limits<int>::max();
        if (v <= static_cast<double>(std::numeric_limits<int>::min())) return std::numeric_limits<int>::min();
        return static_cast<int>(v); // truncates toward zero
    }
    return std::nullopt;
}

std::optional<double> numericAsDouble(const toml::node& node) {
    if (const auto* f = node.as_floating_point()) {
        if (!std::isfinite(f->get())) return std::nullopt;
        return f->get();
    }
    if (const auto* i = node.as_integer()) {
        return static_cast<double>(i->get());
    }
    return std::nullopt;
}

// Unknown keys are ignored; recognized keys with a non-numeric value are
// dropped with a warning and loading continues.
EffectBundle readEffectBundle(const toml::table* table, const RecordScope& scope, const std::string& where) {
    EffectBundle bundle;
    if (!table) {
        return bundle;
    }

    auto readDelta = [&](std::string_view key, std::optional<int>& target) {
        const toml::node* node = table->get(key);
        if (!node) return;
        target = numericAsInt(*node);
        if (!target) warnMalformed(scope, where, key);
    };

    readDelta("treasury", bundle.treasury);
    readDelta("pollution", bundle.pollution);
    readDelta("vitality", bundle.vitality);
    readDelta("trust", bundle.trust);
    readDelta("incomeBase", bundle.incomeBase);
    if (const toml::node* node = table->get("growthRate")) {
        bundle.growthRate = numericAsDouble(*node);
        if (!bundle.growthRate) warnMalformed(scope, where, "growthRate");
    }
    return bundle;
}

bool readString(const toml::table& t, std::string_view key, std::string& target, bool required,
                const RecordScope& scope, std::string* errorMessage) {
    const toml::node* node = t.get(key);
    if (!node) {
        if (required) {
            setError(errorMessage, scope, "missing required field '" + std::string(key) + "'");
            return false;
        }
        return true;
    }
    if (const auto v = node->value<std::string>()) {
        target = *v;
        return true;
    }
    setError(errorMessage, scope, "field '" + std::string(key) + "' must be a string");
    return false;
}

bool readInt(const toml::table& t, std::string_view key, int& target,
             const RecordScope& scope, std::string* errorMessage) {
    const toml::node* node = t.get(key);
    if (!node) {
        return true;
    }
    const toml::value<std::int64_t>* v = node->as_integer();
    if (!v || v->get() > std::numeric_limits<int>::max() || v->get() < std::numeric_limits<int>::min()) {
        setError(errorMessage, scope, "field '" + std::string(key) + "' must be an integer");
        return false;
    }
    target = static_cast<int>(v->get());
    return true;
}

bool readBool(const toml::table& t, std::string_view key, bool& target,
              const RecordScope& scope, std::string* errorMessage) {
    const toml::node* node = t.get(key);
    if (!node) {
        return true;
    }
    if (const auto v = node->value<bool>()) {
        target = *v;
        return true;
    }
    setError(errorMessage, scope, "field '" + std::string(key) + "' must be a boolean");
    return false;
}

bool parseEventTable(const toml::table& t, RecordScope& scope, EventRecord& e, std::string* errorMessage) {
    if (!readString(t, "id", e.id, true, scope, errorMessage)) return false;
    scope.id = e.id;
    e.name = e.id;
    e.maxTick = std::numeric_limits<int>::max();
    if (!readString(t, "name", e.name, false, scope, errorMessage)) return false;
    if (!readString(t, "text", e.text, false, scope, errorMessage)) return false;
    if (!readInt(t, "minTick", e.minTick, scope, errorMessage)) return false;
    if (!readInt(t, "maxTick", e.maxTick, scope, errorMessage)) return false;
    if (!readInt(t, "weight", e.weight, scope, errorMessage)) return false;

    std::string kind = "automatic";
    if (!readString(t, "kind", kind, false, scope, errorMessage)) return false;
    if (!parseEventKind(kind, e.kind)) {
        setError(errorMessage, scope, "unknown kind '" + kind + "'");
        return false;
    }
    if (e.maxTick < e.minTick) {
        setError(errorMessage, scope, "maxTick is before minTick");
        return false;
    }
    if (e.weight < 1) {
        setError(errorMessage, scope, "weight must be >= 1");
        return false;
    }

    e.effects = readEffectBundle(t["effects"].as_table(), scope, "effects");

    const toml::array* choices = t["choices"].as_array();
    if (choices && !e.isInteractive()) {
        std::cerr << "[Content] " << scope.describe() << ": choices on an automatic event are ignored.\n";
    }
    if (e.isInteractive()) {
        if (!choices || choices->empty()) {
            setError(errorMessage, scope, "interactive event needs at least one choice");
            return false;
        }
        if (choices->size() > static_cast<std::size_t>(EventRecord::kMaxEventChoices)) {
            setError(errorMessage, scope, "interactive event has more than 3 choices");
            return false;
        }
        for (std::size_t c = 0; c < choices->size(); ++c) {
            const toml::table* ct = (*choices)[c].as_table();
            if (!ct) {
                setError(errorMessage, scope, "choice " + std::to_string(c) + " is not a table");
                return false;
            }
            EventChoice choice;
            if (!readString(*ct, "text", choice.text, true, scope, errorMessage)) return false;
            choice.effects = readEffectBundle((*ct)["effects"].as_table(), scope,
                                              "choices[" + std::to_string(c) + "].effects");
            e.choices.push_back(std::move(choice));
        }
    }
    return true;
}

bool parseActionTable(const toml::table& t, RecordScope& scope, ActionRecord& a, std::string* errorMessage) {
    if (!readString(t, "id", a.id, true, scope, errorMessage)) return false;
    scope.id = a.id;
    a.name = a.id;
    if (!readString(t, "name", a.name, false, scope, errorMessage)) return false;
    if (!readString(t, "description", a.description, false, scope, errorMessage)) return false;
    if (!readInt(t, "unlockTick", a.unlockTick, scope, errorMessage)) return false;
    if (!readInt(t, "minTrust", a.minTrust, scope, errorMessage)) return false;
    if (!readInt(t, "cost", a.cost, scope, errorMessage)) return false;
    if (!readBool(t, "repeatable", a.repeatable, scope, errorMessage)) return false;
    if (a.cost < 0) {
        setError(errorMessage, scope, "cost must be >= 0");
        return false;
    }

    std::string narrative = "none";
    if (!readString(t, "narrative", narrative, false, scope, errorMessage)) return false;
    if (!parseNarrativeKey(narrative, a.narrative)) {
        setError(errorMessage, scope, "unknown narrative '" + narrative + "'");
        return false;
    }

    a.effects = readEffectBundle(t["effects"].as_table(), scope, "effects");
    if (const toml::node* node = t.get("incomeDelta")) {
        if (const auto delta = numericAsInt(*node)) {
            a.effects.incomeBase = a.effects.incomeBase.value_or(0) + *delta;
        } else {
            warnMalformed(scope, "action", "incomeDelta");
        }
    }
    return true;
}

template <typename Record, typename ParseFn>
bool parseRecordArray(const toml::table& root,
                      const char* arrayName,
                      const std::string& sourceName,
                      ParseFn parse,
                      std::vector<Record>& out,
                      std::string* errorMessage) {
    std::vector<Record> records;
    std::unordered_set<std::string> seenIds;
    if (const toml::array* items = root[arrayName].as_array()) {
        for (std::size_t i = 0; i < items->size(); ++i) {
            RecordScope scope{sourceName, arrayName, i, {}};
            const toml::table* t = (*items)[i].as_table();
            if (!t) {
                setError(errorMessage, scope, "entry is not a table");
                return false;
            }
            Record record;
            if (!parse(*t, scope, record, errorMessage)) {
                return false;
            }
            if (!seenIds.insert(record.id).second) {
                setError(errorMessage, scope, "duplicate id");
                return false;
            }
            records.push_back(std::move(record));
        }
    }
    out = std::move(records);
    return true;
}

template <typename Fn>
bool guardToml(const std::string& sourceName, std::string* errorMessage, Fn fn) {
    try {
        return fn();
    } catch (const toml::parse_error& err) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to parse content '" << sourceName << "': " << err.description()
                << " (line " << err.source().begin.line << ")";
            *errorMessage = oss.str();
        }
    } catch (const std::exception& err) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to load content '" << sourceName << "': " << err.what();
            *errorMessage = oss.str();
        }
    }
    return false;
}

} // namespace

bool parseEventsToml(std::string_view text,
                     const std::string& sourceName,
                     std::vector<EventRecord>& out,
                     std::string* errorMessage) {
    return guardToml(sourceName, errorMessage, [&]() {
        const toml::table root = toml::parse(text, sourceName);
        return parseRecordArray<EventRecord>(root, "events", sourceName, parseEventTable, out, errorMessage);
    });
}

bool parseActionsToml(std::string_view text,
                      const std::string& sourceName,
                      std::vector<ActionRecord>& out,
                      std::string* errorMessage) {
    return guardToml(sourceName, errorMessage, [&]() {
        const toml::table root = toml::parse(text, sourceName);
        return parseRecordArray<ActionRecord>(root, "actions", sourceName, parseActionTable, out, errorMessage);
    });
}

bool loadEventsFromFile(const std::string& path, std::vector<EventRecord>& out, std::string* errorMessage) {
    return guardToml(path, errorMessage, [&]() {
        const toml::table root = toml::parse_file(path);
        return parseRecordArray<EventRecord>(root, "events", path, parseEventTable, out, errorMessage);
    });
}

bool loadActionsFromFile(const std::string& path, std::vector<ActionRecord>& out, std::string* errorMessage) {
    return guardToml(path, errorMessage, [&]() {
        const toml::table root = toml::parse_file(path);
        return parseRecordArray<ActionRecord>(root, "actions", path, parseActionTable, out, errorMessage);
    });
}

bool loadContentCatalog(const std::string& contentDir, ContentCatalog& out, std::string* errorMessage) {
    const std::filesystem::path dir(contentDir);
    ContentCatalog catalog;
    if (!loadEventsFromFile((dir / "events.toml").string(), catalog.events, errorMessage)) {
        return false;
    }
    if (!loadActionsFromFile((dir / "actions.toml").string(), catalog.actions, errorMessage)) {
        return false;
    }
    out = std::move(catalog);
    return true;
}
