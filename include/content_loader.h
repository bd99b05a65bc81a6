#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "content.h"

// Reads `events.toml` and `actions.toml` from `contentDir`.
bool loadContentCatalog(const std::string& contentDir, ContentCatalog& out, std::string* errorMessage = nullptr);

bool loadEventsFromFile(const std::string& path, std::vector<EventRecord>& out, std::string* errorMessage = nullptr);
bool loadActionsFromFile(const std::string& path, std::vector<ActionRecord>& out, std::string* errorMessage = nullptr);

// In-memory variants; `sourceName` is only used in messages.
bool parseEventsToml(std::string_view text,
                     const std::string& sourceName,
                     std::vector<EventRecord>& out,
                     std::string* errorMessage = nullptr);
bool parseActionsToml(std::string_view text,
                      const std::string& sourceName,
                      std::vector<ActionRecord>& out,
                      std::string* errorMessage = nullptr);
