#pragma once

#include <string>

class ConflictEngine;

struct SnapshotReport {
    int countries = 0;
    int players = 0;
    int wars = 0;
    int pushes = 0;
    int repairedPushes = 0;   // active pushes whose war was missing or over
    int clearedPlayerLinks = 0;
    int repairedWars = 0;     // second active war for the same pair
};

// TOML mirror of the engine state: [[countries]], [[players]], [[wars]],
// [[pushes]] and [[accounts]]. Restoring replaces the engine state wholesale
// and must not run while the tick scheduler is active.
std::string renderSnapshot(ConflictEngine& engine);
bool restoreSnapshot(ConflictEngine& engine,
                     const std::string& tomlText,
                     std::string* errorMessage = nullptr,
                     SnapshotReport* report = nullptr);

bool saveSnapshot(ConflictEngine& engine, const std::string& path, std::string* errorMessage = nullptr);
bool loadSnapshot(ConflictEngine& engine,
                  const std::string& path,
                  std::string* errorMessage = nullptr,
                  SnapshotReport* report = nullptr);
