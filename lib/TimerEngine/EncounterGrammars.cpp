/*
 * =================================================================================
 * Project:   Special Attack Timers - Regen & Surge Cooldown Tracker
 * File:      lib/TimerEngine/EncounterGrammars.cpp
 * =================================================================================
 */
#include <limits.h>
#include <string.h>

#include "EncounterGrammars.h"
#include "LogicUtils.h"

// =================================================================================
// SECTION: TABLES
// =================================================================================

// Template region IDs (de-instanced). Bloat, Nylocas, Sotetseg and Xarpus
// include a hallway, so entry is detected by crossing the barrier tiles.
static const BossRoom BOSS_ROOMS[] = {
    { TOB_MAIDEN_REGION,        "Maiden",        ZONE_ENTRY_REGION,  0, 0, 0, 0 },
    { TOB_BLOAT_REGION,         "Bloat",         ZONE_ENTRY_BARRIER, INT_MIN, 3303, 4446, 4449 },
    { TOB_NYLOCAS_REGION,       "Nylocas",       ZONE_ENTRY_BARRIER, 3295, 3296, 4254, 4254 },
    { TOB_SOTETSEG_REGION,      "Sotetseg",      ZONE_ENTRY_BARRIER, 3278, 3281, 4308, 4308 },
    { TOB_SOTETSEG_MAZE_REGION, "Sotetseg Maze", ZONE_ENTRY_REGION,  0, 0, 0, 0 },
    { TOB_XARPUS_REGION,        "Xarpus",        ZONE_ENTRY_BARRIER, 3169, 3171, 4380, 4380 },
    { TOB_VERZIK_REGION,        "Verzik",        ZONE_ENTRY_NPC,     0, 0, 0, 0 },
};
static const size_t NUM_BOSS_ROOMS = sizeof(BOSS_ROOMS) / sizeof(BOSS_ROOMS[0]);

// Priority order. Phase markers come before restore markers.
static const GrammarRule RULES[] = {
    { "WaveCompleted",   EncounterGrammars::matchWaveCompleted },
    { "WaveStarted",     EncounterGrammars::matchWaveStarted },
    { "RewardClaimed",   EncounterGrammars::matchRewardClaimed },
    { "DelveCompleted",  EncounterGrammars::matchDelveCompleted },
    { "RoomCompleted",   EncounterGrammars::matchRoomCompleted },
    { "RunCompleted",    EncounterGrammars::matchRunCompleted },
    { "SurgeRestore",    EncounterGrammars::matchSurgeRestore },
    { "DeathCharge",     EncounterGrammars::matchDeathChargeRestore },
    { "CooldownExpired", EncounterGrammars::matchCooldownExpired },
};
static const size_t NUM_RULES = sizeof(RULES) / sizeof(RULES[0]);

static void setSignal(TextSignal &out, SignalKind kind, int32_t segment, int32_t expectedDelta) {
    out.kind = kind;
    out.segment = segment;
    out.expectedDelta = expectedDelta;
}

// =================================================================================
// SECTION: COLOSSEUM WAVES
// =================================================================================

// "Wave 7 completed! Wave duration: ..."
bool EncounterGrammars::matchWaveCompleted(const char *text, TextSignal &out) {
    if (!LogicUtils::startsWith(text, "Wave ")) return false;

    int32_t wave = 0;
    const char *rest = nullptr;
    if (!LogicUtils::parseBoundedNumber(text + 5, 1, COLOSSEUM_MAX_WAVE, wave, &rest)) return false;
    if (!LogicUtils::startsWith(rest, " completed!")) return false;

    setSignal(out, SIG_WAVE_COMPLETED, wave, 0);
    return true;
}

// "Wave: 7" and nothing else
bool EncounterGrammars::matchWaveStarted(const char *text, TextSignal &out) {
    if (!LogicUtils::startsWith(text, "Wave: ")) return false;

    int32_t wave = 0;
    const char *rest = nullptr;
    if (!LogicUtils::parseBoundedNumber(text + 6, 1, COLOSSEUM_MAX_WAVE, wave, &rest)) return false;
    if (*rest != '\0') return false;

    setSignal(out, SIG_WAVE_STARTED, wave, 0);
    return true;
}

bool EncounterGrammars::matchRewardClaimed(const char *text, TextSignal &out) {
    if (!LogicUtils::contains(text, CLAIM_REWARDS_MESSAGE)) return false;
    setSignal(out, SIG_REWARD_CLAIMED, 0, 0);
    return true;
}

// =================================================================================
// SECTION: DOOM OF MOKHAIOTL DELVES
// =================================================================================

// "Delve level: 3 duration: 1:02.40"
bool EncounterGrammars::matchDelveCompleted(const char *text, TextSignal &out) {
    if (!LogicUtils::startsWith(text, "Delve level: ")) return false;

    int32_t level = 0;
    const char *rest = LogicUtils::skipDigits(text + 13, level);
    if (rest == nullptr) return false;
    if (!LogicUtils::startsWith(rest, " duration:")) return false;

    setSignal(out, SIG_DELVE_COMPLETED, level, 0);
    return true;
}

bool EncounterGrammars::isDoomSpawn(const char *npcName) {
    return npcName != nullptr && LogicUtils::contains(npcName, DOOM_NPC_NAME_MARKER);
}

// =================================================================================
// SECTION: THEATRE OF BLOOD ROOMS
// =================================================================================

// "Wave 'The Maiden of Sugadinti' (Normal Mode) complete! Duration: ..."
bool EncounterGrammars::matchRoomCompleted(const char *text, TextSignal &out) {
    if (!LogicUtils::startsWith(text, "Wave '")) return false;

    const char *closeQuote = strstr(text + 6, "' (");
    if (closeQuote == nullptr) return false;
    if (strstr(closeQuote + 3, ") complete!") == nullptr) return false;

    setSignal(out, SIG_ROOM_COMPLETED, 0, 0);
    return true;
}

bool EncounterGrammars::matchRunCompleted(const char *text, TextSignal &out) {
    if (!LogicUtils::startsWith(text, TOB_COMPLETION_PREFIX)) return false;
    setSignal(out, SIG_RUN_COMPLETED, 0, 0);
    return true;
}

const BossRoom *EncounterGrammars::findBossRoom(int32_t regionId) {
    for (size_t i = 0; i < NUM_BOSS_ROOMS; i++) {
        if (BOSS_ROOMS[i].regionId == regionId) return &BOSS_ROOMS[i];
    }
    return nullptr;
}

bool EncounterGrammars::isInsideStatus(int32_t status) {
    return status == TOB_STATUS_IN_PARTY || status == TOB_STATUS_IN_RAID;
}

bool EncounterGrammars::isBarrierCrossed(const BossRoom &room, int32_t x, int32_t y) {
    if (room.strategy != ZONE_ENTRY_BARRIER) return false;
    return x >= room.minX && x <= room.maxX && y >= room.minY && y <= room.maxY;
}

// =================================================================================
// SECTION: RESTORE & COOLDOWN MARKERS
// =================================================================================

bool EncounterGrammars::matchSurgeRestore(const char *text, TextSignal &out) {
    if (strcmp(text, SURGE_POTION_MESSAGE) != 0) return false;
    setSignal(out, SIG_SURGE_RESTORE, 0, SURGE_POTION_RESTORE);
    return true;
}

bool EncounterGrammars::matchDeathChargeRestore(const char *text, TextSignal &out) {
    if (!LogicUtils::contains(text, DEATH_CHARGE_MESSAGE)) return false;
    setSignal(out, SIG_DEATH_CHARGE_RESTORE, 0, DEATH_CHARGE_RESTORE);
    return true;
}

bool EncounterGrammars::matchCooldownExpired(const char *text, TextSignal &out) {
    if (strcmp(text, SURGE_COOLDOWN_EXPIRED_MESSAGE) != 0) return false;
    setSignal(out, SIG_COOLDOWN_EXPIRED, 0, 0);
    return true;
}

// =================================================================================
// SECTION: DISPATCH
// =================================================================================

bool EncounterGrammars::classify(const char *text, TextSignal &out) {
    setSignal(out, SIG_NONE, 0, 0);
    if (text == nullptr) return false;

    for (size_t i = 0; i < NUM_RULES; i++) {
        if (RULES[i].match(text, out)) return true;
    }
    return false;
}

const GrammarRule *EncounterGrammars::rules(size_t &count) {
    count = NUM_RULES;
    return RULES;
}
