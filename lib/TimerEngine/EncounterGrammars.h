/*
 * =================================================================================
 * Project:   Special Attack Timers - Regen & Surge Cooldown Tracker
 * File:      lib/TimerEngine/EncounterGrammars.h
 *
 * Description:
 * Text and zone vocabulary of the three supported encounters:
 *   A. Fortis Colosseum   (waves)
 *   B. Doom of Mokhaiotl  (delves)
 *   C. Theatre of Blood   (boss rooms)
 * plus the restore / cooldown markers. Each matcher is a plain function
 * tried in a fixed order; the first hit wins.
 * =================================================================================
 */
#pragma once
#include "Types.h"

// --- Colosseum (waves) ---
#define COLOSSEUM_MAX_WAVE 12
#define CLAIM_REWARDS_MESSAGE "Search the chest nearby"

// --- Doom of Mokhaiotl (delves) ---
#define DOOM_NPC_NAME_MARKER "Doom"

// --- Theatre of Blood (rooms) ---
#define TOB_COMPLETION_PREFIX "Theatre of Blood total completion time:"
#define TOB_LOBBY_REGION 12869
#define TOB_MAIDEN_REGION 12613
#define TOB_BLOAT_REGION 13125
#define TOB_NYLOCAS_REGION 13122
#define TOB_SOTETSEG_REGION 13123
#define TOB_SOTETSEG_MAZE_REGION 13379
#define TOB_XARPUS_REGION 12612
#define TOB_VERZIK_REGION 12611
#define VERZIK_FIGHT_START_NPC_ID 8370
#define TOB_STATUS_IN_PARTY 2
#define TOB_STATUS_IN_RAID 3
#define BARRIER_CONFIRM_OPTION "Yes, let's begin"
#define VERZIK_CONFIRM_OPTION "Continue"

// --- Restore & Cooldown Markers ---
#define SURGE_POTION_MESSAGE "You drink some of your surge potion."
#define DEATH_CHARGE_MESSAGE "Some of your special attack energy has been restored"
#define SURGE_COOLDOWN_EXPIRED_MESSAGE "You now feel capable of drinking another dose of surge potion."

// A Theatre of Blood boss room. Barrier bounds are inclusive template coordinates.
struct BossRoom {
  int32_t regionId;
  const char *name;
  ZoneEntryStrategy strategy;
  int32_t minX, maxX;
  int32_t minY, maxY;
};

typedef bool (*SignalMatcher)(const char *text, TextSignal &out);

struct GrammarRule {
  const char *name;
  SignalMatcher match;
};

class EncounterGrammars {
public:
    // --- Colosseum (waves) ---
    static bool matchWaveCompleted(const char *text, TextSignal &out);
    static bool matchWaveStarted(const char *text, TextSignal &out);
    static bool matchRewardClaimed(const char *text, TextSignal &out);

    // --- Doom of Mokhaiotl (delves) ---
    static bool matchDelveCompleted(const char *text, TextSignal &out);
    static bool isDoomSpawn(const char *npcName);

    // --- Theatre of Blood (rooms) ---
    static bool matchRoomCompleted(const char *text, TextSignal &out);
    static bool matchRunCompleted(const char *text, TextSignal &out);
    static const BossRoom *findBossRoom(int32_t regionId);
    static bool isInsideStatus(int32_t status);
    static bool isBarrierCrossed(const BossRoom &room, int32_t x, int32_t y);

    // --- Markers ---
    static bool matchSurgeRestore(const char *text, TextSignal &out);
    static bool matchDeathChargeRestore(const char *text, TextSignal &out);
    static bool matchCooldownExpired(const char *text, TextSignal &out);

    /**
     * Runs the rule table in priority order.
     * @param text Tag-stripped message.
     * @param out  Filled with the first match; kind is SIG_NONE otherwise.
     * @return true if any rule matched.
     */
    static bool classify(const char *text, TextSignal &out);

    static const GrammarRule *rules(size_t &count);
};
