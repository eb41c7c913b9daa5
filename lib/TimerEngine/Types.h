/*
 * =================================================================================
 * Project:   Special Attack Timers - Regen & Surge Cooldown Tracker
 * File:      Types.h
 * =================================================================================
 */
#pragma once
#include <stdint.h>
#include <stddef.h>

// --- Enums ---
enum EventType : uint8_t {
  EVT_SESSION_START,
  EVT_SESSION_END,
  EVT_TICK,
  EVT_CHAT_MESSAGE,
  EVT_EQUIPMENT_CHANGED,
  EVT_NPC_SPAWNED,
  EVT_MENU_OPTION,
  EVT_ENCOUNTER_STATUS
};
enum ChatChannel : uint8_t { CHAT_GAME, CHAT_SPAM, CHAT_OTHER };
enum EventResult : uint8_t { EVENT_APPLIED, EVENT_IGNORED, EVENT_REJECTED };
enum DisplayFormat : uint8_t { FORMAT_TICKS, FORMAT_SECONDS, FORMAT_DECIMALS };

// What a recognized text message means to the engine.
enum SignalKind : uint8_t {
  SIG_NONE,
  SIG_WAVE_COMPLETED,  // Colosseum
  SIG_WAVE_STARTED,    // Colosseum
  SIG_REWARD_CLAIMED,  // Colosseum
  SIG_DELVE_COMPLETED, // Delve
  SIG_ROOM_COMPLETED,  // Theatre
  SIG_RUN_COMPLETED,   // Theatre
  SIG_SURGE_RESTORE,
  SIG_DEATH_CHARGE_RESTORE,
  SIG_COOLDOWN_EXPIRED
};

// How a Theatre boss room detects that the fight area was entered.
enum ZoneEntryStrategy : uint8_t { ZONE_ENTRY_REGION, ZONE_ENTRY_BARRIER, ZONE_ENTRY_NPC };

// --- Constants ---

// Energy (displayed as 100%, stored as 1000)
#define MAX_SPEC_ENERGY 1000
#define SURGE_POTION_RESTORE 250
#define DEATH_CHARGE_RESTORE 150

// Timing
#define TICK_DURATION_MS 600
#define SPEC_REGEN_TICKS 50
#define LIGHTBEARER_REGEN_TICKS (SPEC_REGEN_TICKS / 2)
#define SURGE_COOLDOWN_TICKS 500
#define RESTORE_GRACE_TICKS 2
#define DELVE_RESEED_OFFSET 2

// Sentinels
#define NO_REGION -1
#define NO_ENERGY -1
#define NO_TICK -1

// Text buffers
#define MAX_EVENT_TEXT 128
#define MAX_LOG_LENGTH 150

// --- Configuration Structs ---
struct TimerDefaults {
  uint32_t regenTicks;
  uint32_t acceleratedRegenTicks;
  uint32_t maxEnergy;
  uint32_t restoreGraceTicks;
  uint32_t delveReseedOffset;
  uint32_t surgeCooldownMs;
};

struct DisplaySettings {
  bool showInfoBox;
  DisplayFormat displayFormat;
  bool showCircularOverlay;
  bool showSurgeInfoBox;
  DisplayFormat surgeDisplayFormat;
  uint32_t activeColor;      // 0xRRGGBBAA
  uint32_t circleColor;
  uint32_t surgeColor;
  uint32_t surgePausedColor;
};

// --- State Structs ---
struct TimerState {
  int32_t ticksUntilRegen;
  int32_t regenCadence;
  bool accelerated;
  int32_t lastObservedEnergy; // NO_ENERGY until the first sample
  bool ignoreWindowActive;
  int32_t ignoreUntilTick;    // NO_TICK until the next tick anchors it
  int32_t expectedDelta;
};

struct PhaseState {
  bool encounterPaused;     // regen + cooldown
  bool secondaryZonePaused; // cooldown only (between Theatre rooms)
  bool encounterModeActive;
  int32_t currentZoneId;    // NO_REGION until a valid sample
  bool segmentEntryArmed;
  bool roomCheckPending;    // entered before any zone sample
};

struct CooldownState {
  bool running;
  unsigned long endMillis;
  bool paused;
  uint32_t pausedRemainingMs;
};

struct SessionState {
  bool loggedIn;
  int32_t lastTickIndex;
  TimerState regen;
  PhaseState phase;
  CooldownState cooldown;
};

// --- Signal Structs ---
struct Location {
  bool valid;
  int32_t regionId;
  int32_t x;
  int32_t y;
};

struct TextSignal {
  SignalKind kind;
  int32_t segment;       // wave / delve number when the grammar carries one
  int32_t expectedDelta; // restore markers only
};

struct TimerEvent {
  EventType type;
  int32_t specEnergy;
  int32_t tickIndex;     // -1 on text events means "use the last tick seen"
  Location location;
  ChatChannel channel;
  bool accelerated;
  int32_t npcId;
  int32_t status;
  char text[MAX_EVENT_TEXT + 1];
};

extern const char *eventTypeToString(EventType t);
extern const char *signalKindToString(SignalKind k);
extern const char *formatToString(DisplayFormat f);
extern const char *resultToString(EventResult r);
