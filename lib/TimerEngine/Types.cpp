/*
 * =================================================================================
 * Project:   Special Attack Timers - Regen & Surge Cooldown Tracker
 * File:      Types.cpp
 * =================================================================================
 */

 #include "Types.h"

const char *eventTypeToString(EventType t) {
  switch (t) {
  case EVT_SESSION_START:
    return "SESSION_START";
  case EVT_SESSION_END:
    return "SESSION_END";
  case EVT_TICK:
    return "TICK";
  case EVT_CHAT_MESSAGE:
    return "CHAT_MESSAGE";
  case EVT_EQUIPMENT_CHANGED:
    return "EQUIPMENT_CHANGED";
  case EVT_NPC_SPAWNED:
    return "NPC_SPAWNED";
  case EVT_MENU_OPTION:
    return "MENU_OPTION";
  case EVT_ENCOUNTER_STATUS:
    return "ENCOUNTER_STATUS";
  default:
    return "UNKNOWN";
  }
}

const char *signalKindToString(SignalKind k) {
  switch (k) {
  case SIG_WAVE_COMPLETED:
    return "WAVE_COMPLETED";
  case SIG_WAVE_STARTED:
    return "WAVE_STARTED";
  case SIG_REWARD_CLAIMED:
    return "REWARD_CLAIMED";
  case SIG_DELVE_COMPLETED:
    return "DELVE_COMPLETED";
  case SIG_ROOM_COMPLETED:
    return "ROOM_COMPLETED";
  case SIG_RUN_COMPLETED:
    return "RUN_COMPLETED";
  case SIG_SURGE_RESTORE:
    return "SURGE_RESTORE";
  case SIG_DEATH_CHARGE_RESTORE:
    return "DEATH_CHARGE_RESTORE";
  case SIG_COOLDOWN_EXPIRED:
    return "COOLDOWN_EXPIRED";
  default:
    return "NONE";
  }
}

const char *formatToString(DisplayFormat f) {
  switch (f) {
  case FORMAT_SECONDS:
    return "SECONDS";
  case FORMAT_DECIMALS:
    return "DECIMALS";
  default:
    return "TICKS";
  }
}

const char *resultToString(EventResult r) {
  switch (r) {
  case EVENT_APPLIED:
    return "APPLIED";
  case EVENT_REJECTED:
    return "REJECTED";
  default:
    return "IGNORED";
  }
}
