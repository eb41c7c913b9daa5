/*
 * File: test/test_phase_tracker/test_phase_tracker.cpp
 * Description: Encounter phase transitions and their effect on both timers.
 * Covers Colosseum waves, Doom delves, Theatre of Blood rooms (region,
 * barrier, NPC and dialogue entry) and the cooldown pause sync.
 */
#include <unity.h>
#include "PhaseTracker.h"
#include "MockTimerHAL.h"

// --- Constants ---
const TimerDefaults defaults = { 50, 25, 1000, 2, 2, 300000 };

// --- Fixture ---
struct Fixture {
    MockTimerHAL hal;
    TimerState regenState;
    CooldownState cooldownState;
    PhaseState phaseState;
    RegenTimer regen;
    CooldownTimer cooldown;
    EncounterPhaseTracker phase;

    Fixture()
        : regen(regenState, defaults),
          cooldown(cooldownState, hal),
          phase(phaseState, regen, cooldown, hal, defaults) {}
};

// --- Helpers ---
TextSignal makeSignal(SignalKind kind, int32_t segment = 0) {
    TextSignal signal = { kind, segment, 0 };
    return signal;
}

Location at(int32_t regionId, int32_t x, int32_t y) {
    Location location = { true, regionId, x, y };
    return location;
}

// Puts the tracker between two ToB rooms with the player in the lobby.
void enterTobBetweenRooms(Fixture& f) {
    f.phase.onLocationSample(at(TOB_LOBBY_REGION, 3200, 4400));
    f.phase.onEncounterStatus(TOB_STATUS_IN_PARTY);
    TEST_ASSERT_TRUE(f.phase.isSecondaryZonePaused());
}

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// COLOSSEUM WAVES
// ============================================================================

void test_wave_completed_pauses_and_wave_start_reseeds(void) {
    Fixture f;
    f.regen.reseed(17);

    TEST_ASSERT_TRUE(f.phase.applyTextSignal(makeSignal(SIG_WAVE_COMPLETED, 3)));
    TEST_ASSERT_TRUE(f.phase.isEncounterPaused());
    TEST_ASSERT_TRUE(f.hal.hasLogContaining(">>> PHASE CHANGE: PAUSED"));

    TEST_ASSERT_TRUE(f.phase.applyTextSignal(makeSignal(SIG_WAVE_STARTED, 4)));
    TEST_ASSERT_FALSE(f.phase.isEncounterPaused());
    TEST_ASSERT_EQUAL_INT32(50, f.regen.getTicksUntilRegen());
}

void test_wave_start_reseeds_to_lightbearer_cadence(void) {
    Fixture f;
    f.regen.onCadenceFlagChanged(true);
    f.regen.reseed(3);

    f.phase.applyTextSignal(makeSignal(SIG_WAVE_STARTED, 1));

    TEST_ASSERT_EQUAL_INT32(25, f.regen.getTicksUntilRegen());
}

void test_reward_claim_resumes_without_reseed(void) {
    Fixture f;
    f.regen.reseed(17);
    f.phase.applyTextSignal(makeSignal(SIG_WAVE_COMPLETED, 12));

    f.phase.applyTextSignal(makeSignal(SIG_REWARD_CLAIMED));
    TEST_ASSERT_FALSE(f.phase.isEncounterPaused());
    TEST_ASSERT_EQUAL_INT32(17, f.regen.getTicksUntilRegen());

    // Idempotent
    f.phase.applyTextSignal(makeSignal(SIG_REWARD_CLAIMED));
    TEST_ASSERT_FALSE(f.phase.isEncounterPaused());
}

void test_non_phase_signal_is_not_applied(void) {
    Fixture f;

    TEST_ASSERT_FALSE(f.phase.applyTextSignal(makeSignal(SIG_SURGE_RESTORE)));
    TEST_ASSERT_FALSE(f.phase.applyTextSignal(makeSignal(SIG_NONE)));
    TEST_ASSERT_FALSE(f.phase.isEncounterPaused());
}

// ============================================================================
// DOOM OF MOKHAIOTL DELVES
// ============================================================================

void test_delve_pauses_and_doom_spawn_reseeds_short(void) {
    Fixture f;

    f.phase.applyTextSignal(makeSignal(SIG_DELVE_COMPLETED, 2));
    TEST_ASSERT_TRUE(f.phase.isEncounterPaused());

    f.phase.onNpcSpawned("Doom of Mokhaiotl", 14707);
    TEST_ASSERT_FALSE(f.phase.isEncounterPaused());
    TEST_ASSERT_EQUAL_INT32(48, f.regen.getTicksUntilRegen());
}

void test_doom_spawn_with_lightbearer(void) {
    Fixture f;
    f.regen.onCadenceFlagChanged(true);
    f.phase.applyTextSignal(makeSignal(SIG_DELVE_COMPLETED, 5));

    f.phase.onNpcSpawned("Doom of Mokhaiotl (Burrowed)", 14708);

    TEST_ASSERT_EQUAL_INT32(23, f.regen.getTicksUntilRegen());
}

void test_unrelated_npc_changes_nothing(void) {
    Fixture f;
    f.phase.applyTextSignal(makeSignal(SIG_DELVE_COMPLETED, 2));
    f.regen.reseed(30);

    f.phase.onNpcSpawned("Goblin", 3029);
    f.phase.onNpcSpawned(nullptr, 1);

    TEST_ASSERT_TRUE(f.phase.isEncounterPaused());
    TEST_ASSERT_EQUAL_INT32(30, f.regen.getTicksUntilRegen());
}

// ============================================================================
// THEATRE OF BLOOD: ENTER / LEAVE
// ============================================================================

void test_entering_tob_outside_boss_room_pauses_cooldown_only(void) {
    Fixture f;
    enterTobBetweenRooms(f);

    TEST_ASSERT_TRUE(f.phase.isEncounterModeActive());
    TEST_ASSERT_TRUE(f.phase.isSecondaryZonePaused());
    TEST_ASSERT_FALSE(f.phase.isEncounterPaused());
    TEST_ASSERT_TRUE(f.phase.isCooldownPauseRequired());
}

void test_entering_tob_inside_boss_room_does_not_pause(void) {
    Fixture f;
    f.phase.onLocationSample(at(TOB_XARPUS_REGION, 3170, 4390));

    f.phase.onEncounterStatus(TOB_STATUS_IN_RAID);

    TEST_ASSERT_TRUE(f.phase.isEncounterModeActive());
    TEST_ASSERT_FALSE(f.phase.isSecondaryZonePaused());
}

void test_rejoin_before_first_sample_resolves_in_barrier_room(void) {
    Fixture f;

    // Logged back in mid-fight: the status arrives before any position
    f.phase.onEncounterStatus(TOB_STATUS_IN_RAID);
    TEST_ASSERT_TRUE(f.phase.isSecondaryZonePaused());

    // Already past the Bloat barrier strip
    f.phase.onLocationSample(at(TOB_BLOAT_REGION, 3290, 4440));

    TEST_ASSERT_FALSE(f.phase.isSecondaryZonePaused());
    TEST_ASSERT_FALSE(f.phase.isCooldownPauseRequired());
    TEST_ASSERT_TRUE(f.hal.hasLogContaining("Rejoined in boss room"));
}

void test_rejoin_before_first_sample_in_lobby_stays_paused(void) {
    Fixture f;
    f.phase.onEncounterStatus(TOB_STATUS_IN_PARTY);

    f.phase.onLocationSample(at(TOB_LOBBY_REGION, 3200, 4400));
    TEST_ASSERT_TRUE(f.phase.isSecondaryZonePaused());

    // Only the first sample settles the check; the barrier still applies afterwards
    f.phase.onLocationSample(at(TOB_BLOAT_REGION, 3310, 4447));
    TEST_ASSERT_TRUE(f.phase.isSecondaryZonePaused());
}

void test_status_is_transition_detected(void) {
    Fixture f;
    enterTobBetweenRooms(f);
    f.phase.onLocationSample(at(TOB_MAIDEN_REGION, 3180, 4440));
    TEST_ASSERT_FALSE(f.phase.isSecondaryZonePaused());

    // Switching between the two "inside" values is not a new entry
    f.phase.onEncounterStatus(TOB_STATUS_IN_RAID);
    f.phase.onLocationSample(at(TOB_LOBBY_REGION, 3200, 4400));
    f.phase.onEncounterStatus(TOB_STATUS_IN_PARTY);
    TEST_ASSERT_FALSE(f.phase.isSecondaryZonePaused());
}

void test_leaving_tob_unpauses(void) {
    Fixture f;
    enterTobBetweenRooms(f);

    f.phase.onEncounterStatus(0);

    TEST_ASSERT_FALSE(f.phase.isEncounterModeActive());
    TEST_ASSERT_FALSE(f.phase.isSecondaryZonePaused());
}

void test_room_completion_and_run_completion(void) {
    Fixture f;
    f.phase.onLocationSample(at(TOB_VERZIK_REGION, 3168, 4310));

    f.phase.applyTextSignal(makeSignal(SIG_ROOM_COMPLETED));
    TEST_ASSERT_TRUE(f.phase.isEncounterModeActive());
    TEST_ASSERT_TRUE(f.phase.isSecondaryZonePaused());
    TEST_ASSERT_FALSE(f.phase.isEncounterPaused());
    TEST_ASSERT_TRUE(f.hal.hasLogContaining(">>> ROOM CHANGE: BETWEEN ROOMS"));

    f.phase.applyTextSignal(makeSignal(SIG_RUN_COMPLETED));
    TEST_ASSERT_FALSE(f.phase.isSecondaryZonePaused());
}

// ============================================================================
// THEATRE OF BLOOD: ROOM ENTRY
// ============================================================================

void test_region_room_entered_on_first_sample(void) {
    Fixture f;
    enterTobBetweenRooms(f);

    f.phase.onLocationSample(at(TOB_MAIDEN_REGION, 3180, 4440));

    TEST_ASSERT_FALSE(f.phase.isSecondaryZonePaused());
    TEST_ASSERT_FALSE(f.phase.isSegmentEntryArmed());
    TEST_ASSERT_EQUAL_INT32(TOB_MAIDEN_REGION, f.phase.getCurrentZoneId());
}

void test_sotetseg_maze_counts_as_room(void) {
    Fixture f;
    enterTobBetweenRooms(f);

    f.phase.onLocationSample(at(TOB_SOTETSEG_MAZE_REGION, 3360, 4310));

    TEST_ASSERT_FALSE(f.phase.isSecondaryZonePaused());
}

void test_bloat_hallway_waits_for_barrier(void) {
    Fixture f;
    enterTobBetweenRooms(f);

    // Hallway: same region, outside the barrier strip
    f.phase.onLocationSample(at(TOB_BLOAT_REGION, 3310, 4447));
    TEST_ASSERT_TRUE(f.phase.isSecondaryZonePaused());
    TEST_ASSERT_TRUE(f.phase.isSegmentEntryArmed());

    f.phase.onLocationSample(at(TOB_BLOAT_REGION, 3304, 4447));
    TEST_ASSERT_TRUE(f.phase.isSecondaryZonePaused());

    f.phase.onLocationSample(at(TOB_BLOAT_REGION, 3303, 4447));
    TEST_ASSERT_FALSE(f.phase.isSecondaryZonePaused());
    TEST_ASSERT_FALSE(f.phase.isSegmentEntryArmed());
}

void test_barrier_not_retriggered_after_room_completion(void) {
    Fixture f;
    enterTobBetweenRooms(f);
    f.phase.onLocationSample(at(TOB_NYLOCAS_REGION, 3295, 4250));
    f.phase.onLocationSample(at(TOB_NYLOCAS_REGION, 3295, 4254));
    TEST_ASSERT_FALSE(f.phase.isSecondaryZonePaused());

    f.phase.applyTextSignal(makeSignal(SIG_ROOM_COMPLETED));

    // Walking back over the barrier of the finished room does nothing
    f.phase.onLocationSample(at(TOB_NYLOCAS_REGION, 3296, 4254));
    TEST_ASSERT_TRUE(f.phase.isSecondaryZonePaused());

    // Next room re-arms
    f.phase.onLocationSample(at(TOB_SOTETSEG_REGION, 3280, 4300));
    TEST_ASSERT_TRUE(f.phase.isSegmentEntryArmed());
    f.phase.onLocationSample(at(TOB_SOTETSEG_REGION, 3280, 4308));
    TEST_ASSERT_FALSE(f.phase.isSecondaryZonePaused());
}

void test_invalid_location_is_skipped(void) {
    Fixture f;
    enterTobBetweenRooms(f);

    Location unknown = { false, TOB_MAIDEN_REGION, 0, 0 };
    f.phase.onLocationSample(unknown);

    TEST_ASSERT_TRUE(f.phase.isSecondaryZonePaused());
    TEST_ASSERT_EQUAL_INT32(TOB_LOBBY_REGION, f.phase.getCurrentZoneId());
}

void test_verzik_spawn_enters_room(void) {
    Fixture f;
    enterTobBetweenRooms(f);
    f.phase.onLocationSample(at(TOB_VERZIK_REGION, 3168, 4300));

    // Region alone is not enough for Verzik
    TEST_ASSERT_TRUE(f.phase.isSecondaryZonePaused());

    f.phase.onNpcSpawned("Verzik Vitur", VERZIK_FIGHT_START_NPC_ID);
    TEST_ASSERT_FALSE(f.phase.isSecondaryZonePaused());
    TEST_ASSERT_FALSE(f.phase.isSegmentEntryArmed());
}

void test_verzik_spawn_ignored_when_not_between_rooms(void) {
    Fixture f;

    f.phase.onNpcSpawned("Verzik Vitur", VERZIK_FIGHT_START_NPC_ID);

    TEST_ASSERT_FALSE(f.phase.isSecondaryZonePaused());
    TEST_ASSERT_TRUE(f.phase.isSegmentEntryArmed());
}

void test_barrier_dialogue_enters_room(void) {
    Fixture f;
    enterTobBetweenRooms(f);
    f.phase.onLocationSample(at(TOB_XARPUS_REGION, 3170, 4370));

    f.phase.onMenuOption("Yes, let's begin.");

    TEST_ASSERT_FALSE(f.phase.isSecondaryZonePaused());
}

void test_verzik_continue_only_in_verzik_region(void) {
    Fixture f;
    enterTobBetweenRooms(f);

    f.phase.onMenuOption("Continue");
    TEST_ASSERT_TRUE(f.phase.isSecondaryZonePaused());

    f.phase.onLocationSample(at(TOB_VERZIK_REGION, 3168, 4300));
    f.phase.onMenuOption("Continue.");
    TEST_ASSERT_TRUE(f.phase.isSecondaryZonePaused());

    f.phase.onMenuOption("Continue");
    TEST_ASSERT_FALSE(f.phase.isSecondaryZonePaused());
}

void test_menu_ignored_outside_tob(void) {
    Fixture f;
    f.phase.applyTextSignal(makeSignal(SIG_WAVE_COMPLETED, 1));

    f.phase.onMenuOption("Yes, let's begin.");

    TEST_ASSERT_FALSE(f.phase.isEncounterModeActive());
    TEST_ASSERT_TRUE(f.phase.isEncounterPaused());
    TEST_ASSERT_FALSE(f.phase.isSecondaryZonePaused());
}

// ============================================================================
// COOLDOWN SYNC
// ============================================================================

void test_wave_pause_freezes_surge_cooldown(void) {
    Fixture f;
    f.cooldown.start(300000, false);

    f.phase.applyTextSignal(makeSignal(SIG_WAVE_COMPLETED, 1));
    TEST_ASSERT_TRUE(f.cooldown.isPaused());
    TEST_ASSERT_EQUAL_UINT32(300000, f.cooldown.remainingMs());

    f.hal.advanceTime(60000);
    TEST_ASSERT_EQUAL_UINT32(300000, f.cooldown.remainingMs());

    f.phase.applyTextSignal(makeSignal(SIG_WAVE_STARTED, 2));
    TEST_ASSERT_FALSE(f.cooldown.isPaused());
    TEST_ASSERT_EQUAL_UINT32(300000, f.cooldown.remainingMs());
    TEST_ASSERT_EQUAL_UINT32(f.hal.currentMillis + 300000, f.cooldownState.endMillis);
}

void test_cooldown_stays_paused_while_either_flag_set(void) {
    Fixture f;
    enterTobBetweenRooms(f);
    f.cooldown.start(300000, f.phase.isCooldownPauseRequired());
    TEST_ASSERT_TRUE(f.cooldown.isPaused());

    f.phase.applyTextSignal(makeSignal(SIG_WAVE_COMPLETED, 1));
    f.phase.applyTextSignal(makeSignal(SIG_WAVE_STARTED, 2));

    // Still between rooms
    TEST_ASSERT_TRUE(f.cooldown.isPaused());

    f.phase.onLocationSample(at(TOB_MAIDEN_REGION, 3180, 4440));
    TEST_ASSERT_FALSE(f.cooldown.isPaused());
}

void test_reset_restores_defaults(void) {
    Fixture f;
    enterTobBetweenRooms(f);
    f.phase.applyTextSignal(makeSignal(SIG_WAVE_COMPLETED, 1));

    f.phase.reset();

    TEST_ASSERT_FALSE(f.phase.isEncounterPaused());
    TEST_ASSERT_FALSE(f.phase.isSecondaryZonePaused());
    TEST_ASSERT_FALSE(f.phase.isEncounterModeActive());
    TEST_ASSERT_EQUAL_INT32(NO_REGION, f.phase.getCurrentZoneId());
    TEST_ASSERT_TRUE(f.phase.isSegmentEntryArmed());
}

// ============================================================================
// MAIN
// ============================================================================

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_wave_completed_pauses_and_wave_start_reseeds);
    RUN_TEST(test_wave_start_reseeds_to_lightbearer_cadence);
    RUN_TEST(test_reward_claim_resumes_without_reseed);
    RUN_TEST(test_non_phase_signal_is_not_applied);

    RUN_TEST(test_delve_pauses_and_doom_spawn_reseeds_short);
    RUN_TEST(test_doom_spawn_with_lightbearer);
    RUN_TEST(test_unrelated_npc_changes_nothing);

    RUN_TEST(test_entering_tob_outside_boss_room_pauses_cooldown_only);
    RUN_TEST(test_entering_tob_inside_boss_room_does_not_pause);
    RUN_TEST(test_rejoin_before_first_sample_resolves_in_barrier_room);
    RUN_TEST(test_rejoin_before_first_sample_in_lobby_stays_paused);
    RUN_TEST(test_status_is_transition_detected);
    RUN_TEST(test_leaving_tob_unpauses);
    RUN_TEST(test_room_completion_and_run_completion);

    RUN_TEST(test_region_room_entered_on_first_sample);
    RUN_TEST(test_sotetseg_maze_counts_as_room);
    RUN_TEST(test_bloat_hallway_waits_for_barrier);
    RUN_TEST(test_barrier_not_retriggered_after_room_completion);
    RUN_TEST(test_invalid_location_is_skipped);
    RUN_TEST(test_verzik_spawn_enters_room);
    RUN_TEST(test_verzik_spawn_ignored_when_not_between_rooms);
    RUN_TEST(test_barrier_dialogue_enters_room);
    RUN_TEST(test_verzik_continue_only_in_verzik_region);
    RUN_TEST(test_menu_ignored_outside_tob);

    RUN_TEST(test_wave_pause_freezes_surge_cooldown);
    RUN_TEST(test_cooldown_stays_paused_while_either_flag_set);
    RUN_TEST(test_reset_restores_defaults);

    return UNITY_END();
}
