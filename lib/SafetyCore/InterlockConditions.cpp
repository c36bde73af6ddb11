/*
 * =================================================================================
 * Project:   RV Safety Core - PIN Authorization & Safety Interlock Supervisor
 * File:      lib/SafetyCore/InterlockConditions.cpp
 * =================================================================================
 */
#include "InterlockConditions.h"

// =================================================================================
// SECTION: PREDICATES
// =================================================================================

static bool vehicleNotMoving(const SystemState& s) {
    return s.vehicleSpeedMph < VEHICLE_STOPPED_THRESHOLD_MPH;
}

static bool parkingBrakeEngaged(const SystemState& s) {
    return s.parkingBrakeEngaged;
}

static bool levelingJacksDeployed(const SystemState& s) {
    return s.levelingJacksDown;
}

static bool engineNotRunning(const SystemState& s) {
    return !s.engineRunning;
}

static bool transmissionInPark(const SystemState& s) {
    return s.transmissionGear == GEAR_PARK;
}

static bool slideRoomsRetracted(const SystemState& s) {
    return s.allSlidesRetracted;
}

static const ConditionDescriptor CONDITION_TABLE[] = {
    { COND_VEHICLE_NOT_MOVING,      "vehicle_not_moving",      vehicleNotMoving },
    { COND_PARKING_BRAKE_ENGAGED,   "parking_brake_engaged",   parkingBrakeEngaged },
    { COND_LEVELING_JACKS_DEPLOYED, "leveling_jacks_deployed", levelingJacksDeployed },
    { COND_ENGINE_NOT_RUNNING,      "engine_not_running",      engineNotRunning },
    { COND_TRANSMISSION_IN_PARK,    "transmission_in_park",    transmissionInPark },
    { COND_SLIDE_ROOMS_RETRACTED,   "slide_rooms_retracted",   slideRoomsRetracted },
};

static const size_t CONDITION_COUNT = sizeof(CONDITION_TABLE) / sizeof(CONDITION_TABLE[0]);

// =================================================================================
// SECTION: LOOKUP
// =================================================================================

InterlockCondition InterlockConditions::fromName(const std::string& name) {
    for (size_t i = 0; i < CONDITION_COUNT; i++) {
        if (name == CONDITION_TABLE[i].name) return CONDITION_TABLE[i].id;
    }
    return COND_UNKNOWN;
}

const char* InterlockConditions::toName(InterlockCondition condition) {
    for (size_t i = 0; i < CONDITION_COUNT; i++) {
        if (CONDITION_TABLE[i].id == condition) return CONDITION_TABLE[i].name;
    }
    return "unknown";
}

bool InterlockConditions::evaluate(InterlockCondition condition, const SystemState& state) {
    for (size_t i = 0; i < CONDITION_COUNT; i++) {
        if (CONDITION_TABLE[i].id == condition) {
            return CONDITION_TABLE[i].predicate(state);
        }
    }
    return false;
}

const ConditionDescriptor* InterlockConditions::table(size_t& count) {
    count = CONDITION_COUNT;
    return CONDITION_TABLE;
}
