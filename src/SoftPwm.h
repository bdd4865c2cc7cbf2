#pragma once

/// @file SoftPwm.h
/// SoftPwm main header. Includes the public API and the platform backends.

#define SOFTPWM_VERSION 1000000

#include "spwm/config.h"
#include "spwm/error.h"
#include "spwm/log.h"
#include "spwm/duty_cycle.h"
#include "spwm/time_format.h"
#include "spwm/pin.h"
#include "spwm/channel_events.h"
#include "spwm/lifecycle.h"
#include "spwm/pulse_engine.h"
#include "spwm/channel_config.h"
#include "spwm/rgb_led.h"

#include "platforms/stub/stub_pin.h"
#include "platforms/posix/sysfs_pin.h"
