#pragma once

// Convenience header: the controller core without the physics backend

#include "upright/error.hpp"
#include "upright/log.hpp"
#include "upright/morphology.hpp"
#include "upright/physics.hpp"
#include "upright/body_plan.hpp"
#include "upright/sensor_encoder.hpp"
#include "upright/fitness.hpp"
#include "upright/action_policy.hpp"
#include "upright/action_filter.hpp"
#include "upright/experience_buffer.hpp"
#include "upright/controller_net.hpp"
#include "upright/model_exporter.hpp"
#include "upright/model_manager.hpp"
#include "upright/scheduler.hpp"
#include "upright/actuator.hpp"
#include "upright/telemetry.hpp"
#include "upright/config.hpp"
#include "upright/robot_controller.hpp"
