#pragma once

/**
 * @file sprout.hpp
 * @brief Single include for the whole library.
 */

#include "config.hpp"

#include "archetype.hpp"
#include "bundle.hpp"
#include "command_buffer.hpp"
#include "component.hpp"
#include "entity.hpp"
#include "world.hpp"

#include "app.hpp"
#include "schedule.hpp"

#include "builtin/hierarchy.hpp"
#include "builtin/hierarchy_ops.hpp"
#include "builtin/transform.hpp"
#include "builtin/transform_propagation.hpp"

#include "spawn/spawn_children.hpp"
#include "spawn/spawn_commands.hpp"
#include "spawn/spawn_key.hpp"
#include "spawn/spawn_plugin.hpp"
#include "spawn/spawn_system.hpp"
#include "spawn/spawnable.hpp"
#include "spawn/spawnables.hpp"
