#pragma once

// Umbrella header.

#include "log.hpp"
#include "errors.hpp"
#include "types.hpp"
#include "config.hpp"
#include "connection.hpp"
#include "connection_pool.hpp"
#include "dialect.hpp"
#include "value_codec.hpp"
#include "migrations.hpp"
#include "metadata_store.hpp"
#include "schema_introspector.hpp"
#include "table_locks.hpp"
#include "crud_engine.hpp"
#include "schema_mutator.hpp"
#include "view_resolver.hpp"
#include "serialization.hpp"
#include "engine.hpp"
