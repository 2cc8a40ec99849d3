#pragma once

/**
 * @file sqlstep.hpp
 * @brief Convenience header pulling in the whole typed SQLite access layer.
 */

#include "ErrorHandler.hpp"
#include "Value.hpp"
#include "SQLiteTraits.hpp"
#include "SQLiteStatement.hpp"
#include "SQLiteRow.hpp"
#include "SQLiteCursor.hpp"
#include "SQLiteConnection.hpp"
