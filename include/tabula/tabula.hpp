#pragma once

/// Convenience umbrella header for the Tabula library.

#include <tabula/backend/array_backend.hpp>
#include <tabula/backend/frame_backend.hpp>
#include <tabula/backend/in_memory.hpp>
#include <tabula/check/builtin.hpp>
#include <tabula/check/check.hpp>
#include <tabula/core/column.hpp>
#include <tabula/core/config.hpp>
#include <tabula/core/frame.hpp>
#include <tabula/core/print.hpp>
#include <tabula/engine/dtype.hpp>
#include <tabula/error/error_handler.hpp>
#include <tabula/error/errors.hpp>
#include <tabula/schema/array_schema.hpp>
#include <tabula/schema/frame_schema.hpp>
