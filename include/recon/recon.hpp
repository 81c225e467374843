#pragma once

/// Convenience umbrella header for the recon library.

#include <recon/core/error.hpp>
#include <recon/core/normalize.hpp>
#include <recon/core/table.hpp>
#include <recon/io/json.hpp>
#include <recon/runtime/compare.hpp>
#include <recon/runtime/keys.hpp>
#include <recon/runtime/merge.hpp>
#include <recon/runtime/ops.hpp>
#include <recon/runtime/split.hpp>
