#pragma once

#include <recon/core/normalize.hpp>
#include <recon/core/table.hpp>
#include <recon/runtime/compare.hpp>
#include <recon/runtime/split.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace recon::ops {

// ─── Throwing conveniences ────────────────────────────────────────────────────
//  Same semantics as runtime::compare / runtime::split; failures are raised as
//  std::runtime_error carrying Error::format().

[[nodiscard]] auto compare(const Table& left, const Table& right, const std::string& key,
                           CompareOptions options = {}) -> runtime::CompareOutput;

[[nodiscard]] auto compare(const Table& left, const Table& right,
                           const std::vector<std::string>& keys, CompareOptions options = {})
    -> runtime::CompareOutput;

[[nodiscard]] auto split(const Table& table, const std::string& key) -> runtime::SplitOutput;

[[nodiscard]] auto split(const Table& table, const std::vector<std::string>& keys)
    -> runtime::SplitOutput;

// ─── Printing ─────────────────────────────────────────────────────────────────

void print(const Table& t, std::ostream& out = std::cout);

/// Print all four tables and the log of a compare outcome.
void print(const runtime::CompareOutput& output, std::ostream& out = std::cout);

/// Print every part of a split outcome, each under its key value.
void print(const runtime::SplitOutput& output, std::ostream& out = std::cout);

}  // namespace recon::ops
