#pragma once
/**
 * @file keyboard/layout_tables.hpp
 * @brief Static layout data for the bundled layouts.
 *
 * This header is intentionally placed under `src/` (not installed). The
 * public entry point is `kbtap::io::keyboard::Layout`.
 */

#include <kbtap-io/keyboard/layout.hpp>

#include <vector>

namespace kbtap::io::keyboard::detail {

/// Named keys shared by every layout (modifiers, editing, navigation,
/// function keys, numpad, media keys) plus the US number row.
std::vector<Layout::Entry> baseEntries();

std::vector<Layout::Entry> qwertyEntries();
std::vector<Layout::Entry> qwertzEntries();
std::vector<Layout::Entry> colemakEntries();
std::vector<Layout::Entry> colemakDhEntries();

} // namespace kbtap::io::keyboard::detail
