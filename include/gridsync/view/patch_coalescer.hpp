#pragma once

#include <vector>

#include "gridsync/view/view_model.hpp"

namespace gridsync::view {

/**
 * Reduce patches to one per (op, path), keeping the newest by timestamp.
 *
 * Stable: among equal timestamps the later input wins. Output is in
 * ascending timestamp order of the surviving patches. Empty in, empty out.
 */
std::vector<Patch> coalesce_patches(std::vector<Patch> patches);

} // namespace gridsync::view
