#include "gridsync/view/patch_coalescer.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace gridsync::view {

std::vector<Patch> coalesce_patches(std::vector<Patch> patches) {
    std::stable_sort(patches.begin(), patches.end(),
                     [](const Patch& a, const Patch& b) { return a.timestamp < b.timestamp; });

    // Walk newest first; the first patch seen for a key is the survivor.
    std::set<std::pair<PatchOp, PatchPath>> seen;
    std::vector<Patch> out;
    for (auto it = patches.rbegin(); it != patches.rend(); ++it) {
        if (seen.insert({it->op, it->path}).second) {
            out.push_back(std::move(*it));
        }
    }
    std::reverse(out.begin(), out.end());
    return out;
}

} // namespace gridsync::view
