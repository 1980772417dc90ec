#include "EvolutionaryPruner.hh"
#include <algorithm>
#include <cmath>
#include <stdexcept>

int removalCount(int numActive, const PruneSettings &settings) {
    if (numActive < settings.safetyFloor) return 0;
    int count = int(std::floor(numActive * settings.removalRatio));
    // Small populations would otherwise stall at zero removals.
    return std::min(std::max(count, 1), numActive);
}

PruneResult pruneWeakest(std::vector<Member> &members, const std::vector<int> &twin,
                         StructuralSolver &solver, const PruneSettings &settings) {
    if (twin.size() != members.size()) throw std::runtime_error("Twin table does not match the member collection");

    std::vector<int> ranked;
    for (const auto &m : members)
        if (m.active) ranked.push_back(m.id);
    std::stable_sort(ranked.begin(), ranked.end(), [&](int a, int b) {
        return members[a].strainEnergy < members[b].strainEnergy;
    });

    PruneResult result;
    result.numSelected = removalCount(ranked.size(), settings);
    result.held = (result.numSelected == 0);

    auto softKill = [&](int id) {
        solver.scaleMemberStiffness(id, settings.softKillFactor);
        members[id].active = false;
        result.removedIds.push_back(id);
        ++result.numRemoved;
    };

    for (int i = 0; i < result.numSelected; ++i) {
        const int id = ranked[i];
        if (!members[id].active) continue; // already removed as a twin this step
        softKill(id);
        const int t = twin[id];
        if ((t >= 0) && members[t].active) softKill(t);
    }

    return result;
}
