#include "chessscribe/assembler.h"
#include "chessscribe/error.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace ChessScribe {

std::optional<size_t> RoleAssignment::Get(Role role) const {
    switch (role) {
    case Role::Header:
        return header;
    case Role::Image:
        return image;
    case Role::Solution:
        return solution;
    }
    return std::nullopt;
}

void RoleAssignment::Set(Role role, size_t position) {
    switch (role) {
    case Role::Header:
        header = position;
        break;
    case Role::Image:
        image = position;
        break;
    case Role::Solution:
        solution = position;
        break;
    }
}

AssemblyContext::AssemblyContext(const BlockStream& stream, const Pattern& header,
                                 const Pattern& solution, ImageAcceptor acceptor,
                                 int max_search_distance)
    : stream_(stream), header_(header), solution_(solution), acceptor_(std::move(acceptor)),
      max_search_distance_(max_search_distance), role_cache_(stream.size(), kUnclassified),
      consumed_(stream.size(), false) {
    if (max_search_distance_ < 1) { throw InputError("max_search_distance must be at least 1"); }
}

std::optional<Role> AssemblyContext::RoleOf(size_t position) const {
    int8_t& cached = role_cache_[position];
    if (cached == kUnclassified) {
        const Block& block = stream_[position];
        cached             = kInert;
        if (block.IsText()) {
            // A line matching both patterns counts as a header.
            if (Matches(header_, block.text)) {
                cached = static_cast<int8_t>(Role::Header);
            } else if (Matches(solution_, block.text)) {
                cached = static_cast<int8_t>(Role::Solution);
            }
        } else if (block.IsImage()) {
            if (!acceptor_ || acceptor_(block)) {
                cached = static_cast<int8_t>(Role::Image);
            } else {
                ++rejected_images_;
                spdlog::debug("Block {} (page {}): image rejected", block.global_index, block.page);
            }
        }
    }
    if (cached == kInert) { return std::nullopt; }
    return static_cast<Role>(cached);
}

void AssemblyContext::Consume(const RoleAssignment& roles) {
    for (Role role : {Role::Header, Role::Image, Role::Solution}) {
        if (auto pos = roles.Get(role)) { consumed_[*pos] = true; }
    }
}

std::optional<size_t> AssemblyContext::FindNearest(Role role, size_t origin,
                                                   SearchDirection direction,
                                                   const RoleAssignment& assigned) const {
    const long long n     = static_cast<long long>(stream_.size());
    const long long o     = static_cast<long long>(origin);
    const long long d_max = max_search_distance_;
    const bool backward   = direction != SearchDirection::Forward;
    const bool forward    = direction != SearchDirection::Backward;

    // Window shared by the origin and every block already in the diagram.
    long long lo = std::max(0LL, o - d_max);
    long long hi = std::min(n - 1, o + d_max);
    for (Role r : {Role::Header, Role::Image, Role::Solution}) {
        if (auto pos = assigned.Get(r)) {
            const long long p = static_cast<long long>(*pos);
            lo                = std::max(lo, p - d_max);
            hi                = std::min(hi, p + d_max);
        }
    }
    if (lo > hi) { return std::nullopt; }

    auto matches = [&](long long pos) {
        if (pos < lo || pos > hi) { return false; }
        const size_t p = static_cast<size_t>(pos);
        if (consumed_[p]) { return false; }
        auto r = RoleOf(p);
        return r && *r == role;
    };

    // Growing distance; the backward candidate is the earlier one on a tie.
    for (long long d = 0; d <= d_max; ++d) {
        if (backward && matches(o - d)) { return static_cast<size_t>(o - d); }
        if (forward && matches(o + d)) { return static_cast<size_t>(o + d); }
    }
    return std::nullopt;
}

bool IsAnchorRole(DiagramStructure structure, Role role) {
    switch (structure) {
    case DiagramStructure::HeaderImageSolution:
    case DiagramStructure::HeaderSolutionImage:
        return role == Role::Header;
    case DiagramStructure::ImageHeaderSolution:
        return role == Role::Image;
    case DiagramStructure::Flexible:
        return true;
    }
    return false;
}

RoleAssignment LocateRoles(DiagramStructure structure, const AssemblyContext& context,
                           size_t anchor, Role anchor_role) {
    if (!IsAnchorRole(structure, anchor_role)) {
        throw InputError("Role " + ToRoleString(anchor_role) + " cannot anchor structure " +
                         ToDiagramStructureString(structure));
    }

    RoleAssignment roles;
    roles.Set(anchor_role, anchor);

    // Every search is bounded by the roles found before it, so all blocks of
    // one diagram lie pairwise within max_search_distance.
    switch (structure) {
    case DiagramStructure::HeaderImageSolution:
        roles.image = context.FindNearest(Role::Image, anchor, SearchDirection::Forward, roles);
        if (roles.image) {
            roles.solution =
                context.FindNearest(Role::Solution, *roles.image, SearchDirection::Forward, roles);
        }
        break;
    case DiagramStructure::ImageHeaderSolution:
        roles.header   = context.FindNearest(Role::Header, anchor, SearchDirection::Backward, roles);
        roles.solution = context.FindNearest(Role::Solution, anchor, SearchDirection::Forward, roles);
        break;
    case DiagramStructure::HeaderSolutionImage:
        roles.solution = context.FindNearest(Role::Solution, anchor, SearchDirection::Forward, roles);
        if (roles.solution) {
            roles.image =
                context.FindNearest(Role::Image, *roles.solution, SearchDirection::Forward, roles);
        }
        break;
    case DiagramStructure::Flexible:
        for (Role role : {Role::Header, Role::Image, Role::Solution}) {
            if (role == anchor_role) { continue; }
            if (auto pos = context.FindNearest(role, anchor, SearchDirection::Both, roles)) {
                roles.Set(role, *pos);
            }
        }
        break;
    }
    return roles;
}

DiagramAssembler::DiagramAssembler(const AssemblerConfig& config, const Pattern& header,
                                   const Pattern& solution, ImageAcceptor acceptor)
    : config_(config), header_(header), solution_(solution), acceptor_(std::move(acceptor)) {}

AssemblyResult DiagramAssembler::Run(const BlockStream& stream) const {
    AssemblyContext context(stream, header_, solution_, acceptor_, config_.max_search_distance);
    AssemblyResult result;
    AssemblyStats& stats = result.stats;

    for (size_t pos = 0; pos < stream.size(); ++pos) {
        if (context.IsConsumed(pos)) { continue; }

        auto role = context.RoleOf(pos);
        if (!role || !IsAnchorRole(config_.structure, *role)) { continue; }

        if (config_.page_end > 0 && stream[pos].page > config_.page_end) {
            stats.reached_page_end = true;
            break;
        }

        ++stats.anchors_tried;
        RoleAssignment roles = LocateRoles(config_.structure, context, pos, *role);

        if (!roles.image) {
            ++stats.unresolved;
            spdlog::debug("Anchor {} ({}, page {}): no image in range", pos, ToRoleString(*role),
                          stream[pos].page);
            continue;
        }
        if (!roles.IsEmittable()) {
            ++stats.dropped_as_noise;
            spdlog::debug("Image {} (page {}): no header or solution, dropped", *roles.image,
                          stream[*roles.image].page);
            continue;
        }

        context.Consume(roles);
        if (!roles.IsComplete()) { ++stats.partial; }
        result.assemblies.push_back(Assembly{pos, *role, roles});

        if (config_.max_diagrams > 0 &&
            static_cast<int>(result.assemblies.size()) >= config_.max_diagrams) {
            stats.reached_max_diagrams = true;
            break;
        }
    }

    // Counts only what the walk examined; unvisited images never reach the acceptor.
    for (size_t pos = 0; pos < stream.size(); ++pos) {
        if (config_.page_end > 0 && stream[pos].page > config_.page_end) { break; }
        if (stream[pos].IsImage()) { ++stats.images; }
        if (!context.IsClassified(pos)) { continue; }
        auto role = context.RoleOf(pos);
        if (!role) { continue; }
        if (*role == Role::Header) { ++stats.headers; }
        if (*role == Role::Solution) { ++stats.solutions; }
    }
    stats.rejected_images = context.rejected_images();

    spdlog::debug("Assembly: {} diagrams from {} anchors ({} unresolved, {} noise, {} partial)",
                  result.assemblies.size(), stats.anchors_tried, stats.unresolved,
                  stats.dropped_as_noise, stats.partial);
    return result;
}

} // namespace ChessScribe
