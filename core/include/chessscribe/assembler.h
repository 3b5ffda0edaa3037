/// \file assembler.h
/// \brief Structural search correlating header, image and solution blocks.

#pragma once

#include "block_stream.h"
#include "common.h"
#include "pattern.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace ChessScribe {

/// Decides whether an image block may fill the Image role (e.g. chessboard check).
using ImageAcceptor = std::function<bool(const Block& block)>;

/// Assembler settings.
struct AssemblerConfig {
    DiagramStructure structure = DiagramStructure::HeaderImageSolution;
    int max_search_distance    = 20; ///< Search radius in global-index units.
    int max_diagrams           = 0;  ///< 0 = unlimited.
    int page_end               = 0;  ///< Stop once an anchor lies beyond this page (0 = none).
};

/// Stream positions chosen for each role of one diagram.
struct RoleAssignment {
    std::optional<size_t> header;
    std::optional<size_t> image;
    std::optional<size_t> solution;

    std::optional<size_t> Get(Role role) const;
    void Set(Role role, size_t position);

    /// Image resolved plus at least one of header/solution.
    bool IsEmittable() const { return image && (header || solution); }
    bool IsComplete() const { return header && image && solution; }
};

/// Direction of a nearest-role search relative to its origin.
enum class SearchDirection : uint8_t {
    Forward,
    Backward,
    Both,
};

/// Per-run assembly state: the stream, the role classifiers and the set of
/// consumed blocks. One context per run keeps the assembler re-entrant.
class AssemblyContext {
public:
    AssemblyContext(const BlockStream& stream, const Pattern& header, const Pattern& solution,
                    ImageAcceptor acceptor, int max_search_distance);

    const BlockStream& stream() const { return stream_; }
    int max_search_distance() const { return max_search_distance_; }

    /// Role of the block at a position, or nullopt for inert blocks. Cached.
    std::optional<Role> RoleOf(size_t position) const;

    bool IsConsumed(size_t position) const { return consumed_[position]; }

    /// Marks every block of an assignment as used.
    void Consume(const RoleAssignment& roles);

    /// Nearest unconsumed block with the given role within the search window
    /// of origin. Ties on distance go to the earlier global index.
    /// \param assigned Positions already chosen for the diagram; a candidate must
    ///        also lie within max_search_distance of each of them.
    std::optional<size_t> FindNearest(Role role, size_t origin, SearchDirection direction,
                                      const RoleAssignment& assigned = RoleAssignment()) const;

    /// True once RoleOf has examined the position.
    bool IsClassified(size_t position) const { return role_cache_[position] != kUnclassified; }

    /// Number of image blocks the acceptor rejected so far.
    int rejected_images() const { return rejected_images_; }

private:
    const BlockStream& stream_;
    const Pattern& header_;
    const Pattern& solution_;
    ImageAcceptor acceptor_;
    int max_search_distance_;

    static constexpr int8_t kUnclassified = -2;
    static constexpr int8_t kInert        = -1;

    mutable std::vector<int8_t> role_cache_;
    mutable int rejected_images_ = 0;
    std::vector<bool> consumed_;
};

/// True when blocks of this role start a search under the given structure.
bool IsAnchorRole(DiagramStructure structure, Role role);

/// Resolves the remaining roles around an anchor according to the structure.
/// The anchor's own role is always set in the result.
RoleAssignment LocateRoles(DiagramStructure structure, const AssemblyContext& context,
                           size_t anchor, Role anchor_role);

/// One emitted correlation.
struct Assembly {
    size_t anchor    = 0;
    Role anchor_role = Role::Header;
    RoleAssignment roles;
};

/// Counters describing one assembly run.
struct AssemblyStats {
    int headers          = 0; ///< Text blocks classified as headers.
    int solutions        = 0; ///< Text blocks classified as solutions.
    int images           = 0; ///< Image blocks in the stream.
    int rejected_images  = 0; ///< Image blocks refused by the acceptor.
    int anchors_tried    = 0;
    int unresolved       = 0; ///< Anchors for which no image was found.
    int dropped_as_noise = 0; ///< Image found but neither header nor solution.
    int partial          = 0; ///< Emitted with header or solution missing.
    bool reached_max_diagrams = false;
    bool reached_page_end     = false;
};

struct AssemblyResult {
    std::vector<Assembly> assemblies;
    AssemblyStats stats;
};

/// Walks a block stream and emits one Assembly per correlated diagram.
class DiagramAssembler {
public:
    DiagramAssembler(const AssemblerConfig& config, const Pattern& header, const Pattern& solution,
                     ImageAcceptor acceptor = nullptr);

    /// Runs a full pass. Does not modify the stream; repeated runs on the same
    /// input give the same result.
    AssemblyResult Run(const BlockStream& stream) const;

    const AssemblerConfig& config() const { return config_; }

private:
    AssemblerConfig config_;
    Pattern header_;
    Pattern solution_;
    ImageAcceptor acceptor_;
};

} // namespace ChessScribe
