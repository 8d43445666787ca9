#pragma once

#include <monotower/core/types.hpp>
#include <monotower/world/block.hpp>

#include <raylib.h>

#include <cstdint>

namespace monotower::physics {

// One narrow-phase contact, as seen by the resolver.
struct ContactReport {
    std::uint64_t call{0};

    core::BlockId block_id{core::kInvalidBlockId};
    world::GridCoord grid{};
    world::BlockType block_type{world::BlockType::Standard};

    Vector3 position{};
    Vector3 velocity{};
    Vector3 closest{};
    Vector3 normal{};
    float dist_sq{0.0f};
    float penetration{0.0f};

    bool region_merged{false};
    core::RegionId region{core::kNoRegion};
    world::Aabb box{};

    bool seam_like{false};
    bool neighbor_seam{false};
    bool resolved{false};
    bool grounding{false};
};

// Optional sink for resolver diagnostics. The resolver does no diagnostic work
// when none is installed.
class ICollisionObserver {
public:
    virtual ~ICollisionObserver() = default;

    virtual void on_contact(const ContactReport& report) = 0;
    virtual void on_hazard(const world::Block& block, const Vector3& position) = 0;
};

// Logs seam-like and strongly horizontal contacts at LOG_DEBUG, at most once per cooldown window.
class LoggingCollisionObserver final : public ICollisionObserver {
public:
    explicit LoggingCollisionObserver(int cooldown_calls = 10)
        : cooldown_calls_(cooldown_calls) {}

    void on_contact(const ContactReport& report) override;
    void on_hazard(const world::Block& block, const Vector3& position) override;

    std::uint64_t logged() const { return logged_; }

private:
    int cooldown_calls_{10};
    std::uint64_t last_logged_call_{0};
    bool has_logged_{false};
    std::uint64_t logged_{0};
};

} // namespace monotower::physics
