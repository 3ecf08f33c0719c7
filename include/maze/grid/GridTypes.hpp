#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>

namespace maze {

using u8  = std::uint8_t;
using u32 = std::uint32_t;

// x = column, y = row.
struct Position {
    int x{}, y{};
    constexpr bool operator==(const Position&) const = default;
};

struct PositionHash {
    std::size_t operator()(const Position& p) const noexcept {
        const std::uint64_t ux = static_cast<std::uint64_t>(static_cast<std::uint32_t>(p.x));
        const std::uint64_t uy = static_cast<std::uint64_t>(static_cast<std::uint32_t>(p.y));
        std::uint64_t k = (ux << 32) | uy;
        // SplitMix64 finalizer
        k += 0x9e3779b97f4a7c15ull;
        k = (k ^ (k >> 30)) * 0xbf58476d1ce4e5b9ull;
        k = (k ^ (k >> 27)) * 0x94d049bb133111ebull;
        k ^= (k >> 31);
        if constexpr (sizeof(std::size_t) < sizeof(std::uint64_t)) {
            return static_cast<std::size_t>(k ^ (k >> 32));
        } else {
            return static_cast<std::size_t>(k);
        }
    }
};

// Path only ever appears in a pathfinder's private working copy.
enum class CellKind : u8 {
    Wall,
    Empty,
    Start,
    End,
    Path,
};

struct Cell {
    Position position{};
    CellKind kind = CellKind::Wall;
};

[[nodiscard]] constexpr CellKind classify(const Cell& c) noexcept { return c.kind; }

[[nodiscard]] constexpr bool is_passable(CellKind k) noexcept { return k != CellKind::Wall; }
[[nodiscard]] constexpr bool is_passable(const Cell& c) noexcept { return is_passable(c.kind); }

[[nodiscard]] constexpr bool is_terminal(CellKind k) noexcept {
    return k == CellKind::Start || k == CellKind::End;
}

[[nodiscard]] constexpr bool in_bounds(int x, int y, int width, int height) noexcept {
    return x >= 0 && y >= 0 && x < width && y < height;
}

// Fixed one-character mapping shared by exporters and tests.
[[nodiscard]] constexpr char cell_kind_char(CellKind k) noexcept {
    switch (k) {
    case CellKind::Wall:  return '#';
    case CellKind::Empty: return ' ';
    case CellKind::Start: return 'S';
    case CellKind::End:   return 'E';
    case CellKind::Path:  return '.';
    }
    return '?';
}

[[nodiscard]] constexpr std::optional<CellKind> cell_kind_from_char(char c) noexcept {
    switch (c) {
    case '#': return CellKind::Wall;
    case ' ': return CellKind::Empty;
    case 'S': return CellKind::Start;
    case 'E': return CellKind::End;
    case '.': return CellKind::Path;
    default:  return std::nullopt;
    }
}

using NodeId = u32;

constexpr NodeId kInvalid = std::numeric_limits<NodeId>::max();

// Encode/decode (x,y) <-> NodeId (row-major)
inline NodeId   to_id(int x, int y, int width) { return static_cast<NodeId>(y * width + x); }
inline Position from_id(NodeId id, int width)  { return { int(id % u32(width)), int(id / u32(width)) }; }

// 4-connected unit steps: right, down, left, up.
inline constexpr int kDirX[4] = { 1, 0, -1,  0 };
inline constexpr int kDirY[4] = { 0, 1,  0, -1 };

} // namespace maze
