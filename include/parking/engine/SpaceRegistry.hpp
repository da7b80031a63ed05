#pragma once

#include <QMap>
#include <QPair>
#include <optional>
#include <vector>

#include "parking/core/Error.hpp"
#include "parking/data/ParkingLot.hpp"
#include "parking/data/Space.hpp"

namespace parking {
namespace engine {

// Space ids are assigned row-major from 1 each time spaces() is called.
class SpaceRegistry
{
public:
    SpaceRegistry();

    static std::optional<SpaceRegistry> create(int rows, int cols, core::Error *error = nullptr);
    static std::optional<SpaceRegistry> fromSpaces(int rows, int cols, const std::vector<data::Space> &spaces,
                                                   core::Error *error = nullptr);

    bool resize(int rows, int cols, core::Error *error = nullptr);

    int rows() const;
    int cols() const;
    int count() const;

    std::optional<data::SpaceType> typeAt(int row, int col) const;
    bool setType(int row, int col, data::SpaceType type);
    bool setTypeById(int id, data::SpaceType type);
    std::optional<data::Space> spaceById(int id) const;

    std::vector<data::Space> spaces() const;

    // Checks that `lot.spaces` holds every (row, col) of the lot exactly once.
    static bool verify(const data::ParkingLot &lot, core::Error *error = nullptr);

private:
    using Cell = QPair<int, int>;

    std::optional<Cell> cellForId(int id) const;

    int m_rows = 0;
    int m_cols = 0;
    QMap<Cell, data::SpaceType> m_cells;
};

} // namespace engine
} // namespace parking
