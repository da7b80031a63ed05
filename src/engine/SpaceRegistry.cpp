#include "parking/engine/SpaceRegistry.hpp"

#include "parking/core/Logging.hpp"
#include "parking/engine/LotGeometry.hpp"

#include <QObject>
#include <QSet>

namespace parking {
namespace engine {

SpaceRegistry::SpaceRegistry() = default;

std::optional<SpaceRegistry> SpaceRegistry::create(int rows, int cols, core::Error *error)
{
    SpaceRegistry registry;
    if (!registry.resize(rows, cols, error)) {
        return std::nullopt;
    }
    return registry;
}

std::optional<SpaceRegistry> SpaceRegistry::fromSpaces(int rows, int cols, const std::vector<data::Space> &spaces,
                                                       core::Error *error)
{
    auto registry = create(rows, cols, error);
    if (!registry) {
        return std::nullopt;
    }
    for (const auto &space : spaces) {
        if (!registry->setType(space.row, space.col, space.type)) {
            qCWarning(lcEngine) << "dropping stored space" << space.id << "at" << space.row << space.col
                                << "outside a" << rows << "x" << cols << "lot";
        }
    }
    return registry;
}

bool SpaceRegistry::resize(int rows, int cols, core::Error *error)
{
    if (!LotGeometry::isValidDimensions(rows, cols)) {
        core::reportError(error, core::ErrorCode::Validation,
                          QObject::tr("Rows and columns must be positive numbers."));
        return false;
    }

    QMap<Cell, data::SpaceType> cells;
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            const Cell cell(r, c);
            cells.insert(cell, m_cells.value(cell, data::SpaceType::Regular));
        }
    }
    m_cells = std::move(cells);
    m_rows = rows;
    m_cols = cols;
    return true;
}

int SpaceRegistry::rows() const
{
    return m_rows;
}

int SpaceRegistry::cols() const
{
    return m_cols;
}

int SpaceRegistry::count() const
{
    return m_cells.size();
}

std::optional<data::SpaceType> SpaceRegistry::typeAt(int row, int col) const
{
    const auto it = m_cells.constFind(Cell(row, col));
    if (it == m_cells.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

bool SpaceRegistry::setType(int row, int col, data::SpaceType type)
{
    auto it = m_cells.find(Cell(row, col));
    if (it == m_cells.end()) {
        return false;
    }
    it.value() = type;
    return true;
}

bool SpaceRegistry::setTypeById(int id, data::SpaceType type)
{
    const auto cell = cellForId(id);
    if (!cell) {
        return false;
    }
    return setType(cell->first, cell->second, type);
}

std::optional<data::Space> SpaceRegistry::spaceById(int id) const
{
    const auto cell = cellForId(id);
    if (!cell) {
        return std::nullopt;
    }
    data::Space space;
    space.id = id;
    space.row = cell->first;
    space.col = cell->second;
    space.type = m_cells.value(*cell);
    return space;
}

std::vector<data::Space> SpaceRegistry::spaces() const
{
    std::vector<data::Space> result;
    result.reserve(static_cast<size_t>(m_cells.size()));
    // QMap orders QPair keys by row, then column.
    int id = 1;
    for (auto it = m_cells.constBegin(); it != m_cells.constEnd(); ++it) {
        data::Space space;
        space.id = id++;
        space.row = it.key().first;
        space.col = it.key().second;
        space.type = it.value();
        result.push_back(space);
    }
    return result;
}

bool SpaceRegistry::verify(const data::ParkingLot &lot, core::Error *error)
{
    const long long expected = static_cast<long long>(lot.rows) * lot.cols;
    if (static_cast<long long>(lot.spaces.size()) != expected) {
        core::reportError(error, core::ErrorCode::InconsistentState,
                          QObject::tr("Lot \"%1\" has %2 spaces but %3 x %4 = %5 cells.")
                              .arg(lot.name)
                              .arg(lot.spaces.size())
                              .arg(lot.rows)
                              .arg(lot.cols)
                              .arg(expected));
        return false;
    }

    QSet<Cell> seen;
    for (const auto &space : lot.spaces) {
        const Cell cell(space.row, space.col);
        if (space.row < 0 || space.row >= lot.rows || space.col < 0 || space.col >= lot.cols
            || seen.contains(cell)) {
            core::reportError(error, core::ErrorCode::InconsistentState,
                              QObject::tr("Lot \"%1\" has a misplaced or duplicate space %2 at row %3, column %4.")
                                  .arg(lot.name)
                                  .arg(space.id)
                                  .arg(space.row)
                                  .arg(space.col));
            return false;
        }
        seen.insert(cell);
    }
    return true;
}

std::optional<SpaceRegistry::Cell> SpaceRegistry::cellForId(int id) const
{
    if (id < 1 || id > m_cells.size() || m_cols <= 0) {
        return std::nullopt;
    }
    return Cell((id - 1) / m_cols, (id - 1) % m_cols);
}

} // namespace engine
} // namespace parking
