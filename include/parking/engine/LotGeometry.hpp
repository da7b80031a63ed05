#pragma once

#include <QRectF>
#include <QSet>
#include <optional>

#include "parking/core/Error.hpp"
#include "parking/data/Space.hpp"

namespace parking {
namespace engine {

// Lot dimensions in metres. Rows are stacked along y, separated by aisles;
// columns run along x.
class LotGeometry
{
public:
    static constexpr double SpaceWidth = 2.5;
    static constexpr double SpaceDepth = 5.0;
    static constexpr double AisleWidth = 6.0;
    static constexpr double MergedAisleWidth = 0.1;

    LotGeometry(int rows, int cols, QSet<int> mergedAisles = {});

    int rows() const;
    int cols() const;
    const QSet<int> &mergedAisles() const;

    // Width of the aisle between `row` and `row + 1`. Only defined for
    // 0 <= row < rows - 1.
    double aisleWidthAfterRow(int row) const;
    double rowYPosition(int row) const;
    double lotHeight() const;
    double lotWidth() const;
    QRectF spaceRect(const data::Space &space) const;

    static double aisleWidthAfterRow(int row, int rows, const QSet<int> &mergedAisles);
    static double lotHeight(int rows, const QSet<int> &mergedAisles);
    static double rowYPosition(int row, const QSet<int> &mergedAisles);
    static double spaceXPosition(int col);
    static double lotWidth(int cols);

    static bool isValidDimensions(int rows, int cols);

    // Returns the aisle index removed by merging rows `first` and `second`.
    static std::optional<int> validateMerge(int rows, int first, int second, core::Error *error = nullptr);
    static std::optional<int> validateMerge(int rows, const QString &first, const QString &second,
                                            core::Error *error = nullptr);

    // Drops merged aisles that no longer exist for `rows`.
    static QSet<int> clampMergedAisles(const QSet<int> &mergedAisles, int rows);

private:
    int m_rows = 0;
    int m_cols = 0;
    QSet<int> m_mergedAisles;
};

} // namespace engine
} // namespace parking
