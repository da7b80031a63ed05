#include "parking/engine/LotGeometry.hpp"

#include "parking/core/Logging.hpp"

#include <QObject>
#include <algorithm>
#include <cstdlib>

namespace parking {
namespace engine {

namespace {
std::optional<int> parseRowIndex(const QString &text)
{
    bool ok = false;
    const int value = text.trimmed().toInt(&ok, 10);
    if (!ok) {
        return std::nullopt;
    }
    return value;
}
} // namespace

LotGeometry::LotGeometry(int rows, int cols, QSet<int> mergedAisles)
    : m_rows(rows)
    , m_cols(cols)
    , m_mergedAisles(std::move(mergedAisles))
{
}

int LotGeometry::rows() const
{
    return m_rows;
}

int LotGeometry::cols() const
{
    return m_cols;
}

const QSet<int> &LotGeometry::mergedAisles() const
{
    return m_mergedAisles;
}

double LotGeometry::aisleWidthAfterRow(int row) const
{
    return aisleWidthAfterRow(row, m_rows, m_mergedAisles);
}

double LotGeometry::rowYPosition(int row) const
{
    return rowYPosition(row, m_mergedAisles);
}

double LotGeometry::lotHeight() const
{
    return lotHeight(m_rows, m_mergedAisles);
}

double LotGeometry::lotWidth() const
{
    return lotWidth(m_cols);
}

QRectF LotGeometry::spaceRect(const data::Space &space) const
{
    return QRectF(spaceXPosition(space.col), rowYPosition(space.row), SpaceWidth, SpaceDepth);
}

double LotGeometry::aisleWidthAfterRow(int row, int rows, const QSet<int> &mergedAisles)
{
    Q_ASSERT_X(row >= 0 && row < rows - 1, "LotGeometry::aisleWidthAfterRow", "no aisle after this row");
    if (row < 0 || row >= rows - 1) {
        qCWarning(lcEngine) << "no aisle after row" << row << "in a lot with" << rows << "rows";
        return 0.0;
    }
    return mergedAisles.contains(row) ? MergedAisleWidth : AisleWidth;
}

double LotGeometry::lotHeight(int rows, const QSet<int> &mergedAisles)
{
    double height = 0.0;
    for (int r = 0; r < rows; ++r) {
        height += SpaceDepth;
        if (r < rows - 1) {
            height += aisleWidthAfterRow(r, rows, mergedAisles);
        }
    }
    return height;
}

double LotGeometry::rowYPosition(int row, const QSet<int> &mergedAisles)
{
    // Every row before `row` has an aisle after it, so the lot needs at least row + 1 rows.
    double y = 0.0;
    for (int r = 0; r < row; ++r) {
        y += SpaceDepth + aisleWidthAfterRow(r, row + 1, mergedAisles);
    }
    return y;
}

double LotGeometry::spaceXPosition(int col)
{
    return col * SpaceWidth;
}

double LotGeometry::lotWidth(int cols)
{
    return cols * SpaceWidth;
}

bool LotGeometry::isValidDimensions(int rows, int cols)
{
    return rows > 0 && cols > 0;
}

std::optional<int> LotGeometry::validateMerge(int rows, int first, int second, core::Error *error)
{
    if (first < 0 || first >= rows || second < 0 || second >= rows) {
        core::reportError(error, core::ErrorCode::Validation,
                          QObject::tr("Row numbers must be between 0 and %1.").arg(rows - 1));
        return std::nullopt;
    }
    if (std::abs(first - second) != 1) {
        core::reportError(error, core::ErrorCode::Validation, QObject::tr("Rows must be adjacent to merge."));
        return std::nullopt;
    }
    return std::min(first, second);
}

std::optional<int> LotGeometry::validateMerge(int rows, const QString &first, const QString &second,
                                              core::Error *error)
{
    const auto firstRow = parseRowIndex(first);
    const auto secondRow = parseRowIndex(second);
    if (!firstRow || !secondRow) {
        core::reportError(error, core::ErrorCode::Validation, QObject::tr("Please enter valid row numbers."));
        return std::nullopt;
    }
    return validateMerge(rows, *firstRow, *secondRow, error);
}

QSet<int> LotGeometry::clampMergedAisles(const QSet<int> &mergedAisles, int rows)
{
    QSet<int> kept;
    for (int aisle : mergedAisles) {
        if (aisle >= 0 && aisle < rows - 1) {
            kept.insert(aisle);
        }
    }
    return kept;
}

} // namespace engine
} // namespace parking
