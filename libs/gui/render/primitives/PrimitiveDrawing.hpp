#pragma once
#include "../../../core/model/OverlayTypes.hpp"

#include <QColor>
#include <QPen>
#include <QPointF>
#include <QString>

class QPainter;

namespace vantage::PrimitiveDrawing {

// Dash pattern scaled to the bitmap (Qt measures dashes in pen widths)
void applyDash(QPen& pen, DashStyle style, double pixelRatio);

// Label text at a bitmap position, with a dark halo when enabled in RenderConfig
void drawLabel(QPainter& painter, const QPointF& bitmapPos, const QString& text,
               const QColor& color, double pixelSize, int alignFlags);

} // namespace vantage::PrimitiveDrawing
