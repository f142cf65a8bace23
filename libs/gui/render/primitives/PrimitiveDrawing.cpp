#include "PrimitiveDrawing.hpp"
#include "../RenderConfig.hpp"

#include <QFont>
#include <QFontMetricsF>
#include <QPainter>
#include <algorithm>

namespace vantage::PrimitiveDrawing {

void applyDash(QPen& pen, DashStyle style, double pixelRatio) {
    const double width = std::max(1.0, pen.widthF());
    switch (style) {
        case DashStyle::Solid:
            pen.setStyle(Qt::SolidLine);
            break;
        case DashStyle::Dashed: {
            const double dash = render::kDashLength * pixelRatio / width;
            pen.setDashPattern({dash, dash});
            break;
        }
        case DashStyle::Dotted: {
            const double dot = render::kDotLength * pixelRatio / width;
            pen.setDashPattern({dot, dot});
            break;
        }
    }
}

void drawLabel(QPainter& painter, const QPointF& bitmapPos, const QString& text,
               const QColor& color, double pixelSize, int alignFlags) {
    if (text.isEmpty()) return;

    QFont font = painter.font();
    font.setPixelSize(std::max(1, static_cast<int>(pixelSize + 0.5)));
    painter.setFont(font);

    const QFontMetricsF metrics(font);
    const double w = metrics.horizontalAdvance(text);
    const double h = metrics.height();

    double left = bitmapPos.x();
    if (alignFlags & Qt::AlignHCenter) left -= w / 2.0;
    else if (alignFlags & Qt::AlignRight) left -= w;

    double top = bitmapPos.y();
    if (alignFlags & Qt::AlignVCenter) top -= h / 2.0;
    else if (alignFlags & Qt::AlignBottom) top -= h;

    const QRectF box(left, top, w + 1.0, h);
    if (render::kTextShadow) {
        painter.setPen(QColor(0, 0, 0, 204));
        painter.drawText(box.translated(1.0, 1.0), Qt::AlignLeft | Qt::AlignTop, text);
    }
    painter.setPen(color);
    painter.drawText(box, Qt::AlignLeft | Qt::AlignTop, text);
}

} // namespace vantage::PrimitiveDrawing
