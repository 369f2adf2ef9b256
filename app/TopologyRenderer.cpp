#include "TopologyRenderer.hpp"

#include <QColor>
#include <QFont>
#include <QFontMetrics>
#include <QImage>
#include <QPainter>
#include <QPen>
#include <QRectF>
#include <QStringList>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace net_survey::app
{
    namespace
    {
        constexpr int NODES_PER_RING = 18;
        constexpr double PI = 3.14159265358979323846;

        QRectF LabelBox(const QFontMetrics &metrics, const QString &label, const QPointF &center, qreal padding)
        {
            QRect text = metrics.boundingRect(QRect(), Qt::AlignCenter, label);
            QRectF box(0, 0, text.width() + 2 * padding, text.height() + 2 * padding);
            box.moveCenter(center);
            return box;
        }
    }

    QString NodeLabel(const scanner::Device &device)
    {
        QStringList lines;
        lines << QString::fromStdString(device.ip);
        if (device.hostname)
            lines << QString::fromStdString(*device.hostname);
        if (device.vendor)
            lines << QString::fromStdString(*device.vendor);
        return lines.join('\n');
    }

    TopologyLayout ComputeLayout(const scanner::ScanResult &result, const QSize &canvas)
    {
        TopologyLayout layout;
        layout.canvas = canvas;
        layout.hub.center = QPointF(canvas.width() / 2.0, canvas.height() / 2.0);
        layout.hub.label = QStringLiteral("Gateway\n") +
                           QString::fromStdString(result.gateway_ip.value_or("gateway"));

        std::vector<const scanner::Device *> others;
        for (const auto &device : result.devices)
        {
            if (device.is_gateway)
                layout.hub.label = NodeLabel(device);
            else
                others.push_back(&device);
        }

        if (others.empty())
            return layout;

        const int rings = static_cast<int>((others.size() + NODES_PER_RING - 1) / NODES_PER_RING);
        const double maxRx = canvas.width() * 0.42;
        const double maxRy = canvas.height() * 0.40;

        for (std::size_t i = 0; i < others.size(); ++i)
        {
            const int ring = static_cast<int>(i / NODES_PER_RING);
            const std::size_t onRing = std::min<std::size_t>(NODES_PER_RING, others.size() - ring * NODES_PER_RING);
            const std::size_t slot = i % NODES_PER_RING;

            const double scale = static_cast<double>(ring + 1) / rings;
            const double offset = (ring % 2) ? PI / onRing : 0.0;
            const double angle = -PI / 2 + offset + 2 * PI * slot / onRing;

            TopologyNode node;
            node.label = NodeLabel(*others[i]);
            node.center = QPointF(layout.hub.center.x() + maxRx * scale * std::cos(angle),
                                  layout.hub.center.y() + maxRy * scale * std::sin(angle));
            layout.satellites.push_back(node);
        }
        return layout;
    }

    void RenderTopologyPng(const scanner::ScanResult &result, const std::string &path, const QString &title)
    {
        const TopologyLayout layout = ComputeLayout(result);

        QImage image(layout.canvas, QImage::Format_ARGB32);
        image.fill(Qt::white);

        QPainter painter(&image);
        painter.setRenderHint(QPainter::Antialiasing);

        QFont font = painter.font();
        font.setPixelSize(18);
        painter.setFont(font);
        QFontMetrics metrics(font);

        painter.setPen(QPen(QColor(110, 110, 110), 2));
        for (const auto &node : layout.satellites)
            painter.drawLine(layout.hub.center, node.center);

        painter.setPen(QPen(Qt::black, 2));
        for (const auto &node : layout.satellites)
        {
            QRectF box = LabelBox(metrics, node.label, node.center, 10);
            painter.setBrush(Qt::white);
            painter.drawRect(box);
            painter.drawText(box, Qt::AlignCenter, node.label);
        }

        QRectF hubText = LabelBox(metrics, layout.hub.label, layout.hub.center, 0);
        const qreal radius = std::hypot(hubText.width(), hubText.height()) / 2 + 16;
        painter.setBrush(QColor(211, 211, 211));
        painter.drawEllipse(layout.hub.center, radius + 8, radius + 8);
        painter.setBrush(Qt::NoBrush);
        painter.drawEllipse(layout.hub.center, radius, radius);
        painter.drawText(hubText, Qt::AlignCenter, layout.hub.label);

        font.setPixelSize(24);
        painter.setFont(font);
        painter.drawText(QPointF(30, 50), title);
        painter.end();

        if (!image.save(QString::fromStdString(path), "PNG"))
            throw std::runtime_error("Cannot write " + path);
    }
}
