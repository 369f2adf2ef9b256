#pragma once

#include <string>
#include <vector>
#include <QPointF>
#include <QSize>
#include <QString>
#include "../scanner/Device.hpp"

namespace net_survey::app
{
    // 16:9 at 150 dpi.
    inline constexpr int CANVAS_WIDTH = 2400;
    inline constexpr int CANVAS_HEIGHT = 1350;

    struct TopologyNode
    {
        QString label;
        QPointF center;
    };

    struct TopologyLayout
    {
        QSize canvas;
        TopologyNode hub;
        std::vector<TopologyNode> satellites;
    };

    // Address, hostname and vendor on separate lines, absent fields skipped.
    QString NodeLabel(const scanner::Device &device);

    // Gateway in the middle, every other device on concentric rings around it.
    TopologyLayout ComputeLayout(const scanner::ScanResult &result, const QSize &canvas = QSize(CANVAS_WIDTH, CANVAS_HEIGHT));

    // Needs a QGuiApplication for font rendering. Throws std::runtime_error
    // when the PNG cannot be written.
    void RenderTopologyPng(const scanner::ScanResult &result, const std::string &path,
                           const QString &title = QStringLiteral("net_survey topology"));
}
