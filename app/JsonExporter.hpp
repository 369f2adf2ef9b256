#pragma once

#include <string>
#include <QJsonObject>
#include "../scanner/Device.hpp"

namespace net_survey::app
{
    QJsonObject DeviceToJson(const scanner::Device &device);
    QJsonObject ScanResultToJson(const scanner::ScanResult &result);

    // Throws std::runtime_error when the file cannot be written.
    void SaveJson(const scanner::ScanResult &result, const std::string &path);
}
